/* -*- Mode: C++; tab-width: 4; c-basic-offset: 4; indent-tabs-mode: nil -*- */
/*
 *     Copyright 2024-Present Couchbase, Inc.
 *
 *   Use of this software is governed by the Business Source License included
 *   in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
 *   in that file, in accordance with the Business Source License, use of this
 *   software will be governed by the Apache License, Version 2.0, included in
 *   the file licenses/APL2.txt.
 */
#include "bson.h"
#include "btree.h"
#include "catalog.h"
#include "exception.h"
#include "struct_pack.h"
#include "util.h"

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <platform/string_hex.h>
#include <limits>

namespace wtreader {

static nlohmann::json address_to_json(const BlockAddress& address) {
    return {{"offset", address.offset},
            {"size", address.size},
            {"checksum", cb::to_hex(address.checksum)}};
}

nlohmann::json Diagnostic::to_json() const {
    nlohmann::json ret;
    ret["file"] = file;
    if (!address.isEmpty()) {
        ret["address"] = address_to_json(address);
    }
    ret["error"] = wtreader_strerror(error);
    ret["reason"] = reason;
    if (recordId) {
        ret["record_id"] = *recordId;
    }
    return ret;
}

nlohmann::json CatalogEntry::to_json() const {
    nlohmann::json ret;
    ret["name"] = name;
    if (!ns.empty()) {
        ret["ns"] = ns;
    }
    ret["uri"] = uri;
    ret["file"] = fileName;
    if (root.isEmpty()) {
        ret["root"] = nullptr;
    } else {
        ret["root"] = address_to_json(root);
    }
    ret["key_format"] = keyFormat;
    ret["value_format"] = valueFormat;
    ret["block_compressor"] = blockCompressor;
    ret["allocation_size"] = allocationSize;
    ret["available"] = available;
    if (documentCountEstimate) {
        ret["count_estimate"] = *documentCountEstimate;
    }
    return ret;
}

static FileOpsInterface* get_file_ops(FileOpsInterface* fileops) {
    if (fileops) {
        return fileops;
    }
    return wtreader_get_default_file_ops();
}

static PackedValue decode_key(std::string_view bytes,
                              std::string_view keyFormat) {
    if (count_columns(keyFormat) != 1) {
        throw Exception(WTREADER_ERROR_NOT_SUPPORTED,
                        fmt::format("Key format \"{}\" has more than one "
                                    "column",
                                    keyFormat));
    }
    return unpack_struct(bytes, keyFormat).front();
}

static Value column_to_value(char type, PackedValue column) {
    if (auto* i = std::get_if<int64_t>(&column)) {
        return {*i};
    }
    if (auto* u = std::get_if<uint64_t>(&column)) {
        if (*u > uint64_t(std::numeric_limits<int64_t>::max())) {
            // BSON has no unsigned 64 bit type
            return {std::to_string(*u)};
        }
        return {int64_t(*u)};
    }
    auto& bytes = std::get<std::string>(column);
    if (type == 'u') {
        return {Binary{0, std::move(bytes)}};
    }
    return {std::move(bytes)};
}

static Document decode_value(std::string_view bytes,
                             std::string_view valueFormat) {
    if (valueFormat == "u") {
        return decode_bson(bytes);
    }

    const auto types = column_types(valueFormat);
    auto columns = unpack_struct(bytes, valueFormat);
    Document document;
    for (size_t ii = 0; ii < columns.size(); ++ii) {
        document.fields.push_back(
                {std::to_string(ii),
                 column_to_value(types[ii], std::move(columns[ii]))});
    }
    return document;
}

/**
 * Turn a record into a DocumentRecord. Keys and values which fail to
 * decode give a placeholder with the status set and a diagnostic.
 */
static DocumentRecord decode_record(const CatalogEntry& entry,
                                    const std::string& path,
                                    const Record& record,
                                    std::vector<Diagnostic>& diagnostics) {
    DocumentRecord ret;
    ret.rawKey = record.key;
    ret.rawValue = record.value;
    ret.stopped = record.window.hasStop();
    ret.valueResolved = record.valueResolved;

    std::optional<int64_t> recordId;
    try {
        ret.key = decode_key(record.key, entry.keyFormat);
        if (auto* id = std::get_if<int64_t>(&ret.key)) {
            recordId = *id;
        }
    } catch (const Exception& e) {
        ret.key = record.key;
        ret.status = e.errcode;
        log_last_internal_error("%s: key %s: %s",
                                path.c_str(),
                                to_hex_string(record.key).c_str(),
                                e.what());
        diagnostics.push_back({path, record.leaf, e.errcode, e.what(), {}});
        return ret;
    }

    if (!record.valueResolved) {
        return ret;
    }

    try {
        ret.document = decode_value(record.value, entry.valueFormat);
    } catch (const Exception& e) {
        ret.status = e.errcode;
        log_last_internal_error("%s: key %s: %s",
                                path.c_str(),
                                to_hex_string(record.key).c_str(),
                                e.what());
        diagnostics.push_back(
                {path, record.leaf, e.errcode, e.what(), recordId});
    }
    return ret;
}

namespace {

class CollectionCursorImpl : public CollectionCursor {
public:
    CollectionCursorImpl(const std::string& dataDir,
                         CatalogEntry entry,
                         const ScanOptions& options)
        : entry(std::move(entry)), options(options) {
        open_table_file(&file, dataDir, this->entry, options.fileops);
        walker = std::make_unique<TreeWalker>(
                file, this->entry.root, this->options, diagnostics);
    }

    wtreader_error_t next(DocumentRecord& record) override {
        if (status != WTREADER_SUCCESS) {
            return status;
        }
        if (options.limit && returned >= *options.limit) {
            return WTREADER_ERROR_NOT_FOUND;
        }

        try {
            Record raw;
            if (!walker->next(raw)) {
                return WTREADER_ERROR_NOT_FOUND;
            }
            record = decode_record(entry, file.path, raw, diagnostics);
            ++returned;
            return WTREADER_SUCCESS;
        } catch (const Exception& e) {
            log_last_internal_error("CollectionCursor::next() %s", e.what());
            status = e.errcode;
        } catch (const std::bad_alloc&) {
            status = WTREADER_ERROR_ALLOC_FAIL;
        }
        return status;
    }

    const std::vector<Diagnostic>& getDiagnostics() const override {
        return diagnostics;
    }

    const CatalogEntry& getEntry() const override {
        return entry;
    }

    uint64_t getPagesRead() const override {
        return walker->getPagesRead();
    }

protected:
    const CatalogEntry entry;
    const ScanOptions options;
    wt_file file;
    std::vector<Diagnostic> diagnostics;
    std::unique_ptr<TreeWalker> walker;
    uint64_t returned{0};
    // Set once the scan failed; all further calls return it
    wtreader_error_t status{WTREADER_SUCCESS};
};

} // namespace

static CatalogEntry lookup(const Catalog& catalog, std::string_view name) {
    const auto* entry = catalog.find(name);
    if (entry == nullptr) {
        throw Exception(WTREADER_ERROR_NO_SUCH_COLLECTION,
                        fmt::format("No collection named \"{}\"", name));
    }
    return *entry;
}

std::pair<wtreader_error_t, CollectionListing> listCollections(
        const std::string& dataDir, FileOpsInterface* fileops) {
    try {
        const auto catalog = Catalog::load(dataDir, get_file_ops(fileops));
        return {WTREADER_SUCCESS,
                {catalog.getCollections(), catalog.getDiagnostics()}};
    } catch (const Exception& e) {
        log_last_internal_error("wtreader::listCollections() %s", e.what());
        return {e.errcode, {}};
    } catch (const std::bad_alloc&) {
        return {WTREADER_ERROR_ALLOC_FAIL, {}};
    }
}

std::pair<wtreader_error_t, CatalogEntry> resolve(const std::string& dataDir,
                                                  std::string_view name,
                                                  FileOpsInterface* fileops) {
    try {
        const auto catalog = Catalog::load(dataDir, get_file_ops(fileops));
        return {WTREADER_SUCCESS, lookup(catalog, name)};
    } catch (const Exception& e) {
        log_last_internal_error("wtreader::resolve() %s", e.what());
        return {e.errcode, {}};
    } catch (const std::bad_alloc&) {
        return {WTREADER_ERROR_ALLOC_FAIL, {}};
    }
}

std::pair<wtreader_error_t, UniqueCollectionCursorPtr> openCollection(
        const std::string& dataDir,
        std::string_view name,
        ScanOptions options) {
    options.fileops = get_file_ops(options.fileops);
    try {
        const auto catalog = Catalog::load(dataDir, options.fileops);
        return {WTREADER_SUCCESS,
                std::make_unique<CollectionCursorImpl>(
                        dataDir, lookup(catalog, name), options)};
    } catch (const Exception& e) {
        log_last_internal_error("wtreader::openCollection() %s", e.what());
        return {e.errcode, {}};
    } catch (const std::bad_alloc&) {
        return {WTREADER_ERROR_ALLOC_FAIL, {}};
    }
}

ScanResult readCollection(const std::string& dataDir,
                          std::string_view name,
                          std::optional<uint64_t> limit,
                          ScanOptions options) {
    if (limit) {
        options.limit = limit;
    }

    ScanResult result;
    auto [status, cursor] = openCollection(dataDir, name, options);
    if (status != WTREADER_SUCCESS) {
        result.status = status;
        return result;
    }

    DocumentRecord record;
    while ((status = cursor->next(record)) == WTREADER_SUCCESS) {
        result.documents.push_back(std::move(record));
    }
    if (status != WTREADER_ERROR_NOT_FOUND) {
        result.status = status;
    }
    result.diagnostics = cursor->getDiagnostics();
    return result;
}

std::pair<wtreader_error_t, DocumentRecord> findRecord(
        const std::string& dataDir,
        std::string_view name,
        int64_t recordId,
        ScanOptions options) {
    options.fileops = get_file_ops(options.fileops);
    try {
        const auto catalog = Catalog::load(dataDir, options.fileops);
        const auto entry = lookup(catalog, name);
        if (entry.keyFormat != "q") {
            throw Exception(WTREADER_ERROR_NOT_SUPPORTED,
                            fmt::format("\"{}\" isn't keyed by record id "
                                        "(key format \"{}\")",
                                        name,
                                        entry.keyFormat));
        }

        wt_file file;
        open_table_file(&file, dataDir, entry, options.fileops);
        std::vector<Diagnostic> diagnostics;
        auto record = btree_seek(
                file, entry.root, pack_record_id(recordId), options, diagnostics);
        if (!record) {
            // A damaged page on the way down hides the record
            if (!diagnostics.empty()) {
                return {diagnostics.back().error, {}};
            }
            return {WTREADER_ERROR_NOT_FOUND, {}};
        }
        return {WTREADER_SUCCESS,
                decode_record(entry, file.path, *record, diagnostics)};
    } catch (const Exception& e) {
        log_last_internal_error("wtreader::findRecord() %s", e.what());
        return {e.errcode, {}};
    } catch (const std::bad_alloc&) {
        return {WTREADER_ERROR_ALLOC_FAIL, {}};
    }
}

std::pair<wtreader_error_t, PackedValue> decodeKey(std::string_view bytes,
                                                   std::string_view keyFormat) {
    try {
        return {WTREADER_SUCCESS, decode_key(bytes, keyFormat)};
    } catch (const Exception& e) {
        log_last_internal_error("wtreader::decodeKey() %s", e.what());
        return {e.errcode, {}};
    } catch (const std::bad_alloc&) {
        return {WTREADER_ERROR_ALLOC_FAIL, {}};
    }
}

std::pair<wtreader_error_t, Document> decodeValue(
        std::string_view bytes, std::string_view valueFormat) {
    try {
        return {WTREADER_SUCCESS, decode_value(bytes, valueFormat)};
    } catch (const Exception& e) {
        log_last_internal_error("wtreader::decodeValue() %s", e.what());
        return {e.errcode, {}};
    } catch (const std::bad_alloc&) {
        return {WTREADER_ERROR_ALLOC_FAIL, {}};
    }
}

} // namespace wtreader
