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
#include "catalog.h"
#include "bson.h"
#include "exception.h"
#include "struct_pack.h"
#include "util.h"

#include <boost/algorithm/string/predicate.hpp>
#include <fcntl.h>
#include <fmt/format.h>

namespace wtreader {

using boost::algorithm::starts_with;

static bool file_exists(FileOpsInterface* ops, const std::string& path) {
    wtreader_error_info_t errinfo;
    auto handle = ops->constructor(&errinfo);
    const auto errcode = ops->open(&errinfo, &handle, path.c_str(), O_RDONLY);
    if (errcode == WTREADER_SUCCESS) {
        (void)ops->close(&errinfo, handle);
    }
    ops->destructor(handle);
    // A file we can't open for other reasons is reported when it's read
    return errcode != WTREADER_ERROR_NO_SUCH_FILE;
}

/// Unpack a metadata key or value (format "S")
static std::string unpack_string(const std::string& data) {
    auto values = unpack_struct(data, "S");
    return std::get<std::string>(values.front());
}

bool Catalog::isCollection(std::string_view name) {
    return !starts_with(name, MDB_INDEX_PREFIX) &&
           name != MDB_SIZE_STORER_TABLE;
}

void Catalog::report(const std::string& file,
                     wtreader_error_t error,
                     const std::string& reason) {
    log_last_internal_error("%s: %s", file.c_str(), reason.c_str());
    diagnostics.push_back({file, {}, error, reason, {}});
}

Catalog Catalog::load(const std::string& dataDir, FileOpsInterface* ops) {
    Catalog catalog(dataDir, ops);
    catalog.turtle = read_turtle(ops, dataDir);
    catalog.readMetadata();

    for (const auto& [uri, config] : catalog.metadata) {
        if (starts_with(uri, WT_TABLE_PREFIX)) {
            catalog.tables.push_back(catalog.makeEntry(
                    uri.substr(sizeof(WT_TABLE_PREFIX) - 1), config));
        }
    }

    catalog.readMongoCatalog();
    catalog.readSizeStorer();
    return catalog;
}

void Catalog::readMetadata() {
    const auto meta = parse_file_metadata(turtle.metadataConfig);
    const auto path = make_path(dataDir, WT_METAFILE);

    wt_file file;
    try {
        wt_file_open(&file,
                     path,
                     ops,
                     {meta.allocationSize,
                      parse_block_compressor(meta.blockCompressor)});
    } catch (const Exception& e) {
        if (e.errcode == WTREADER_ERROR_NO_SUCH_FILE) {
            throw Exception(WTREADER_ERROR_NO_BOOTSTRAP, e.what());
        }
        throw;
    }

    ScanOptions options;
    options.fileops = ops;
    TreeWalker walker(file, meta.root, options, diagnostics);
    Record record;
    while (walker.next(record)) {
        try {
            metadata.emplace(unpack_string(record.key),
                             unpack_string(record.value));
        } catch (const Exception& e) {
            log_last_internal_error("%s: skipped metadata record: %s",
                                    path.c_str(),
                                    e.what());
            diagnostics.push_back({path, record.leaf, e.errcode, e.what(), {}});
        }
    }
}

CatalogEntry Catalog::makeEntry(const std::string& name,
                                const std::string& tableConfig) {
    CatalogEntry entry;
    entry.name = name;
    entry.uri = WT_TABLE_PREFIX + name;
    entry.fileName = name + ".wt";

    try {
        const auto table = ConfigMap::from_string(tableConfig);
        entry.keyFormat = table.getString("key_format", "u");
        entry.valueFormat = table.getString("value_format", "u");

        std::string source = WT_FILE_PREFIX + entry.fileName;
        auto colgroup = metadata.find(WT_COLGROUP_PREFIX + name);
        if (colgroup != metadata.end()) {
            source = ConfigMap::from_string(colgroup->second)
                             .getString("source", source);
        }
        if (!starts_with(source, WT_FILE_PREFIX)) {
            throw Exception(WTREADER_ERROR_NOT_SUPPORTED,
                            fmt::format("{}: unsupported data source \"{}\"",
                                        entry.uri,
                                        source));
        }
        entry.fileName = source.substr(sizeof(WT_FILE_PREFIX) - 1);

        auto file = metadata.find(source);
        if (file == metadata.end()) {
            throw Exception(WTREADER_ERROR_NO_SUCH_FILE,
                            fmt::format("{}: no metadata for \"{}\"",
                                        entry.uri,
                                        source));
        }
        const auto meta = parse_file_metadata(file->second);
        entry.root = meta.root;
        entry.allocationSize = meta.allocationSize;
        entry.blockCompressor = meta.blockCompressor;
    } catch (const Exception& e) {
        entry.available = false;
        report(make_path(dataDir, WT_METAFILE), e.errcode, e.what());
        return entry;
    }

    const auto path = make_path(dataDir, entry.fileName);
    if (!file_exists(ops, path)) {
        entry.available = false;
        report(path,
               WTREADER_ERROR_NO_SUCH_FILE,
               fmt::format("data file of {} is missing", entry.uri));
    }
    return entry;
}

void Catalog::scan(const CatalogEntry& entry,
                   const std::function<void(const Record&)>& callback) {
    const auto path = make_path(dataDir, entry.fileName);
    try {
        wt_file file;
        open_table_file(&file, dataDir, entry, ops);
        ScanOptions options;
        options.fileops = ops;
        TreeWalker walker(file, entry.root, options, diagnostics);
        Record record;
        while (walker.next(record)) {
            try {
                callback(record);
            } catch (const Exception& e) {
                diagnostics.push_back(
                        {path, record.leaf, e.errcode, e.what(), {}});
            }
        }
    } catch (const Exception& e) {
        // The collections are still usable without these annotations
        report(path, e.errcode, e.what());
    }
}

void Catalog::readMongoCatalog() {
    auto it = std::find_if(tables.begin(), tables.end(), [](const auto& e) {
        return e.name == MDB_CATALOG_TABLE;
    });
    if (it == tables.end() || !it->available) {
        return;
    }

    std::map<std::string, std::string> namespaces;
    scan(*it, [&namespaces](const Record& record) {
        const auto document = decode_bson(record.value);
        const auto* ident = document.find("ident");
        if (ident == nullptr || !ident->holds<std::string>()) {
            return;
        }

        const Value* ns = document.find("ns");
        if (ns == nullptr) {
            const auto* md = document.find("md");
            if (md && md->holds<Document>()) {
                ns = md->get<Document>().find("ns");
            }
        }
        if (ns && ns->holds<std::string>()) {
            namespaces[ident->get<std::string>()] = ns->get<std::string>();
        }
    });

    for (auto& entry : tables) {
        auto ns = namespaces.find(entry.name);
        if (ns != namespaces.end()) {
            entry.ns = ns->second;
        }
    }
}

static std::optional<uint64_t> record_count(const Document& document) {
    const auto* value = document.find("numRecords");
    if (value == nullptr) {
        return {};
    }
    if (value->holds<int64_t>()) {
        return uint64_t(std::max(value->get<int64_t>(), int64_t(0)));
    }
    if (value->holds<int32_t>()) {
        return uint64_t(std::max(value->get<int32_t>(), 0));
    }
    if (value->holds<double>() && value->get<double>() >= 0) {
        return uint64_t(value->get<double>());
    }
    return {};
}

void Catalog::readSizeStorer() {
    auto it = std::find_if(tables.begin(), tables.end(), [](const auto& e) {
        return e.name == MDB_SIZE_STORER_TABLE;
    });
    // MongoDB keys the sizes by table URI; a table of the same name with
    // other keys is ordinary user data
    if (it == tables.end() || !it->available ||
        (it->keyFormat != "u" && it->keyFormat != "S")) {
        return;
    }

    std::map<std::string, uint64_t> counts;
    const auto keyFormat = it->keyFormat;
    scan(*it, [&counts, &keyFormat](const Record& record) {
        const auto values = unpack_struct(record.key, keyFormat);
        const auto* uri = values.size() == 1
                                  ? std::get_if<std::string>(&values.front())
                                  : nullptr;
        if (uri == nullptr) {
            throw Exception(WTREADER_ERROR_CORRUPT,
                            fmt::format("Size table key doesn't match key "
                                        "format \"{}\"",
                                        keyFormat));
        }
        const auto& key = *uri;
        if (!starts_with(key, WT_TABLE_PREFIX)) {
            return;
        }
        auto count = record_count(decode_bson(record.value));
        if (count) {
            counts[key.substr(sizeof(WT_TABLE_PREFIX) - 1)] = *count;
        }
    });

    for (auto& entry : tables) {
        auto count = counts.find(entry.name);
        if (count != counts.end()) {
            entry.documentCountEstimate = count->second;
        }
    }
}

std::vector<CatalogEntry> Catalog::getCollections() const {
    std::vector<CatalogEntry> ret;
    for (const auto& entry : tables) {
        if (isCollection(entry.name)) {
            ret.push_back(entry);
        }
    }
    return ret;
}

const CatalogEntry* Catalog::find(std::string_view name) const {
    for (const auto& entry : tables) {
        if (entry.name == name) {
            return &entry;
        }
    }
    for (const auto& entry : tables) {
        if (!entry.ns.empty() && entry.ns == name) {
            return &entry;
        }
    }
    return nullptr;
}

void open_table_file(wt_file* file,
                     const std::string& dataDir,
                     const CatalogEntry& entry,
                     FileOpsInterface* ops) {
    if (!entry.available) {
        throw Exception(WTREADER_ERROR_NO_SUCH_FILE,
                        fmt::format("Collection \"{}\" is not available "
                                    "(data file \"{}\")",
                                    entry.name,
                                    entry.fileName));
    }
    wt_file_open(file,
                 make_path(dataDir, entry.fileName),
                 ops,
                 {entry.allocationSize,
                  parse_block_compressor(entry.blockCompressor)});
}

} // namespace wtreader
