/*
 *     Copyright 2024-Present Couchbase, Inc.
 *
 *   Use of this software is governed by the Business Source License included
 *   in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
 *   in that file, in accordance with the Business Source License, use of this
 *   software will be governed by the Apache License, Version 2.0, included in
 *   the file licenses/APL2.txt.
 */
#pragma once

#define WTREADER_WT_READER_H

#include <libwtreader/error.h>
#include <libwtreader/wt_common.h>
#include <libwtreader/file_ops.h>
#include <libwtreader/document.h>
#include <libwtreader/visibility.h>
#include <nlohmann/json_fwd.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

/**
 * Get a textual representation of the error code
 *
 * @param errcode The error code to look up
 * @return a textual representation of the error
 */
LIBWTREADER_API
const char* wtreader_strerror(wtreader_error_t errcode);

namespace wtreader {

struct Page;
class PageCache;

/**
 * One column unpacked from a WiredTiger struct: signed formats give
 * int64_t, unsigned formats give uint64_t, string and raw formats give
 * the bytes.
 */
using PackedValue = std::variant<int64_t, uint64_t, std::string>;

/// Controls how a collection is traversed
struct ScanOptions {
    /**
     * Skip subtrees which can't be decoded (bad checksum, unsupported page
     * type, malformed cells, cycles) and report them as diagnostics instead
     * of failing the scan.
     */
    bool tolerateCorruption{true};
    /// Fetch overflow values. Metadata-only scans may turn this off.
    bool resolveOverflow{true};
    /// Stop after this many documents
    std::optional<uint64_t> limit;
    /// Checked before every page fetch; set it from another thread to abort
    const std::atomic<bool>* cancel{nullptr};
    /// Optional cache of decoded pages which may be shared between scans
    PageCache* cache{nullptr};
    /// File operations to use (the default POSIX implementation if null)
    FileOpsInterface* fileops{nullptr};
};

/**
 * A problem found (and skipped) during a scan. The address is empty for
 * problems not tied to a block (e.g. a record which failed to decode is
 * reported with its leaf page address and record id).
 */
struct Diagnostic {
    std::string file;
    BlockAddress address;
    wtreader_error_t error{WTREADER_SUCCESS};
    std::string reason;
    std::optional<int64_t> recordId;

    nlohmann::json to_json() const;
};

/// Everything known about one table in the data directory
struct CatalogEntry {
    /// The WiredTiger table name (e.g. "collection-7-1234567890")
    std::string name;
    /// The MongoDB namespace ("db.collection") if _mdb_catalog names it
    std::string ns;
    std::string uri;
    /// Data file name relative to the data directory
    std::string fileName;
    BlockAddress root;
    std::string keyFormat{"u"};
    std::string valueFormat{"u"};
    std::string blockCompressor;
    uint32_t allocationSize{4096};
    /// False if the data file (or its metadata) is missing
    bool available{true};
    std::optional<uint64_t> documentCountEstimate;

    nlohmann::json to_json() const;
};

struct CollectionListing {
    std::vector<CatalogEntry> collections;
    std::vector<Diagnostic> diagnostics;
};

/**
 * A record read from a collection. If the value couldn't be decoded the
 * record is still returned as a placeholder: status holds the error, the
 * document is empty and the raw bytes are kept for inspection.
 */
struct DocumentRecord {
    PackedValue key;
    std::string rawKey;
    std::string rawValue;
    wtreader_error_t status{WTREADER_SUCCESS};
    std::optional<Document> document;
    /// Set when the record carries a stop time (it is not current)
    bool stopped{false};
    /**
     * False for overflow values which weren't fetched
     * (ScanOptions::resolveOverflow); the document is empty
     */
    bool valueResolved{true};
};

/**
 * A lazily evaluated, pull based cursor over the documents in a
 * collection, in key order. The cursor owns its file handle which is
 * closed when the cursor is destroyed.
 */
class CollectionCursor {
public:
    virtual ~CollectionCursor() = default;

    /**
     * Move to the next record.
     *
     * @param record where to store the record
     * @return WTREADER_SUCCESS if a record was returned,
     *         WTREADER_ERROR_NOT_FOUND at the end of the collection (or
     *         once the limit is reached), WTREADER_ERROR_CANCEL if the
     *         scan was cancelled, or the fatal error which stopped the scan
     */
    virtual wtreader_error_t next(DocumentRecord& record) = 0;

    /// Problems found so far (grows as the cursor advances)
    virtual const std::vector<Diagnostic>& getDiagnostics() const = 0;

    virtual const CatalogEntry& getEntry() const = 0;

    /// Number of tree pages (not counting overflow pages) read so far
    virtual uint64_t getPagesRead() const = 0;
};

using UniqueCollectionCursorPtr = std::unique_ptr<CollectionCursor>;

/// The outcome of a complete (eager) collection read
struct ScanResult {
    wtreader_error_t status{WTREADER_SUCCESS};
    std::vector<DocumentRecord> documents;
    std::vector<Diagnostic> diagnostics;
};

/**
 * List the collections in a data directory. Index tables and the
 * sizeStorer table are excluded. Collections whose data file is missing
 * are included with available set to false.
 *
 * @param dataDir the directory containing WiredTiger.turtle
 * @param fileops the file operations to use (default if null)
 */
LIBWTREADER_API
std::pair<wtreader_error_t, CollectionListing> listCollections(
        const std::string& dataDir, FileOpsInterface* fileops = {});

/**
 * Look up a collection by its exact (case sensitive) table name, or
 * failing that by its MongoDB namespace.
 *
 * @return WTREADER_ERROR_NO_SUCH_COLLECTION if no table matches
 */
LIBWTREADER_API
std::pair<wtreader_error_t, CatalogEntry> resolve(
        const std::string& dataDir,
        std::string_view name,
        FileOpsInterface* fileops = {});

/**
 * Open a cursor over the documents of a collection. The catalog is read
 * and the collection's data file is opened (and its descriptor verified),
 * but no tree pages are read until the first call to next().
 */
LIBWTREADER_API
std::pair<wtreader_error_t, UniqueCollectionCursorPtr> openCollection(
        const std::string& dataDir,
        std::string_view name,
        ScanOptions options = {});

/**
 * Read (up to limit) documents of a collection into memory. The limit
 * overrides the one in options if present.
 */
LIBWTREADER_API
ScanResult readCollection(const std::string& dataDir,
                          std::string_view name,
                          std::optional<uint64_t> limit = {},
                          ScanOptions options = {});

/**
 * Look up a single record by its record id (collections with key format
 * "q") without scanning the collection.
 *
 * @return WTREADER_ERROR_NOT_FOUND if the record doesn't exist
 */
LIBWTREADER_API
std::pair<wtreader_error_t, DocumentRecord> findRecord(
        const std::string& dataDir,
        std::string_view name,
        int64_t recordId,
        ScanOptions options = {});

/**
 * Decode a single column key stored in the given WiredTiger format
 * (e.g. "q" for MongoDB record ids, "S" for strings, "u" for raw bytes)
 */
LIBWTREADER_API
std::pair<wtreader_error_t, PackedValue> decodeKey(std::string_view bytes,
                                                   std::string_view keyFormat);

/**
 * Decode a value stored in the given WiredTiger format. Format "u" is
 * decoded as a BSON document; other formats are unpacked column by column
 * into a document with the fields "0", "1", ...
 */
LIBWTREADER_API
std::pair<wtreader_error_t, Document> decodeValue(std::string_view bytes,
                                                  std::string_view valueFormat);

/**
 * Get the message logged by the most recent failure on this thread (it
 * usually names the file and offset involved)
 */
LIBWTREADER_API
std::string getLastInternalError();

/**
 * Install a handler which is called with every message logged by the
 * library (fatal errors and skipped pages or records)
 */
LIBWTREADER_API
void setOnInternalError(std::function<void(std::string_view)> handler);

} // namespace wtreader
