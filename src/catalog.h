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

#include "btree.h"
#include "metadata.h"

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#define WT_TABLE_PREFIX "table:"
#define WT_COLGROUP_PREFIX "colgroup:"
#define WT_FILE_PREFIX "file:"

// MongoDB's own catalog and collection size tables
#define MDB_CATALOG_TABLE "_mdb_catalog"
#define MDB_SIZE_STORER_TABLE "sizeStorer"
#define MDB_INDEX_PREFIX "index-"

namespace wtreader {

/**
 * The tables of a data directory, built from the turtle file and the
 * metadata table (WiredTiger.wt), annotated with the namespaces from
 * MongoDB's _mdb_catalog and the record counts from its sizeStorer.
 */
class Catalog {
public:
    /**
     * Read the catalog of a data directory.
     *
     * Problems with individual tables (missing files, damaged metadata
     * entries, unreadable _mdb_catalog pages) are recorded as diagnostics.
     *
     * @throws Exception(WTREADER_ERROR_NO_BOOTSTRAP) if the turtle file or
     *         the metadata file is missing, and other fatal errors
     */
    static Catalog load(const std::string& dataDir, FileOpsInterface* ops);

    /// Collections as listed to users (no index or sizeStorer tables)
    std::vector<CatalogEntry> getCollections() const;

    /**
     * Find a table by its exact name, or failing that by its MongoDB
     * namespace. Index tables and the sizeStorer may be found by name.
     *
     * @return the entry or nullptr
     */
    const CatalogEntry* find(std::string_view name) const;

    const std::vector<CatalogEntry>& getTables() const {
        return tables;
    }

    const std::vector<Diagnostic>& getDiagnostics() const {
        return diagnostics;
    }

    const Turtle& getTurtle() const {
        return turtle;
    }

    /// @return true for tables shown by listCollections()
    static bool isCollection(std::string_view name);

protected:
    Catalog(std::string dataDir, FileOpsInterface* ops)
        : dataDir(std::move(dataDir)), ops(ops) {
    }

    void readMetadata();
    CatalogEntry makeEntry(const std::string& name,
                           const std::string& tableConfig);
    void readMongoCatalog();
    void readSizeStorer();

    /**
     * Read every record of a table, reporting problems as diagnostics
     * instead of throwing
     */
    void scan(const CatalogEntry& entry,
              const std::function<void(const Record&)>& callback);

    void report(const std::string& file,
                wtreader_error_t error,
                const std::string& reason);

    const std::string dataDir;
    FileOpsInterface* const ops;
    Turtle turtle;
    // Content of the metadata table, keyed by URI
    std::map<std::string, std::string> metadata;
    std::vector<CatalogEntry> tables;
    std::vector<Diagnostic> diagnostics;
};

/**
 * Open the data file of a catalog entry
 *
 * @throws Exception(WTREADER_ERROR_NO_SUCH_FILE) if the entry isn't
 *         available, and the errors of wt_file_open()
 */
void open_table_file(wt_file* file,
                     const std::string& dataDir,
                     const CatalogEntry& entry,
                     FileOpsInterface* ops);

} // namespace wtreader
