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

#include <libwtreader/wt_reader.h>

#include <cstddef>
#include <memory>
#include <string>

namespace wtreader {

/**
 * A bounded LRU cache of decoded pages, keyed by (file, offset, checksum).
 *
 * The cache is optional and explicitly scoped: create one and pass it in
 * ScanOptions to share decoded pages between scans (for instance when the
 * same collection is read repeatedly). It is safe to use from multiple
 * threads.
 */
class PageCache {
public:
    /// @param capacity the maximum number of pages to keep
    explicit PageCache(size_t capacity);
    ~PageCache();

    PageCache(const PageCache&) = delete;
    PageCache& operator=(const PageCache&) = delete;

    /// @return the cached page, or nullptr (and count a miss)
    std::shared_ptr<const Page> find(const std::string& file,
                                     const BlockAddress& address);

    void insert(const std::string& file,
                const BlockAddress& address,
                std::shared_ptr<const Page> page);

    size_t size() const;
    size_t getHits() const;
    size_t getMisses() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace wtreader
