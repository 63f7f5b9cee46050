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

#include "cell.h"
#include "internal.h"
#include "page.h"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace wtreader {

/// A key/value pair read from a leaf page, overflow items resolved
struct Record {
    std::string key;
    std::string value;
    TimeWindow window;
    /// The leaf page the record was found on
    BlockAddress leaf;
    /// False if the value is an overflow item which wasn't fetched
    bool valueResolved{true};
};

/**
 * Read and decode the page at the given address, going through the cache
 * if one is supplied.
 *
 * @throws Exception (see read_block() and decode_page())
 */
std::shared_ptr<const Page> read_page(wt_file& file,
                                      const BlockAddress& address,
                                      PageCache* cache);

/**
 * Read the data of an overflow item.
 *
 * @throws Exception(WTREADER_ERROR_CORRUPT) if the address doesn't refer
 *         to an overflow page
 */
std::string read_overflow(wt_file& file,
                          const BlockAddress& address,
                          PageCache* cache);

/**
 * Ordered traversal of a row-store B-tree.
 *
 * The walker keeps an explicit stack of the pages between the root and the
 * current leaf, and only reads a page when the traversal reaches it. Each
 * subtree is finished before the walker moves on to its right sibling.
 *
 * Problems confined to one page are recorded in the diagnostics vector and
 * the page's subtree is skipped if options.tolerateCorruption is set;
 * otherwise (and for fatal errors) an Exception is thrown from next().
 */
class TreeWalker {
public:
    TreeWalker(wt_file& file,
               const BlockAddress& root,
               const ScanOptions& options,
               std::vector<Diagnostic>& diagnostics);

    /**
     * Move to the next record in key order.
     *
     * @return false at the end of the tree
     * @throws Exception(WTREADER_ERROR_CANCEL) if the cancel flag is set
     */
    bool next(Record& record);

    /**
     * Look up a single key by descending from the root.
     *
     * @return the record, or an empty optional if the key doesn't exist
     *         (or was deleted)
     */
    std::optional<Record> seek(std::string_view key);

    /// Number of tree pages read so far
    uint64_t getPagesRead() const {
        return pagesRead;
    }

protected:
    struct Child {
        std::string key;
        BlockAddress address;
        ChildKind kind;
    };

    enum class ValueState : uint8_t {
        Inline,
        Overflow,
        RemovedOverflow,
        Deleted,
        // A key directly followed by another key
        Empty
    };

    struct LeafEntry {
        std::string key;
        ValueState state{ValueState::Empty};
        std::string_view value;
        BlockAddress overflow;
        TimeWindow window;
    };

    struct Frame {
        std::shared_ptr<const Page> page;
        std::vector<Child> children;
        std::vector<LeafEntry> entries;
        size_t position{0};
        int depth{0};
    };

    /**
     * Read the page at address and push it onto the stack. Page-level
     * errors are reported and the page is skipped when tolerated.
     */
    void push(const BlockAddress& address,
              std::optional<ChildKind> kind,
              int depth);

    Frame load(const BlockAddress& address,
               std::optional<ChildKind> kind,
               int depth,
               std::unordered_set<uint64_t>& seen);

    void parseInternal(Frame& frame);
    void parseLeaf(Frame& frame);

    /**
     * Turn a leaf entry into a record.
     *
     * @return false if the entry holds no live value
     */
    bool makeRecord(const Frame& frame, const LeafEntry& entry, Record& record);

    void checkCancel() const;

    /// Record a skipped page or record (and log it)
    void report(const BlockAddress& address,
                wtreader_error_t error,
                const std::string& reason);

    wt_file& file;
    const BlockAddress root;
    const ScanOptions options;
    std::vector<Diagnostic>& diagnostics;

    std::vector<Frame> stack;
    std::unordered_set<uint64_t> visited;
    std::optional<std::string> lastKey;
    uint64_t pagesRead{0};
    bool started{false};
};

/**
 * Point lookup of a key in the tree rooted at root
 *
 * @return the record or an empty optional if it doesn't exist
 * @throws Exception for errors which aren't tolerated
 */
std::optional<Record> btree_seek(wt_file& file,
                                 const BlockAddress& root,
                                 std::string_view key,
                                 const ScanOptions& options,
                                 std::vector<Diagnostic>& diagnostics);

} // namespace wtreader
