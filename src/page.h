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

#include "internal.h"

#include <string>
#include <string_view>

namespace wtreader {

/**
 * This is the on-disk representation of the page types. Only the row-store
 * and overflow pages are used by the collections we read.
 */
enum class PageType : uint8_t {
    Invalid = 0,
    BlockManager = 1,
    ColumnFix = 2,
    ColumnInternal = 3,
    ColumnVariable = 4,
    Overflow = 5,
    RowInternal = 6,
    RowLeaf = 7
};

std::string to_string(PageType type);

/**
 * A decoded page. The image is the complete, decompressed page (headers
 * included); cells and overflow data reference into it.
 */
struct Page {
    PageType type{PageType::Invalid};
    uint64_t recno{0};
    uint64_t write_gen{0};
    uint32_t mem_size{0};
    /// Number of cells, or the data length for overflow pages
    uint32_t entries{0};
    uint8_t flags{0};
    uint8_t version{0};
    bool compressed{false};
    BlockAddress address;
    std::string image;

    /// The bytes following the page and block headers
    std::string_view payload() const;
};

/**
 * Decode a block read by read_block() into a page.
 *
 * @param block the raw block
 * @param address the address the block was read from
 * @param compressor the file's block compressor
 * @throws Exception(WTREADER_ERROR_UNSUPPORTED_PAGE_TYPE) for anything
 *         but row-store and overflow pages,
 *         Exception(WTREADER_ERROR_ENCRYPTED) for encrypted pages,
 *         Exception(WTREADER_ERROR_DECOMPRESSION_MISMATCH) if the page
 *         doesn't decompress to its recorded size,
 *         Exception(WTREADER_ERROR_CORRUPT) for inconsistent headers
 */
Page decode_page(std::string block,
                 const BlockAddress& address,
                 Compressor compressor);

} // namespace wtreader
