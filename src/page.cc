/*
 *     Copyright 2024-Present Couchbase, Inc.
 *
 *   Use of this software is governed by the Business Source License included
 *   in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
 *   in that file, in accordance with the Business Source License, use of this
 *   software will be governed by the Apache License, Version 2.0, included in
 *   the file licenses/APL2.txt.
 */
#include "page.h"
#include "compress.h"
#include "disk_types.h"
#include "exception.h"

#include <fmt/format.h>
#include <cstring>

namespace wtreader {

std::string to_string(PageType type) {
    switch (type) {
    case PageType::Invalid:
        return "invalid";
    case PageType::BlockManager:
        return "block manager";
    case PageType::ColumnFix:
        return "column-store fixed-length leaf";
    case PageType::ColumnInternal:
        return "column-store internal";
    case PageType::ColumnVariable:
        return "column-store variable-length leaf";
    case PageType::Overflow:
        return "overflow";
    case PageType::RowInternal:
        return "row-store internal";
    case PageType::RowLeaf:
        return "row-store leaf";
    }
    return fmt::format("unknown ({})", int(type));
}

std::string_view Page::payload() const {
    std::string_view ret{image};
    ret.remove_prefix(WT_PAGE_HEADER_BYTE_SIZE);
    if (type == PageType::Overflow) {
        return ret.substr(0, entries);
    }
    return ret;
}

Page decode_page(std::string block,
                 const BlockAddress& address,
                 Compressor compressor) {
    if (block.size() < WT_PAGE_HEADER_BYTE_SIZE) {
        throw Exception(WTREADER_ERROR_CORRUPT,
                        fmt::format("Block {} is too small for a page ({} "
                                    "bytes)",
                                    to_string(address),
                                    block.size()));
    }

    raw_page_header header;
    std::memcpy(&header, block.data(), sizeof(header));

    Page page;
    page.address = address;
    page.recno = decode_raw64(header.recno);
    page.write_gen = decode_raw64(header.write_gen);
    page.mem_size = decode_raw32(header.mem_size);
    page.entries = decode_raw32(header.entries);
    page.flags = decode_raw08(header.flags);
    page.version = decode_raw08(header.version);

    const auto type = decode_raw08(header.type);
    switch (PageType(type)) {
    case PageType::Overflow:
    case PageType::RowInternal:
    case PageType::RowLeaf:
        page.type = PageType(type);
        break;
    default:
        throw Exception(WTREADER_ERROR_UNSUPPORTED_PAGE_TYPE,
                        fmt::format("Block {}: unsupported page type {}",
                                    to_string(address),
                                    to_string(PageType(type))));
    }

    if (page.flags & WT_PAGE_ENCRYPTED) {
        throw Exception(WTREADER_ERROR_ENCRYPTED,
                        fmt::format("Block {}: page is encrypted",
                                    to_string(address)));
    }

    if (page.mem_size < WT_PAGE_HEADER_BYTE_SIZE) {
        throw Exception(WTREADER_ERROR_CORRUPT,
                        fmt::format("Block {}: page size {} is smaller than "
                                    "the page header",
                                    to_string(address),
                                    page.mem_size));
    }

    if (page.flags & WT_PAGE_COMPRESSED) {
        if (page.mem_size <= WT_BLOCK_COMPRESS_SKIP) {
            throw Exception(WTREADER_ERROR_CORRUPT,
                            fmt::format("Block {}: compressed page of only {} "
                                        "bytes",
                                        to_string(address),
                                        page.mem_size));
        }
        std::string_view compressed{block};
        compressed.remove_prefix(WT_BLOCK_COMPRESS_SKIP);
        auto tail = decompress(compressor,
                               compressed,
                               page.mem_size - WT_BLOCK_COMPRESS_SKIP);
        block.resize(WT_BLOCK_COMPRESS_SKIP);
        block.append(tail);
        page.compressed = true;
    } else {
        if (page.mem_size > block.size()) {
            throw Exception(WTREADER_ERROR_CORRUPT,
                            fmt::format("Block {}: page size {} exceeds the "
                                        "block size",
                                        to_string(address),
                                        page.mem_size));
        }
        // Drop the padding up to the allocation size
        block.resize(page.mem_size);
    }
    page.image = std::move(block);

    if (page.type == PageType::Overflow &&
        page.entries > page.mem_size - WT_PAGE_HEADER_BYTE_SIZE) {
        throw Exception(WTREADER_ERROR_CORRUPT,
                        fmt::format("Block {}: overflow data length {} "
                                    "exceeds the page",
                                    to_string(address),
                                    page.entries));
    }
    return page;
}

} // namespace wtreader
