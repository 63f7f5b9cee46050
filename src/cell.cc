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
#include "cell.h"
#include "disk_types.h"
#include "exception.h"
#include "intpack.h"

#include <fmt/format.h>
#include <bitset>

namespace wtreader {

namespace {

/// The page being decoded, for bounds and error messages
struct CellContext {
    const Page& page;
    const uint8_t* begin;
    const uint8_t* end;
    uint32_t allocation_size;

    [[noreturn]] void corrupt(const uint8_t* cell, const std::string& what) const {
        throw Exception(WTREADER_ERROR_CORRUPT,
                        fmt::format("Block {}: cell at page offset {}: {}",
                                    to_string(page.address),
                                    WT_PAGE_HEADER_BYTE_SIZE + (cell - begin),
                                    what));
    }

    uint8_t byte(const uint8_t* cell, const uint8_t*& p) const {
        if (p >= end) {
            corrupt(cell, "cell runs past the end of the page");
        }
        return *p++;
    }

    std::string_view take(const uint8_t* cell,
                          const uint8_t*& p,
                          uint64_t len) const {
        if (len > uint64_t(end - p)) {
            corrupt(cell,
                    fmt::format("data length {} runs past the end of the "
                                "page",
                                len));
        }
        std::string_view ret{reinterpret_cast<const char*>(p), size_t(len)};
        p += len;
        return ret;
    }
};

} // namespace

static void unpack_time_window(const uint8_t*& p,
                               const uint8_t* end,
                               uint8_t flags,
                               TimeWindow& tw) {
    if (flags & WT_CELL_TS_START) {
        tw.start_ts = vunpack_uint(p, end);
    }
    if (flags & WT_CELL_TXN_START) {
        tw.start_txn = vunpack_uint(p, end);
    }
    if (flags & WT_CELL_TS_DURABLE_START) {
        tw.durable_start_ts = tw.start_ts + vunpack_uint(p, end);
    }
    if (flags & WT_CELL_TS_STOP) {
        tw.stop_ts = tw.start_ts + vunpack_uint(p, end);
    }
    if (flags & WT_CELL_TXN_STOP) {
        tw.stop_txn = tw.start_txn + vunpack_uint(p, end);
    }
    if (flags & WT_CELL_TS_DURABLE_STOP) {
        tw.durable_stop_ts = tw.stop_ts + vunpack_uint(p, end);
    }
    tw.prepared = (flags & WT_CELL_PREPARE) != 0;
}

BlockAddress unpack_address(const uint8_t*& p,
                            const uint8_t* end,
                            uint32_t allocation_size) {
    const auto offset = vunpack_uint(p, end);
    const auto size = vunpack_uint(p, end);
    const auto checksum = vunpack_uint(p, end);

    if (size == 0) {
        return {};
    }

    // Guard the multiplications below
    if (offset >= (UINT64_MAX / allocation_size) - 1 ||
        size > UINT32_MAX / allocation_size || checksum > UINT32_MAX) {
        throw Exception(WTREADER_ERROR_CORRUPT,
                        fmt::format("Invalid address cookie (offset:{} "
                                    "size:{} checksum:{})",
                                    offset,
                                    size,
                                    checksum));
    }

    BlockAddress ret;
    ret.offset = (offset + 1) * allocation_size;
    ret.size = uint32_t(size * allocation_size);
    ret.checksum = uint32_t(checksum);
    return ret;
}

BlockAddress unpack_address(std::string_view cookie, uint32_t allocation_size) {
    const auto* p = reinterpret_cast<const uint8_t*>(cookie.data());
    const auto* end = p + cookie.size();
    auto ret = unpack_address(p, end, allocation_size);
    if (p != end) {
        throw Exception(WTREADER_ERROR_CORRUPT,
                        fmt::format("Address cookie has {} trailing bytes",
                                    end - p));
    }
    return ret;
}

/**
 * Unpack one cell.
 *
 * @param ctx the page
 * @param cell the first byte of the cell
 * @param next set to the first byte after the cell
 * @param copy_allowed false while resolving a value copy cell (a copy
 *        never references another copy)
 */
static Cell unpack_cell(const CellContext& ctx,
                        const uint8_t* cell,
                        const uint8_t*& next,
                        bool copy_allowed) {
    const uint8_t* p = cell;
    const auto desc = ctx.byte(cell, p);

    switch (WT_CELL_SHORT_TYPE(desc)) {
    case WT_CELL_KEY_SHORT: {
        const auto data = ctx.take(cell, p, desc >> WT_CELL_SHORT_SHIFT);
        next = p;
        return KeyCell{0, data};
    }
    case WT_CELL_KEY_SHORT_PFX: {
        const auto prefix = ctx.byte(cell, p);
        const auto data = ctx.take(cell, p, desc >> WT_CELL_SHORT_SHIFT);
        next = p;
        return KeyCell{prefix, data};
    }
    case WT_CELL_VALUE_SHORT: {
        const auto data = ctx.take(cell, p, desc >> WT_CELL_SHORT_SHIFT);
        next = p;
        return ValueCell{data, {}};
    }
    }

    const auto type = WT_CELL_TYPE(desc);
    uint8_t prefix = 0;
    if (type == WT_CELL_KEY_PFX) {
        prefix = ctx.byte(cell, p);
    }

    TimeWindow tw;
    if (desc & WT_CELL_SECOND_DESC) {
        const auto flags = ctx.byte(cell, p);
        if (flags & 0x80) {
            ctx.corrupt(cell,
                        fmt::format("unknown time window flags {:#x}",
                                    int(flags)));
        }
        switch (type) {
        case WT_CELL_ADDR_DEL:
        case WT_CELL_ADDR_INT:
        case WT_CELL_ADDR_LEAF:
        case WT_CELL_ADDR_LEAF_NO: {
            // Aggregated time information of the child; one packed
            // integer for every flag except "prepared"
            const auto count = std::bitset<8>(flags & 0x7e).count();
            for (size_t ii = 0; ii < count; ++ii) {
                (void)vunpack_uint(p, ctx.end);
            }
            break;
        }
        case WT_CELL_DEL:
        case WT_CELL_VALUE:
        case WT_CELL_VALUE_COPY:
        case WT_CELL_VALUE_OVFL:
        case WT_CELL_VALUE_OVFL_RM:
            unpack_time_window(p, ctx.end, flags, tw);
            break;
        default:
            ctx.corrupt(cell,
                        fmt::format("second descriptor on cell type {:#x}",
                                    type));
        }
    }

    if (type == WT_CELL_ADDR_DEL && (ctx.page.flags & WT_PAGE_FT_UPDATE)) {
        // Fast-truncate transaction id, timestamps and prepare state
        for (int ii = 0; ii < 4; ++ii) {
            (void)vunpack_uint(p, ctx.end);
        }
    }

    uint64_t v = 0;
    if (desc & WT_CELL_64V) {
        v = vunpack_uint(p, ctx.end);
    }

    switch (type) {
    case WT_CELL_VALUE_COPY: {
        if (!copy_allowed) {
            ctx.corrupt(cell, "value copy cell references another copy");
        }
        const auto offset = vunpack_uint(p, ctx.end);
        if (offset == 0 || offset > uint64_t(cell - ctx.begin)) {
            ctx.corrupt(cell,
                        fmt::format("value copy offset {} is outside the "
                                    "page",
                                    offset));
        }
        next = p;
        const uint8_t* ignore;
        auto copied = unpack_cell(ctx, cell - offset, ignore, false);
        if (auto* value = std::get_if<ValueCell>(&copied)) {
            value->window = tw;
        } else if (auto* ovfl = std::get_if<OverflowValueCell>(&copied)) {
            ovfl->window = tw;
        } else {
            ctx.corrupt(cell, "value copy cell references a non-value cell");
        }
        return copied;
    }
    case WT_CELL_DEL:
        next = p;
        return DeletedValueCell{tw};
    case WT_CELL_ADDR_DEL:
    case WT_CELL_ADDR_INT:
    case WT_CELL_ADDR_LEAF:
    case WT_CELL_ADDR_LEAF_NO:
    case WT_CELL_KEY:
    case WT_CELL_KEY_PFX:
    case WT_CELL_KEY_OVFL:
    case WT_CELL_KEY_OVFL_RM:
    case WT_CELL_VALUE:
    case WT_CELL_VALUE_OVFL:
    case WT_CELL_VALUE_OVFL_RM:
        break;
    default:
        ctx.corrupt(cell, fmt::format("unknown cell type {:#x}", type));
    }

    auto len = vunpack_uint(p, ctx.end);
    if (type == WT_CELL_KEY || type == WT_CELL_KEY_PFX ||
        (type == WT_CELL_VALUE && v == 0 &&
         (desc & WT_CELL_SECOND_DESC) == 0)) {
        len += WT_CELL_SIZE_ADJUST;
    }
    const auto data = ctx.take(cell, p, len);
    next = p;

    switch (type) {
    case WT_CELL_KEY:
    case WT_CELL_KEY_PFX:
        return KeyCell{prefix, data};
    case WT_CELL_VALUE:
        return ValueCell{data, tw};
    }

    const auto address = unpack_address(data, ctx.allocation_size);
    if (address.isEmpty()) {
        ctx.corrupt(cell, "empty address cookie");
    }

    switch (type) {
    case WT_CELL_KEY_OVFL:
        return OverflowKeyCell{address, false};
    case WT_CELL_KEY_OVFL_RM:
        return OverflowKeyCell{address, true};
    case WT_CELL_VALUE_OVFL:
        return OverflowValueCell{address, tw, false};
    case WT_CELL_VALUE_OVFL_RM:
        return OverflowValueCell{address, tw, true};
    case WT_CELL_ADDR_DEL:
        return ChildAddressCell{address, ChildKind::Deleted};
    case WT_CELL_ADDR_INT:
        return ChildAddressCell{address, ChildKind::Internal};
    case WT_CELL_ADDR_LEAF:
        return ChildAddressCell{address, ChildKind::Leaf};
    case WT_CELL_ADDR_LEAF_NO:
        return ChildAddressCell{address, ChildKind::LeafNoOverflow};
    }
    ctx.corrupt(cell, fmt::format("unknown cell type {:#x}", type));
}

std::vector<Cell> decode_cells(const Page& page, uint32_t allocation_size) {
    const auto payload = page.payload();
    const auto* begin = reinterpret_cast<const uint8_t*>(payload.data());
    const CellContext ctx{page, begin, begin + payload.size(), allocation_size};

    std::vector<Cell> cells;
    cells.reserve(page.entries);
    const uint8_t* p = begin;
    for (uint32_t ii = 0; ii < page.entries; ++ii) {
        if (p >= ctx.end) {
            throw Exception(
                    WTREADER_ERROR_CELL_COUNT_MISMATCH,
                    fmt::format("Block {}: page declares {} cells but only "
                                "{} fit",
                                to_string(page.address),
                                page.entries,
                                ii));
        }
        const uint8_t* next = nullptr;
        cells.emplace_back(unpack_cell(ctx, p, next, true));
        p = next;
    }
    if (p != ctx.end) {
        throw Exception(WTREADER_ERROR_CELL_COUNT_MISMATCH,
                        fmt::format("Block {}: {} bytes follow the last of "
                                    "the {} declared cells",
                                    to_string(page.address),
                                    ctx.end - p,
                                    page.entries));
    }
    return cells;
}

} // namespace wtreader
