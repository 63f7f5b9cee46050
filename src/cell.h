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
#include "page.h"

#include <string_view>
#include <variant>
#include <vector>

/*
 * Cell descriptor byte.
 *
 * Short cells keep their type in the low 2 bits and their length in the
 * upper 6 bits. All other cells use bit 2 to flag a following 64 bit
 * value (RLE count), bit 3 to flag a second descriptor byte holding time
 * window information, and the upper 4 bits for the cell type.
 */
#define WT_CELL_KEY_SHORT 0x01
#define WT_CELL_KEY_SHORT_PFX 0x02
#define WT_CELL_VALUE_SHORT 0x03
#define WT_CELL_SHORT_TYPE(v) ((v)&0x03U)
#define WT_CELL_SHORT_SHIFT 2
#define WT_CELL_SHORT_MAX 63

#define WT_CELL_64V 0x04
#define WT_CELL_SECOND_DESC 0x08

#define WT_CELL_ADDR_DEL (0)
#define WT_CELL_ADDR_INT (1 << 4)
#define WT_CELL_ADDR_LEAF (2 << 4)
#define WT_CELL_ADDR_LEAF_NO (3 << 4)
#define WT_CELL_DEL (4 << 4)
#define WT_CELL_KEY (5 << 4)
#define WT_CELL_KEY_OVFL (6 << 4)
#define WT_CELL_KEY_PFX (7 << 4)
#define WT_CELL_VALUE (8 << 4)
#define WT_CELL_VALUE_COPY (9 << 4)
#define WT_CELL_VALUE_OVFL (10 << 4)
#define WT_CELL_VALUE_OVFL_RM (11 << 4)
#define WT_CELL_KEY_OVFL_RM (12 << 4)
#define WT_CELL_TYPE_MASK (0x0fU << 4)
#define WT_CELL_TYPE(v) ((v)&WT_CELL_TYPE_MASK)

// Long key and value lengths are stored minus the largest short length
#define WT_CELL_SIZE_ADJUST (WT_CELL_SHORT_MAX + 1)

// Second descriptor byte
#define WT_CELL_PREPARE 0x01
#define WT_CELL_TS_DURABLE_START 0x02
#define WT_CELL_TS_DURABLE_STOP 0x04
#define WT_CELL_TS_START 0x08
#define WT_CELL_TS_STOP 0x10
#define WT_CELL_TXN_START 0x20
#define WT_CELL_TXN_STOP 0x40

#define WT_TS_NONE 0
#define WT_TS_MAX UINT64_MAX
#define WT_TXN_NONE 0
#define WT_TXN_MAX UINT64_MAX

namespace wtreader {

/// Visibility information attached to a value
struct TimeWindow {
    uint64_t start_ts{WT_TS_NONE};
    uint64_t start_txn{WT_TXN_NONE};
    uint64_t durable_start_ts{WT_TS_NONE};
    uint64_t stop_ts{WT_TS_MAX};
    uint64_t stop_txn{WT_TXN_MAX};
    uint64_t durable_stop_ts{WT_TS_NONE};
    bool prepared{false};

    /// A value with a stop time has been removed or replaced
    bool hasStop() const {
        return stop_ts != WT_TS_MAX || stop_txn != WT_TXN_MAX;
    }
};

/// An on-page key; the first prefix bytes are shared with the previous key
struct KeyCell {
    uint8_t prefix{0};
    std::string_view suffix;
};

struct OverflowKeyCell {
    BlockAddress address;
    bool removed{false};
};

struct ValueCell {
    std::string_view data;
    TimeWindow window;
};

struct OverflowValueCell {
    BlockAddress address;
    TimeWindow window;
    bool removed{false};
};

/// A tombstone
struct DeletedValueCell {
    TimeWindow window;
};

enum class ChildKind : uint8_t { Deleted, Internal, Leaf, LeafNoOverflow };

struct ChildAddressCell {
    BlockAddress address;
    ChildKind kind{ChildKind::Leaf};
};

using Cell = std::variant<KeyCell,
                          OverflowKeyCell,
                          ValueCell,
                          OverflowValueCell,
                          DeletedValueCell,
                          ChildAddressCell>;

/**
 * Decode all cells of a row-store page. Value copy cells are resolved to
 * the value they reference. The returned cells reference the page image.
 *
 * @throws Exception(WTREADER_ERROR_CELL_COUNT_MISMATCH) if the page holds
 *         fewer cells than its header declares, or bytes remain after the
 *         last one; Exception(WTREADER_ERROR_MALFORMED_VARINT) and
 *         Exception(WTREADER_ERROR_CORRUPT) for damaged cells
 */
std::vector<Cell> decode_cells(const Page& page, uint32_t allocation_size);

/**
 * Decode an address cookie (packed offset, size and checksum, in units of
 * the allocation size).
 *
 * @return the address (empty if the size is zero)
 */
BlockAddress unpack_address(std::string_view cookie, uint32_t allocation_size);

/**
 * Decode an address cookie and advance the read pointer past it
 */
BlockAddress unpack_address(const uint8_t*& p,
                            const uint8_t* end,
                            uint32_t allocation_size);

} // namespace wtreader
