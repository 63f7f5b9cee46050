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

#include "bitfield.h"
#include "internal.h"

/**
 * The file descriptor block stored in the first allocation unit of every
 * .wt file.
 */
struct raw_block_desc {
    raw_32 magic;
    raw_16 majorv;
    raw_16 minorv;
    raw_32 checksum;
    raw_32 unused;
};
static_assert(sizeof(raw_block_desc) == WT_BLOCK_DESC_SIZE,
              "Unexpected block descriptor size");

/**
 * The page header at the start of every page image. For overflow pages
 * the entries field holds the length of the overflow data.
 */
struct raw_page_header {
    raw_64 recno;
    raw_64 write_gen;
    raw_32 mem_size;
    raw_32 entries;
    raw_08 type;
    raw_08 flags;
    raw_08 unused;
    raw_08 version;
};
static_assert(sizeof(raw_page_header) == WT_PAGE_HEADER_SIZE,
              "Unexpected page header size");

/**
 * The block manager's header, which follows the page header. The checksum
 * covers the whole block (with this field zeroed) if the data checksum
 * flag is set, otherwise just the first WT_BLOCK_COMPRESS_SKIP bytes.
 */
struct raw_block_header {
    raw_32 disk_size;
    raw_32 checksum;
    raw_08 flags;
    raw_08 unused[3];
};
static_assert(sizeof(raw_block_header) == WT_BLOCK_HEADER_SIZE,
              "Unexpected block header size");

// raw_page_header::flags
#define WT_PAGE_COMPRESSED 0x01
#define WT_PAGE_EMPTY_V_ALL 0x02
#define WT_PAGE_EMPTY_V_NONE 0x04
#define WT_PAGE_ENCRYPTED 0x08
// Deleted-child address cells carry fast-truncate information
#define WT_PAGE_FT_UPDATE 0x10

// raw_block_header::flags
#define WT_BLOCK_DATA_CKSUM 0x01

// Offset of the checksum field within a block
#define WT_BLOCK_CHECKSUM_OFFSET (WT_PAGE_HEADER_SIZE + 4)
// Offset of the checksum field within the descriptor block
#define WT_BLOCK_DESC_CHECKSUM_OFFSET 8
