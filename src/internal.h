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

/*
 * This file contains datastructures and prototypes for functions only to
 * be used by the internal workings of libwtreader. If you for some reason
 * need access to them from outside the library, you should write a
 * function to give you what you need.
 */
#include <libwtreader/wt_reader.h>

#include <string>
#include <string_view>

#define WT_BLOCK_MAGIC 120897
#define WT_BLOCK_MAJOR_VERSION 1
#define WT_BLOCK_MINOR_VERSION 0

// On-disk sizes of the structures in disk_types.h
#define WT_BLOCK_DESC_SIZE 16
#define WT_PAGE_HEADER_SIZE 28
#define WT_BLOCK_HEADER_SIZE 12
#define WT_PAGE_HEADER_BYTE_SIZE (WT_PAGE_HEADER_SIZE + WT_BLOCK_HEADER_SIZE)

// The leading bytes of a block which are never compressed (and which are
// checksummed when the block doesn't carry a full data checksum)
#define WT_BLOCK_COMPRESS_SKIP 64

#define WT_DEFAULT_ALLOCATION_SIZE 4096
#define WT_MAX_ALLOCATION_SIZE (128 * 1024 * 1024)

// Version byte leading a checkpoint address cookie
#define WT_BM_CHECKPOINT_VERSION 1

// Range of WiredTiger release major versions whose file format we read
#define WT_TURTLE_MIN_MAJOR 2
#define WT_TURTLE_MAX_MAJOR 11

// Deeper trees than this are considered corrupt
#define WT_MAX_TREE_DEPTH 64

#define MAX_ERR_STR_LEN 250

#define WT_METAFILE "WiredTiger.wt"
#define WT_METAFILE_URI "file:WiredTiger.wt"
#define WT_METADATA_TURTLE "WiredTiger.turtle"
#define WT_METADATA_TURTLE_SET "WiredTiger.turtle.set"
#define WT_METADATA_VERSION "WiredTiger version"

namespace wtreader {

/// Block compressors a file may be configured with
enum class Compressor : uint8_t { None, Snappy, Zlib };

/**
 * Map the block_compressor configuration of a file to a Compressor.
 *
 * @throws Exception(WTREADER_ERROR_UNSUPPORTED_FORMAT_VERSION) for
 *         compressors we can't decode (zstd, lz4, ...)
 */
Compressor parse_block_compressor(std::string_view name);

std::string to_string(Compressor compressor);

/* Configuration of an open file, supplied by the catalog */
struct wt_file_options {
    uint32_t allocation_size{WT_DEFAULT_ALLOCATION_SIZE};
    Compressor compressor{Compressor::None};
};

/* Structure representing an open .wt file */
struct wt_file {
    wt_file() = default;
    wt_file(const wt_file&) = delete;
    wt_file& operator=(const wt_file&) = delete;
    ~wt_file();

    /// Close the file (if open) and reset the structure
    wtreader_error_t close();

    FileOpsInterface* ops{nullptr};
    wt_file_handle handle{nullptr};
    std::string path;
    wtreader_error_info_t lastError;
    bool handle_open{false};
    // File size in bytes, as found when the file was opened
    uint64_t size{0};
    uint16_t major_version{0};
    uint16_t minor_version{0};
    wt_file_options options;
};

/**
 * Open a .wt file for reading and verify its descriptor block.
 *
 * @param file  Pointer to wt_file struct to initialize.
 * @param filename  Path to the file
 * @param ops  File I/O operations to use
 * @param options  allocation size and compressor of the file
 * @throws Exception with WTREADER_ERROR_NO_SUCH_FILE, OPEN_FILE, READ,
 *         CORRUPT, CHECKSUM_FAIL or UNSUPPORTED_FORMAT_VERSION
 */
void wt_file_open(wt_file* file,
                  const std::string& filename,
                  FileOpsInterface* ops,
                  wt_file_options options);

/**
 * Read the block at the given address and verify its size and checksum
 * against both the block header and the address cookie.
 *
 * @return the raw (possibly compressed) block
 * @throws Exception(WTREADER_ERROR_TRUNCATED_FILE) if the block extends
 *         beyond the end of the file,
 *         Exception(WTREADER_ERROR_CHECKSUM_FAIL) on size or checksum
 *         mismatch
 */
std::string read_block(wt_file& file, const BlockAddress& address);

/**
 * Read a small file (the turtle file) in full using the given file ops.
 *
 * @return the content, or an empty optional if the file doesn't exist
 */
std::optional<std::string> read_whole_file(FileOpsInterface* ops,
                                           const std::string& filename);

/// @return true for errors confined to one page (the walker may skip it)
bool is_page_level_error(wtreader_error_t errcode);

} // namespace wtreader

extern thread_local char internal_error_string[MAX_ERR_STR_LEN];
