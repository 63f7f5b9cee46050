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
#include "crc32.h"
#include "disk_types.h"
#include "exception.h"
#include "internal.h"
#include "util.h"

#include <fcntl.h>
#include <fmt/format.h>
#include <gsl/gsl-lite.hpp>
#include <cstring>

namespace wtreader {

std::string to_string(const BlockAddress& address) {
    if (address.isEmpty()) {
        return "[empty]";
    }
    return fmt::format("[{}-{}, {}, {:#x}]",
                       address.offset,
                       address.offset + address.size,
                       address.size,
                       address.checksum);
}

bool is_page_level_error(wtreader_error_t errcode) {
    switch (errcode) {
    case WTREADER_ERROR_CORRUPT:
    case WTREADER_ERROR_CHECKSUM_FAIL:
    case WTREADER_ERROR_UNSUPPORTED_PAGE_TYPE:
    case WTREADER_ERROR_DECOMPRESSION_MISMATCH:
    case WTREADER_ERROR_CELL_COUNT_MISMATCH:
    case WTREADER_ERROR_MALFORMED_VARINT:
    case WTREADER_ERROR_CORRUPT_TREE:
    case WTREADER_ERROR_ENCRYPTED:
        return true;
    default:
        return false;
    }
}

/**
 * Read exactly nbytes at the given offset. Short reads are retried; an
 * early end of file means the file is shorter than its metadata claims.
 */
static void read_fully(wt_file& file, void* dst, size_t nbytes, wt_off_t pos) {
    auto* ptr = static_cast<char*>(dst);
    while (nbytes > 0) {
        const auto got = file.ops->pread(
                &file.lastError, file.handle, ptr, nbytes, pos);
        if (got < 0) {
            throw Exception(
                    WTREADER_ERROR_READ,
                    fmt::format("Failed to read {} bytes at offset {} of "
                                "\"{}\": {}",
                                nbytes,
                                pos,
                                file.path,
                                std::strerror(file.lastError.error)));
        }
        if (got == 0) {
            throw Exception(WTREADER_ERROR_TRUNCATED_FILE,
                            fmt::format("Unexpected end of file at offset {} "
                                        "of \"{}\"",
                                        pos,
                                        file.path));
        }
        ptr += got;
        nbytes -= size_t(got);
        pos += got;
    }
}

static bool is_valid_allocation_size(uint32_t size) {
    return size >= 512 && size <= WT_MAX_ALLOCATION_SIZE &&
           (size & (size - 1)) == 0;
}

void wt_file_open(wt_file* file,
                  const std::string& filename,
                  FileOpsInterface* ops,
                  wt_file_options options) {
    Expects(file && ops);

    (void)file->close();
    if (!is_valid_allocation_size(options.allocation_size)) {
        throw Exception(WTREADER_ERROR_CORRUPT,
                        fmt::format("Invalid allocation size {} for \"{}\"",
                                    options.allocation_size,
                                    filename));
    }

    file->path = filename;
    file->options = options;
    file->ops = ops;
    file->handle = ops->constructor(&file->lastError);

    const auto errcode = ops->open(
            &file->lastError, &file->handle, filename.c_str(), O_RDONLY);
    if (errcode != WTREADER_SUCCESS) {
        const auto message =
                fmt::format("Failed to open \"{}\": {}",
                            filename,
                            std::strerror(file->lastError.error));
        (void)file->close();
        throw Exception(errcode, message);
    }
    file->handle_open = true;

    const auto eof = ops->goto_eof(&file->lastError, file->handle);
    if (eof < 0) {
        throw Exception(WTREADER_ERROR_READ,
                        fmt::format("Failed to get size of \"{}\": {}",
                                    filename,
                                    std::strerror(file->lastError.error)));
    }
    file->size = uint64_t(eof);

    if (file->size < options.allocation_size) {
        throw Exception(WTREADER_ERROR_TRUNCATED_FILE,
                        fmt::format("\"{}\" is {} bytes, smaller than one "
                                    "allocation unit ({})",
                                    filename,
                                    file->size,
                                    options.allocation_size));
    }

    // The descriptor checksum covers the whole first allocation unit
    std::string buffer(options.allocation_size, '\0');
    read_fully(*file, buffer.data(), buffer.size(), 0);
    raw_block_desc desc;
    std::memcpy(&desc, buffer.data(), sizeof(desc));

    if (decode_raw32(desc.magic) != WT_BLOCK_MAGIC) {
        throw Exception(WTREADER_ERROR_CORRUPT,
                        fmt::format("\"{}\" does not appear to be a "
                                    "WiredTiger file (magic:{})",
                                    filename,
                                    decode_raw32(desc.magic)));
    }

    const auto checksum = decode_raw32(desc.checksum);
    if (!perform_integrity_check(
                reinterpret_cast<const uint8_t*>(buffer.data()),
                buffer.size(),
                WT_BLOCK_DESC_CHECKSUM_OFFSET,
                checksum)) {
        throw Exception(WTREADER_ERROR_CHECKSUM_FAIL,
                        fmt::format("Descriptor block checksum mismatch in "
                                    "\"{}\" (stored:{:#x})",
                                    filename,
                                    checksum));
    }

    file->major_version = decode_raw16(desc.majorv);
    file->minor_version = decode_raw16(desc.minorv);
    if (file->major_version > WT_BLOCK_MAJOR_VERSION ||
        (file->major_version == WT_BLOCK_MAJOR_VERSION &&
         file->minor_version > WT_BLOCK_MINOR_VERSION)) {
        throw Exception(WTREADER_ERROR_UNSUPPORTED_FORMAT_VERSION,
                        fmt::format("Unsupported block manager version {}.{} "
                                    "in \"{}\" (expected {}.{})",
                                    file->major_version,
                                    file->minor_version,
                                    filename,
                                    WT_BLOCK_MAJOR_VERSION,
                                    WT_BLOCK_MINOR_VERSION));
    }
}

wtreader_error_t wt_file::close() {
    wtreader_error_t errcode = WTREADER_SUCCESS;
    if (ops) {
        if (handle_open) {
            errcode = ops->close(&lastError, handle);
        }
        ops->destructor(handle);
    }
    ops = nullptr;
    handle = nullptr;
    handle_open = false;
    size = 0;
    major_version = 0;
    minor_version = 0;
    options = {};
    path.clear();
    return errcode;
}

wt_file::~wt_file() {
    (void)close();
}

std::string read_block(wt_file& file, const BlockAddress& address) {
    if (address.size < WT_PAGE_HEADER_BYTE_SIZE ||
        address.offset < file.options.allocation_size) {
        throw Exception(WTREADER_ERROR_CORRUPT,
                        fmt::format("Invalid block address {} in \"{}\"",
                                    to_string(address),
                                    file.path));
    }
    if (address.offset + address.size > file.size) {
        throw Exception(WTREADER_ERROR_TRUNCATED_FILE,
                        fmt::format("Block {} extends beyond the end of \"{}\" "
                                    "(file size:{})",
                                    to_string(address),
                                    file.path,
                                    file.size));
    }

    std::string block(address.size, '\0');
    read_fully(file, block.data(), block.size(), wt_off_t(address.offset));

    raw_block_header header;
    std::memcpy(&header, block.data() + WT_PAGE_HEADER_SIZE, sizeof(header));
    const auto disk_size = decode_raw32(header.disk_size);
    const auto checksum = decode_raw32(header.checksum);
    const auto flags = decode_raw08(header.flags);

    if (disk_size != address.size) {
        throw Exception(WTREADER_ERROR_CHECKSUM_FAIL,
                        fmt::format("Block {} in \"{}\": disk size {} doesn't "
                                    "match the address",
                                    to_string(address),
                                    file.path,
                                    disk_size));
    }
    if (checksum != address.checksum) {
        throw Exception(WTREADER_ERROR_CHECKSUM_FAIL,
                        fmt::format("Block {} in \"{}\": stored checksum {:#x} "
                                    "doesn't match the address",
                                    to_string(address),
                                    file.path,
                                    checksum));
    }

    const size_t length = (flags & WT_BLOCK_DATA_CKSUM) ? block.size()
                                                        : WT_BLOCK_COMPRESS_SKIP;
    if (!perform_integrity_check(reinterpret_cast<const uint8_t*>(block.data()),
                                 length,
                                 WT_BLOCK_CHECKSUM_OFFSET,
                                 checksum)) {
        throw Exception(WTREADER_ERROR_CHECKSUM_FAIL,
                        fmt::format("Block {} in \"{}\": checksum mismatch",
                                    to_string(address),
                                    file.path));
    }
    return block;
}

std::optional<std::string> read_whole_file(FileOpsInterface* ops,
                                           const std::string& filename) {
    wt_file file;
    file.path = filename;
    file.ops = ops;
    file.handle = ops->constructor(&file.lastError);
    const auto errcode = ops->open(
            &file.lastError, &file.handle, filename.c_str(), O_RDONLY);
    if (errcode == WTREADER_ERROR_NO_SUCH_FILE) {
        return {};
    }
    if (errcode != WTREADER_SUCCESS) {
        throw Exception(errcode,
                        fmt::format("Failed to open \"{}\": {}",
                                    filename,
                                    std::strerror(file.lastError.error)));
    }
    file.handle_open = true;

    const auto eof = ops->goto_eof(&file.lastError, file.handle);
    if (eof < 0) {
        throw Exception(WTREADER_ERROR_READ,
                        fmt::format("Failed to get size of \"{}\": {}",
                                    filename,
                                    std::strerror(file.lastError.error)));
    }
    file.size = uint64_t(eof);

    std::string content(gsl::narrow<size_t>(file.size), '\0');
    read_fully(file, content.data(), content.size(), 0);
    return content;
}

} // namespace wtreader
