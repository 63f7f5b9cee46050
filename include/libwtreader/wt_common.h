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

#include <fcntl.h>
#include <sys/types.h>
#include <cstdint>
#include <string>

#include <libwtreader/visibility.h>

/**
 * Offsets within a .wt file. off_t can't be trusted to be 64 bits wide on
 * all platforms (Windows follows the LLP64 data model and defines it as a
 * signed long), so use a fixed width type instead.
 */
using wt_off_t = int64_t;

/** Error information from the last operating system call on a file */
struct wtreader_error_info_t {
    int error{0};
};

/** Opaque file handle returned by FileOpsInterface::constructor */
using wt_file_handle = struct wt_file_handle_opaque*;

namespace wtreader {

/**
 * The physical location of a block within a .wt file, decoded from an
 * address cookie (offset, size and checksum are all multiplied out to
 * bytes).
 */
struct BlockAddress {
    uint64_t offset{0};
    uint32_t size{0};
    uint32_t checksum{0};

    /// An address cookie with a zero size refers to no block at all
    bool isEmpty() const {
        return size == 0;
    }

    bool operator==(const BlockAddress&) const = default;
};

/// Render an address as "[offset, offset+size) checksum" for messages
LIBWTREADER_API
std::string to_string(const BlockAddress& address);

} // namespace wtreader
