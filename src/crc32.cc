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

#include <platform/crc32c.h>

#include <gsl/gsl-lite.hpp>

uint32_t get_checksum(const uint8_t* buf, size_t buf_len) {
    return crc32c(buf, buf_len, 0);
}

uint32_t get_block_checksum(const uint8_t* buf,
                            size_t len,
                            size_t checksum_offset) {
    Expects(checksum_offset + sizeof(uint32_t) <= len);
    static const uint8_t zeros[sizeof(uint32_t)] = {0, 0, 0, 0};
    auto crc = crc32c(buf, checksum_offset, 0);
    crc = crc32c(zeros, sizeof(zeros), crc);
    const auto tail = checksum_offset + sizeof(uint32_t);
    return crc32c(buf + tail, len - tail, crc);
}

bool perform_integrity_check(const uint8_t* buf,
                             size_t len,
                             size_t checksum_offset,
                             uint32_t checksum) {
    return get_block_checksum(buf, len, checksum_offset) == checksum;
}
