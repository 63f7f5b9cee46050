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

#include <cstddef>
#include <cstdint>

/**
 * Compute the CRC32C checksum WiredTiger stores in block headers and
 * the file descriptor block.
 */
uint32_t get_checksum(const uint8_t* buf, size_t buf_len);

/**
 * Compute the checksum of a block whose checksum field (4 bytes at
 * checksum_offset) must be treated as zero. Only the first len bytes
 * are covered.
 */
uint32_t get_block_checksum(const uint8_t* buf,
                            size_t len,
                            size_t checksum_offset);

/**
 * Verify the checksum of the first len bytes of a block, treating the
 * checksum field as zero.
 *
 * @return true if the checksum matches
 */
bool perform_integrity_check(const uint8_t* buf,
                             size_t len,
                             size_t checksum_offset,
                             uint32_t checksum);
