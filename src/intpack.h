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
 * WiredTiger's variable-length integer packing.
 *
 * The first byte holds a marker in its high bits telling how the value is
 * stored; small values fit in the marker byte itself. The encoding is
 * chosen so that comparing the packed bytes lexicographically gives the
 * same order as comparing the integers.
 *
 *   0x10 | n       negative, 8-n big endian bytes follow (leading 0xff
 *                  bytes dropped)
 *   0x20 - 0x3f    negative, 13 bits, one more byte follows
 *   0x40 - 0x7f    negative, 6 bits
 *   0x80 - 0xbf    positive, 6 bits
 *   0xc0 - 0xdf    positive, 13 bits, one more byte follows
 *   0xe0 | n       positive, n big endian bytes follow
 */

#include <cstdint>
#include <string>

#define NEG_MULTI_MARKER uint8_t(0x10)
#define NEG_2BYTE_MARKER uint8_t(0x20)
#define NEG_1BYTE_MARKER uint8_t(0x40)
#define POS_1BYTE_MARKER uint8_t(0x80)
#define POS_2BYTE_MARKER uint8_t(0xc0)
#define POS_MULTI_MARKER uint8_t(0xe0)

#define NEG_1BYTE_MIN (-(1 << 6))
#define NEG_2BYTE_MIN (-(1 << 13) + NEG_1BYTE_MIN)
#define POS_1BYTE_MAX ((1 << 6) - 1)
#define POS_2BYTE_MAX ((1 << 13) + POS_1BYTE_MAX)

// The largest number of bytes a packed 64 bit integer occupies
#define WT_INTPACK64_MAXSIZE 9

namespace wtreader {

/**
 * Unpack an unsigned integer and advance the read pointer.
 *
 * @throws Exception(WTREADER_ERROR_MALFORMED_VARINT) if the encoding is
 *         invalid, negative, or runs past end
 */
uint64_t vunpack_uint(const uint8_t*& p, const uint8_t* end);

/**
 * Unpack a signed integer and advance the read pointer.
 *
 * @throws Exception(WTREADER_ERROR_MALFORMED_VARINT)
 */
int64_t vunpack_int(const uint8_t*& p, const uint8_t* end);

/// Append the packed form of an unsigned integer
void vpack_uint(std::string& out, uint64_t x);

/// Append the packed form of a signed integer
void vpack_int(std::string& out, int64_t x);

} // namespace wtreader
