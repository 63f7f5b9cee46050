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

#include <cstdint>

/*
 * Fixed-width types. Since these are made out of chars they will be
 * byte-aligned, so structs consisting only of these will be packed.
 *
 * WiredTiger writes all fixed size header fields in little endian byte
 * order.
 */

struct raw_08 {
    uint8_t raw_bytes[1];
};

struct raw_16 {
    uint8_t raw_bytes[2];
};

struct raw_32 {
    uint8_t raw_bytes[4];
};

struct raw_64 {
    uint8_t raw_bytes[8];
};

/* Functions for decoding raw_xx types to native integers: */
#define decode_raw08(a) wtreader_decode_raw08(a)
#define decode_raw16(a) wtreader_decode_raw16(a)
#define decode_raw32(a) wtreader_decode_raw32(a)
#define decode_raw64(a) wtreader_decode_raw64(a)

/* Functions for encoding native integers to raw_xx types: */
#define encode_raw08(a) wtreader_encode_raw08(a)
#define encode_raw16(a) wtreader_encode_raw16(a)
#define encode_raw32(a) wtreader_encode_raw32(a)
#define encode_raw64(a) wtreader_encode_raw64(a)

uint8_t wtreader_decode_raw08(raw_08 raw);
uint16_t wtreader_decode_raw16(raw_16 raw);
uint32_t wtreader_decode_raw32(raw_32 raw);
uint64_t wtreader_decode_raw64(raw_64 raw);

raw_08 wtreader_encode_raw08(uint8_t value);
raw_16 wtreader_encode_raw16(uint16_t value);
raw_32 wtreader_encode_raw32(uint32_t value);
raw_64 wtreader_encode_raw64(uint64_t value);
