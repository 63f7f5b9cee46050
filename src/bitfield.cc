/*
 *     Copyright 2024-Present Couchbase, Inc.
 *
 *   Use of this software is governed by the Business Source License included
 *   in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
 *   in that file, in accordance with the Business Source License, use of this
 *   software will be governed by the Apache License, Version 2.0, included in
 *   the file licenses/APL2.txt.
 */
#include "bitfield.h"

#include <cstddef>

template <typename T, size_t N>
static T decode_le(const uint8_t (&bytes)[N]) {
    T value = 0;
    for (size_t ii = N; ii > 0; --ii) {
        value = (value << 8) | bytes[ii - 1];
    }
    return value;
}

template <typename T, size_t N>
static void encode_le(T value, uint8_t (&bytes)[N]) {
    for (size_t ii = 0; ii < N; ++ii) {
        bytes[ii] = uint8_t(value & 0xff);
        value >>= 8;
    }
}

uint8_t wtreader_decode_raw08(raw_08 raw) {
    return raw.raw_bytes[0];
}

uint16_t wtreader_decode_raw16(raw_16 raw) {
    return decode_le<uint16_t>(raw.raw_bytes);
}

uint32_t wtreader_decode_raw32(raw_32 raw) {
    return decode_le<uint32_t>(raw.raw_bytes);
}

uint64_t wtreader_decode_raw64(raw_64 raw) {
    return decode_le<uint64_t>(raw.raw_bytes);
}

raw_08 wtreader_encode_raw08(uint8_t value) {
    raw_08 raw;
    raw.raw_bytes[0] = value;
    return raw;
}

raw_16 wtreader_encode_raw16(uint16_t value) {
    raw_16 raw;
    encode_le(value, raw.raw_bytes);
    return raw;
}

raw_32 wtreader_encode_raw32(uint32_t value) {
    raw_32 raw;
    encode_le(value, raw.raw_bytes);
    return raw;
}

raw_64 wtreader_encode_raw64(uint64_t value) {
    raw_64 raw;
    encode_le(value, raw.raw_bytes);
    return raw;
}
