/*
 *     Copyright 2024-Present Couchbase, Inc.
 *
 *   Use of this software is governed by the Business Source License included
 *   in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
 *   in that file, in accordance with the Business Source License, use of this
 *   software will be governed by the Apache License, Version 2.0, included in
 *   the file licenses/APL2.txt.
 */
#include "intpack.h"
#include "exception.h"

#include <fmt/format.h>

namespace wtreader {

[[noreturn]] static void throw_malformed(const char* what, uint8_t marker) {
    throw Exception(
            WTREADER_ERROR_MALFORMED_VARINT,
            fmt::format("{} (marker byte:{:#04x})", what, int(marker)));
}

static uint8_t next_byte(const uint8_t*& p, const uint8_t* end, uint8_t marker) {
    if (p >= end) {
        throw_malformed("Packed integer is truncated", marker);
    }
    return *p++;
}

/// Read the big endian tail of a positive multi-byte value
static uint64_t unpack_posint(const uint8_t*& p, const uint8_t* end) {
    const auto marker = *p++;
    const int len = marker & 0xf;
    if (len > int(sizeof(uint64_t))) {
        throw_malformed("Packed integer is longer than 8 bytes", marker);
    }
    uint64_t x = 0;
    for (int ii = 0; ii < len; ++ii) {
        x = (x << 8) | next_byte(p, end, marker);
    }
    return x;
}

/// Read the big endian tail of a negative multi-byte value
static uint64_t unpack_negint(const uint8_t*& p, const uint8_t* end) {
    const auto marker = *p++;
    const int lz = marker & 0xf;
    if (lz > int(sizeof(uint64_t))) {
        throw_malformed("Packed integer is longer than 8 bytes", marker);
    }
    uint64_t x = UINT64_MAX;
    for (int len = int(sizeof(uint64_t)) - lz; len != 0; --len) {
        x = (x << 8) | next_byte(p, end, marker);
    }
    return x;
}

uint64_t vunpack_uint(const uint8_t*& p, const uint8_t* end) {
    if (p >= end) {
        throw Exception(WTREADER_ERROR_MALFORMED_VARINT,
                        "Packed integer is truncated (no bytes left)");
    }
    const auto marker = *p;
    switch (marker & 0xf0) {
    case POS_1BYTE_MARKER:
    case POS_1BYTE_MARKER | 0x10:
    case POS_1BYTE_MARKER | 0x20:
    case POS_1BYTE_MARKER | 0x30:
        ++p;
        return marker & 0x3f;
    case POS_2BYTE_MARKER:
    case POS_2BYTE_MARKER | 0x10: {
        ++p;
        uint64_t x = uint64_t(marker & 0x1f) << 8;
        x |= next_byte(p, end, marker);
        return x + POS_1BYTE_MAX + 1;
    }
    case POS_MULTI_MARKER:
        return unpack_posint(p, end) + POS_2BYTE_MAX + 1;
    }
    throw_malformed("Invalid unsigned packed integer marker", marker);
}

int64_t vunpack_int(const uint8_t*& p, const uint8_t* end) {
    if (p >= end) {
        throw Exception(WTREADER_ERROR_MALFORMED_VARINT,
                        "Packed integer is truncated (no bytes left)");
    }
    const auto marker = *p;
    switch (marker & 0xf0) {
    case NEG_MULTI_MARKER:
        return int64_t(unpack_negint(p, end));
    case NEG_2BYTE_MARKER:
    case NEG_2BYTE_MARKER | 0x10: {
        ++p;
        int64_t x = int64_t(marker & 0x1f) << 8;
        x |= next_byte(p, end, marker);
        return x + NEG_2BYTE_MIN;
    }
    case NEG_1BYTE_MARKER:
    case NEG_1BYTE_MARKER | 0x10:
    case NEG_1BYTE_MARKER | 0x20:
    case NEG_1BYTE_MARKER | 0x30:
        ++p;
        return int64_t(marker & 0x3f) + NEG_1BYTE_MIN;
    }
    const auto x = vunpack_uint(p, end);
    if (x > uint64_t(INT64_MAX)) {
        throw_malformed("Packed signed integer overflows", marker);
    }
    return int64_t(x);
}

/// Number of significant bytes in x (zero for zero)
static int significant_bytes(uint64_t x) {
    int len = 0;
    while (x != 0) {
        ++len;
        x >>= 8;
    }
    return len;
}

static void pack_bytes(std::string& out, uint64_t x, int len) {
    for (int shift = (len - 1) * 8; len != 0; --len, shift -= 8) {
        out.push_back(char(uint8_t(x >> shift)));
    }
}

void vpack_uint(std::string& out, uint64_t x) {
    if (x <= POS_1BYTE_MAX) {
        out.push_back(char(POS_1BYTE_MARKER | uint8_t(x)));
    } else if (x <= POS_2BYTE_MAX) {
        x -= POS_1BYTE_MAX + 1;
        out.push_back(char(POS_2BYTE_MARKER | uint8_t((x >> 8) & 0x1f)));
        out.push_back(char(uint8_t(x & 0xff)));
    } else {
        x -= POS_2BYTE_MAX + 1;
        const auto len = significant_bytes(x);
        out.push_back(char(POS_MULTI_MARKER | uint8_t(len)));
        pack_bytes(out, x, len);
    }
}

void vpack_int(std::string& out, int64_t x) {
    if (x < NEG_2BYTE_MIN) {
        // Store the number of leading 0xff bytes, so that more negative
        // numbers get a smaller marker byte
        const auto len = significant_bytes(~uint64_t(x));
        const auto lz = int(sizeof(uint64_t)) - len;
        out.push_back(char(NEG_MULTI_MARKER | uint8_t(lz)));
        pack_bytes(out, uint64_t(x), len);
    } else if (x < NEG_1BYTE_MIN) {
        x -= NEG_2BYTE_MIN;
        out.push_back(char(NEG_2BYTE_MARKER | uint8_t((x >> 8) & 0x1f)));
        out.push_back(char(uint8_t(x & 0xff)));
    } else if (x < 0) {
        x -= NEG_1BYTE_MIN;
        out.push_back(char(NEG_1BYTE_MARKER | uint8_t(x & 0x3f)));
    } else {
        vpack_uint(out, uint64_t(x));
    }
}

} // namespace wtreader
