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
#include "struct_pack.h"
#include "exception.h"
#include "intpack.h"

#include <fmt/format.h>
#include <cstring>

namespace wtreader {

namespace {

struct FormatItem {
    char type;
    uint32_t count;
    bool hasCount;
};

} // namespace

/// Split a format into items, expanding repeat counts of value types
static std::vector<FormatItem> parse_format(std::string_view format) {
    std::vector<FormatItem> items;
    size_t pos = 0;
    if (!format.empty() && std::strchr("@<>!=", format.front()) != nullptr) {
        ++pos;
    }
    while (pos < format.size()) {
        uint64_t count = 0;
        bool hasCount = false;
        while (pos < format.size() && format[pos] >= '0' &&
               format[pos] <= '9') {
            count = count * 10 + uint64_t(format[pos] - '0');
            hasCount = true;
            if (count > UINT32_MAX) {
                throw Exception(WTREADER_ERROR_CORRUPT,
                                fmt::format("Invalid count in format \"{}\"",
                                            format));
            }
            ++pos;
        }
        if (pos == format.size()) {
            throw Exception(WTREADER_ERROR_CORRUPT,
                            fmt::format("Format \"{}\" ends with a count",
                                        format));
        }
        const char type = format[pos++];
        switch (type) {
        case 'x':
        case 's':
        case 'S':
        case 'u':
        case 't':
            // The count is a size, not a repeat count
            items.push_back({type, uint32_t(count), hasCount});
            break;
        case 'b':
        case 'B':
        case 'h':
        case 'H':
        case 'i':
        case 'I':
        case 'l':
        case 'L':
        case 'q':
        case 'Q':
        case 'r':
            for (uint64_t ii = 0; ii < (hasCount ? count : 1); ++ii) {
                items.push_back({type, 1, false});
            }
            break;
        default:
            throw Exception(WTREADER_ERROR_NOT_SUPPORTED,
                            fmt::format("Unsupported format character '{}' "
                                        "in \"{}\"",
                                        type,
                                        format));
        }
    }
    return items;
}

std::string column_types(std::string_view format) {
    std::string ret;
    for (const auto& item : parse_format(format)) {
        if (item.type != 'x') {
            ret.push_back(item.type);
        }
    }
    return ret;
}

size_t count_columns(std::string_view format) {
    return column_types(format).size();
}

std::vector<PackedValue> unpack_struct(std::string_view data,
                                       std::string_view format) {
    const auto items = parse_format(format);
    const auto* p = reinterpret_cast<const uint8_t*>(data.data());
    const auto* end = p + data.size();

    auto take = [&p, end, format](uint64_t len) {
        if (len > uint64_t(end - p)) {
            throw Exception(WTREADER_ERROR_CORRUPT,
                            fmt::format("Data too short for format \"{}\"",
                                        format));
        }
        std::string ret(reinterpret_cast<const char*>(p), size_t(len));
        p += len;
        return ret;
    };

    std::vector<PackedValue> values;
    for (size_t ii = 0; ii < items.size(); ++ii) {
        const auto& item = items[ii];
        const bool last = ii + 1 == items.size();
        switch (item.type) {
        case 'x':
            (void)take(item.hasCount ? item.count : 1);
            break;
        case 'b': {
            const auto byte = uint8_t(take(1)[0]);
            values.emplace_back(int64_t(int8_t(byte ^ 0x80)));
            break;
        }
        case 'B':
        case 't':
            values.emplace_back(uint64_t(uint8_t(take(1)[0])));
            break;
        case 'h':
        case 'i':
        case 'l':
        case 'q':
            values.emplace_back(vunpack_int(p, end));
            break;
        case 'H':
        case 'I':
        case 'L':
        case 'Q':
        case 'r':
            values.emplace_back(vunpack_uint(p, end));
            break;
        case 's':
            values.emplace_back(take(item.hasCount ? item.count : 1));
            break;
        case 'S':
            if (item.hasCount) {
                auto value = take(item.count);
                const auto nul = value.find('\0');
                if (nul != std::string::npos) {
                    value.resize(nul);
                }
                values.emplace_back(std::move(value));
            } else {
                const auto* nul =
                        p == end ? nullptr
                                 : static_cast<const uint8_t*>(std::memchr(
                                           p, 0, size_t(end - p)));
                if (nul == nullptr) {
                    throw Exception(WTREADER_ERROR_CORRUPT,
                                    fmt::format("Unterminated string for "
                                                "format \"{}\"",
                                                format));
                }
                values.emplace_back(take(uint64_t(nul - p)));
                ++p;
            }
            break;
        case 'u':
            if (item.hasCount) {
                values.emplace_back(take(item.count));
            } else if (last) {
                values.emplace_back(take(uint64_t(end - p)));
            } else {
                values.emplace_back(take(vunpack_uint(p, end)));
            }
            break;
        }
    }

    if (p != end) {
        throw Exception(WTREADER_ERROR_CORRUPT,
                        fmt::format("{} bytes left after unpacking format "
                                    "\"{}\"",
                                    end - p,
                                    format));
    }
    return values;
}

std::string pack_record_id(int64_t recordId) {
    std::string ret;
    vpack_int(ret, recordId);
    return ret;
}

} // namespace wtreader
