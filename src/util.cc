/*
 *     Copyright 2024-Present Couchbase, Inc.
 *
 *   Use of this software is governed by the Business Source License included
 *   in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
 *   in that file, in accordance with the Business Source License, use of this
 *   software will be governed by the Apache License, Version 2.0, included in
 *   the file licenses/APL2.txt.
 */
#include "util.h"
#include "exception.h"

#include <fmt/format.h>
#include <cstdarg>
#include <cstdio>
#include <mutex>

thread_local char internal_error_string[MAX_ERR_STR_LEN];

static std::mutex onInternalErrorMutex;
static std::function<void(std::string_view)> onInternalError;

void wtreader::setOnInternalError(
        std::function<void(std::string_view)> handler) {
    std::lock_guard<std::mutex> guard(onInternalErrorMutex);
    onInternalError = std::move(handler);
}

std::string wtreader::getLastInternalError() {
    return internal_error_string;
}

void log_last_internal_error(const char* format, ...) {
    va_list args;
    va_start(args, format);
    vsnprintf(internal_error_string, MAX_ERR_STR_LEN, format, args);
    va_end(args);
    std::lock_guard<std::mutex> guard(onInternalErrorMutex);
    if (onInternalError) {
        onInternalError(internal_error_string);
    }
}

namespace wtreader {

std::string make_path(const std::string& dir, std::string_view name) {
    if (dir.empty()) {
        return std::string{name};
    }
    if (dir.back() == '/') {
        return dir + std::string{name};
    }
    return fmt::format("{}/{}", dir, name);
}

std::string to_hex_string(std::string_view data) {
    static const char digits[] = "0123456789abcdef";
    std::string ret;
    ret.reserve(data.size() * 2);
    for (const auto c : data) {
        ret.push_back(digits[(uint8_t(c) >> 4) & 0xf]);
        ret.push_back(digits[uint8_t(c) & 0xf]);
    }
    return ret;
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

std::string from_hex_string(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        throw Exception(WTREADER_ERROR_CORRUPT,
                        fmt::format("Odd length hex string: \"{}\"", hex));
    }
    std::string ret;
    ret.reserve(hex.size() / 2);
    for (size_t ii = 0; ii < hex.size(); ii += 2) {
        const auto hi = hex_value(hex[ii]);
        const auto lo = hex_value(hex[ii + 1]);
        if (hi < 0 || lo < 0) {
            throw Exception(WTREADER_ERROR_CORRUPT,
                            fmt::format("Invalid hex string: \"{}\"", hex));
        }
        ret.push_back(char((hi << 4) | lo));
    }
    return ret;
}

} // namespace wtreader
