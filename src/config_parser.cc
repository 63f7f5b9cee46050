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
#include "config_parser.h"
#include "exception.h"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <fmt/format.h>
#include <charconv>

namespace wtreader {

namespace {

class Tokenizer {
public:
    explicit Tokenizer(std::string_view text) : text(text) {
    }

    bool done() {
        skipSpace();
        return pos == text.size();
    }

    /// Read a key or value up to the next separator at nesting level 0
    std::string next(bool isKey) {
        skipSpace();
        if (pos < text.size() && text[pos] == '"') {
            return quoted();
        }
        if (!isKey && pos < text.size() &&
            (text[pos] == '(' || text[pos] == '[')) {
            return nested();
        }

        const auto start = pos;
        while (pos < text.size()) {
            const char c = text[pos];
            if (c == ',' || (isKey && (c == '=' || c == ':'))) {
                break;
            }
            if (c == '(' || c == ')' || c == '[' || c == ']' || c == '"') {
                fail(fmt::format("unexpected '{}'", c));
            }
            ++pos;
        }
        std::string ret{text.substr(start, pos - start)};
        boost::algorithm::trim(ret);
        return ret;
    }

    /// Consume the separator following a key
    bool assignment() {
        skipSpace();
        if (pos < text.size() && (text[pos] == '=' || text[pos] == ':')) {
            ++pos;
            return true;
        }
        return false;
    }

    /// Consume the separator between items
    void separator() {
        skipSpace();
        if (pos == text.size()) {
            return;
        }
        if (text[pos] != ',') {
            fail(fmt::format("expected ',' but found '{}'", text[pos]));
        }
        ++pos;
    }

private:
    [[noreturn]] void fail(const std::string& message) const {
        throw Exception(
                WTREADER_ERROR_CORRUPT,
                fmt::format("Invalid configuration string at offset {}: {}",
                            pos,
                            message));
    }

    void skipSpace() {
        while (pos < text.size() &&
               (text[pos] == ' ' || text[pos] == '\t' || text[pos] == '\n' ||
                text[pos] == '\r')) {
            ++pos;
        }
    }

    std::string quoted() {
        ++pos;
        std::string ret;
        while (pos < text.size()) {
            const char c = text[pos++];
            if (c == '"') {
                return ret;
            }
            if (c == '\\') {
                if (pos == text.size()) {
                    break;
                }
                const char escaped = text[pos++];
                switch (escaped) {
                case 'n':
                    ret.push_back('\n');
                    break;
                case 't':
                    ret.push_back('\t');
                    break;
                default:
                    ret.push_back(escaped);
                }
                continue;
            }
            ret.push_back(c);
        }
        fail("unterminated string");
    }

    std::string nested() {
        std::vector<char> closers;
        const auto start = pos;
        bool inString = false;
        while (pos < text.size()) {
            const char c = text[pos++];
            if (inString) {
                if (c == '\\') {
                    ++pos;
                } else if (c == '"') {
                    inString = false;
                }
                continue;
            }
            switch (c) {
            case '"':
                inString = true;
                break;
            case '(':
                closers.push_back(')');
                break;
            case '[':
                closers.push_back(']');
                break;
            case ')':
            case ']':
                if (closers.empty() || closers.back() != c) {
                    fail(fmt::format("unbalanced '{}'", c));
                }
                closers.pop_back();
                if (closers.empty()) {
                    return std::string{
                            text.substr(start + 1, pos - start - 2)};
                }
                break;
            }
        }
        fail("unbalanced brackets");
    }

    std::string_view text;
    size_t pos{0};
};

} // namespace

ConfigMap ConfigMap::from_string(std::string_view text) {
    ConfigMap ret;
    Tokenizer tokenizer(text);
    while (!tokenizer.done()) {
        auto key = tokenizer.next(true);
        if (key.empty()) {
            throw Exception(WTREADER_ERROR_CORRUPT,
                            fmt::format("Invalid configuration string \"{}\": "
                                        "empty key",
                                        text));
        }
        std::string value = "true";
        if (tokenizer.assignment()) {
            value = tokenizer.next(false);
        }
        ret.entries.emplace_back(std::move(key), std::move(value));
        tokenizer.separator();
    }
    return ret;
}

bool ConfigMap::contains(std::string_view key) const {
    return get(key).has_value();
}

std::optional<std::string> ConfigMap::get(std::string_view key) const {
    for (const auto& [k, v] : entries) {
        if (k == key) {
            return v;
        }
    }
    return {};
}

std::string ConfigMap::getString(std::string_view key,
                                 std::string_view defaultValue) const {
    auto value = get(key);
    if (!value) {
        return std::string{defaultValue};
    }
    return *value;
}

static uint64_t parse_number(std::string_view value) {
    uint64_t ret = 0;
    const auto* end = value.data() + value.size();
    const auto [ptr, ec] = std::from_chars(value.data(), end, ret);
    if (value.empty() || ec != std::errc() || ptr != end) {
        throw Exception(
                WTREADER_ERROR_CORRUPT,
                fmt::format("Invalid number \"{}\" in configuration", value));
    }
    return ret;
}

std::optional<uint64_t> ConfigMap::getUint64(std::string_view key) const {
    auto value = get(key);
    if (!value) {
        return {};
    }
    return parse_number(*value);
}

uint64_t parse_size(std::string_view value) {
    size_t digits = 0;
    while (digits < value.size() && value[digits] >= '0' &&
           value[digits] <= '9') {
        ++digits;
    }
    const auto number = parse_number(value.substr(0, digits));
    const auto suffix =
            boost::algorithm::to_upper_copy(std::string{value.substr(digits)});

    int shift;
    if (suffix.empty() || suffix == "B") {
        shift = 0;
    } else if (suffix == "K" || suffix == "KB") {
        shift = 10;
    } else if (suffix == "M" || suffix == "MB") {
        shift = 20;
    } else if (suffix == "G" || suffix == "GB") {
        shift = 30;
    } else if (suffix == "T" || suffix == "TB") {
        shift = 40;
    } else {
        throw Exception(
                WTREADER_ERROR_CORRUPT,
                fmt::format("Invalid size \"{}\" in configuration", value));
    }

    if (number > (UINT64_MAX >> shift)) {
        throw Exception(
                WTREADER_ERROR_CORRUPT,
                fmt::format("Size \"{}\" in configuration is too big", value));
    }
    return number << shift;
}

std::optional<uint64_t> ConfigMap::getSize(std::string_view key) const {
    auto value = get(key);
    if (!value) {
        return {};
    }
    return parse_size(*value);
}

ConfigMap ConfigMap::getMap(std::string_view key) const {
    auto value = get(key);
    if (!value) {
        return {};
    }
    return from_string(*value);
}

} // namespace wtreader
