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
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace wtreader {

/**
 * A parsed WiredTiger configuration string such as
 *
 *     key_format=q,value_format=u,app_metadata=(formatVersion=1),
 *     checkpoint=(WiredTigerCheckpoint.3=(addr="01c0...",order=3))
 *
 * Items are "key[=value]" separated by commas. Values are bare words,
 * quoted strings, parenthesised nested configurations or bracketed lists;
 * nested values are kept as their (unparsed) inner text and can be parsed
 * with getMap(). A key without a value is stored with the value "true".
 * The first occurrence of a key wins on lookup.
 */
class ConfigMap {
public:
    ConfigMap() = default;

    /**
     * Parse a configuration string
     *
     * @throws Exception(WTREADER_ERROR_CORRUPT) on unbalanced brackets,
     *         unterminated strings or empty keys
     */
    static ConfigMap from_string(std::string_view text);

    bool contains(std::string_view key) const;

    /// @return the value, or an empty optional if the key isn't present
    std::optional<std::string> get(std::string_view key) const;

    std::string getString(std::string_view key,
                          std::string_view defaultValue = {}) const;

    /**
     * @throws Exception(WTREADER_ERROR_CORRUPT) if the value isn't a number
     */
    std::optional<uint64_t> getUint64(std::string_view key) const;

    /**
     * Get a size which may carry a unit suffix (B, KB, MB, GB, TB; the
     * multiplier is 1024)
     *
     * @throws Exception(WTREADER_ERROR_CORRUPT) if the value isn't a size
     */
    std::optional<uint64_t> getSize(std::string_view key) const;

    /// Parse the nested configuration stored under key (empty if missing)
    ConfigMap getMap(std::string_view key) const;

    const std::vector<std::pair<std::string, std::string>>& items() const {
        return entries;
    }

private:
    std::vector<std::pair<std::string, std::string>> entries;
};

/**
 * Parse a size with an optional unit suffix ("4KB", "512", "1MB")
 *
 * @throws Exception(WTREADER_ERROR_CORRUPT)
 */
uint64_t parse_size(std::string_view value);

} // namespace wtreader
