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

#include <libwtreader/visibility.h>
#include <nlohmann/json_fwd.hpp>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace wtreader {

/// The BSON element type tags understood by the record codec
enum class BsonType : uint8_t {
    Double = 0x01,
    String = 0x02,
    Document = 0x03,
    Array = 0x04,
    Binary = 0x05,
    Undefined = 0x06,
    ObjectId = 0x07,
    Boolean = 0x08,
    DateTime = 0x09,
    Null = 0x0a,
    Regex = 0x0b,
    JavaScript = 0x0d,
    Symbol = 0x0e,
    Int32 = 0x10,
    Timestamp = 0x11,
    Int64 = 0x12,
    Decimal128 = 0x13,
    MinKey = 0xff,
    MaxKey = 0x7f
};

LIBWTREADER_API
std::string to_string(BsonType type);

struct Null {
    bool operator==(const Null&) const = default;
};

struct Undefined {
    bool operator==(const Undefined&) const = default;
};

struct MinKey {
    bool operator==(const MinKey&) const = default;
};

struct MaxKey {
    bool operator==(const MaxKey&) const = default;
};

struct Binary {
    uint8_t subtype{0};
    std::string data;
    bool operator==(const Binary&) const = default;
};

struct ObjectId {
    std::array<uint8_t, 12> bytes{};
    /// @return the 24 character lower case hex representation
    std::string to_hex() const;
    bool operator==(const ObjectId&) const = default;
};

/// Milliseconds since the Unix epoch
struct DateTime {
    int64_t millis{0};
    bool operator==(const DateTime&) const = default;
};

/// MongoDB internal timestamp (the low word is the increment)
struct Timestamp {
    uint32_t increment{0};
    uint32_t seconds{0};
    bool operator==(const Timestamp&) const = default;
};

/// IEEE 754-2008 decimal128, kept as the raw little endian bytes
struct Decimal128 {
    std::array<uint8_t, 16> bytes{};
    bool operator==(const Decimal128&) const = default;
};

struct Regex {
    std::string pattern;
    std::string options;
    bool operator==(const Regex&) const = default;
};

struct JavaScript {
    std::string code;
    bool operator==(const JavaScript&) const = default;
};

struct Symbol {
    std::string name;
    bool operator==(const Symbol&) const = default;
};

struct Field;
struct Value;

/**
 * An ordered set of fields. Field order is preserved exactly as stored;
 * duplicate names are legal in BSON and are kept.
 */
struct Document {
    std::vector<Field> fields;

    /// @return the first field with the given name, or nullptr
    const Value* find(std::string_view name) const;
    size_t size() const;
    bool empty() const;
    bool operator==(const Document& other) const;
};

using Array = std::vector<Value>;

struct Value {
    using Variant = std::variant<Null,
                                 bool,
                                 int32_t,
                                 int64_t,
                                 double,
                                 std::string,
                                 Binary,
                                 ObjectId,
                                 DateTime,
                                 Timestamp,
                                 Decimal128,
                                 Regex,
                                 JavaScript,
                                 Symbol,
                                 Undefined,
                                 MinKey,
                                 MaxKey,
                                 Document,
                                 Array>;

    Variant data;

    /// The BSON type tag this value would be encoded with
    BsonType type() const;

    template <typename T>
    const T& get() const {
        return std::get<T>(data);
    }

    template <typename T>
    bool holds() const {
        return std::holds_alternative<T>(data);
    }

    bool operator==(const Value& other) const;
};

struct Field {
    std::string name;
    Value value;
    bool operator==(const Field& other) const;
};

/**
 * Render the document as relaxed MongoDB extended JSON: numbers, strings
 * and booleans map directly, other types use the "$oid", "$date",
 * "$binary", "$numberDecimal" ... wrappers. Field order is preserved.
 */
LIBWTREADER_API
nlohmann::ordered_json to_json(const Document& document);

LIBWTREADER_API
nlohmann::ordered_json to_json(const Value& value);

} // namespace wtreader
