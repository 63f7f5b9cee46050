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
#include <libwtreader/document.h>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <platform/base64.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <optional>

namespace wtreader {

std::string to_string(BsonType type) {
    switch (type) {
    case BsonType::Double:
        return "double";
    case BsonType::String:
        return "string";
    case BsonType::Document:
        return "object";
    case BsonType::Array:
        return "array";
    case BsonType::Binary:
        return "binData";
    case BsonType::Undefined:
        return "undefined";
    case BsonType::ObjectId:
        return "objectId";
    case BsonType::Boolean:
        return "bool";
    case BsonType::DateTime:
        return "date";
    case BsonType::Null:
        return "null";
    case BsonType::Regex:
        return "regex";
    case BsonType::JavaScript:
        return "javascript";
    case BsonType::Symbol:
        return "symbol";
    case BsonType::Int32:
        return "int";
    case BsonType::Timestamp:
        return "timestamp";
    case BsonType::Int64:
        return "long";
    case BsonType::Decimal128:
        return "decimal";
    case BsonType::MinKey:
        return "minKey";
    case BsonType::MaxKey:
        return "maxKey";
    }
    return fmt::format("unknown({:#x})", uint8_t(type));
}

std::string ObjectId::to_hex() const {
    std::string ret;
    ret.reserve(bytes.size() * 2);
    for (const auto byte : bytes) {
        ret.append(fmt::format("{:02x}", byte));
    }
    return ret;
}

const Value* Document::find(std::string_view name) const {
    auto it = std::find_if(fields.begin(), fields.end(), [name](const auto& f) {
        return f.name == name;
    });
    if (it == fields.end()) {
        return nullptr;
    }
    return &it->value;
}

size_t Document::size() const {
    return fields.size();
}

bool Document::empty() const {
    return fields.empty();
}

bool Document::operator==(const Document& other) const {
    return fields == other.fields;
}

bool Field::operator==(const Field& other) const {
    return name == other.name && value == other.value;
}

bool Value::operator==(const Value& other) const {
    return data == other.data;
}

BsonType Value::type() const {
    struct Visitor {
        BsonType operator()(const Null&) const {
            return BsonType::Null;
        }
        BsonType operator()(bool) const {
            return BsonType::Boolean;
        }
        BsonType operator()(int32_t) const {
            return BsonType::Int32;
        }
        BsonType operator()(int64_t) const {
            return BsonType::Int64;
        }
        BsonType operator()(double) const {
            return BsonType::Double;
        }
        BsonType operator()(const std::string&) const {
            return BsonType::String;
        }
        BsonType operator()(const Binary&) const {
            return BsonType::Binary;
        }
        BsonType operator()(const ObjectId&) const {
            return BsonType::ObjectId;
        }
        BsonType operator()(const DateTime&) const {
            return BsonType::DateTime;
        }
        BsonType operator()(const Timestamp&) const {
            return BsonType::Timestamp;
        }
        BsonType operator()(const Decimal128&) const {
            return BsonType::Decimal128;
        }
        BsonType operator()(const Regex&) const {
            return BsonType::Regex;
        }
        BsonType operator()(const JavaScript&) const {
            return BsonType::JavaScript;
        }
        BsonType operator()(const Symbol&) const {
            return BsonType::Symbol;
        }
        BsonType operator()(const Undefined&) const {
            return BsonType::Undefined;
        }
        BsonType operator()(const MinKey&) const {
            return BsonType::MinKey;
        }
        BsonType operator()(const MaxKey&) const {
            return BsonType::MaxKey;
        }
        BsonType operator()(const Document&) const {
            return BsonType::Document;
        }
        BsonType operator()(const Array&) const {
            return BsonType::Array;
        }
    };
    return std::visit(Visitor{}, data);
}

/// ISO-8601 for dates between the years 1970 and 9999, otherwise null
static std::optional<std::string> iso_date(int64_t millis) {
    using namespace std::chrono;
    // 9999-12-31T23:59:59.999Z
    if (millis < 0 || millis > 253402300799999LL) {
        return {};
    }
    const sys_time<milliseconds> tp{milliseconds{millis}};
    const auto day = floor<days>(tp);
    const year_month_day ymd{day};
    const hh_mm_ss<milliseconds> time{tp - day};
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                       int(ymd.year()),
                       unsigned(ymd.month()),
                       unsigned(ymd.day()),
                       time.hours().count(),
                       time.minutes().count(),
                       time.seconds().count(),
                       time.subseconds().count());
}

/// Divide the 128 bit number {high, low} by 10, returning the remainder
static int divide_by_10(uint64_t& high, uint64_t& low) {
    uint32_t words[] = {uint32_t(high >> 32),
                        uint32_t(high),
                        uint32_t(low >> 32),
                        uint32_t(low)};
    uint64_t remainder = 0;
    for (auto& word : words) {
        const uint64_t current = (remainder << 32) | word;
        word = uint32_t(current / 10);
        remainder = current % 10;
    }
    high = (uint64_t(words[0]) << 32) | words[1];
    low = (uint64_t(words[2]) << 32) | words[3];
    return int(remainder);
}

/// The decimal string of a BID encoded decimal128
static std::string decimal128_to_string(const Decimal128& value) {
    uint64_t low;
    uint64_t high;
    std::memcpy(&low, value.bytes.data(), sizeof(low));
    std::memcpy(&high, value.bytes.data() + sizeof(low), sizeof(high));

    const bool negative = (high >> 63) != 0;
    const auto combination = (high >> 58) & 0x1f;
    if (combination == 0x1f) {
        return "NaN";
    }
    if (combination == 0x1e) {
        return negative ? "-Infinity" : "Infinity";
    }

    int exponent;
    // The 113 bit significand
    uint64_t sigHigh = 0;
    uint64_t sigLow = 0;
    if (((high >> 61) & 3) == 3) {
        // Non-canonical (the significand would exceed 34 digits)
        exponent = int((high >> 47) & 0x3fff) - 6176;
    } else {
        exponent = int((high >> 49) & 0x3fff) - 6176;
        sigHigh = high & 0x1ffffffffffffULL;
        sigLow = low;
        // 10^34 - 1
        if (sigHigh > 0x1ed09bead87c0ULL ||
            (sigHigh == 0x1ed09bead87c0ULL && sigLow > 0x378d8e63ffffffffULL)) {
            sigHigh = 0;
            sigLow = 0;
        }
    }

    std::string digits;
    do {
        digits.push_back(char('0' + divide_by_10(sigHigh, sigLow)));
    } while (sigHigh != 0 || sigLow != 0);
    std::reverse(digits.begin(), digits.end());

    std::string ret = negative ? "-" : "";
    const auto adjusted = exponent + int(digits.size()) - 1;
    if (exponent <= 0 && adjusted >= -6) {
        if (exponent == 0) {
            ret.append(digits);
        } else {
            const auto point = int(digits.size()) + exponent;
            if (point > 0) {
                ret.append(digits.substr(0, size_t(point)));
                ret.push_back('.');
                ret.append(digits.substr(size_t(point)));
            } else {
                ret.append("0.");
                ret.append(size_t(-point), '0');
                ret.append(digits);
            }
        }
        return ret;
    }

    ret.push_back(digits[0]);
    if (digits.size() > 1) {
        ret.push_back('.');
        ret.append(digits.substr(1));
    }
    ret.append(fmt::format("E{}{}", adjusted < 0 ? "" : "+", adjusted));
    return ret;
}

nlohmann::ordered_json to_json(const Value& value) {
    using nlohmann::ordered_json;
    struct Visitor {
        ordered_json operator()(const Null&) const {
            return nullptr;
        }
        ordered_json operator()(bool v) const {
            return v;
        }
        ordered_json operator()(int32_t v) const {
            return v;
        }
        ordered_json operator()(int64_t v) const {
            return v;
        }
        ordered_json operator()(double v) const {
            if (std::isnan(v)) {
                return {{"$numberDouble", "NaN"}};
            }
            if (std::isinf(v)) {
                return {{"$numberDouble", v < 0 ? "-Infinity" : "Infinity"}};
            }
            return v;
        }
        ordered_json operator()(const std::string& v) const {
            return v;
        }
        ordered_json operator()(const Binary& v) const {
            return {{"$binary",
                     {{"base64", cb::base64::encode(v.data)},
                      {"subType", fmt::format("{:02x}", v.subtype)}}}};
        }
        ordered_json operator()(const ObjectId& v) const {
            return {{"$oid", v.to_hex()}};
        }
        ordered_json operator()(const DateTime& v) const {
            auto iso = iso_date(v.millis);
            if (iso) {
                return {{"$date", *iso}};
            }
            return {{"$date", {{"$numberLong", std::to_string(v.millis)}}}};
        }
        ordered_json operator()(const Timestamp& v) const {
            return {{"$timestamp", {{"t", v.seconds}, {"i", v.increment}}}};
        }
        ordered_json operator()(const Decimal128& v) const {
            return {{"$numberDecimal", decimal128_to_string(v)}};
        }
        ordered_json operator()(const Regex& v) const {
            return {{"$regularExpression",
                     {{"pattern", v.pattern}, {"options", v.options}}}};
        }
        ordered_json operator()(const JavaScript& v) const {
            return {{"$code", v.code}};
        }
        ordered_json operator()(const Symbol& v) const {
            return {{"$symbol", v.name}};
        }
        ordered_json operator()(const Undefined&) const {
            return {{"$undefined", true}};
        }
        ordered_json operator()(const MinKey&) const {
            return {{"$minKey", 1}};
        }
        ordered_json operator()(const MaxKey&) const {
            return {{"$maxKey", 1}};
        }
        ordered_json operator()(const Document& v) const {
            return to_json(v);
        }
        ordered_json operator()(const Array& v) const {
            auto ret = ordered_json::array();
            for (const auto& element : v) {
                ret.push_back(to_json(element));
            }
            return ret;
        }
    };
    return std::visit(Visitor{}, value.data);
}

nlohmann::ordered_json to_json(const Document& document) {
    auto ret = nlohmann::ordered_json::object();
    for (const auto& field : document.fields) {
        // Duplicate names are legal in BSON; the first one wins here
        if (!ret.contains(field.name)) {
            ret[field.name] = to_json(field.value);
        }
    }
    return ret;
}

} // namespace wtreader
