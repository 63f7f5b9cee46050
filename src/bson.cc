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
#include "bson.h"
#include "bitfield.h"
#include "exception.h"

#include <fmt/format.h>
#include <cstring>

namespace wtreader {

namespace {

/// A bounds checked reader over one (possibly nested) document
class BsonReader {
public:
    BsonReader(std::string_view data, size_t base)
        : data(data), base(base) {
    }

    [[noreturn]] void corrupt(const std::string& what) const {
        throw Exception(WTREADER_ERROR_CORRUPT,
                        fmt::format("Invalid BSON at offset {}: {}",
                                    base + pos,
                                    what));
    }

    size_t remaining() const {
        return data.size() - pos;
    }

    size_t offset() const {
        return base + pos;
    }

    std::string_view bytes(size_t len) {
        if (len > remaining()) {
            corrupt(fmt::format("{} bytes needed, {} left", len, remaining()));
        }
        auto ret = data.substr(pos, len);
        pos += len;
        return ret;
    }

    uint8_t u8() {
        return uint8_t(bytes(1)[0]);
    }

    int32_t i32() {
        raw_32 raw;
        std::memcpy(&raw, bytes(sizeof(raw)).data(), sizeof(raw));
        return int32_t(decode_raw32(raw));
    }

    uint64_t u64() {
        raw_64 raw;
        std::memcpy(&raw, bytes(sizeof(raw)).data(), sizeof(raw));
        return decode_raw64(raw);
    }

    std::string cstring() {
        const auto nul = data.find('\0', pos);
        if (nul == std::string_view::npos) {
            corrupt("unterminated name");
        }
        std::string ret{data.substr(pos, nul - pos)};
        pos = nul + 1;
        return ret;
    }

    /// int32 length (including the NUL), bytes, NUL
    std::string string() {
        const auto len = i32();
        if (len < 1) {
            corrupt(fmt::format("invalid string length {}", len));
        }
        const auto value = bytes(size_t(len));
        if (value.back() != '\0') {
            corrupt("string is not NUL terminated");
        }
        return std::string{value.substr(0, value.size() - 1)};
    }

private:
    std::string_view data;
    // Offset of data within the top level document
    size_t base;
    size_t pos{0};
};

} // namespace

static Document decode_document(std::string_view data, size_t base, int depth);

static Value decode_element(BsonReader& reader,
                            uint8_t type,
                            const std::string& name,
                            int depth) {
    switch (BsonType(type)) {
    case BsonType::Double: {
        const auto bits = reader.u64();
        double value;
        std::memcpy(&value, &bits, sizeof(value));
        return {value};
    }
    case BsonType::String:
        return {reader.string()};
    case BsonType::Document:
    case BsonType::Array: {
        const auto offset = reader.offset();
        const auto len = reader.i32();
        if (len < BSON_MIN_DOCUMENT_SIZE ||
            size_t(len) - sizeof(int32_t) > reader.remaining()) {
            reader.corrupt(fmt::format(
                    "invalid length {} of embedded field \"{}\"", len, name));
        }
        const auto body = reader.bytes(size_t(len) - sizeof(int32_t));
        auto document = decode_document(body, offset + sizeof(int32_t), depth + 1);
        if (BsonType(type) == BsonType::Document) {
            return {std::move(document)};
        }
        Array array;
        array.reserve(document.fields.size());
        for (auto& field : document.fields) {
            array.push_back(std::move(field.value));
        }
        return {std::move(array)};
    }
    case BsonType::Binary: {
        const auto len = reader.i32();
        if (len < 0) {
            reader.corrupt(fmt::format("invalid binary length {}", len));
        }
        Binary binary;
        binary.subtype = reader.u8();
        binary.data = std::string{reader.bytes(size_t(len))};
        return {std::move(binary)};
    }
    case BsonType::Undefined:
        return {Undefined{}};
    case BsonType::ObjectId: {
        ObjectId oid;
        std::memcpy(oid.bytes.data(), reader.bytes(oid.bytes.size()).data(),
                    oid.bytes.size());
        return {oid};
    }
    case BsonType::Boolean: {
        const auto value = reader.u8();
        if (value > 1) {
            reader.corrupt(fmt::format("invalid boolean {}", value));
        }
        return {value == 1};
    }
    case BsonType::DateTime:
        return {DateTime{int64_t(reader.u64())}};
    case BsonType::Null:
        return {Null{}};
    case BsonType::Regex: {
        Regex regex;
        regex.pattern = reader.cstring();
        regex.options = reader.cstring();
        return {std::move(regex)};
    }
    case BsonType::JavaScript:
        return {JavaScript{reader.string()}};
    case BsonType::Symbol:
        return {Symbol{reader.string()}};
    case BsonType::Int32:
        return {reader.i32()};
    case BsonType::Timestamp: {
        const auto value = reader.u64();
        return {Timestamp{uint32_t(value), uint32_t(value >> 32)}};
    }
    case BsonType::Int64:
        return {int64_t(reader.u64())};
    case BsonType::Decimal128: {
        Decimal128 decimal;
        std::memcpy(decimal.bytes.data(),
                    reader.bytes(decimal.bytes.size()).data(),
                    decimal.bytes.size());
        return {decimal};
    }
    case BsonType::MinKey:
        return {MinKey{}};
    case BsonType::MaxKey:
        return {MaxKey{}};
    }

    throw Exception(WTREADER_ERROR_UNKNOWN_FIELD_TYPE,
                    fmt::format("Unknown BSON type {:#04x} of field \"{}\" "
                                "at offset {}",
                                type,
                                name,
                                reader.offset()));
}

/// Decode the element list of a document (the bytes after its length)
static Document decode_document(std::string_view data, size_t base, int depth) {
    BsonReader reader(data, base);
    if (depth > BSON_MAX_DEPTH) {
        reader.corrupt(fmt::format("nested deeper than {} levels",
                                   BSON_MAX_DEPTH));
    }

    Document document;
    while (true) {
        const auto type = reader.u8();
        if (type == 0) {
            break;
        }
        auto name = reader.cstring();
        auto value = decode_element(reader, type, name, depth);
        document.fields.push_back({std::move(name), std::move(value)});
    }
    if (reader.remaining() != 0) {
        reader.corrupt(fmt::format("{} bytes after the end of the document",
                                   reader.remaining()));
    }
    return document;
}

Document decode_bson(std::string_view bytes) {
    if (bytes.size() < BSON_MIN_DOCUMENT_SIZE) {
        throw Exception(WTREADER_ERROR_CORRUPT,
                        fmt::format("BSON document of {} bytes is too short",
                                    bytes.size()));
    }
    raw_32 raw;
    std::memcpy(&raw, bytes.data(), sizeof(raw));
    const auto length = decode_raw32(raw);
    if (length != bytes.size()) {
        throw Exception(WTREADER_ERROR_CORRUPT,
                        fmt::format("BSON document length {} doesn't match "
                                    "the value size {}",
                                    length,
                                    bytes.size()));
    }
    return decode_document(bytes.substr(sizeof(raw)), sizeof(raw), 0);
}

} // namespace wtreader
