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

#include "internal.h"

#include <string>
#include <string_view>
#include <vector>

namespace wtreader {

/**
 * Unpack a WiredTiger struct (the key and value formats of a table) into
 * its columns.
 *
 * Supported format characters, each optionally preceded by a repeat count:
 *
 *     x        pad byte (no value)
 *     b        int8 stored as a byte biased by 0x80
 *     B t      unsigned byte
 *     h i l q  signed packed integer
 *     H I L Q r  unsigned packed integer
 *     s        fixed length string (the count is the length)
 *     S        NUL terminated string (with a count: fixed length)
 *     u        raw bytes, length prefixed unless it is the last column
 *
 * A leading byte order character ('@', '<', '>', '!', '=') is ignored.
 *
 * @throws Exception(WTREADER_ERROR_MALFORMED_VARINT) for bad packed
 *         integers, Exception(WTREADER_ERROR_CORRUPT) if the data doesn't
 *         match the format, Exception(WTREADER_ERROR_NOT_SUPPORTED) for
 *         format characters we don't know
 */
std::vector<PackedValue> unpack_struct(std::string_view data,
                                       std::string_view format);

/// @return the number of columns (values) described by format
size_t count_columns(std::string_view format);

/// @return the type character of each column, repeat counts expanded
std::string column_types(std::string_view format);

/// Pack a record id the way collection keys (format "q") are stored
std::string pack_record_id(int64_t recordId);

} // namespace wtreader
