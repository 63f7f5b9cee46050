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

/**
 * Format a message into the thread local "last internal error" buffer
 * and pass it to the handler installed with wtreader::setOnInternalError
 * (if any). The message is truncated to MAX_ERR_STR_LEN.
 */
void log_last_internal_error(const char* format, ...)
#ifdef __GNUC__
        __attribute__((format(printf, 1, 2)))
#endif
        ;

namespace wtreader {

/// Join a directory and a file name
std::string make_path(const std::string& dir, std::string_view name);

/// @return the data as lower case hex digits
std::string to_hex_string(std::string_view data);

/**
 * Decode a string of hex digits
 *
 * @throws Exception(WTREADER_ERROR_CORRUPT) on odd length or bad digits
 */
std::string from_hex_string(std::string_view hex);

} // namespace wtreader
