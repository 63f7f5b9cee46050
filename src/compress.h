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

namespace wtreader {

/**
 * Decompress the compressed part of a page image.
 *
 * Snappy payloads written by WiredTiger carry the length of the snappy
 * stream in an 8 byte little endian prefix (the rest of the block is
 * padding up to the allocation size). Zlib payloads are a plain zlib
 * stream followed by padding.
 *
 * @param compressor the file's block compressor
 * @param input the compressed bytes (including any trailing padding)
 * @param expected the decompressed length recorded in the page header
 * @return the decompressed bytes
 * @throws Exception(WTREADER_ERROR_DECOMPRESSION_MISMATCH) if the
 *         output length differs from expected, or
 *         Exception(WTREADER_ERROR_CORRUPT) if the input can't be decoded
 */
std::string decompress(Compressor compressor,
                       std::string_view input,
                       size_t expected);

} // namespace wtreader
