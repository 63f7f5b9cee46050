/*
 *     Copyright 2024-Present Couchbase, Inc.
 *
 *   Use of this software is governed by the Business Source License included
 *   in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
 *   in that file, in accordance with the Business Source License, use of this
 *   software will be governed by the Apache License, Version 2.0, included in
 *   the file licenses/APL2.txt.
 */
#include "compress.h"
#include "bitfield.h"
#include "exception.h"

#include <fmt/format.h>
#include <gsl/gsl-lite.hpp>
#include <platform/compress.h>
#include <zlib.h>
#include <algorithm>
#include <cstring>

namespace wtreader {

static constexpr size_t max_inflated_page_size = 512 * 1024 * 1024;

Compressor parse_block_compressor(std::string_view name) {
    if (name.empty() || name == "none") {
        return Compressor::None;
    }
    if (name == "snappy") {
        return Compressor::Snappy;
    }
    if (name == "zlib") {
        return Compressor::Zlib;
    }
    throw Exception(WTREADER_ERROR_UNSUPPORTED_FORMAT_VERSION,
                    fmt::format("Unsupported block compressor \"{}\"", name));
}

std::string to_string(Compressor compressor) {
    switch (compressor) {
    case Compressor::None:
        return "none";
    case Compressor::Snappy:
        return "snappy";
    case Compressor::Zlib:
        return "zlib";
    }
    return fmt::format("Compressor({})", int(compressor));
}

static std::string inflate_snappy(std::string_view input, size_t expected) {
    raw_64 prefix;
    if (input.size() < sizeof(prefix)) {
        throw Exception(WTREADER_ERROR_CORRUPT,
                        "Snappy payload is shorter than its length prefix");
    }
    std::memcpy(&prefix, input.data(), sizeof(prefix));
    const auto length = decode_raw64(prefix);
    if (length > input.size() - sizeof(prefix)) {
        throw Exception(WTREADER_ERROR_CORRUPT,
                        fmt::format("Snappy stored size {} exceeds the "
                                    "source size {}",
                                    length,
                                    input.size() - sizeof(prefix)));
    }

    auto allocator = cb::compression::Allocator{
            cb::compression::Allocator::Mode::Malloc};
    cb::compression::Buffer buffer(allocator);
    // Pages larger than expected are reported by decompress() as a size
    // mismatch, so only guard against absurd sizes here
    if (!cb::compression::inflateSnappy(
                {input.data() + sizeof(prefix), gsl::narrow<size_t>(length)},
                buffer,
                std::max(expected, max_inflated_page_size))) {
        throw Exception(WTREADER_ERROR_CORRUPT,
                        fmt::format("Invalid snappy stream of {} bytes",
                                    length));
    }
    return {buffer.data(), buffer.size()};
}

static std::string inflate_zlib(std::string_view input, size_t expected) {
    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));
    if (inflateInit(&strm) != Z_OK) {
        throw Exception(WTREADER_ERROR_ALLOC_FAIL, "inflateInit failed");
    }

    // One spare byte to detect pages which inflate beyond their size
    std::string output(expected + 1, '\0');
    strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    strm.avail_in = gsl::narrow<uInt>(input.size());
    strm.next_out = reinterpret_cast<Bytef*>(output.data());
    strm.avail_out = gsl::narrow<uInt>(output.size());

    const int ret = inflate(&strm, Z_FINISH);
    const auto produced = size_t(strm.total_out);
    inflateEnd(&strm);

    if (ret != Z_STREAM_END) {
        if (ret == Z_BUF_ERROR && produced == output.size()) {
            throw Exception(WTREADER_ERROR_DECOMPRESSION_MISMATCH,
                            fmt::format("zlib stream inflates beyond the "
                                        "expected {} bytes",
                                        expected));
        }
        throw Exception(WTREADER_ERROR_CORRUPT,
                        fmt::format("Invalid zlib stream (inflate:{})", ret));
    }
    output.resize(produced);
    return output;
}

std::string decompress(Compressor compressor,
                       std::string_view input,
                       size_t expected) {
    std::string output;
    switch (compressor) {
    case Compressor::None:
        throw Exception(WTREADER_ERROR_CORRUPT,
                        "Compressed page in a file without a block "
                        "compressor");
    case Compressor::Snappy:
        output = inflate_snappy(input, expected);
        break;
    case Compressor::Zlib:
        output = inflate_zlib(input, expected);
        break;
    }

    if (output.size() != expected) {
        throw Exception(WTREADER_ERROR_DECOMPRESSION_MISMATCH,
                        fmt::format("Decompressed {} bytes, expected {}",
                                    output.size(),
                                    expected));
    }
    return output;
}

} // namespace wtreader
