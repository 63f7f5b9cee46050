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
#include "metadata.h"
#include "cell.h"
#include "exception.h"
#include "util.h"

#include <boost/algorithm/string/trim.hpp>
#include <fmt/format.h>
#include <algorithm>

namespace wtreader {

Turtle parse_turtle(std::string_view content, const std::string& path) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < content.size()) {
        auto end = content.find('\n', start);
        if (end == std::string_view::npos) {
            end = content.size();
        }
        std::string line{content.substr(start, end - start)};
        boost::algorithm::trim_right(line);
        lines.push_back(std::move(line));
        start = end + 1;
    }
    while (!lines.empty() && lines.back().empty()) {
        lines.pop_back();
    }
    if (lines.size() % 2 != 0) {
        throw Exception(WTREADER_ERROR_CORRUPT,
                        fmt::format("\"{}\": odd number of lines ({})",
                                    path,
                                    lines.size()));
    }

    Turtle turtle;
    turtle.path = path;
    for (size_t ii = 0; ii < lines.size(); ii += 2) {
        turtle.entries.emplace_back(std::move(lines[ii]),
                                    std::move(lines[ii + 1]));
    }

    const std::string* version = nullptr;
    const std::string* metadata = nullptr;
    for (const auto& [key, value] : turtle.entries) {
        if (key == WT_METADATA_VERSION) {
            version = &value;
        } else if (key == WT_METAFILE_URI) {
            metadata = &value;
        }
    }

    if (version == nullptr) {
        throw Exception(WTREADER_ERROR_UNSUPPORTED_FORMAT_VERSION,
                        fmt::format("\"{}\" doesn't record the WiredTiger "
                                    "version",
                                    path));
    }
    const auto config = ConfigMap::from_string(*version);
    const auto major = config.getUint64("major").value_or(0);
    turtle.major = int(std::min(major, uint64_t(INT32_MAX)));
    turtle.minor = int(std::min(config.getUint64("minor").value_or(0),
                                uint64_t(INT32_MAX)));
    turtle.patch = int(std::min(config.getUint64("patch").value_or(0),
                                uint64_t(INT32_MAX)));
    if (major < WT_TURTLE_MIN_MAJOR || major > WT_TURTLE_MAX_MAJOR) {
        throw Exception(WTREADER_ERROR_UNSUPPORTED_FORMAT_VERSION,
                        fmt::format("\"{}\": unsupported WiredTiger release "
                                    "{}.{}.{} (supported major versions {} to "
                                    "{})",
                                    path,
                                    turtle.major,
                                    turtle.minor,
                                    turtle.patch,
                                    WT_TURTLE_MIN_MAJOR,
                                    WT_TURTLE_MAX_MAJOR));
    }

    if (metadata == nullptr) {
        throw Exception(WTREADER_ERROR_NO_BOOTSTRAP,
                        fmt::format("\"{}\" doesn't describe {}",
                                    path,
                                    WT_METAFILE_URI));
    }
    turtle.metadataConfig = *metadata;
    return turtle;
}

Turtle read_turtle(FileOpsInterface* ops, const std::string& dataDir) {
    for (const auto* name : {WT_METADATA_TURTLE, WT_METADATA_TURTLE_SET}) {
        const auto path = make_path(dataDir, name);
        auto content = read_whole_file(ops, path);
        if (content) {
            return parse_turtle(*content, path);
        }
    }
    throw Exception(WTREADER_ERROR_NO_BOOTSTRAP,
                    fmt::format("No {} in \"{}\"", WT_METADATA_TURTLE, dataDir));
}

BlockAddress parse_checkpoint_cookie(std::string_view hex,
                                     uint32_t allocationSize) {
    if (hex.empty()) {
        return {};
    }

    const auto cookie = from_hex_string(hex);
    const auto* p = reinterpret_cast<const uint8_t*>(cookie.data());
    const auto* end = p + cookie.size();
    const auto version = *p++;
    if (version != WT_BM_CHECKPOINT_VERSION) {
        throw Exception(WTREADER_ERROR_UNSUPPORTED_FORMAT_VERSION,
                        fmt::format("Unsupported checkpoint cookie version {}",
                                    version));
    }
    // The alloc, avail and discard lists and the file size follow the root
    return unpack_address(p, end, allocationSize);
}

FileMetadata parse_file_metadata(std::string_view config) {
    const auto map = ConfigMap::from_string(config);

    FileMetadata ret;
    if (auto size = map.getSize("allocation_size")) {
        if (*size == 0 || *size > WT_MAX_ALLOCATION_SIZE) {
            throw Exception(WTREADER_ERROR_CORRUPT,
                            fmt::format("Invalid allocation size {}", *size));
        }
        ret.allocationSize = uint32_t(*size);
    }
    ret.blockCompressor = map.getString("block_compressor");

    std::optional<uint64_t> best;
    std::string addr;
    for (const auto& [name, value] : map.getMap("checkpoint").items()) {
        const auto checkpoint = ConfigMap::from_string(value);
        const auto order = checkpoint.getUint64("order").value_or(0);
        if (!best || order > *best) {
            best = order;
            ret.checkpoint = name;
            addr = checkpoint.getString("addr");
        }
    }

    ret.root = parse_checkpoint_cookie(addr, ret.allocationSize);
    return ret;
}

} // namespace wtreader
