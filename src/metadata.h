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

#include "config_parser.h"
#include "internal.h"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace wtreader {

/**
 * The bootstrap file (WiredTiger.turtle). It is a text file of alternating
 * key and value lines:
 *
 *     WiredTiger version string
 *     WiredTiger 10.0.2: (December 21, 2021)
 *     WiredTiger version
 *     major=10,minor=0,patch=2
 *     file:WiredTiger.wt
 *     allocation_size=4KB,...,checkpoint=(WiredTigerCheckpoint.7=(...))
 */
struct Turtle {
    /// The file the turtle was read from
    std::string path;
    std::vector<std::pair<std::string, std::string>> entries;
    int major{0};
    int minor{0};
    int patch{0};
    /// The configuration of the metadata file (file:WiredTiger.wt)
    std::string metadataConfig;
};

/**
 * Read and parse the turtle file of a data directory, falling back to the
 * WiredTiger.turtle.set file left by an interrupted update.
 *
 * @throws Exception(WTREADER_ERROR_NO_BOOTSTRAP) if neither exists or the
 *         metadata file isn't described,
 *         Exception(WTREADER_ERROR_UNSUPPORTED_FORMAT_VERSION) if the
 *         release isn't one we can read
 */
Turtle read_turtle(FileOpsInterface* ops, const std::string& dataDir);

/// Parse the text of a turtle file (see read_turtle())
Turtle parse_turtle(std::string_view content, const std::string& path);

/// The parts of a "file:" metadata entry needed to read the file
struct FileMetadata {
    /// Root page of the most recent checkpoint (empty for an empty tree)
    BlockAddress root;
    /// Name of the most recent checkpoint
    std::string checkpoint;
    uint32_t allocationSize{WT_DEFAULT_ALLOCATION_SIZE};
    std::string blockCompressor;
};

/**
 * Extract the root address, allocation size and compressor from a file's
 * configuration string. The checkpoint with the highest order wins.
 *
 * @throws Exception(WTREADER_ERROR_CORRUPT) for a damaged configuration,
 *         Exception(WTREADER_ERROR_UNSUPPORTED_FORMAT_VERSION) for an
 *         unknown checkpoint cookie version
 */
FileMetadata parse_file_metadata(std::string_view config);

/**
 * Decode the root address from a hex encoded checkpoint cookie
 * (a version byte followed by the root, alloc, avail and discard
 * addresses and the file size).
 */
BlockAddress parse_checkpoint_cookie(std::string_view hex,
                                     uint32_t allocationSize);

} // namespace wtreader
