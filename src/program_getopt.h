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

#include <platform/command_line_options_parser.h>

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string_view>
#include <vector>

namespace wtreader {

/**
 * The command line options shared by the wtreader programs (--version and
 * --verbose) plus the options each program adds.
 */
class ProgramGetopt {
public:
    ProgramGetopt();

    /**
     * Add a command line option to the list of command line options
     * to accept
     */
    void addOption(cb::getopt::Option option);

    /**
     * Parse the command line options and call the callbacks for all
     * options found.
     *
     * @param argc argument count
     * @param argv argument vector
     * @param error an error callback for unknown options
     */
    [[nodiscard]] std::vector<std::string_view> parse(
            int argc, char* const* argv, std::function<void()> error) const;

    /// Print the common command line options to the output stream
    void usage(std::ostream& out) const;

    /// Should messages about skipped pages be printed as they happen
    [[nodiscard]] bool isVerbose() const {
        return verbose;
    }

protected:
    cb::getopt::CommandLineOptionsParser parser;
    bool verbose{false};
};

std::ostream& operator<<(std::ostream& os, const ProgramGetopt& programOptions);

/**
 * Parse the value of a numeric option (--limit, --record-id)
 *
 * @return the number, or an empty optional unless the whole value is a
 *         decimal number in range
 */
std::optional<uint64_t> parse_unsigned_option(std::string_view value);
std::optional<int64_t> parse_signed_option(std::string_view value);

} // namespace wtreader
