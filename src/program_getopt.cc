/*
 *     Copyright 2024-Present Couchbase, Inc.
 *
 *   Use of this software is governed by the Business Source License included
 *   in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
 *   in that file, in accordance with the Business Source License, use of this
 *   software will be governed by the Apache License, Version 2.0, included in
 *   the file licenses/APL2.txt.
 */

#include "program_getopt.h"
#include <fmt/format.h>
#include <libwtreader/wt_reader.h>

#include <cctype>
#include <cstdlib>
#include <ostream>
#include <stdexcept>
#include <string>

using cb::getopt::Argument;
using cb::getopt::Option;

namespace wtreader {

ProgramGetopt::ProgramGetopt() {
    addOption({[this](auto) {
                   verbose = true;
                   setOnInternalError([](std::string_view message) {
                       fmt::println(stderr, "{}", message);
                   });
               },
               'v',
               "verbose",
               "Print every skipped page and record as it is found"});
    addOption({[](auto) {
                   fmt::println(stdout, "wtreader {}", PRODUCT_VERSION);
                   std::exit(EXIT_SUCCESS);
               },
               "version",
               "Print program version and exit"});
}

void ProgramGetopt::addOption(Option option) {
    parser.addOption(std::move(option));
}

std::vector<std::string_view> ProgramGetopt::parse(
        int argc, char* const* argv, std::function<void()> error) const {
    return parser.parse(argc, argv, std::move(error));
}

void ProgramGetopt::usage(std::ostream& out) const {
    parser.usage(out);
}

std::ostream& operator<<(std::ostream& os,
                         const ProgramGetopt& programOptions) {
    programOptions.usage(os);
    return os;
}

template <typename Convert>
static auto parse_number(std::string_view value, Convert convert)
        -> std::optional<decltype(convert(std::string{}, nullptr))> {
    // std::stoull skips leading space and accepts (and negates) a sign
    if (value.empty() || std::isspace(static_cast<unsigned char>(value[0]))) {
        return {};
    }
    const std::string text{value};
    try {
        size_t end = 0;
        auto ret = convert(text, &end);
        if (end != text.size()) {
            return {};
        }
        return ret;
    } catch (const std::invalid_argument&) {
        return {};
    } catch (const std::out_of_range&) {
        return {};
    }
}

std::optional<uint64_t> parse_unsigned_option(std::string_view value) {
    if (!value.empty() && (value[0] == '-' || value[0] == '+')) {
        return {};
    }
    return parse_number(value, [](const std::string& text, size_t* end) {
        return uint64_t(std::stoull(text, end));
    });
}

std::optional<int64_t> parse_signed_option(std::string_view value) {
    return parse_number(value, [](const std::string& text, size_t* end) {
        return int64_t(std::stoll(text, end));
    });
}

} // namespace wtreader
