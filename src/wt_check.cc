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

#include <fmt/format.h>
#include <libwtreader/wt_reader.h>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <iostream>

#include "program_getopt.h"

static wtreader::ProgramGetopt program_options;

static bool quiet = false;

static void print_diagnostics(const std::vector<wtreader::Diagnostic>& diags) {
    for (const auto& diag : diags) {
        fmt::println(stderr,
                     "{}",
                     diag.to_json().dump(
                             -1, ' ', false,
                             nlohmann::json::error_handler_t::replace));
    }
}

/// @return true if the collection was read without any problems
static bool check_collection(const std::string& dbpath,
                             const wtreader::CatalogEntry& entry) {
    wtreader::ScanOptions options;
    auto [errcode, cursor] = wtreader::openCollection(dbpath, entry.name, options);
    if (errcode != WTREADER_SUCCESS) {
        fmt::println(stderr,
                     "{}: {} ({})",
                     entry.name,
                     wtreader_strerror(errcode),
                     wtreader::getLastInternalError());
        return false;
    }

    uint64_t documents = 0;
    uint64_t failed = 0;
    wtreader::DocumentRecord record;
    while ((errcode = cursor->next(record)) == WTREADER_SUCCESS) {
        ++documents;
        if (record.status != WTREADER_SUCCESS) {
            ++failed;
        }
    }

    const auto& diags = cursor->getDiagnostics();
    print_diagnostics(diags);
    const bool ok = errcode == WTREADER_ERROR_NOT_FOUND && diags.empty();
    if (errcode != WTREADER_ERROR_NOT_FOUND) {
        fmt::println(stderr,
                     "{}: scan failed: {} ({})",
                     entry.name,
                     wtreader_strerror(errcode),
                     wtreader::getLastInternalError());
    }
    if (!quiet || !ok) {
        fmt::println("{} ({}): {} documents, {} undecodable, {} pages, {}",
                     entry.name,
                     entry.ns.empty() ? "-" : entry.ns,
                     documents,
                     failed,
                     cursor->getPagesRead(),
                     ok ? "OK" : "DAMAGED");
    }
    return ok;
}

static void usage(int exitcode) {
    std::cerr << R"(Usage: wt_check [options] <dbpath> [<dbpath2> ...]

Read every collection in the data directory and report damaged pages
and documents. Exits with 1 if any problem was found.

Options:

)" << program_options
              << std::endl;
    std::exit(exitcode);
}

static bool check_directory(const std::string& dbpath) {
    auto [errcode, listing] = wtreader::listCollections(dbpath);
    if (errcode != WTREADER_SUCCESS) {
        fmt::println(stderr,
                     "{}: {} ({})",
                     dbpath,
                     wtreader_strerror(errcode),
                     wtreader::getLastInternalError());
        return false;
    }

    bool ok = listing.diagnostics.empty();
    print_diagnostics(listing.diagnostics);
    for (const auto& entry : listing.collections) {
        if (!entry.available) {
            fmt::println("{}: data file {} is missing", entry.name, entry.fileName);
            ok = false;
            continue;
        }
        ok &= check_collection(dbpath, entry);
    }
    return ok;
}

int main(int argc, char** argv) {
    program_options.addOption({[](auto) { quiet = true; },
                               'q',
                               "quiet",
                               "Only print collections with problems"});
    program_options.addOption(
            {[](auto) { usage(EXIT_SUCCESS); }, "help", "This help text"});

    auto arguments =
            program_options.parse(argc, argv, [] { usage(EXIT_FAILURE); });
    if (arguments.empty()) {
        usage(EXIT_FAILURE);
    }

    bool ok = true;
    for (const auto& arg : arguments) {
        ok &= check_directory(std::string{arg});
    }
    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
