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
#include <optional>
#include <string>

#include "program_getopt.h"
#include "util.h"

static wtreader::ProgramGetopt program_options;

static bool dump_body = true;
static bool dump_hex = false;

template <typename Json>
static void print_json(FILE* out, const Json& json) {
    // Keys and strings recovered from damaged files aren't always UTF-8
    fmt::println(out,
                 "{}",
                 json.dump(-1, ' ', false, Json::error_handler_t::replace));
}

static void print_diagnostics(const std::vector<wtreader::Diagnostic>& diags) {
    for (const auto& diag : diags) {
        print_json(stderr, diag.to_json());
    }
}

static nlohmann::ordered_json key_to_json(const wtreader::PackedValue& key) {
    if (auto* i = std::get_if<int64_t>(&key)) {
        return *i;
    }
    if (auto* u = std::get_if<uint64_t>(&key)) {
        return *u;
    }
    return std::get<std::string>(key);
}

static void print_record(const wtreader::DocumentRecord& record) {
    nlohmann::ordered_json json;
    json["key"] = key_to_json(record.key);
    if (record.stopped) {
        json["stopped"] = true;
    }
    if (record.status != WTREADER_SUCCESS) {
        json["error"] = wtreader_strerror(record.status);
    }
    json["size"] = record.rawValue.size();
    if (dump_body && record.document) {
        json["document"] = wtreader::to_json(*record.document);
    }
    if (dump_hex || (dump_body && record.status != WTREADER_SUCCESS)) {
        json["raw"] = wtreader::to_hex_string(record.rawValue);
    }
    print_json(stdout, json);
}

static int list_collections(const std::string& dbpath) {
    auto [errcode, listing] = wtreader::listCollections(dbpath);
    if (errcode != WTREADER_SUCCESS) {
        fmt::println(stderr,
                     "Failed to read the catalog of \"{}\": {} ({})",
                     dbpath,
                     wtreader_strerror(errcode),
                     wtreader::getLastInternalError());
        return EXIT_FAILURE;
    }
    for (const auto& entry : listing.collections) {
        print_json(stdout, entry.to_json());
    }
    print_diagnostics(listing.diagnostics);
    return EXIT_SUCCESS;
}

static int dump_collection(const std::string& dbpath,
                           const std::string& name,
                           const wtreader::ScanOptions& options) {
    auto [errcode, cursor] = wtreader::openCollection(dbpath, name, options);
    if (errcode != WTREADER_SUCCESS) {
        fmt::println(stderr,
                     "Failed to open \"{}\": {} ({})",
                     name,
                     wtreader_strerror(errcode),
                     wtreader::getLastInternalError());
        return EXIT_FAILURE;
    }

    wtreader::DocumentRecord record;
    while ((errcode = cursor->next(record)) == WTREADER_SUCCESS) {
        print_record(record);
    }
    print_diagnostics(cursor->getDiagnostics());
    if (errcode != WTREADER_ERROR_NOT_FOUND) {
        fmt::println(stderr,
                     "Scan of \"{}\" failed: {} ({})",
                     name,
                     wtreader_strerror(errcode),
                     wtreader::getLastInternalError());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

static int dump_record(const std::string& dbpath,
                       const std::string& name,
                       int64_t recordId,
                       const wtreader::ScanOptions& options) {
    auto [errcode, record] =
            wtreader::findRecord(dbpath, name, recordId, options);
    if (errcode == WTREADER_ERROR_NOT_FOUND) {
        fmt::println(stderr, "Record {} not found in \"{}\"", recordId, name);
        return EXIT_FAILURE;
    }
    if (errcode != WTREADER_SUCCESS) {
        fmt::println(stderr,
                     "Failed to look up record {} in \"{}\": {} ({})",
                     recordId,
                     name,
                     wtreader_strerror(errcode),
                     wtreader::getLastInternalError());
        return EXIT_FAILURE;
    }
    print_record(record);
    return EXIT_SUCCESS;
}

[[noreturn]] static void usage(int exitcode) {
    std::cerr << R"(Usage: wt_dump [options] <dbpath> [collection]

Without a collection the catalog of the data directory is listed. The
collection may be given by its table name (collection-7-...) or by its
namespace (db.collection).

Options:

)" << program_options
              << std::endl;
    std::exit(exitcode);
}

int main(int argc, char** argv) {
    wtreader::ScanOptions options;
    std::optional<int64_t> record_id;

    program_options.addOption(
            {[&options](auto value) {
                 const auto limit = wtreader::parse_unsigned_option(value);
                 if (!limit) {
                     fmt::println(stderr, "Invalid --limit \"{}\"", value);
                     usage(EXIT_FAILURE);
                 }
                 options.limit = *limit;
             },
             'l',
             "limit",
             cb::getopt::Argument::Required,
             "<count>",
             "Stop after dumping this many documents"});
    program_options.addOption(
            {[&record_id](auto value) {
                 record_id = wtreader::parse_signed_option(value);
                 if (!record_id) {
                     fmt::println(stderr, "Invalid --record-id \"{}\"", value);
                     usage(EXIT_FAILURE);
                 }
             },
             'r',
             "record-id",
             cb::getopt::Argument::Required,
             "<id>",
             "Only dump the document with the given record id"});
    program_options.addOption({[](auto) { dump_body = false; },
                               "no-body",
                               "Don't print the documents"});
    program_options.addOption({[](auto) { dump_hex = true; },
                               'x',
                               "hex",
                               "Print the raw value bytes as hex"});
    program_options.addOption(
            {[&options](auto) { options.tolerateCorruption = false; },
             "strict",
             "Stop at the first damaged page instead of skipping it"});
    program_options.addOption(
            {[](auto) { usage(EXIT_SUCCESS); }, "help", "This help text"});

    auto arguments =
            program_options.parse(argc, argv, [] { usage(EXIT_FAILURE); });
    if (arguments.empty() || arguments.size() > 2) {
        usage(EXIT_FAILURE);
    }
    options.resolveOverflow = dump_body || dump_hex;

    const std::string dbpath{arguments[0]};
    if (arguments.size() == 1) {
        return list_collections(dbpath);
    }

    const std::string name{arguments[1]};
    if (record_id) {
        return dump_record(dbpath, name, *record_id, options);
    }
    return dump_collection(dbpath, name, options);
}
