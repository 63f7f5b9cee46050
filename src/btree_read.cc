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
#include "btree.h"
#include "exception.h"
#include "util.h"

#include <fmt/format.h>
#include <libwtreader/page_cache.h>
#include <algorithm>

namespace wtreader {

std::shared_ptr<const Page> read_page(wt_file& file,
                                      const BlockAddress& address,
                                      PageCache* cache) {
    if (cache) {
        auto page = cache->find(file.path, address);
        if (page) {
            return page;
        }
    }

    auto page = std::make_shared<const Page>(decode_page(
            read_block(file, address), address, file.options.compressor));
    if (cache) {
        cache->insert(file.path, address, page);
    }
    return page;
}

std::string read_overflow(wt_file& file,
                          const BlockAddress& address,
                          PageCache* cache) {
    auto page = read_page(file, address, cache);
    if (page->type != PageType::Overflow) {
        throw Exception(WTREADER_ERROR_CORRUPT,
                        fmt::format("Overflow item {} refers to a {} page",
                                    to_string(address),
                                    to_string(page->type)));
    }
    return std::string{page->payload()};
}

static bool kind_matches(std::optional<ChildKind> kind, PageType type) {
    if (!kind) {
        // The root may be either
        return type == PageType::RowInternal || type == PageType::RowLeaf;
    }
    switch (*kind) {
    case ChildKind::Internal:
        return type == PageType::RowInternal;
    case ChildKind::Leaf:
    case ChildKind::LeafNoOverflow:
        return type == PageType::RowLeaf;
    case ChildKind::Deleted:
        break;
    }
    return false;
}

TreeWalker::TreeWalker(wt_file& file,
                       const BlockAddress& root,
                       const ScanOptions& options,
                       std::vector<Diagnostic>& diagnostics)
    : file(file), root(root), options(options), diagnostics(diagnostics) {
}

void TreeWalker::checkCancel() const {
    if (options.cancel && options.cancel->load()) {
        throw Exception(WTREADER_ERROR_CANCEL,
                        fmt::format("Scan of \"{}\" cancelled", file.path));
    }
}

void TreeWalker::report(const BlockAddress& address,
                        wtreader_error_t error,
                        const std::string& reason) {
    log_last_internal_error("%s: skipped %s: %s",
                            file.path.c_str(),
                            to_string(address).c_str(),
                            reason.c_str());
    diagnostics.push_back({file.path, address, error, reason, {}});
}

TreeWalker::Frame TreeWalker::load(const BlockAddress& address,
                                   std::optional<ChildKind> kind,
                                   int depth,
                                   std::unordered_set<uint64_t>& seen) {
    checkCancel();
    if (depth > WT_MAX_TREE_DEPTH) {
        throw Exception(WTREADER_ERROR_CORRUPT_TREE,
                        fmt::format("Tree is deeper than {} levels at {}",
                                    WT_MAX_TREE_DEPTH,
                                    to_string(address)));
    }
    if (!seen.insert(address.offset).second) {
        throw Exception(WTREADER_ERROR_CORRUPT_TREE,
                        fmt::format("Block {} is referenced twice (cycle)",
                                    to_string(address)));
    }

    Frame frame;
    frame.depth = depth;
    frame.page = read_page(file, address, options.cache);
    ++pagesRead;

    if (!kind_matches(kind, frame.page->type)) {
        throw Exception(WTREADER_ERROR_CORRUPT,
                        fmt::format("Block {}: unexpected {} page",
                                    to_string(address),
                                    to_string(frame.page->type)));
    }

    if (frame.page->type == PageType::RowInternal) {
        parseInternal(frame);
    } else {
        parseLeaf(frame);
    }
    return frame;
}

void TreeWalker::push(const BlockAddress& address,
                      std::optional<ChildKind> kind,
                      int depth) {
    try {
        stack.push_back(load(address, kind, depth, visited));
    } catch (const Exception& e) {
        if (!options.tolerateCorruption || !is_page_level_error(e.errcode)) {
            throw;
        }
        report(address, e.errcode, e.what());
    }
}

void TreeWalker::parseInternal(Frame& frame) {
    const auto& page = *frame.page;
    const auto cells = decode_cells(page, file.options.allocation_size);

    std::optional<std::string> key;
    for (const auto& cell : cells) {
        if (const auto* k = std::get_if<KeyCell>(&cell)) {
            if (key) {
                throw Exception(WTREADER_ERROR_CORRUPT,
                                fmt::format("Block {}: internal page key "
                                            "without child address",
                                            to_string(page.address)));
            }
            if (k->prefix != 0) {
                throw Exception(WTREADER_ERROR_CORRUPT,
                                fmt::format("Block {}: prefix compressed key "
                                            "on internal page",
                                            to_string(page.address)));
            }
            key = std::string{k->suffix};
        } else if (const auto* ok = std::get_if<OverflowKeyCell>(&cell)) {
            if (key) {
                throw Exception(WTREADER_ERROR_CORRUPT,
                                fmt::format("Block {}: internal page key "
                                            "without child address",
                                            to_string(page.address)));
            }
            key = read_overflow(file, ok->address, options.cache);
        } else if (const auto* child = std::get_if<ChildAddressCell>(&cell)) {
            if (!key) {
                throw Exception(WTREADER_ERROR_CORRUPT,
                                fmt::format("Block {}: child address without "
                                            "key",
                                            to_string(page.address)));
            }
            frame.children.push_back(
                    {std::move(*key), child->address, child->kind});
            key.reset();
        } else {
            throw Exception(WTREADER_ERROR_CORRUPT,
                            fmt::format("Block {}: value cell on internal "
                                        "page",
                                        to_string(page.address)));
        }
    }

    if (key) {
        throw Exception(WTREADER_ERROR_CORRUPT,
                        fmt::format("Block {}: internal page ends with a key",
                                    to_string(page.address)));
    }
    if (frame.children.empty()) {
        throw Exception(WTREADER_ERROR_CORRUPT,
                        fmt::format("Block {}: internal page without children",
                                    to_string(page.address)));
    }
}

void TreeWalker::parseLeaf(Frame& frame) {
    const auto& page = *frame.page;
    const auto cells = decode_cells(page, file.options.allocation_size);

    std::string previous;
    LeafEntry* pending = nullptr;
    for (const auto& cell : cells) {
        if (const auto* k = std::get_if<KeyCell>(&cell)) {
            if (k->prefix > previous.size()) {
                throw Exception(WTREADER_ERROR_CORRUPT,
                                fmt::format("Block {}: key prefix {} is "
                                            "longer than the previous key",
                                            to_string(page.address),
                                            k->prefix));
            }
            LeafEntry entry;
            entry.key = previous.substr(0, k->prefix);
            entry.key.append(k->suffix);
            previous = entry.key;
            frame.entries.push_back(std::move(entry));
            pending = &frame.entries.back();
            continue;
        }
        if (const auto* ok = std::get_if<OverflowKeyCell>(&cell)) {
            if (ok->removed) {
                throw Exception(WTREADER_ERROR_CORRUPT,
                                fmt::format("Block {}: reference to removed "
                                            "overflow key {}",
                                            to_string(page.address),
                                            to_string(ok->address)));
            }
            LeafEntry entry;
            entry.key = read_overflow(file, ok->address, options.cache);
            previous = entry.key;
            frame.entries.push_back(std::move(entry));
            pending = &frame.entries.back();
            continue;
        }
        if (std::holds_alternative<ChildAddressCell>(cell)) {
            throw Exception(WTREADER_ERROR_CORRUPT,
                            fmt::format("Block {}: child address on leaf page",
                                        to_string(page.address)));
        }

        if (pending == nullptr) {
            throw Exception(WTREADER_ERROR_CORRUPT,
                            fmt::format("Block {}: value cell without key",
                                        to_string(page.address)));
        }
        if (const auto* v = std::get_if<ValueCell>(&cell)) {
            pending->state = ValueState::Inline;
            pending->value = v->data;
            pending->window = v->window;
        } else if (const auto* ov = std::get_if<OverflowValueCell>(&cell)) {
            pending->state = ov->removed ? ValueState::RemovedOverflow
                                         : ValueState::Overflow;
            pending->overflow = ov->address;
            pending->window = ov->window;
        } else if (const auto* d = std::get_if<DeletedValueCell>(&cell)) {
            pending->state = ValueState::Deleted;
            pending->window = d->window;
        }
        pending = nullptr;
    }
}

bool TreeWalker::makeRecord(const Frame& frame,
                            const LeafEntry& entry,
                            Record& record) {
    switch (entry.state) {
    case ValueState::Deleted:
        return false;
    case ValueState::RemovedOverflow:
        report(entry.overflow,
               WTREADER_ERROR_CORRUPT,
               fmt::format("value of a key on leaf {} refers to a removed "
                           "overflow item",
                           to_string(frame.page->address)));
        return false;
    case ValueState::Inline:
    case ValueState::Empty:
        record.value.assign(entry.value.data(), entry.value.size());
        record.valueResolved = true;
        break;
    case ValueState::Overflow:
        record.value.clear();
        record.valueResolved = false;
        if (options.resolveOverflow) {
            checkCancel();
            try {
                record.value = read_overflow(file, entry.overflow, options.cache);
                record.valueResolved = true;
            } catch (const Exception& e) {
                if (!options.tolerateCorruption ||
                    !is_page_level_error(e.errcode)) {
                    throw;
                }
                report(entry.overflow, e.errcode, e.what());
                return false;
            }
        }
        break;
    }

    record.key = entry.key;
    record.window = entry.window;
    record.leaf = frame.page->address;
    return true;
}

bool TreeWalker::next(Record& record) {
    if (!started) {
        started = true;
        if (root.isEmpty()) {
            return false;
        }
        push(root, {}, 0);
    }

    while (!stack.empty()) {
        auto& top = stack.back();
        if (top.page->type == PageType::RowLeaf) {
            if (top.position == top.entries.size()) {
                stack.pop_back();
                continue;
            }
            const auto& entry = top.entries[top.position++];
            if (!makeRecord(top, entry, record)) {
                continue;
            }
            if (lastKey && *lastKey >= record.key) {
                report(top.page->address,
                       WTREADER_ERROR_CORRUPT_TREE,
                       fmt::format("key {} is out of order (previous {})",
                                   to_hex_string(record.key),
                                   to_hex_string(*lastKey)));
            }
            lastKey = record.key;
            return true;
        }

        if (top.position == top.children.size()) {
            stack.pop_back();
            continue;
        }
        const auto child = top.children[top.position++];
        if (child.kind == ChildKind::Deleted) {
            continue;
        }
        // top is invalidated by the push
        push(child.address, child.kind, top.depth + 1);
    }
    return false;
}

std::optional<Record> TreeWalker::seek(std::string_view key) {
    if (root.isEmpty()) {
        return {};
    }

    std::unordered_set<uint64_t> seen;
    BlockAddress address = root;
    std::optional<ChildKind> kind;
    int depth = 0;

    try {
        while (true) {
            auto frame = load(address, kind, depth, seen);
            if (frame.page->type == PageType::RowLeaf) {
                auto it = std::lower_bound(
                        frame.entries.begin(),
                        frame.entries.end(),
                        key,
                        [](const LeafEntry& entry, std::string_view k) {
                            return std::string_view{entry.key} < k;
                        });
                if (it == frame.entries.end() || it->key != key) {
                    return {};
                }
                Record record;
                if (!makeRecord(frame, *it, record)) {
                    return {};
                }
                return record;
            }

            // The first key on an internal page sorts before everything
            auto it = std::upper_bound(
                    frame.children.begin() + 1,
                    frame.children.end(),
                    key,
                    [](std::string_view k, const Child& child) {
                        return k < std::string_view{child.key};
                    });
            const auto& child = *(it - 1);
            if (child.kind == ChildKind::Deleted) {
                return {};
            }
            address = child.address;
            kind = child.kind;
            ++depth;
        }
    } catch (const Exception& e) {
        if (!options.tolerateCorruption || !is_page_level_error(e.errcode)) {
            throw;
        }
        report(address, e.errcode, e.what());
    }
    return {};
}

std::optional<Record> btree_seek(wt_file& file,
                                 const BlockAddress& root,
                                 std::string_view key,
                                 const ScanOptions& options,
                                 std::vector<Diagnostic>& diagnostics) {
    TreeWalker walker(file, root, options, diagnostics);
    return walker.seek(key);
}

} // namespace wtreader
