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
#include "page.h"

#include <boost/intrusive/list.hpp>
#include <fmt/format.h>
#include <gsl/gsl-lite.hpp>
#include <libwtreader/page_cache.h>
#include <mutex>
#include <unordered_map>

namespace wtreader {

struct CachedPage {
    CachedPage(std::string key, std::shared_ptr<const Page> page)
        : key(std::move(key)), page(std::move(page)) {
    }

    const std::string key;
    std::shared_ptr<const Page> page;
    // Hook for intrusive list.
    boost::intrusive::list_member_hook<> _lru_hook;
};

using UniqueCachedPagePtr = std::unique_ptr<CachedPage>;

using ListMember =
        boost::intrusive::member_hook<CachedPage,
                                      boost::intrusive::list_member_hook<>,
                                      &CachedPage::_lru_hook>;

using CachedPageList = boost::intrusive::list<CachedPage, ListMember>;
using CachedPageMap = std::unordered_map<std::string, UniqueCachedPagePtr>;

struct PageCache::Impl {
    explicit Impl(size_t capacity) : capacity(capacity) {
    }

    ~Impl() {
        // Note: all elements in intrusive list MUST be unlinked
        //       before they are freed
        auto itr = lru.begin();
        while (itr != lru.end()) {
            itr = lru.erase(itr);
        }
    }

    const size_t capacity;
    mutable std::mutex mutex;
    // Most recently used first
    CachedPageList lru;
    CachedPageMap map;
    size_t hits{0};
    size_t misses{0};
};

static std::string make_key(const std::string& file,
                            const BlockAddress& address) {
    return fmt::format("{}:{}:{}", file, address.offset, address.checksum);
}

PageCache::PageCache(size_t capacity) : impl(std::make_unique<Impl>(capacity)) {
    Expects(capacity > 0);
}

PageCache::~PageCache() = default;

std::shared_ptr<const Page> PageCache::find(const std::string& file,
                                            const BlockAddress& address) {
    const auto key = make_key(file, address);
    std::lock_guard<std::mutex> guard(impl->mutex);
    auto itr = impl->map.find(key);
    if (itr == impl->map.end()) {
        ++impl->misses;
        return {};
    }
    ++impl->hits;
    auto& entry = *itr->second;
    // Move it to the front of LRU, and return.
    impl->lru.splice(impl->lru.begin(), impl->lru, impl->lru.iterator_to(entry));
    return entry.page;
}

void PageCache::insert(const std::string& file,
                       const BlockAddress& address,
                       std::shared_ptr<const Page> page) {
    auto key = make_key(file, address);
    std::lock_guard<std::mutex> guard(impl->mutex);
    auto itr = impl->map.find(key);
    if (itr != impl->map.end()) {
        // Someone else decoded the same page; keep the newest
        auto& entry = *itr->second;
        entry.page = std::move(page);
        impl->lru.splice(
                impl->lru.begin(), impl->lru, impl->lru.iterator_to(entry));
        return;
    }

    if (impl->map.size() == impl->capacity) {
        // Evict the last page in the LRU list
        auto& victim = impl->lru.back();
        impl->lru.pop_back();
        impl->map.erase(impl->map.find(victim.key));
    }

    auto entry = std::make_unique<CachedPage>(key, std::move(page));
    impl->lru.push_front(*entry);
    impl->map.emplace(std::move(key), std::move(entry));
}

size_t PageCache::size() const {
    std::lock_guard<std::mutex> guard(impl->mutex);
    return impl->map.size();
}

size_t PageCache::getHits() const {
    std::lock_guard<std::mutex> guard(impl->mutex);
    return impl->hits;
}

size_t PageCache::getMisses() const {
    std::lock_guard<std::mutex> guard(impl->mutex);
    return impl->misses;
}

} // namespace wtreader
