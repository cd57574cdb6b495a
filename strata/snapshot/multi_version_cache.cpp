// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#include "multi_version_cache.hpp"

#include <algorithm>
#include <mutex>
#include <string>

#include <strata/core/common/util.hpp>
#include <strata/infra/common/ensure.hpp>
#include <strata/infra/common/log.hpp>
#include <strata/snapshot/diff_layer.hpp>

namespace strata::snapshot {

MultiVersionCache::MultiVersionCache(StateVersion base_version, unsigned eviction_threads, Metrics* metrics)
    : min_version_{base_version}, metrics_{metrics}, pool_{eviction_threads} {}

void MultiVersionCache::add_diff_layer(const DiffLayer& diff) {
    const Layer parent{diff.parent()};
    std::unique_lock lock{mutex_};

    Ancestry ancestry;
    if (const auto parent_diff{as_diff(parent)}) {
        const auto it{ancestry_.find(parent_diff->root())};
        ensure_invariant(it != ancestry_.end(), [&] {
            return "parent " + to_hex(parent_diff->root(), true) + " of " + to_hex(diff.root(), true) + " not cached";
        });
        ancestry = it->second;
    }
    ancestry.insert(diff.root());
    ancestry_.insert_or_assign(diff.root(), std::move(ancestry));

    for (const auto& account_hash : diff.destructs()) {
        destructs_[account_hash].push_back({diff.version(), diff.root()});
        ++item_count_;
    }
    for (const auto& [key, value] : diff.writes()) {
        switch (key.kind()) {
            case StateKey::Kind::kAccount:
                accounts_[key.account_hash()].push_back({diff.version(), diff.root(), value});
                ++item_count_;
                break;
            case StateKey::Kind::kStorage:
                storage_[key.account_hash()][key.slot_hash()].push_back({diff.version(), diff.root(), value});
                ++item_count_;
                break;
            default:
                break;
        }
    }
    if (metrics_) {
        metrics_->set(metrics_->cache_items, item_count_);
    }
}

void MultiVersionCache::remove_diff_layer(const DiffLayer& diff) {
    {
        std::unique_lock lock{mutex_};
        min_version_ = std::max(min_version_, diff.version());
    }
    pool_.push_task([this, root = diff.root()] { evict(root); });
}

void MultiVersionCache::discard_diff_layer(const DiffLayer& diff) {
    pool_.push_task([this, root = diff.root()] { evict(root); });
}

template <typename Container, typename Predicate>
static size_t erase_entries(Container& map, Predicate&& should_erase) {
    size_t erased{0};
    for (auto it{map.begin()}; it != map.end();) {
        auto& list{it->second};
        const auto removed{std::erase_if(list, should_erase)};
        erased += removed;
        if (list.empty()) {
            map.erase(it++);
        } else {
            ++it;
        }
    }
    return erased;
}

void MultiVersionCache::evict(const Hash& root) {
    std::unique_lock lock{mutex_};
    const StateVersion min_version{min_version_};
    const auto is_evictable = [&](const auto& entry) { return entry.version <= min_version || entry.root == root; };

    size_t erased{erase_entries(destructs_, is_evictable)};
    erased += erase_entries(accounts_, is_evictable);
    for (auto it{storage_.begin()}; it != storage_.end();) {
        erased += erase_entries(it->second, is_evictable);
        if (it->second.empty()) {
            storage_.erase(it++);
        } else {
            ++it;
        }
    }

    ancestry_.erase(root);
    for (auto& [r, ancestors] : ancestry_) {
        ancestors.erase(root);
    }

    item_count_ -= erased;
    if (metrics_) {
        metrics_->mark(metrics_->cache_evictions);
        metrics_->set(metrics_->cache_items, item_count_);
    }
    STRATA_TRACE_M("Evicted cache items", {"root", to_hex(root, true),
                                           "min_version", std::to_string(min_version),
                                           "erased", std::to_string(erased),
                                           "left", std::to_string(item_count_)});
}

template <typename Entry>
const Entry* MultiVersionCache::select(const std::vector<Entry>& entries, StateVersion version,
                                       const Ancestry& ancestry) const {
    const Entry* best{nullptr};
    for (const auto& entry : entries) {
        if (entry.version > version || entry.version <= min_version_) continue;
        if (best && best->version >= entry.version) continue;
        if (!ancestry.contains(entry.root)) continue;
        best = &entry;
    }
    return best;
}

CacheQueryResult MultiVersionCache::resolve(const std::vector<Item>* items, const std::vector<Marker>* markers,
                                            StateVersion version, const Hash& root) const {
    const auto ancestry_it{ancestry_.find(root)};
    if (ancestry_it == ancestry_.end()) {
        return {.value = std::nullopt, .need_fallback_to_disk = true};
    }
    const Ancestry& ancestry{ancestry_it->second};

    const Item* item{items ? select(*items, version, ancestry) : nullptr};
    const Marker* marker{markers ? select(*markers, version, ancestry) : nullptr};

    if (item && (!marker || item->version >= marker->version)) {
        if (item->data.empty()) return {};
        return {.value = item->data, .need_fallback_to_disk = false};
    }
    if (marker) {
        return {};
    }
    return {.value = std::nullopt, .need_fallback_to_disk = true};
}

CacheQueryResult MultiVersionCache::query_account(StateVersion version, const Hash& root,
                                                  const Hash& account_hash) const {
    std::shared_lock lock{mutex_};
    const auto item_it{accounts_.find(account_hash)};
    const auto marker_it{destructs_.find(account_hash)};
    return resolve(item_it != accounts_.end() ? &item_it->second : nullptr,
                   marker_it != destructs_.end() ? &marker_it->second : nullptr, version, root);
}

CacheQueryResult MultiVersionCache::query_storage(StateVersion version, const Hash& root, const Hash& account_hash,
                                                  const Hash& slot_hash) const {
    std::shared_lock lock{mutex_};
    const std::vector<Item>* items{nullptr};
    if (const auto account_it{storage_.find(account_hash)}; account_it != storage_.end()) {
        if (const auto slot_it{account_it->second.find(slot_hash)}; slot_it != account_it->second.end()) {
            items = &slot_it->second;
        }
    }
    const auto marker_it{destructs_.find(account_hash)};
    return resolve(items, marker_it != destructs_.end() ? &marker_it->second : nullptr, version, root);
}

CacheQueryResult MultiVersionCache::query(StateVersion version, const Hash& root, const StateKey& key) const {
    switch (key.kind()) {
        case StateKey::Kind::kAccount:
            return query_account(version, root, key.account_hash());
        case StateKey::Kind::kStorage:
            return query_storage(version, root, key.account_hash(), key.slot_hash());
        default:
            return {.value = std::nullopt, .need_fallback_to_disk = true};
    }
}

size_t MultiVersionCache::item_count() const {
    std::shared_lock lock{mutex_};
    return item_count_;
}

StateVersion MultiVersionCache::min_version() const {
    std::shared_lock lock{mutex_};
    return min_version_;
}

bool MultiVersionCache::has_ancestry(const Hash& root) const {
    std::shared_lock lock{mutex_};
    return ancestry_.contains(root);
}

}  // namespace strata::snapshot
