// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#include "lookup.hpp"

#include <algorithm>
#include <chrono>
#include <mutex>
#include <ranges>
#include <string>

#include <strata/core/common/util.hpp>
#include <strata/infra/common/ensure.hpp>
#include <strata/infra/common/log.hpp>
#include <strata/snapshot/diff_layer.hpp>

namespace strata::snapshot {

void ReverseLookupIndex::build(const Layer& head) {
    std::vector<std::shared_ptr<DiffLayer>> chain;
    for (auto current{as_diff(head)}; current; current = as_diff(current->parent())) {
        chain.push_back(current);
    }

    std::unique_lock lock{mutex_};
    entries_.clear();
    descendants_.clear();
    for (const auto& diff : std::ranges::reverse_view(chain)) {
        add_layer_locked(*diff);
    }
    STRATA_DEBUG_M("Built lookup index", {"layers", std::to_string(chain.size()),
                                          "keys", std::to_string(entries_.size())});
}

void ReverseLookupIndex::add_entry(const StateKey& key, const IndexEntry& entry) {
    entries_[key].push_back(entry);
}

void ReverseLookupIndex::add_layer(const DiffLayer& diff) {
    std::unique_lock lock{mutex_};
    add_layer_locked(diff);
}

void ReverseLookupIndex::add_layer_locked(const DiffLayer& diff) {
    const auto start{std::chrono::steady_clock::now()};

    const IndexEntry entry{diff.root(), diff.version()};
    for (const auto& [key, value] : diff.writes()) {
        add_entry(key, entry);
    }
    for (const auto& account_hash : diff.destructs()) {
        add_entry(StateKey::destruct(account_hash), entry);
    }

    descendants_.try_emplace(diff.root());
    for (auto ancestor{as_diff(diff.parent())}; ancestor; ancestor = as_diff(ancestor->parent())) {
        const auto it{descendants_.find(ancestor->root())};
        ensure_invariant(it != descendants_.end(), [&] {
            return "ancestor " + to_hex(ancestor->root(), true) + " of " + to_hex(diff.root(), true) + " not indexed";
        });
        it->second.insert(diff.root());
    }

    if (metrics_) {
        metrics_->mark_elapsed(metrics_->index_add_nanos, std::chrono::steady_clock::now() - start);
    }
}

bool ReverseLookupIndex::has_entry(const StateKey& key, const Hash& root) const {
    const auto it{entries_.find(key)};
    return it != entries_.end() && std::ranges::any_of(it->second, [&](const IndexEntry& e) { return e.root == root; });
}

void ReverseLookupIndex::remove_entry(const StateKey& key, const Hash& root) {
    const auto it{entries_.find(key)};
    auto& list{it->second};
    list.erase(std::ranges::find_if(list, [&](const IndexEntry& e) { return e.root == root; }));
    if (list.empty()) {
        entries_.erase(it);
    }
}

SnapshotResult ReverseLookupIndex::verify_layer_locked(const DiffLayer& diff) const {
    const auto report_corruption = [&](const StateKey& key) {
        STRATA_ERROR_M("Lookup index corrupted", {"key", key.to_string(),
                                                  "layer", to_hex(diff.root(), true),
                                                  "version", std::to_string(diff.version())});
        return tl::make_unexpected(SnapshotError::kIndexCorruption);
    };
    for (const auto& [key, value] : diff.writes()) {
        if (!has_entry(key, diff.root())) {
            return report_corruption(key);
        }
    }
    for (const auto& account_hash : diff.destructs()) {
        const StateKey key{StateKey::destruct(account_hash)};
        if (!has_entry(key, diff.root())) {
            return report_corruption(key);
        }
    }
    return {};
}

SnapshotResult ReverseLookupIndex::verify_layer(const DiffLayer& diff) const {
    std::shared_lock lock{mutex_};
    return verify_layer_locked(diff);
}

SnapshotResult ReverseLookupIndex::remove_layer(const DiffLayer& diff) {
    const auto start{std::chrono::steady_clock::now()};
    std::unique_lock lock{mutex_};

    if (const auto result{verify_layer_locked(diff)}; !result) {
        return result;
    }
    for (const auto& [key, value] : diff.writes()) {
        remove_entry(key, diff.root());
    }
    for (const auto& account_hash : diff.destructs()) {
        remove_entry(StateKey::destruct(account_hash), diff.root());
    }

    descendants_.erase(diff.root());
    for (auto& [root, set] : descendants_) {
        set.erase(diff.root());
    }

    if (metrics_) {
        metrics_->mark_elapsed(metrics_->index_remove_nanos, std::chrono::steady_clock::now() - start);
    }
    return {};
}

LookupResult ReverseLookupIndex::lookup(const StateKey& key, const Hash& head) const {
    std::shared_lock lock{mutex_};
    const auto it{entries_.find(key)};
    if (it == entries_.end()) {
        return tl::make_unexpected(SnapshotError::kKeyNotIndexed);
    }
    for (const auto& entry : std::ranges::reverse_view(it->second)) {
        if (entry.root == head) {
            return entry;
        }
        const auto desc_it{descendants_.find(entry.root)};
        if (desc_it != descendants_.end() && desc_it->second.contains(head)) {
            return entry;
        }
    }
    return tl::make_unexpected(SnapshotError::kKeyNotIndexed);
}

LookupResult ReverseLookupIndex::lookup_destruct(const Hash& account_hash, const Hash& head) const {
    return lookup(StateKey::destruct(account_hash), head);
}

void ReverseLookupIndex::reset() {
    std::unique_lock lock{mutex_};
    entries_.clear();
    descendants_.clear();
}

size_t ReverseLookupIndex::key_count() const {
    std::shared_lock lock{mutex_};
    return entries_.size();
}

size_t ReverseLookupIndex::descendant_count() const {
    std::shared_lock lock{mutex_};
    size_t count{0};
    for (const auto& [root, set] : descendants_) {
        count += set.size();
    }
    return count;
}

bool ReverseLookupIndex::empty() const {
    std::shared_lock lock{mutex_};
    return entries_.empty() && descendants_.empty();
}

bool ReverseLookupIndex::is_descendant(const Hash& ancestor, const Hash& head) const {
    std::shared_lock lock{mutex_};
    const auto it{descendants_.find(ancestor)};
    return it != descendants_.end() && it->second.contains(head);
}

}  // namespace strata::snapshot
