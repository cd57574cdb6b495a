// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#include "layer_tree.hpp"

#include <algorithm>
#include <mutex>
#include <ranges>
#include <string>
#include <utility>
#include <vector>

#include <strata/core/common/util.hpp>
#include <strata/infra/common/ensure.hpp>
#include <strata/infra/common/log.hpp>
#include <strata/snapshot/diff_layer.hpp>
#include <strata/snapshot/disk_layer.hpp>
#include <strata/snapshot/errors.hpp>

namespace strata::snapshot {

static std::vector<std::shared_ptr<DiffLayer>> diffs_by_version(const FlatHashMap<Hash, Layer>& layers) {
    std::vector<std::shared_ptr<DiffLayer>> diffs;
    diffs.reserve(layers.size());
    for (const auto& [root, layer] : layers) {
        if (auto diff{as_diff(layer)}) {
            diffs.push_back(std::move(diff));
        }
    }
    std::ranges::sort(diffs, {}, [](const auto& diff) { return diff->version(); });
    return diffs;
}

LayerTree::LayerTree(std::shared_ptr<const DiskStore> store, const Hash& disk_root, const Config& config)
    : context_{std::make_shared<Context>(config)} {
    disk_ = std::make_shared<DiskLayer>(disk_root, last_version_, 0, std::move(store), nullptr, context_);
    layers_.emplace(disk_root, disk_);
    if (config.enable_lookup_index) {
        lookup_ = std::make_unique<ReverseLookupIndex>(&context_->metrics);
    }
    if (config.enable_multi_version_cache) {
        cache_ = std::make_unique<MultiVersionCache>(last_version_, config.eviction_threads, &context_->metrics);
    }
    STRATA_INFO_M("Snapshot layer tree opened", {"root", to_hex(disk_root, true),
                                                 "bloom_bits", std::to_string(context_->bloom.bits),
                                                 "bloom_funcs", std::to_string(context_->bloom.hash_functions),
                                                 "aggregator", human_size(config.aggregator_memory_limit)});
}

Layer LayerTree::find_locked(const Hash& root) const {
    const auto it{layers_.find(root)};
    if (it == layers_.end()) {
        throw SnapshotException{SnapshotError::kUnknownRoot, to_hex(root, true)};
    }
    return it->second;
}

std::shared_ptr<DiffLayer> LayerTree::update(const Hash& parent_root,
                                             const Hash& root,
                                             BlockNum block_num,
                                             StateWrites writes,
                                             DestructSet destructs) {
    std::unique_lock lock{mutex_};
    if (layers_.contains(root)) {
        throw SnapshotException{SnapshotError::kLayerExists, to_hex(root, true)};
    }
    Layer parent{find_locked(parent_root)};
    if (const auto disk{as_disk(parent)}; disk && disk->is_stale()) {
        throw SnapshotException{SnapshotError::kStaleLayer, "parent " + to_hex(parent_root, true)};
    }

    auto diff{std::make_shared<DiffLayer>(std::move(parent), root, ++last_version_, block_num, std::move(writes),
                                          std::move(destructs), context_)};
    layers_.emplace(root, diff);
    if (lookup_) {
        lookup_->add_layer(*diff);
    }
    if (cache_) {
        cache_->add_diff_layer(*diff);
    }
    return diff;
}

std::optional<Layer> LayerTree::get(const Hash& root) const {
    std::shared_lock lock{mutex_};
    const auto it{layers_.find(root)};
    if (it == layers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t LayerTree::size() const {
    std::shared_lock lock{mutex_};
    return layers_.size();
}

std::shared_ptr<DiskLayer> LayerTree::disk_layer() const {
    std::shared_lock lock{mutex_};
    return disk_;
}

std::shared_ptr<DiskLayer> LayerTree::flatten(const Hash& root, bool force) {
    std::unique_lock lock{mutex_};
    return flatten_locked(root, force);
}

std::shared_ptr<DiskLayer> LayerTree::flatten_locked(const Hash& root, bool force) {
    const auto target{as_diff(find_locked(root))};
    if (!target) {
        return disk_;
    }

    std::vector<std::shared_ptr<DiffLayer>> chain;
    FlatHashSet<Hash> flattened;
    for (auto current{target}; current; current = as_diff(current->parent())) {
        chain.push_back(current);
        flattened.insert(current->root());
    }
    ForkSplit split{split_forks(*target, flattened)};

    // Nothing may change before the index is known to cover every layer leaving the tree
    if (lookup_) {
        for (const auto* layers : {&chain, &split.discarded}) {
            for (const auto& diff : *layers) {
                if (const auto result{lookup_->verify_layer(*diff)}; !result) {
                    throw SnapshotException{result.error(), "layer " + to_hex(diff->root(), true)};
                }
            }
        }
    }

    std::shared_ptr<DiskLayer> base{target->persist(force)};

    for (const auto& diff : std::ranges::reverse_view(chain)) {
        remove_locked(*diff);
        if (cache_) {
            cache_->remove_diff_layer(*diff);
        }
        context_->metrics.mark(context_->metrics.layers_flattened);
    }

    layers_.erase(disk_->root());
    disk_ = base;
    layers_.insert_or_assign(base->root(), base);

    for (const auto& diff : split.survivors) {
        if (as_diff(diff->parent()) == target) {
            diff->set_parent(base);
        }
    }
    prune_forks(split);

    STRATA_DEBUG_M("Flattened diff layers", {"layers", std::to_string(chain.size()),
                                             "version", std::to_string(base->version()),
                                             "block", std::to_string(base->block_num()),
                                             "buffered", human_size(base->buffer().memory()),
                                             "root", to_hex(base->root(), true)});
    return base;
}

LayerTree::ForkSplit LayerTree::split_forks(const DiffLayer& target, const FlatHashSet<Hash>& flattened) const {
    ForkSplit split;
    FlatHashSet<Hash> alive{target.root()};
    for (auto& diff : diffs_by_version(layers_)) {
        if (flattened.contains(diff->root())) {
            continue;
        }
        const Layer parent{diff->parent()};
        if (as_diff(parent) && alive.contains(root_of(parent))) {
            alive.insert(diff->root());
            split.survivors.push_back(std::move(diff));
        } else {
            split.discarded.push_back(std::move(diff));
        }
    }
    return split;
}

void LayerTree::remove_locked(const DiffLayer& diff) {
    if (lookup_) {
        if (const auto result{lookup_->remove_layer(diff)}; !result) {
            throw SnapshotException{result.error(), "layer " + to_hex(diff.root(), true)};
        }
    }
    layers_.erase(diff.root());
}

void LayerTree::prune_forks(const ForkSplit& split) {
    for (const auto& diff : std::ranges::reverse_view(split.discarded)) {
        remove_locked(*diff);
        if (cache_) {
            cache_->discard_diff_layer(*diff);
        }
        context_->metrics.mark(context_->metrics.layers_discarded);
    }
    if (!split.discarded.empty()) {
        STRATA_DEBUG_M("Pruned stale forks", {"discarded", std::to_string(split.discarded.size()),
                                              "kept", std::to_string(split.survivors.size())});
    }

    for (const auto& diff : split.survivors) {
        diff->rebloom(disk_);
    }
}

void LayerTree::cap(const Hash& root, size_t layers) {
    std::unique_lock lock{mutex_};
    auto bottom{as_diff(find_locked(root))};
    if (!bottom) {
        return;
    }
    if (layers == 0) {
        flatten_locked(root, /*force=*/true);
        return;
    }
    for (size_t i{1}; i < layers; ++i) {
        auto parent{as_diff(bottom->parent())};
        if (!parent) {
            return;
        }
        bottom = std::move(parent);
    }
    if (const auto below{as_diff(bottom->parent())}) {
        flatten_locked(below->root(), /*force=*/false);
    }
}

void LayerTree::rebuild_index() {
    std::unique_lock lock{mutex_};
    if (!lookup_) {
        return;
    }
    lookup_->reset();
    const auto diffs{diffs_by_version(layers_)};
    for (const auto& diff : diffs) {
        lookup_->add_layer(*diff);
    }
    STRATA_INFO_M("Rebuilt lookup index", {"layers", std::to_string(diffs.size()),
                                           "keys", std::to_string(lookup_->key_count())});
}

std::optional<Bytes> LayerTree::resolve(const Hash& root, const StateKey& key) const {
    Layer head;
    {
        std::shared_lock lock{mutex_};
        head = find_locked(root);
    }
    return snapshot::resolve(head, key);
}

std::optional<Bytes> LayerTree::resolve_indexed(const Hash& root, const StateKey& key) const {
    std::shared_lock lock{mutex_};
    Layer head{find_locked(root)};
    if (!lookup_) {
        lock.unlock();
        return snapshot::resolve(head, key);
    }

    const LookupResult writer{lookup_->lookup(key, root)};
    LookupResult destruct{tl::make_unexpected(SnapshotError::kKeyNotIndexed)};
    if (key.is_destructible()) {
        destruct = lookup_->lookup_destruct(key.account_hash(), root);
    }

    if (writer && (!destruct || writer->version >= destruct->version)) {
        const auto it{layers_.find(writer->root)};
        const auto diff{it != layers_.end() ? as_diff(it->second) : nullptr};
        if (!diff) {
            throw SnapshotException{SnapshotError::kIndexCorruption, "untracked writer " + to_hex(writer->root, true)};
        }
        const Bytes* value{diff->find(key)};
        if (!value) {
            throw SnapshotException{SnapshotError::kIndexCorruption, key.to_string() + " not in writer layer"};
        }
        if (value->empty()) return std::nullopt;
        return *value;
    }
    if (destruct) {
        return std::nullopt;
    }
    return disk_->read(key);
}

std::optional<Bytes> LayerTree::resolve_cached(const Hash& root, const StateKey& key) const {
    std::shared_lock lock{mutex_};
    Layer head{find_locked(root)};
    if (!cache_ || key.kind() == StateKey::Kind::kTrieNode) {
        lock.unlock();
        return snapshot::resolve(head, key);
    }
    if (as_disk(head)) {
        return disk_->read(key);
    }

    CacheQueryResult result{cache_->query(version_of(head), root, key)};
    if (result.need_fallback_to_disk) {
        return disk_->read(key);
    }
    return std::move(result.value);
}

std::optional<Bytes> LayerTree::read(const Hash& root, const StateKey& key) const {
    if (cache_) {
        return resolve_cached(root, key);
    }
    if (lookup_) {
        return resolve_indexed(root, key);
    }
    return resolve(root, key);
}

std::optional<Bytes> LayerTree::account(const Hash& root, const Hash& account_hash) const {
    return read(root, StateKey::account(account_hash));
}

std::optional<Bytes> LayerTree::storage(const Hash& root, const Hash& account_hash, const Hash& slot_hash) const {
    return read(root, StateKey::storage(account_hash, slot_hash));
}

Bytes LayerTree::node(const Hash& root, const Hash& owner, ByteView path, const Hash& expected_hash) const {
    Layer head;
    {
        std::shared_lock lock{mutex_};
        head = find_locked(root);
    }
    return std::visit([&](const auto& layer) { return layer->node(owner, path, expected_hash); }, head);
}

}  // namespace strata::snapshot
