// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#include "diff_layer.hpp"

#include <mutex>
#include <string>
#include <utility>

#include <strata/core/common/util.hpp>
#include <strata/infra/common/ensure.hpp>
#include <strata/infra/common/log.hpp>
#include <strata/snapshot/disk_layer.hpp>
#include <strata/snapshot/errors.hpp>

namespace strata::snapshot {

DiffLayer::DiffLayer(Layer parent,
                     const Hash& root,
                     StateVersion version,
                     BlockNum block_num,
                     StateWrites writes,
                     DestructSet destructs,
                     std::shared_ptr<Context> context)
    : root_{root},
      version_{version},
      block_num_{block_num},
      writes_{std::move(writes)},
      destructs_{std::move(destructs)},
      context_{std::move(context)},
      parent_{std::move(parent)} {
    ensure(context_ != nullptr, "diff layer requires a context");
    ensure_invariant(version_ > version_of(parent_), [&] {
        return "diff layer version " + std::to_string(version_) + " not above parent version " +
               std::to_string(version_of(parent_));
    });

    for (const auto& [key, value] : writes_) {
        memory_ += key.size() + value.size();
    }
    memory_ += destructs_.size() * kHashLength;

    std::shared_ptr<DiskLayer> origin;
    if (const auto parent_diff{as_diff(parent_)}) {
        origin = parent_diff->origin();
    } else {
        origin = as_disk(parent_);
    }
    rebloom(std::move(origin));

    context_->metrics.mark(context_->metrics.layers_created);
    STRATA_DEBUG_M("Created new diff layer", {"version", std::to_string(version_),
                                              "block", std::to_string(block_num_),
                                              "items", std::to_string(writes_.size() + destructs_.size()),
                                              "size", human_size(memory_),
                                              "root", to_hex(root_, true)});
}

Layer DiffLayer::parent() const {
    std::shared_lock lock{lock_};
    return parent_;
}

std::shared_ptr<DiskLayer> DiffLayer::origin() const {
    std::shared_lock lock{lock_};
    return origin_;
}

void DiffLayer::set_parent(Layer parent) {
    std::unique_lock lock{lock_};
    parent_ = std::move(parent);
}

const Bytes* DiffLayer::find(const StateKey& key) const {
    const auto it{writes_.find(key)};
    return it != writes_.end() ? &it->second : nullptr;
}

bool DiffLayer::is_destructed(const StateKey& key) const {
    return key.is_destructible() && destructs_.contains(key.account_hash());
}

bool DiffLayer::bloom_may_contain(const StateKey& key) const {
    if (diffed_->contains_hash(bloom_hash(key))) {
        return true;
    }
    return key.is_destructible() && diffed_->contains_hash(bloom_hash(StateKey::destruct(key.account_hash())));
}

DiffLayer::Walk DiffLayer::walk(const StateKey& key) const {
    auto& metrics{context_->metrics};
    {
        std::shared_lock lock{lock_};
        if (!bloom_may_contain(key)) {
            metrics.mark(metrics.bloom_misses);
            return {.value = std::nullopt, .disk = origin_};
        }
    }
    metrics.mark(metrics.bloom_hits);

    const DiffLayer* current{this};
    std::shared_ptr<DiffLayer> hold;  // keeps the current ancestor alive while walking
    while (true) {
        if (const Bytes* value{current->find(key)}) {
            metrics.mark(metrics.dirty_hits);
            if (value->empty()) return {};
            return {.value = *value, .disk = nullptr};
        }
        if (current->is_destructed(key)) {
            metrics.mark(metrics.dirty_hits);
            return {};
        }
        Layer parent{current->parent()};
        if (auto parent_diff{as_diff(parent)}) {
            hold = std::move(parent_diff);
            current = hold.get();
            continue;
        }
        auto parent_disk{as_disk(parent)};
        if (!parent_disk) {
            throw SnapshotException{SnapshotError::kUnknownParentType,
                                    "parent of layer " + to_hex(current->root_, true)};
        }
        metrics.mark(metrics.dirty_misses);
        return {.value = std::nullopt, .disk = std::move(parent_disk)};
    }
}

std::optional<Bytes> DiffLayer::resolve(const StateKey& key) const {
    Walk result{walk(key)};
    if (result.disk) {
        return result.disk->read(key);
    }
    return std::move(result.value);
}

Bytes DiffLayer::node(const Hash& owner, ByteView path, const Hash& expected_hash) const {
    Walk result{walk(StateKey::trie_node(owner, path))};
    if (result.disk) {
        return result.disk->node(owner, path, expected_hash);
    }
    Bytes blob{result.value.value_or(Bytes{})};
    const Hash actual{blob.empty() ? Hash{} : keccak256_as_bytes32(blob)};
    if (actual != expected_hash) {
        STRATA_ERROR_M("Unexpected trie node in diff layer", {"owner", to_hex(owner, true),
                                                               "path", to_hex(path, true),
                                                               "expect", to_hex(expected_hash, true),
                                                               "got", to_hex(actual, true)});
        throw UnexpectedNodeError{"diff", expected_hash, actual, owner, path};
    }
    return blob;
}

std::shared_ptr<DiffLayer> DiffLayer::update(const Hash& root,
                                             StateVersion version,
                                             BlockNum block_num,
                                             StateWrites writes,
                                             DestructSet destructs) {
    return std::make_shared<DiffLayer>(shared_from_this(), root, version, block_num, std::move(writes),
                                       std::move(destructs), context_);
}

std::shared_ptr<DiskLayer> DiffLayer::persist(bool force) {
    if (auto parent_diff{as_diff(parent())}) {
        std::shared_ptr<DiskLayer> base{parent_diff->persist(force)};
        set_parent(base);
    }
    auto disk{as_disk(parent())};
    if (!disk) {
        throw SnapshotException{SnapshotError::kUnknownParentType, "flattened layer " + to_hex(root_, true)};
    }
    return disk->commit(*this, force);
}

BloomFilter DiffLayer::build_self_bloom() const {
    BloomFilter filter{context_->bloom.bits, context_->bloom.hash_functions};
    for (const auto& [key, value] : writes_) {
        filter.add_hash(bloom_hash(key));
    }
    for (const auto& account_hash : destructs_) {
        filter.add_hash(bloom_hash(StateKey::destruct(account_hash)));
    }
    return filter;
}

void DiffLayer::rebloom(std::shared_ptr<DiskLayer> origin) {
    std::unique_lock lock{lock_};
    origin_ = std::move(origin);

    if (const auto parent_diff{as_diff(parent_)}) {
        std::shared_lock parent_lock{parent_diff->lock_};
        diffed_ = parent_diff->diffed_;
    } else {
        diffed_.emplace(context_->bloom.bits, context_->bloom.hash_functions);
    }
    if (!self_diffed_) {
        self_diffed_ = build_self_bloom();
    }
    diffed_->union_in_place(*self_diffed_);

    const double error_rate{diffed_->false_positive_rate()};
    context_->metrics.set_bloom_error(error_rate);
    STRATA_TRACE_M("Rebloomed diff layer", {"version", std::to_string(version_),
                                            "items", std::to_string(diffed_->n()),
                                            "error", std::to_string(error_rate)});
}

BloomFilter DiffLayer::cumulative_bloom() const {
    std::shared_lock lock{lock_};
    return *diffed_;
}

}  // namespace strata::snapshot
