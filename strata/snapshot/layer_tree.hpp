// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>
#include <shared_mutex>
#include <vector>

#include <strata/core/common/base.hpp>
#include <strata/core/common/bytes.hpp>
#include <strata/core/common/hash_maps.hpp>
#include <strata/snapshot/config.hpp>
#include <strata/snapshot/context.hpp>
#include <strata/snapshot/disk_store.hpp>
#include <strata/snapshot/layer.hpp>
#include <strata/snapshot/lookup.hpp>
#include <strata/snapshot/metrics.hpp>
#include <strata/snapshot/multi_version_cache.hpp>
#include <strata/snapshot/state_key.hpp>
#include <strata/snapshot/types.hpp>

namespace strata::snapshot {

class DiffLayer;
class DiskLayer;

//! \brief Forest of diff layers sharing one disk layer, addressed by state root.
//! \details The tree owns every layer, assigns versions and keeps the optional lookup index and multi-version cache
//! in sync with the layers it tracks. Structural changes (update, flatten, cap) are serialized by the tree lock.
//! The bloom walk read path only holds the tree lock to find the head layer, the indexed and cached read paths hold
//! it in shared mode for the whole query because they read the disk layer directly.
class LayerTree {
  public:
    LayerTree(std::shared_ptr<const DiskStore> store, const Hash& disk_root, const Config& config = {});

    LayerTree(const LayerTree&) = delete;
    LayerTree& operator=(const LayerTree&) = delete;

    //! Adds a diff layer on top of the layer having parent_root, assigning it the next version
    //! \throws SnapshotException with kLayerExists or kUnknownRoot
    std::shared_ptr<DiffLayer> update(const Hash& parent_root,
                                      const Hash& root,
                                      BlockNum block_num,
                                      StateWrites writes,
                                      DestructSet destructs = {});

    std::optional<Layer> get(const Hash& root) const;

    //! Number of tracked layers, disk layer included
    size_t size() const;

    std::shared_ptr<DiskLayer> disk_layer() const;

    //! Flattens the layer having root and all its diff ancestors into a new disk layer, then prunes the forks no
    //! longer descending from it. The write buffer is committed to the store if forced or full.
    //! \throws SnapshotException with kUnknownRoot, or kIndexCorruption leaving the tree unchanged
    std::shared_ptr<DiskLayer> flatten(const Hash& root, bool force);

    //! Keeps at most `layers` diff layers below and including root, flattening the ones beneath.
    //! Zero layers means flattening root itself with a forced commit.
    void cap(const Hash& root, size_t layers);

    //! Keeps the configured maximum number of diff layers
    void cap(const Hash& root) { cap(root, context_->config.max_diff_layers); }

    //! Re-synchronizes the lookup index with all the tracked diff layers
    void rebuild_index();

    //! Value of the key at the given state, found through the bloom filters and the parent chain
    std::optional<Bytes> resolve(const Hash& root, const StateKey& key) const;

    //! Value of the key at the given state, found through the lookup index (bloom walk if disabled)
    std::optional<Bytes> resolve_indexed(const Hash& root, const StateKey& key) const;

    //! Value of the key at the given state, found through the multi-version cache falling back to the disk layer
    //! (bloom walk if disabled or for trie nodes)
    std::optional<Bytes> resolve_cached(const Hash& root, const StateKey& key) const;

    std::optional<Bytes> account(const Hash& root, const Hash& account_hash) const;
    std::optional<Bytes> storage(const Hash& root, const Hash& account_hash, const Hash& slot_hash) const;

    //! \throws UnexpectedNodeError if the trie node does not hash to expected_hash
    Bytes node(const Hash& root, const Hash& owner, ByteView path, const Hash& expected_hash) const;

    const Metrics& metrics() const { return context_->metrics; }
    const Config& config() const { return context_->config; }

    ReverseLookupIndex* lookup_index() const { return lookup_.get(); }
    MultiVersionCache* multi_version_cache() const { return cache_.get(); }

  private:
    //! Diff layers left once a chain is flattened: descendants of its top and forks to discard, by version
    struct ForkSplit {
        std::vector<std::shared_ptr<DiffLayer>> survivors;
        std::vector<std::shared_ptr<DiffLayer>> discarded;
    };

    Layer find_locked(const Hash& root) const;
    std::shared_ptr<DiskLayer> flatten_locked(const Hash& root, bool force);
    ForkSplit split_forks(const DiffLayer& target, const FlatHashSet<Hash>& flattened) const;
    void remove_locked(const DiffLayer& diff);
    void prune_forks(const ForkSplit& split);
    std::optional<Bytes> read(const Hash& root, const StateKey& key) const;

    std::shared_ptr<Context> context_;

    mutable std::shared_mutex mutex_;
    FlatHashMap<Hash, Layer> layers_;
    std::shared_ptr<DiskLayer> disk_;
    StateVersion last_version_{0};

    std::unique_ptr<ReverseLookupIndex> lookup_;
    std::unique_ptr<MultiVersionCache> cache_;
};

}  // namespace strata::snapshot
