// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <shared_mutex>
#include <vector>

#include <strata/core/common/base.hpp>
#include <strata/core/common/bytes.hpp>
#include <strata/core/common/hash_maps.hpp>
#include <strata/infra/concurrency/thread_pool.hpp>
#include <strata/snapshot/metrics.hpp>
#include <strata/snapshot/state_key.hpp>
#include <strata/snapshot/types.hpp>

namespace strata::snapshot {

class DiffLayer;

//! Outcome of a point-in-time cache query
struct CacheQueryResult {
    //! The value, std::nullopt when deleted or when the cache cannot tell
    std::optional<Bytes> value;
    //! True when no qualifying item is cached: the caller must consult the disk layer
    bool need_fallback_to_disk{false};
};

//! \brief Versioned cache of account and storage items written by the diff layers, queried at a (version, root).
//! \details An item qualifies for a query if its version is not above the queried one, is above the eviction
//! watermark, and its root lies on the queried root's own ancestor chain. Items at or below the watermark are
//! physically removed by background eviction tasks, queries never depend on whether that already happened.
class MultiVersionCache {
  public:
    explicit MultiVersionCache(StateVersion base_version = 0,
                               unsigned eviction_threads = 1,
                               Metrics* metrics = nullptr);

    MultiVersionCache(const MultiVersionCache&) = delete;
    MultiVersionCache& operator=(const MultiVersionCache&) = delete;

    //! Caches the account and storage items plus destruct markers of a diff layer whose diff parent is cached.
    //! Trie nodes are not cached.
    void add_diff_layer(const DiffLayer& diff);

    //! Retires a flattened layer: raises the watermark to its version and schedules eviction.
    //! Layers must be retired bottom-up.
    void remove_diff_layer(const DiffLayer& diff);

    //! Drops a layer pruned from the tree without moving the watermark
    void discard_diff_layer(const DiffLayer& diff);

    CacheQueryResult query_account(StateVersion version, const Hash& root, const Hash& account_hash) const;
    CacheQueryResult query_storage(StateVersion version, const Hash& root, const Hash& account_hash,
                                   const Hash& slot_hash) const;

    //! Dispatches on the key kind, trie node keys always need fallback
    CacheQueryResult query(StateVersion version, const Hash& root, const StateKey& key) const;

    void pause_eviction() { pool_.pause(); }
    void resume_eviction() { pool_.unpause(); }

    //! Blocks until scheduled eviction tasks are done (only running ones if eviction is paused)
    void wait_for_eviction() { pool_.wait_for_tasks(); }

    //! Number of data items plus destruct markers physically held
    size_t item_count() const;

    StateVersion min_version() const;

    bool has_ancestry(const Hash& root) const;

  private:
    struct Item {
        StateVersion version{0};
        Hash root;
        Bytes data;  // empty when deleted
    };

    struct Marker {
        StateVersion version{0};
        Hash root;
    };

    using Ancestry = FlatHashSet<Hash>;

    template <typename Entry>
    const Entry* select(const std::vector<Entry>& entries, StateVersion version, const Ancestry& ancestry) const;

    CacheQueryResult resolve(const std::vector<Item>* items, const std::vector<Marker>* markers, StateVersion version,
                             const Hash& root) const;

    void evict(const Hash& root);

    mutable std::shared_mutex mutex_;
    FlatHashMap<Hash, std::vector<Marker>> destructs_;
    FlatHashMap<Hash, std::vector<Item>> accounts_;
    FlatHashMap<Hash, FlatHashMap<Hash, std::vector<Item>>> storage_;
    FlatHashMap<Hash, Ancestry> ancestry_;
    StateVersion min_version_;
    size_t item_count_{0};
    Metrics* metrics_;

    ThreadPool pool_;  // last member: outstanding evictions are drained before the maps are destroyed
};

}  // namespace strata::snapshot
