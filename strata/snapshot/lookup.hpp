// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <shared_mutex>
#include <vector>

#include <tl/expected.hpp>

#include <strata/core/common/base.hpp>
#include <strata/core/common/hash_maps.hpp>
#include <strata/snapshot/errors.hpp>
#include <strata/snapshot/layer.hpp>
#include <strata/snapshot/metrics.hpp>
#include <strata/snapshot/state_key.hpp>
#include <strata/snapshot/types.hpp>

namespace strata::snapshot {

class DiffLayer;

//! Identifies the diff layer which wrote a key
struct IndexEntry {
    Hash root;
    StateVersion version{0};

    friend bool operator==(const IndexEntry&, const IndexEntry&) = default;
};

using LookupResult = tl::expected<IndexEntry, SnapshotError>;

//! \brief Reverse index from each touched key to the diff layers writing it, across all forks.
//! \details Entries are kept in global creation order. The descendant relation records, for each tracked diff
//! layer, every younger diff layer built on top of it so that a lookup only accepts writers lying on the queried
//! head's own ancestor chain. Lookup cost is proportional to the number of writers of the key on any fork since
//! the closest writer on the head's chain.
class ReverseLookupIndex {
  public:
    explicit ReverseLookupIndex(Metrics* metrics = nullptr) : metrics_{metrics} {}

    ReverseLookupIndex(const ReverseLookupIndex&) = delete;
    ReverseLookupIndex& operator=(const ReverseLookupIndex&) = delete;

    //! Resets the index and adds every diff layer from the bottom of the head's chain up to the head
    void build(const Layer& head);

    //! Indexes the writes and destructs of a diff layer whose diff parent (if any) is already indexed
    void add_layer(const DiffLayer& diff);

    //! Drops every entry of a diff layer and its descendant relation. The index is left untouched on failure.
    //! \return kIndexCorruption if an entry expected for the layer is missing
    SnapshotResult remove_layer(const DiffLayer& diff);

    //! Checks that every entry of a diff layer is present, without changing the index
    //! \return kIndexCorruption if an entry expected for the layer is missing
    SnapshotResult verify_layer(const DiffLayer& diff) const;

    //! Closest writer of the key on the head's ancestor chain (head included)
    //! \return kKeyNotIndexed if no tracked layer reachable from head wrote the key: consult the disk layer
    LookupResult lookup(const StateKey& key, const Hash& head) const;

    //! Closest layer on the head's ancestor chain destructing the account
    LookupResult lookup_destruct(const Hash& account_hash, const Hash& head) const;

    void reset();

    size_t key_count() const;
    size_t descendant_count() const;
    bool empty() const;

    //! True if head has been built on top of ancestor (directly or not)
    bool is_descendant(const Hash& ancestor, const Hash& head) const;

  private:
    void add_entry(const StateKey& key, const IndexEntry& entry);
    bool has_entry(const StateKey& key, const Hash& root) const;
    void remove_entry(const StateKey& key, const Hash& root);
    SnapshotResult verify_layer_locked(const DiffLayer& diff) const;
    void add_layer_locked(const DiffLayer& diff);

    mutable std::shared_mutex mutex_;
    FlatHashMap<StateKey, std::vector<IndexEntry>> entries_;
    FlatHashMap<Hash, FlatHashSet<Hash>> descendants_;
    Metrics* metrics_;
};

}  // namespace strata::snapshot
