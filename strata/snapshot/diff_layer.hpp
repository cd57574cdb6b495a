// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>
#include <shared_mutex>

#include <strata/core/common/base.hpp>
#include <strata/core/common/bytes.hpp>
#include <strata/snapshot/bloom_filter.hpp>
#include <strata/snapshot/context.hpp>
#include <strata/snapshot/layer.hpp>
#include <strata/snapshot/state_key.hpp>
#include <strata/snapshot/types.hpp>

namespace strata::snapshot {

class DiskLayer;

//! \brief One block's worth of state changes stacked on top of a parent layer.
//! \details The writes and destructs are immutable once constructed. The parent link is swapped (never mutated in
//! place) when an ancestor gets flattened, so it is read and written under the layer lock together with the origin
//! disk layer and the cumulative bloom filter, which always describe the same chain.
class DiffLayer : public std::enable_shared_from_this<DiffLayer> {
  public:
    DiffLayer(Layer parent,
              const Hash& root,
              StateVersion version,
              BlockNum block_num,
              StateWrites writes,
              DestructSet destructs,
              std::shared_ptr<Context> context);

    DiffLayer(const DiffLayer&) = delete;
    DiffLayer& operator=(const DiffLayer&) = delete;

    const Hash& root() const { return root_; }
    StateVersion version() const { return version_; }
    BlockNum block_num() const { return block_num_; }

    //! Approximate memory held by writes and destructs
    uint64_t memory() const { return memory_; }

    const StateWrites& writes() const { return writes_; }
    const DestructSet& destructs() const { return destructs_; }

    Layer parent() const;
    std::shared_ptr<DiskLayer> origin() const;

    //! The value written in this very layer (possibly empty, i.e. deleted) or nullptr if not written here
    const Bytes* find(const StateKey& key) const;

    //! True if this very layer destructs the account the key belongs to
    bool is_destructed(const StateKey& key) const;

    //! Value of the key in the state represented by this layer, std::nullopt if absent or deleted.
    //! The cumulative bloom filter routes keys never written above disk straight to the origin disk layer.
    std::optional<Bytes> resolve(const StateKey& key) const;

    //! Trie node blob stored at (owner, path), checked against the expected hash (zero hash for a missing node)
    //! \throws UnexpectedNodeError on hash mismatch
    Bytes node(const Hash& owner, ByteView path, const Hash& expected_hash) const;

    //! Creates a new layer on top of this one
    std::shared_ptr<DiffLayer> update(const Hash& root,
                                      StateVersion version,
                                      BlockNum block_num,
                                      StateWrites writes,
                                      DestructSet destructs);

    //! Flattens this layer and all its diff ancestors into the disk layer beneath, bottom-up
    //! \return the new disk layer holding the state represented by this layer
    std::shared_ptr<DiskLayer> persist(bool force);

    //! Swaps the parent link, as done when the layer beneath gets flattened
    void set_parent(Layer parent);

    //! Rebuilds the cumulative bloom filter on top of the parent's one, targeting the given disk layer
    void rebloom(std::shared_ptr<DiskLayer> origin);

    //! Copy of the cumulative bloom filter (this layer plus all diff ancestors down to the origin)
    BloomFilter cumulative_bloom() const;

  private:
    struct Walk {
        std::optional<Bytes> value;
        std::shared_ptr<DiskLayer> disk;  // set when the key must be read from this disk layer
    };

    bool bloom_may_contain(const StateKey& key) const;
    Walk walk(const StateKey& key) const;
    BloomFilter build_self_bloom() const;

    const Hash root_;
    const StateVersion version_;
    const BlockNum block_num_;
    const StateWrites writes_;
    const DestructSet destructs_;
    const std::shared_ptr<Context> context_;
    uint64_t memory_{0};

    mutable std::shared_mutex lock_;
    Layer parent_;
    std::shared_ptr<DiskLayer> origin_;
    std::optional<BloomFilter> diffed_;
    std::optional<BloomFilter> self_diffed_;
};

}  // namespace strata::snapshot
