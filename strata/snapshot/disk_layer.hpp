// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <memory>
#include <optional>

#include <strata/core/common/base.hpp>
#include <strata/core/common/bytes.hpp>
#include <strata/snapshot/context.hpp>
#include <strata/snapshot/disk_store.hpp>
#include <strata/snapshot/types.hpp>

namespace strata::snapshot {

class DiffLayer;

//! \brief The persistent base of the layer tree: a store handle plus the write buffer aggregating flattened diffs.
//! \details A disk layer is never mutated: flattening a diff into it produces a new disk layer and marks this one
//! stale. A stale layer remains readable, with the content it had, for as long as someone holds it.
class DiskLayer {
  public:
    DiskLayer(const Hash& root,
              StateVersion version,
              BlockNum block_num,
              std::shared_ptr<const DiskStore> store,
              std::shared_ptr<const WriteBuffer> buffer,
              std::shared_ptr<Context> context);

    DiskLayer(const DiskLayer&) = delete;
    DiskLayer& operator=(const DiskLayer&) = delete;

    const Hash& root() const { return root_; }
    StateVersion version() const { return version_; }
    BlockNum block_num() const { return block_num_; }

    bool is_stale() const { return stale_.load(std::memory_order_acquire); }

    std::optional<Bytes> read(const StateKey& key) const;

    //! Trie node blob stored at (owner, path), checked against the expected hash (zero hash for a missing node)
    //! \throws UnexpectedNodeError on hash mismatch
    Bytes node(const Hash& owner, ByteView path, const Hash& expected_hash) const;

    //! Merges the bottom-most diff layer into a new disk layer. The write buffer is committed to the store only if
    //! forced or if it exceeds the aggregator limits.
    //! \throws SnapshotException with kStaleLayer if this layer has already been superseded
    std::shared_ptr<DiskLayer> commit(const DiffLayer& bottom, bool force);

    const WriteBuffer& buffer() const { return *buffer_; }
    const std::shared_ptr<const DiskStore>& store() const { return store_; }

  private:
    bool exceeds_limits(const WriteBuffer& buffer) const;

    Hash root_;
    StateVersion version_;
    BlockNum block_num_;
    std::shared_ptr<const DiskStore> store_;
    std::shared_ptr<const WriteBuffer> buffer_;
    std::shared_ptr<Context> context_;
    std::atomic<bool> stale_{false};
};

}  // namespace strata::snapshot
