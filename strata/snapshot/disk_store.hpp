// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <memory>
#include <optional>

#include <absl/container/btree_map.h>

#include <strata/core/common/bytes.hpp>
#include <strata/snapshot/state_key.hpp>
#include <strata/snapshot/types.hpp>

namespace strata::snapshot {

//! Ordered key-value items, so that the storage of one account is a contiguous range
using OrderedStateMap = absl::btree_map<StateKey, Bytes>;

//! \brief Writes of the flattened diff layers aggregated in memory by the disk layer until committed to the store.
//! \details Destructs are applied before writes: merging a destruct drops the buffered account and storage items of
//! that account, merging a write records it even if the account was destructed by an earlier merge.
class WriteBuffer {
  public:
    void merge(const StateWrites& writes, const DestructSet& destructs);

    //! The buffered value (possibly empty, i.e. deleted) or nullptr when the key was not written
    const Bytes* find(const StateKey& key) const;

    //! True if the key belongs to an account wiped by a buffered destruct
    bool is_destructed(const StateKey& key) const;

    const OrderedStateMap& writes() const { return writes_; }
    const DestructSet& destructs() const { return destructs_; }

    size_t items() const { return writes_.size() + destructs_.size(); }
    uint64_t memory() const { return memory_; }
    bool empty() const { return writes_.empty() && destructs_.empty(); }

  private:
    void erase_account(const Hash& account_hash);

    OrderedStateMap writes_;
    DestructSet destructs_;
    uint64_t memory_{0};
};

//! \brief The persistent key-value state store beneath the disk layer.
//! \details A handle is a consistent view: commit never mutates it but returns the handle of the new state.
class DiskStore {
  public:
    virtual ~DiskStore() = default;

    virtual std::optional<Bytes> read(const StateKey& key) const = 0;

    virtual std::shared_ptr<const DiskStore> commit(const WriteBuffer& buffer) const = 0;
};

//! In-memory copy-on-commit DiskStore implementation
class MemoryDiskStore : public DiskStore {
  public:
    MemoryDiskStore() = default;
    explicit MemoryDiskStore(OrderedStateMap data);

    std::optional<Bytes> read(const StateKey& key) const override;

    std::shared_ptr<const DiskStore> commit(const WriteBuffer& buffer) const override;

    size_t size() const { return data_.size(); }

  private:
    OrderedStateMap data_;
};

//! Removes the account item and the whole storage of an account from an ordered map
//! \return the number of bytes (keys plus values) removed
uint64_t erase_account_range(OrderedStateMap& map, const Hash& account_hash);

}  // namespace strata::snapshot
