// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#include "disk_store.hpp"

#include <utility>

namespace strata::snapshot {

uint64_t erase_account_range(OrderedStateMap& map, const Hash& account_hash) {
    uint64_t erased_bytes{0};
    if (const auto it{map.find(StateKey::account(account_hash))}; it != map.end()) {
        erased_bytes += it->first.size() + it->second.size();
        map.erase(it);
    }
    auto it{map.lower_bound(StateKey::storage(account_hash, Hash{}))};
    while (it != map.end() && it->first.kind() == StateKey::Kind::kStorage &&
           it->first.account_hash() == account_hash) {
        erased_bytes += it->first.size() + it->second.size();
        it = map.erase(it);
    }
    return erased_bytes;
}

void WriteBuffer::erase_account(const Hash& account_hash) {
    memory_ -= erase_account_range(writes_, account_hash);
}

void WriteBuffer::merge(const StateWrites& writes, const DestructSet& destructs) {
    for (const auto& account_hash : destructs) {
        erase_account(account_hash);
        if (destructs_.insert(account_hash).second) {
            memory_ += kHashLength;
        }
    }
    for (const auto& [key, value] : writes) {
        auto [it, inserted] = writes_.try_emplace(key, value);
        if (inserted) {
            memory_ += key.size() + value.size();
        } else {
            memory_ = memory_ - it->second.size() + value.size();
            it->second = value;
        }
    }
}

const Bytes* WriteBuffer::find(const StateKey& key) const {
    const auto it{writes_.find(key)};
    return it != writes_.end() ? &it->second : nullptr;
}

bool WriteBuffer::is_destructed(const StateKey& key) const {
    return key.is_destructible() && destructs_.contains(key.account_hash());
}

MemoryDiskStore::MemoryDiskStore(OrderedStateMap data) : data_{std::move(data)} {}

std::optional<Bytes> MemoryDiskStore::read(const StateKey& key) const {
    const auto it{data_.find(key)};
    if (it == data_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::shared_ptr<const DiskStore> MemoryDiskStore::commit(const WriteBuffer& buffer) const {
    OrderedStateMap data{data_};
    for (const auto& account_hash : buffer.destructs()) {
        erase_account_range(data, account_hash);
    }
    for (const auto& [key, value] : buffer.writes()) {
        if (value.empty()) {
            data.erase(key);
        } else {
            data.insert_or_assign(key, value);
        }
    }
    return std::make_shared<MemoryDiskStore>(std::move(data));
}

}  // namespace strata::snapshot
