// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <compare>
#include <cstdint>
#include <string>
#include <utility>

#include <evmc/evmc.hpp>

#include <strata/core/common/bytes.hpp>

namespace strata::snapshot {

//! \brief Exact-match key of one state item: an account, a storage slot or a trie node.
//! \details The binary encoding is <kind><account or owner hash>[<slot hash> | <path>] and keys order by encoding,
//! so all the storage keys of one account are contiguous starting at storage(account, 0).
class StateKey {
  public:
    enum class Kind : uint8_t {
        kAccount = 0x01,
        kStorage = 0x02,
        kTrieNode = 0x03,
        kDestruct = 0x04,  // index-only marker for an account destruction
    };

    StateKey() = default;

    static StateKey account(const evmc::bytes32& account_hash);
    static StateKey storage(const evmc::bytes32& account_hash, const evmc::bytes32& slot_hash);
    static StateKey trie_node(const evmc::bytes32& owner, ByteView path);
    static StateKey destruct(const evmc::bytes32& account_hash);

    Kind kind() const { return static_cast<Kind>(encoded_[0]); }

    //! Account hash for account, storage and destruct keys, owner hash for trie node keys
    evmc::bytes32 account_hash() const;

    //! Slot hash of a storage key, zero otherwise
    evmc::bytes32 slot_hash() const;

    //! Path of a trie node key, empty otherwise
    ByteView path() const;

    //! True for keys wiped out by an account destruction
    bool is_destructible() const { return kind() == Kind::kAccount || kind() == Kind::kStorage; }

    ByteView encoded() const { return encoded_; }
    size_t size() const { return encoded_.size(); }

    std::string to_string() const;

    friend bool operator==(const StateKey&, const StateKey&) = default;
    friend std::strong_ordering operator<=>(const StateKey& lhs, const StateKey& rhs) {
        return lhs.encoded_.compare(rhs.encoded_) <=> 0;
    }

    template <typename H>
    friend H AbslHashValue(H h, const StateKey& key) {
        return H::combine(std::move(h), std::string_view{reinterpret_cast<const char*>(key.encoded_.data()),
                                                         key.encoded_.size()});
    }

  private:
    explicit StateKey(Bytes encoded) : encoded_{std::move(encoded)} {}

    Bytes encoded_{static_cast<uint8_t>(Kind::kAccount)};
};

}  // namespace strata::snapshot
