// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#include "state_key.hpp"

#include <cstring>

#include <strata/core/common/base.hpp>
#include <strata/core/common/util.hpp>

namespace strata::snapshot {

static Bytes encode_prefix(StateKey::Kind kind, const evmc::bytes32& hash, size_t extra) {
    Bytes encoded;
    encoded.reserve(1 + kHashLength + extra);
    encoded.push_back(static_cast<uint8_t>(kind));
    encoded.append(hash.bytes, kHashLength);
    return encoded;
}

StateKey StateKey::account(const evmc::bytes32& account_hash) {
    return StateKey{encode_prefix(Kind::kAccount, account_hash, 0)};
}

StateKey StateKey::storage(const evmc::bytes32& account_hash, const evmc::bytes32& slot_hash) {
    Bytes encoded{encode_prefix(Kind::kStorage, account_hash, kHashLength)};
    encoded.append(slot_hash.bytes, kHashLength);
    return StateKey{std::move(encoded)};
}

StateKey StateKey::trie_node(const evmc::bytes32& owner, ByteView path) {
    Bytes encoded{encode_prefix(Kind::kTrieNode, owner, path.size())};
    encoded.append(path);
    return StateKey{std::move(encoded)};
}

StateKey StateKey::destruct(const evmc::bytes32& account_hash) {
    return StateKey{encode_prefix(Kind::kDestruct, account_hash, 0)};
}

evmc::bytes32 StateKey::account_hash() const {
    evmc::bytes32 hash;
    if (encoded_.size() >= 1 + kHashLength) {
        std::memcpy(hash.bytes, encoded_.data() + 1, kHashLength);
    }
    return hash;
}

evmc::bytes32 StateKey::slot_hash() const {
    evmc::bytes32 hash;
    if (kind() == Kind::kStorage) {
        std::memcpy(hash.bytes, encoded_.data() + 1 + kHashLength, kHashLength);
    }
    return hash;
}

ByteView StateKey::path() const {
    if (kind() != Kind::kTrieNode) return {};
    return ByteView{encoded_}.substr(1 + kHashLength);
}

std::string StateKey::to_string() const {
    switch (kind()) {
        case Kind::kAccount:
            return "account:" + to_hex(account_hash());
        case Kind::kStorage:
            return "storage:" + to_hex(account_hash()) + "/" + to_hex(slot_hash());
        case Kind::kTrieNode:
            return "node:" + to_hex(account_hash()) + "/" + to_hex(path());
        case Kind::kDestruct:
            return "destruct:" + to_hex(account_hash());
    }
    return "unknown:" + to_hex(encoded_);
}

}  // namespace strata::snapshot
