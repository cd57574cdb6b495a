// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#include "state_key.hpp"

#include <catch2/catch.hpp>

#include <strata/core/common/hash_maps.hpp>
#include <strata/core/common/util.hpp>

namespace strata::snapshot {

using evmc::literals::operator""_bytes32;

static const auto kAccount{0x00000000000000000000000000000000000000000000000000000000000000aa_bytes32};
static const auto kOtherAccount{0x00000000000000000000000000000000000000000000000000000000000000bb_bytes32};
static const auto kSlot{0x0000000000000000000000000000000000000000000000000000000000000001_bytes32};

TEST_CASE("StateKey accessors", "[snapshot][state_key]") {
    SECTION("account") {
        const auto key{StateKey::account(kAccount)};
        CHECK(key.kind() == StateKey::Kind::kAccount);
        CHECK(key.account_hash() == kAccount);
        CHECK(key.slot_hash() == evmc::bytes32{});
        CHECK(key.path().empty());
        CHECK(key.is_destructible());
        CHECK(key.size() == 33);
    }
    SECTION("storage") {
        const auto key{StateKey::storage(kAccount, kSlot)};
        CHECK(key.kind() == StateKey::Kind::kStorage);
        CHECK(key.account_hash() == kAccount);
        CHECK(key.slot_hash() == kSlot);
        CHECK(key.is_destructible());
        CHECK(key.size() == 65);
    }
    SECTION("trie node") {
        const Bytes path{*from_hex("0x0a0b")};
        const auto key{StateKey::trie_node(kAccount, path)};
        CHECK(key.kind() == StateKey::Kind::kTrieNode);
        CHECK(key.account_hash() == kAccount);
        CHECK(key.path() == ByteView{path});
        CHECK_FALSE(key.is_destructible());
    }
    SECTION("destruct") {
        const auto key{StateKey::destruct(kAccount)};
        CHECK(key.kind() == StateKey::Kind::kDestruct);
        CHECK(key.account_hash() == kAccount);
        CHECK_FALSE(key.is_destructible());
        CHECK(key != StateKey::account(kAccount));
    }
}

TEST_CASE("StateKey storage keys of one account are contiguous", "[snapshot][state_key]") {
    const auto first{StateKey::storage(kAccount, evmc::bytes32{})};
    CHECK(first < StateKey::storage(kAccount, kSlot));
    CHECK(StateKey::storage(kAccount, kSlot) < StateKey::storage(kOtherAccount, evmc::bytes32{}));
    CHECK(StateKey::account(kOtherAccount) < first);
    CHECK(StateKey::storage(kOtherAccount, kSlot) < StateKey::trie_node(kAccount, {}));
}

TEST_CASE("StateKey hashing", "[snapshot][state_key]") {
    FlatHashSet<StateKey> keys;
    keys.insert(StateKey::account(kAccount));
    keys.insert(StateKey::account(kAccount));
    keys.insert(StateKey::destruct(kAccount));
    keys.insert(StateKey::storage(kAccount, kSlot));
    CHECK(keys.size() == 3);
    CHECK(keys.contains(StateKey::storage(kAccount, kSlot)));
}

TEST_CASE("StateKey to_string", "[snapshot][state_key]") {
    CHECK(StateKey::account(kAccount).to_string().starts_with("account:"));
    CHECK(StateKey::storage(kAccount, kSlot).to_string().starts_with("storage:"));
    CHECK(StateKey::destruct(kAccount).to_string().starts_with("destruct:"));
}

}  // namespace strata::snapshot
