// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#include "disk_store.hpp"

#include <catch2/catch.hpp>

#include <strata/snapshot/test_util/state_fixtures.hpp>

namespace strata::snapshot {

using test_util::make_hash;
using test_util::value_of;

TEST_CASE("erase_account_range", "[snapshot][disk_store]") {
    const Hash a{make_hash(1)};
    const Hash b{make_hash(2)};
    OrderedStateMap map;
    map.emplace(StateKey::account(a), value_of("acc-a"));
    map.emplace(StateKey::storage(a, make_hash(10)), value_of("s1"));
    map.emplace(StateKey::storage(a, make_hash(11)), value_of("s2"));
    map.emplace(StateKey::account(b), value_of("acc-b"));
    map.emplace(StateKey::storage(b, make_hash(10)), value_of("s3"));

    const uint64_t erased{erase_account_range(map, a)};
    CHECK(erased == (33 + 5) + (65 + 2) * 2);
    CHECK(map.size() == 2);
    CHECK(map.contains(StateKey::account(b)));
    CHECK(map.contains(StateKey::storage(b, make_hash(10))));
    CHECK(erase_account_range(map, a) == 0);
}

TEST_CASE("WriteBuffer merge", "[snapshot][disk_store]") {
    const Hash a{make_hash(1)};
    const StateKey account{StateKey::account(a)};
    const StateKey slot{StateKey::storage(a, make_hash(10))};
    WriteBuffer buffer;
    CHECK(buffer.empty());

    SECTION("writes overwrite") {
        buffer.merge({{account, value_of("v1")}, {slot, value_of("s1")}}, {});
        CHECK(buffer.items() == 2);
        CHECK(buffer.memory() == 33 + 2 + 65 + 2);
        buffer.merge({{account, value_of("v22")}}, {});
        REQUIRE(buffer.find(account));
        CHECK(*buffer.find(account) == value_of("v22"));
        CHECK(buffer.memory() == 33 + 3 + 65 + 2);
        CHECK_FALSE(buffer.is_destructed(account));
    }

    SECTION("destruct wipes previously buffered items") {
        buffer.merge({{account, value_of("v1")}, {slot, value_of("s1")}}, {});
        buffer.merge({}, {a});
        CHECK(buffer.find(account) == nullptr);
        CHECK(buffer.find(slot) == nullptr);
        CHECK(buffer.is_destructed(slot));
        CHECK(buffer.items() == 1);
        CHECK(buffer.memory() == 32);
    }

    SECTION("writes of the same merge survive the destruct") {
        buffer.merge({{slot, value_of("old")}}, {});
        buffer.merge({{account, value_of("reborn")}}, {a});
        REQUIRE(buffer.find(account));
        CHECK(*buffer.find(account) == value_of("reborn"));
        CHECK(buffer.find(slot) == nullptr);
        CHECK(buffer.is_destructed(slot));
    }
}

TEST_CASE("MemoryDiskStore commit", "[snapshot][disk_store]") {
    const Hash a{make_hash(1)};
    const Hash b{make_hash(2)};
    OrderedStateMap data;
    data.emplace(StateKey::account(a), value_of("acc-a"));
    data.emplace(StateKey::storage(a, make_hash(10)), value_of("s1"));
    data.emplace(StateKey::account(b), value_of("acc-b"));
    const auto store{std::make_shared<MemoryDiskStore>(std::move(data))};

    WriteBuffer buffer;
    buffer.merge({{StateKey::account(b), Bytes{}}}, {});
    buffer.merge({{StateKey::account(a), value_of("new-a")}}, {a});
    const auto committed{store->commit(buffer)};

    CHECK(committed->read(StateKey::account(a)) == value_of("new-a"));
    CHECK_FALSE(committed->read(StateKey::storage(a, make_hash(10))));
    CHECK_FALSE(committed->read(StateKey::account(b)));

    // the original handle is untouched
    CHECK(store->read(StateKey::account(a)) == value_of("acc-a"));
    CHECK(store->read(StateKey::storage(a, make_hash(10))) == value_of("s1"));
    CHECK(store->size() == 3);
}

}  // namespace strata::snapshot
