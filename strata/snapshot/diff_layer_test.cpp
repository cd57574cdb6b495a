// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#include "diff_layer.hpp"

#include <catch2/catch.hpp>

#include <strata/infra/test_util/log.hpp>
#include <strata/snapshot/disk_layer.hpp>
#include <strata/snapshot/test_util/state_fixtures.hpp>

namespace strata::snapshot {

using test_util::make_hash;
using test_util::value_of;

struct DiffLayerTest {
    DiffLayerTest() {
        OrderedStateMap data;
        data.emplace(StateKey::account(make_hash(1)), value_of("disk-a1"));
        data.emplace(StateKey::storage(make_hash(1), make_hash(10)), value_of("disk-s10"));
        data.emplace(StateKey::account(make_hash(2)), value_of("disk-a2"));
        data.emplace(StateKey::account(make_hash(3)), value_of("disk-a3"));
        disk = test_util::make_disk_layer(context, std::move(data));
    }

    std::shared_ptr<DiffLayer> make_diff(Layer parent, uint64_t id, StateVersion version, StateWrites writes,
                                         DestructSet destructs = {}) {
        return std::make_shared<DiffLayer>(std::move(parent), make_hash(1000 + id), version, version,
                                           std::move(writes), std::move(destructs), context);
    }

    strata::test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    std::shared_ptr<Context> context{test_util::make_context()};
    std::shared_ptr<DiskLayer> disk;
};

TEST_CASE_METHOD(DiffLayerTest, "DiffLayer construction", "[snapshot][diff_layer]") {
    const StateKey key{StateKey::account(make_hash(1))};
    auto diff{make_diff(disk, 1, 1, {{key, value_of("abc")}}, {make_hash(5)})};
    CHECK(diff->root() == make_hash(1001));
    CHECK(diff->version() == 1);
    CHECK(diff->memory() == 33 + 3 + 32);
    CHECK(diff->origin() == disk);
    CHECK(as_disk(diff->parent()) == disk);
    CHECK(Metrics::value(context->metrics.layers_created) == 1);
    CHECK(diff->cumulative_bloom().n() == 2);

    SECTION("child versions must increase") {
        CHECK_THROWS_AS(make_diff(diff, 2, 1, {}), std::logic_error);
    }
    SECTION("empty parent reference") {
        CHECK(test_util::thrown_error([&] { make_diff(Layer{std::shared_ptr<DiffLayer>{}}, 2, 2, {}); }) ==
              SnapshotError::kUnknownParentType);
    }
}

TEST_CASE_METHOD(DiffLayerTest, "DiffLayer resolve walks to the closest writer", "[snapshot][diff_layer]") {
    const StateKey a1{StateKey::account(make_hash(1))};
    const StateKey a2{StateKey::account(make_hash(2))};
    const StateKey a3{StateKey::account(make_hash(3))};
    auto d1{make_diff(disk, 1, 1, {{a1, value_of("1")}})};
    auto d2{make_diff(d1, 2, 2, {{a1, value_of("2")}, {a2, Bytes{}}})};
    auto d3{d2->update(make_hash(1003), 3, 3, {}, {})};

    CHECK(d3->origin() == disk);
    CHECK(d3->resolve(a1) == value_of("2"));
    CHECK(d1->resolve(a1) == value_of("1"));
    CHECK_FALSE(d3->resolve(a2));
    CHECK(d1->resolve(a2) == value_of("disk-a2"));
    CHECK(d3->resolve(a3) == value_of("disk-a3"));
    CHECK_FALSE(d3->resolve(StateKey::account(make_hash(4))));
    CHECK(resolve(Layer{d3}, a1) == value_of("2"));
}

TEST_CASE_METHOD(DiffLayerTest, "DiffLayer bloom routes unwritten keys to disk", "[snapshot][diff_layer]") {
    const StateKey a1{StateKey::account(make_hash(1))};
    auto d1{make_diff(disk, 1, 1, {{a1, value_of("1")}})};
    auto d2{make_diff(d1, 2, 2, {{StateKey::storage(make_hash(7), make_hash(70)), value_of("x")}})};

    const auto misses_before{Metrics::value(context->metrics.bloom_misses)};
    for (uint64_t i{100}; i < 200; ++i) {
        CHECK_FALSE(d2->resolve(StateKey::account(make_hash(i))));
    }
    CHECK(d2->resolve(StateKey::account(make_hash(3))) == value_of("disk-a3"));
    CHECK(Metrics::value(context->metrics.bloom_misses) - misses_before >= 95);

    const auto hits_before{Metrics::value(context->metrics.bloom_hits)};
    CHECK(d2->resolve(a1) == value_of("1"));
    CHECK(Metrics::value(context->metrics.bloom_hits) == hits_before + 1);
    CHECK(Metrics::value(context->metrics.dirty_hits) >= 1);
}

TEST_CASE_METHOD(DiffLayerTest, "DiffLayer destructs", "[snapshot][diff_layer]") {
    const Hash account{make_hash(1)};
    const StateKey a1{StateKey::account(account)};
    const StateKey s10{StateKey::storage(account, make_hash(10))};
    const StateKey s11{StateKey::storage(account, make_hash(11))};

    SECTION("destruct hides the account and its storage below") {
        auto d1{make_diff(disk, 1, 1, {{s11, value_of("s11")}})};
        auto d2{make_diff(d1, 2, 2, {}, {account})};
        CHECK_FALSE(d2->resolve(a1));
        CHECK_FALSE(d2->resolve(s10));
        CHECK_FALSE(d2->resolve(s11));
        CHECK(d1->resolve(s11) == value_of("s11"));
        CHECK(d1->resolve(s10) == value_of("disk-s10"));
        CHECK(d2->resolve(StateKey::account(make_hash(2))) == value_of("disk-a2"));
    }

    SECTION("writes in the destructing layer take precedence") {
        auto d1{make_diff(disk, 1, 1, {{a1, value_of("reborn")}}, {account})};
        auto d2{make_diff(d1, 2, 2, {{s11, value_of("new")}})};
        CHECK(d2->resolve(a1) == value_of("reborn"));
        CHECK(d2->resolve(s11) == value_of("new"));
        CHECK_FALSE(d2->resolve(s10));
    }
}

TEST_CASE_METHOD(DiffLayerTest, "DiffLayer node", "[snapshot][diff_layer]") {
    const Hash owner{make_hash(42)};
    const Bytes path{value_of("\x01")};
    const Bytes blob{value_of("node")};
    auto d1{make_diff(disk, 1, 1, {{StateKey::trie_node(owner, path), blob}})};

    CHECK(d1->node(owner, path, keccak256_as_bytes32(blob)) == blob);
    CHECK(d1->node(owner, value_of("\x02"), Hash{}).empty());
    CHECK(test_util::thrown_error([&] { (void)d1->node(owner, path, Hash{}); }) ==
          SnapshotError::kUnexpectedNodeMismatch);
    CHECK_THROWS_AS(d1->node(owner, value_of("\x02"), make_hash(1)), UnexpectedNodeError);
}

TEST_CASE_METHOD(DiffLayerTest, "DiffLayer persist", "[snapshot][diff_layer]") {
    const StateKey a1{StateKey::account(make_hash(1))};
    const StateKey a2{StateKey::account(make_hash(2))};
    auto d1{make_diff(disk, 1, 1, {{a1, value_of("1")}})};
    auto d2{make_diff(d1, 2, 2, {{a2, value_of("2")}})};
    auto d3{make_diff(d2, 3, 3, {{a1, value_of("3")}})};

    auto base{d2->persist(/*force=*/false)};
    CHECK(base->root() == d2->root());
    CHECK(base->version() == 2);
    CHECK(base->read(a1) == value_of("1"));
    CHECK(base->read(a2) == value_of("2"));
    CHECK(disk->is_stale());
    CHECK(as_disk(d2->parent()) != nullptr);

    d3->set_parent(base);
    d3->rebloom(base);
    CHECK(d3->origin() == base);
    CHECK(d3->cumulative_bloom().n() == 1);
    CHECK(d3->resolve(a1) == value_of("3"));
    CHECK(d3->resolve(a2) == value_of("2"));
}

}  // namespace strata::snapshot
