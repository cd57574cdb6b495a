// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#include "multi_version_cache.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include <catch2/catch.hpp>

#include <strata/infra/test_util/log.hpp>
#include <strata/snapshot/diff_layer.hpp>
#include <strata/snapshot/disk_layer.hpp>
#include <strata/snapshot/test_util/state_fixtures.hpp>

namespace strata::snapshot {

using test_util::make_hash;
using test_util::value_of;

struct MultiVersionCacheTest {
    std::shared_ptr<DiffLayer> add(Layer parent, uint64_t id, StateWrites writes, DestructSet destructs = {}) {
        auto diff{std::make_shared<DiffLayer>(std::move(parent), make_hash(1000 + id), ++version, version,
                                              std::move(writes), std::move(destructs), context)};
        cache.add_diff_layer(*diff);
        return diff;
    }

    strata::test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    std::shared_ptr<Context> context{test_util::make_context()};
    std::shared_ptr<DiskLayer> disk{test_util::make_disk_layer(context)};
    StateVersion version{0};
    MultiVersionCache cache{0, 1, &context->metrics};
    const Hash account{make_hash(1)};
    const Hash slot{make_hash(10)};
};

TEST_CASE_METHOD(MultiVersionCacheTest, "MultiVersionCache point-in-time queries", "[snapshot][cache]") {
    auto d1{add(disk, 1, {{StateKey::account(account), value_of("1")}})};
    auto d2{add(d1, 2, {{StateKey::account(account), value_of("2")},
                        {StateKey::storage(account, slot), value_of("s2")}})};
    auto d3{add(d2, 3, {{StateKey::account(make_hash(2)), Bytes{}}})};

    CHECK(cache.query_account(d3->version(), d3->root(), account).value == value_of("2"));
    CHECK(cache.query_account(d1->version(), d1->root(), account).value == value_of("1"));
    CHECK(cache.query_storage(d3->version(), d3->root(), account, slot).value == value_of("s2"));

    const CacheQueryResult storage_at_d1{cache.query_storage(d1->version(), d1->root(), account, slot)};
    CHECK_FALSE(storage_at_d1.value);
    CHECK(storage_at_d1.need_fallback_to_disk);

    const CacheQueryResult deleted{cache.query_account(d3->version(), d3->root(), make_hash(2))};
    CHECK_FALSE(deleted.value);
    CHECK_FALSE(deleted.need_fallback_to_disk);

    const CacheQueryResult unknown_root{cache.query_account(d3->version(), make_hash(77), account)};
    CHECK(unknown_root.need_fallback_to_disk);

    CHECK(cache.item_count() == 4);
    CHECK(Metrics::value(context->metrics.cache_items) == 4);
}

TEST_CASE_METHOD(MultiVersionCacheTest, "MultiVersionCache destruct and write ordering", "[snapshot][cache]") {
    SECTION("write after destruct resurrects") {
        auto d1{add(disk, 1, {{StateKey::account(account), value_of("old")}})};
        auto d2{add(d1, 2, {}, {account})};
        auto d3{add(d2, 3, {{StateKey::account(account), value_of("new")}})};
        CHECK(cache.query_account(d3->version(), d3->root(), account).value == value_of("new"));

        const CacheQueryResult at_d2{cache.query_account(d2->version(), d2->root(), account)};
        CHECK_FALSE(at_d2.value);
        CHECK_FALSE(at_d2.need_fallback_to_disk);

        const CacheQueryResult storage_at_d3{cache.query_storage(d3->version(), d3->root(), account, slot)};
        CHECK_FALSE(storage_at_d3.value);
        CHECK_FALSE(storage_at_d3.need_fallback_to_disk);
    }

    SECTION("destruct after write deletes") {
        auto d1{add(disk, 1, {{StateKey::account(account), value_of("v")}})};
        auto d2{add(d1, 2, {}, {account})};
        const CacheQueryResult result{cache.query_account(d2->version(), d2->root(), account)};
        CHECK_FALSE(result.value);
        CHECK_FALSE(result.need_fallback_to_disk);
    }

    SECTION("write and destruct in the same layer keep the write") {
        auto d1{add(disk, 1, {{StateKey::account(account), value_of("v")}}, {account})};
        CHECK(cache.query_account(d1->version(), d1->root(), account).value == value_of("v"));
    }
}

TEST_CASE_METHOD(MultiVersionCacheTest, "MultiVersionCache fork isolation", "[snapshot][cache]") {
    auto base{add(disk, 1, {})};
    auto a{add(base, 2, {{StateKey::account(account), value_of("a")}})};
    auto b{add(base, 3, {{StateKey::account(account), value_of("b")}})};
    auto b_child{add(b, 4, {})};

    CHECK(cache.query_account(a->version(), a->root(), account).value == value_of("a"));
    CHECK(cache.query_account(b_child->version(), b_child->root(), account).value == value_of("b"));
    CHECK(cache.query_account(base->version(), base->root(), account).need_fallback_to_disk);
    CHECK(cache.has_ancestry(b_child->root()));
}

TEST_CASE_METHOD(MultiVersionCacheTest, "MultiVersionCache watermark", "[snapshot][cache]") {
    auto d1{add(disk, 1, {{StateKey::account(account), value_of("1")}})};
    auto d2{add(d1, 2, {{StateKey::account(make_hash(2)), value_of("x")}})};

    cache.pause_eviction();
    cache.remove_diff_layer(*d1);
    CHECK(cache.min_version() == d1->version());

    // not evicted yet, but no longer served
    CHECK(cache.item_count() == 2);
    const CacheQueryResult result{cache.query_account(d2->version(), d2->root(), account)};
    CHECK_FALSE(result.value);
    CHECK(result.need_fallback_to_disk);
    CHECK(cache.query_account(d2->version(), d2->root(), make_hash(2)).value == value_of("x"));

    cache.resume_eviction();
    cache.wait_for_eviction();
    CHECK(cache.item_count() == 1);
    CHECK_FALSE(cache.has_ancestry(d1->root()));
    CHECK(cache.has_ancestry(d2->root()));
    CHECK(Metrics::value(context->metrics.cache_evictions) == 1);
    CHECK(cache.query_account(d2->version(), d2->root(), make_hash(2)).value == value_of("x"));
}

TEST_CASE_METHOD(MultiVersionCacheTest, "MultiVersionCache watermark never moves back", "[snapshot][cache]") {
    auto d1{add(disk, 1, {})};
    auto d2{add(d1, 2, {})};
    cache.remove_diff_layer(*d2);
    cache.remove_diff_layer(*d1);
    CHECK(cache.min_version() == d2->version());
    cache.wait_for_eviction();
}

TEST_CASE_METHOD(MultiVersionCacheTest, "MultiVersionCache discard", "[snapshot][cache]") {
    auto base{add(disk, 1, {{StateKey::account(account), value_of("base")}})};
    auto fork{add(base, 2, {{StateKey::account(account), value_of("fork")}})};

    cache.discard_diff_layer(*fork);
    cache.wait_for_eviction();
    CHECK(cache.min_version() == 0);
    CHECK(cache.item_count() == 1);
    CHECK_FALSE(cache.has_ancestry(fork->root()));
    CHECK(cache.query_account(base->version(), base->root(), account).value == value_of("base"));
}

TEST_CASE_METHOD(MultiVersionCacheTest, "MultiVersionCache ignores trie nodes", "[snapshot][cache]") {
    auto d1{add(disk, 1, {{StateKey::trie_node(account, value_of("\x01")), value_of("node")}})};
    CHECK(cache.item_count() == 0);
    CHECK(cache.query(d1->version(), d1->root(), StateKey::trie_node(account, value_of("\x01"))).need_fallback_to_disk);
}

TEST_CASE_METHOD(MultiVersionCacheTest, "MultiVersionCache requires cached parent", "[snapshot][cache]") {
    auto d1{std::make_shared<DiffLayer>(disk, make_hash(1001), 1, 1, StateWrites{}, DestructSet{}, context)};
    auto d2{std::make_shared<DiffLayer>(d1, make_hash(1002), 2, 2, StateWrites{}, DestructSet{}, context)};
    CHECK_THROWS_AS(cache.add_diff_layer(*d2), std::logic_error);
}

TEST_CASE_METHOD(MultiVersionCacheTest, "MultiVersionCache concurrent readers and evictions", "[snapshot][cache]") {
    std::vector<std::shared_ptr<DiffLayer>> chain;
    Layer parent{disk};
    for (uint64_t i{1}; i <= 64; ++i) {
        chain.push_back(add(parent, i, {{StateKey::account(account), value_of(std::to_string(i))}}));
        parent = chain.back();
    }
    const auto head{chain.back()};

    std::atomic<bool> wrong_value{false};
    std::vector<std::thread> readers;
    for (int r{0}; r < 4; ++r) {
        readers.emplace_back([&] {
            for (int i{0}; i < 500; ++i) {
                const CacheQueryResult result{cache.query_account(head->version(), head->root(), account)};
                if (result.value != value_of("64")) {
                    wrong_value = true;
                }
            }
        });
    }
    for (size_t i{0}; i + 1 < chain.size(); ++i) {
        cache.remove_diff_layer(*chain[i]);
    }
    for (auto& reader : readers) {
        reader.join();
    }
    cache.wait_for_eviction();
    CHECK_FALSE(wrong_value);
    CHECK(cache.item_count() == 1);
}

}  // namespace strata::snapshot
