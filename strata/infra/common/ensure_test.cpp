// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#include "ensure.hpp"

#include <catch2/catch.hpp>

namespace strata {

TEST_CASE("ensure") {
    CHECK_NOTHROW(ensure(true, "ignored"));
    CHECK_THROWS_AS(ensure(false, "error"), std::logic_error);
    CHECK_THROWS_MATCHES(ensure(false, [] { return "layer " + std::to_string(42); }),
                         std::logic_error, Catch::Message("layer 42"));
}

TEST_CASE("ensure_invariant") {
    CHECK_NOTHROW(ensure_invariant(true, "ignored"));
    CHECK_THROWS_MATCHES(ensure_invariant(false, "parent is missing"),
                         std::logic_error, Catch::Message("Invariant violation: parent is missing"));
}

TEST_CASE("ensure_pre_condition") {
    CHECK_NOTHROW(ensure_pre_condition(true, [] { return "ignored"; }));
    CHECK_THROWS_AS(ensure_pre_condition(false, [] { return "unknown root"; }), std::invalid_argument);
}

}  // namespace strata
