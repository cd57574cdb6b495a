// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// The most common and basic macros, types, and constants.

#include <cstddef>
#include <cstdint>
#include <limits>

#include <strata/core/common/assert.hpp>

namespace strata {

using BlockNum = uint64_t;

//! Process-local sequence number assigned to every state layer at creation
using StateVersion = uint64_t;

inline constexpr size_t kHashLength{32};

// https://en.wikipedia.org/wiki/Binary_prefix
inline constexpr uint64_t kKibi{1024};
inline constexpr uint64_t kMebi{1024 * kKibi};

consteval uint64_t operator"" _Mebi(unsigned long long x) {
    STRATA_ASSERT(x <= std::numeric_limits<uint64_t>::max() / kMebi);
    return x * kMebi;
}

}  // namespace strata
