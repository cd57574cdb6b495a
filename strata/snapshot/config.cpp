// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#include "config.hpp"

#include <algorithm>
#include <cmath>

#include <strata/core/common/random_number.hpp>
#include <strata/infra/common/ensure.hpp>

namespace strata::snapshot {

BloomGeometry bloom_geometry(const Config& config) {
    ensure(config.bloom_target_error_rate > 0.0 && config.bloom_target_error_rate < 1.0,
           "bloom target error rate must be in (0, 1)");
    const auto items{static_cast<double>(std::max<uint64_t>(config.aggregator_item_limit, 1))};
    const double bits{std::ceil(items * std::log(config.bloom_target_error_rate) /
                                std::log(1.0 / std::pow(2.0, std::log(2.0))))};
    const double funcs{std::round((bits / items) * std::log(2.0))};
    return {
        .bits = std::max<uint64_t>(static_cast<uint64_t>(bits), 64),
        .hash_functions = std::max<uint64_t>(static_cast<uint64_t>(funcs), 1),
    };
}

size_t bloom_hasher_offset() {
    static const size_t kOffset{[] {
        RandomNumber random{0, 24};
        return static_cast<size_t>(random.generate_one());
    }()};
    return kOffset;
}

}  // namespace strata::snapshot
