// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>

#include <strata/core/common/base.hpp>

namespace strata::snapshot {

inline constexpr uint64_t kDefaultAggregatorMemoryLimit{4_Mebi};

struct Config {
    //! Target false positive rate of the bloom filters when the aggregator is at its fullest.
    //! Dropping this down drastically increases the size of the filter held by every diff layer.
    double bloom_target_error_rate{0.02};

    //! Maximum size of the disk layer write buffer aggregating flattened diffs before it's committed to the store
    uint64_t aggregator_memory_limit{kDefaultAggregatorMemoryLimit};

    //! Approximate number of items held by the aggregator before it's committed to the store.
    //! An average entry weighs around 15B + 32B hash, so use a smaller divisor to be on the safe side.
    uint64_t aggregator_item_limit{kDefaultAggregatorMemoryLimit / 42};

    //! Number of diff layers retained on top of the disk layer by LayerTree::cap
    size_t max_diff_layers{128};

    //! Maintain the reverse lookup index for direct jumps to the closest writer layer
    bool enable_lookup_index{true};

    //! Maintain the multi-version cache answering point-in-time queries
    bool enable_multi_version_cache{true};

    //! Number of threads running background cache eviction
    unsigned eviction_threads{1};
};

//! Bloom filter geometry derived from the aggregator item limit and the target error rate
struct BloomGeometry {
    uint64_t bits{0};
    uint64_t hash_functions{0};
};

//! Ideal filter size m = ceil(n * ln(p) / ln(1 / 2^ln(2))) and hash count k = round(m / n * ln(2))
BloomGeometry bloom_geometry(const Config& config);

//! Offset in [0, 24] of the 8 bytes of a digest feeding the bloom filters, randomized once per process so that the
//! node population does not all display the same false positives
size_t bloom_hasher_offset();

}  // namespace strata::snapshot
