// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace strata::snapshot {

//! Fire-and-forget counters updated by the snapshot components, never read on a path affecting results
class Metrics {
  public:
    using Counter = std::atomic<uint64_t>;

    void mark(Counter& counter, uint64_t n = 1) { counter.fetch_add(n, std::memory_order_relaxed); }

    void set(Counter& gauge, uint64_t value) { gauge.store(value, std::memory_order_relaxed); }

    template <typename Duration>
    void mark_elapsed(Counter& counter, Duration elapsed) {
        mark(counter, static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed).count()));
    }

    void set_bloom_error(double rate) { bloom_error_.store(rate, std::memory_order_relaxed); }
    double bloom_error() const { return bloom_error_.load(std::memory_order_relaxed); }

    static uint64_t value(const Counter& counter) { return counter.load(std::memory_order_relaxed); }

    Counter bloom_hits{0};
    Counter bloom_misses{0};
    Counter dirty_hits{0};
    Counter dirty_misses{0};
    Counter disk_reads{0};
    Counter layers_created{0};
    Counter layers_flattened{0};
    Counter layers_discarded{0};
    Counter buffer_flushes{0};
    Counter index_add_nanos{0};
    Counter index_remove_nanos{0};
    Counter cache_items{0};
    Counter cache_evictions{0};

  private:
    std::atomic<double> bloom_error_{0.0};
};

}  // namespace strata::snapshot
