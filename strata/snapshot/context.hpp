// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <strata/snapshot/config.hpp>
#include <strata/snapshot/metrics.hpp>

namespace strata::snapshot {

//! Settings and counters shared by every layer of one tree
struct Context {
    explicit Context(const Config& cfg) : config{cfg}, bloom{bloom_geometry(cfg)} {}

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    const Config config;
    const BloomGeometry bloom;
    Metrics metrics;
};

}  // namespace strata::snapshot
