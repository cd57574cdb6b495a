// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

#include <strata/core/common/bytes.hpp>
#include <strata/core/common/util.hpp>
#include <strata/snapshot/context.hpp>
#include <strata/snapshot/disk_layer.hpp>
#include <strata/snapshot/disk_store.hpp>
#include <strata/snapshot/errors.hpp>
#include <strata/snapshot/types.hpp>

namespace strata::snapshot::test_util {

//! Deterministic well-spread 32-byte hash for test number n
inline Hash make_hash(uint64_t n) {
    uint8_t seed[8];
    for (size_t i{0}; i < 8; ++i) {
        seed[i] = static_cast<uint8_t>(n >> (8 * i));
    }
    return keccak256_as_bytes32(ByteView{seed, sizeof(seed)});
}

inline Bytes value_of(std::string_view text) {
    return Bytes{reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

inline std::shared_ptr<Context> make_context(const Config& config = {}) {
    return std::make_shared<Context>(config);
}

inline std::shared_ptr<DiskLayer> make_disk_layer(const std::shared_ptr<Context>& context,
                                                  OrderedStateMap data = {},
                                                  const Hash& root = make_hash(0)) {
    return std::make_shared<DiskLayer>(root, 0, 0, std::make_shared<MemoryDiskStore>(std::move(data)), nullptr,
                                       context);
}

//! The error carried by the SnapshotException thrown by f, std::nullopt if nothing is thrown
template <typename F>
std::optional<SnapshotError> thrown_error(F&& f) {
    try {
        f();
    } catch (const SnapshotException& ex) {
        return ex.error();
    }
    return std::nullopt;
}

}  // namespace strata::snapshot::test_util
