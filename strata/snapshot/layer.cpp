// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#include "layer.hpp"

#include <strata/core/common/overloaded.hpp>
#include <strata/snapshot/diff_layer.hpp>
#include <strata/snapshot/disk_layer.hpp>
#include <strata/snapshot/errors.hpp>

namespace strata::snapshot {

template <typename Visitor>
static decltype(auto) visit_layer(const Layer& layer, Visitor&& visitor) {
    return std::visit(
        [&](const auto& ptr) -> decltype(auto) {
            if (!ptr) {
                throw SnapshotException{SnapshotError::kUnknownParentType, "empty layer reference"};
            }
            return visitor(*ptr);
        },
        layer);
}

Hash root_of(const Layer& layer) {
    return visit_layer(layer, [](const auto& l) { return l.root(); });
}

StateVersion version_of(const Layer& layer) {
    return visit_layer(layer, [](const auto& l) { return l.version(); });
}

std::optional<Bytes> resolve(const Layer& layer, const StateKey& key) {
    return visit_layer(layer, Overloaded{
                                  [&](const DiskLayer& disk) { return disk.read(key); },
                                  [&](const DiffLayer& diff) { return diff.resolve(key); },
                              });
}

}  // namespace strata::snapshot
