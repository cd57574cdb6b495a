// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>
#include <variant>

#include <strata/core/common/bytes.hpp>
#include <strata/snapshot/state_key.hpp>
#include <strata/snapshot/types.hpp>

namespace strata::snapshot {

class DiskLayer;
class DiffLayer;

//! A state layer: either the persistent base or one block's worth of in-memory changes on top of another layer
using Layer = std::variant<std::shared_ptr<DiskLayer>, std::shared_ptr<DiffLayer>>;

//! Root of the state represented by the layer
//! \throws SnapshotException with kUnknownParentType if the layer is empty
Hash root_of(const Layer& layer);

//! Version assigned to the layer at creation
StateVersion version_of(const Layer& layer);

//! Value of the key in the state represented by the layer, std::nullopt if absent or deleted
std::optional<Bytes> resolve(const Layer& layer, const StateKey& key);

inline std::shared_ptr<DiffLayer> as_diff(const Layer& layer) {
    const auto* diff{std::get_if<std::shared_ptr<DiffLayer>>(&layer)};
    return diff ? *diff : nullptr;
}

inline std::shared_ptr<DiskLayer> as_disk(const Layer& layer) {
    const auto* disk{std::get_if<std::shared_ptr<DiskLayer>>(&layer)};
    return disk ? *disk : nullptr;
}

}  // namespace strata::snapshot
