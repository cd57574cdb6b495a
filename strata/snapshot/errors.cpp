// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#include "errors.hpp"

#include <strata/core/common/util.hpp>

namespace strata::snapshot {

std::string_view to_string(SnapshotError error) {
    switch (error) {
        case SnapshotError::kKeyNotIndexed:
            return "key not indexed";
        case SnapshotError::kIndexCorruption:
            return "index corruption";
        case SnapshotError::kUnexpectedNodeMismatch:
            return "unexpected node";
        case SnapshotError::kUnknownParentType:
            return "unknown parent type";
        case SnapshotError::kUnknownRoot:
            return "unknown root";
        case SnapshotError::kLayerExists:
            return "layer exists";
        case SnapshotError::kStaleLayer:
            return "stale layer";
    }
    return "unknown error";
}

static std::string unexpected_node_message(std::string_view location, const Hash& expected, const Hash& actual,
                                           const Hash& owner, ByteView path) {
    std::string message{location};
    message.append(" layer: owner=").append(to_hex(owner, true));
    message.append(" path=").append(to_hex(path, true));
    message.append(" expected=").append(to_hex(expected, true));
    message.append(" got=").append(to_hex(actual, true));
    return message;
}

UnexpectedNodeError::UnexpectedNodeError(std::string_view location, const Hash& expected, const Hash& actual,
                                         const Hash& owner, ByteView path)
    : SnapshotException{SnapshotError::kUnexpectedNodeMismatch,
                        unexpected_node_message(location, expected, actual, owner, path)},
      expected_{expected},
      actual_{actual},
      owner_{owner},
      path_{path} {}

}  // namespace strata::snapshot
