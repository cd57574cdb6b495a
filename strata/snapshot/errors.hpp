// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

#include <strata/core/common/bytes.hpp>
#include <strata/snapshot/types.hpp>

namespace strata::snapshot {

// Error codes for layer tree, lookup index and cache operations
enum class [[nodiscard]] SnapshotError {
    kKeyNotIndexed,           // no tracked diff layer on the queried path wrote the key: consult the disk layer
    kIndexCorruption,         // an index entry expected on removal is missing
    kUnexpectedNodeMismatch,  // resolved trie node does not hash to the expected value
    kUnknownParentType,       // a layer parent is neither a disk nor a diff layer
    kUnknownRoot,             // no layer with the given root is tracked
    kLayerExists,             // a layer with the given root is already tracked
    kStaleLayer,              // the disk layer has been superseded by a flatten
};

std::string_view to_string(SnapshotError error);

// TODO(C++23) Switch to std::expected
using SnapshotResult = tl::expected<void, SnapshotError>;

//! Hard failure surfaced to callers of the layer tree
class SnapshotException : public std::runtime_error {
  public:
    SnapshotException(SnapshotError error, const std::string& message)
        : std::runtime_error{std::string{to_string(error)} + ": " + message}, error_{error} {}

    SnapshotError error() const noexcept { return error_; }

  private:
    SnapshotError error_;
};

//! A trie node was found whose content hash disagrees with the one expected by the caller
class UnexpectedNodeError : public SnapshotException {
  public:
    UnexpectedNodeError(std::string_view location,
                        const Hash& expected,
                        const Hash& actual,
                        const Hash& owner,
                        ByteView path);

    const Hash& expected() const noexcept { return expected_; }
    const Hash& actual() const noexcept { return actual_; }
    const Hash& owner() const noexcept { return owner_; }
    const Bytes& path() const noexcept { return path_; }

  private:
    Hash expected_;
    Hash actual_;
    Hash owner_;
    Bytes path_;
};

}  // namespace strata::snapshot
