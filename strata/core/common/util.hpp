// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <ethash/keccak.hpp>
#include <evmc/evmc.hpp>

#include <strata/core/common/base.hpp>
#include <strata/core/common/bytes.hpp>

namespace strata {

//! \brief Returns a string representing the hex form of provided string of bytes
std::string to_hex(ByteView bytes, bool with_prefix = false);

//! \brief Returns a string representing the hex form of provided 32-byte digest
inline std::string to_hex(const evmc::bytes32& value, bool with_prefix = false) {
    return to_hex(ByteView{value.bytes}, with_prefix);
}

std::optional<Bytes> from_hex(std::string_view hex) noexcept;

// Converts a number of bytes in a human-readable format
std::string human_size(uint64_t bytes, const char* unit = "B");

inline ethash::hash256 keccak256(ByteView view) { return ethash::keccak256(view.data(), view.size()); }

//! \brief Keccak-256 digest of provided bytes as evmc::bytes32
evmc::bytes32 keccak256_as_bytes32(ByteView view);

}  // namespace strata
