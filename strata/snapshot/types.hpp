// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <evmc/evmc.hpp>

#include <strata/core/common/base.hpp>
#include <strata/core/common/bytes.hpp>
#include <strata/core/common/hash_maps.hpp>
#include <strata/snapshot/state_key.hpp>

namespace strata::snapshot {

//! Digest identifying a state version (root), an account, a storage slot or a trie owner
using Hash = evmc::bytes32;

//! Items written by one block, keyed by state key. An empty value marks a deletion.
using StateWrites = FlatHashMap<StateKey, Bytes>;

//! Hashes of the accounts destructed (and storage wiped) by one block
using DestructSet = FlatHashSet<Hash>;

}  // namespace strata::snapshot
