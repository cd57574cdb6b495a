// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <vector>

#include <strata/snapshot/state_key.hpp>

namespace strata::snapshot {

//! \brief Fixed-size bloom filter over 64-bit pre-hashed items.
//! \details No false negatives by construction. Bits are only ever set, never cleared, so a filter obtained by union
//! answers positively for every item added to any of its sources.
class BloomFilter {
  public:
    //! Creates an empty filter of m bits (rounded up to a multiple of 64) using k probes per item
    BloomFilter(uint64_t m, uint64_t k);

    BloomFilter(const BloomFilter&) = default;
    BloomFilter& operator=(const BloomFilter&) = default;
    BloomFilter(BloomFilter&&) noexcept = default;
    BloomFilter& operator=(BloomFilter&&) noexcept = default;

    //! An empty filter with the same geometry as this one
    BloomFilter new_compatible() const { return BloomFilter{m_, k_}; }

    bool is_compatible(const BloomFilter& other) const { return m_ == other.m_ && k_ == other.k_; }

    void add_hash(uint64_t hash);
    bool contains_hash(uint64_t hash) const;

    //! Sets every bit of the other filter into this one
    //! \throws std::invalid_argument if the geometries differ
    void union_in_place(const BloomFilter& other);

    //! Number of bits
    uint64_t m() const { return m_; }
    //! Number of probes per item
    uint64_t k() const { return k_; }
    //! Number of items added, union included
    uint64_t n() const { return n_; }

    //! Estimated false positive rate (1 - e^(-k(n+0.5)/(m-1)))^k
    double false_positive_rate() const;

  private:
    uint64_t m_;
    uint64_t k_;
    uint64_t n_{0};
    std::vector<uint64_t> words_;
};

//! 64-bit bloom digest of a state key: 8 bytes of the account/owner hash at the process-wide random offset, mixed
//! with the slot hash bytes at the same offset for storage keys or a FNV-1a hash of the path for trie nodes
uint64_t bloom_hash(const StateKey& key);

}  // namespace strata::snapshot
