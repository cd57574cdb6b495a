// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#include "bloom_filter.hpp"

#include <cmath>
#include <stdexcept>

#include <strata/core/common/base.hpp>
#include <strata/snapshot/config.hpp>

namespace strata::snapshot {

static constexpr uint64_t kWordBits{64};

BloomFilter::BloomFilter(uint64_t m, uint64_t k)
    : m_{((m + kWordBits - 1) / kWordBits) * kWordBits},
      k_{k},
      words_(m_ / kWordBits, 0) {
    if (m_ == 0 || k_ == 0) {
        throw std::invalid_argument("bloom filter needs at least one bit and one probe");
    }
}

// Kirsch-Mitzenmacher double hashing: probe i lands on h1 + i * h2
static inline uint64_t probe_hash(uint64_t hash, uint64_t i) {
    const uint64_t h1{hash};
    const uint64_t h2{((hash >> 32) | (hash << 32)) | 1};
    return h1 + i * h2;
}

void BloomFilter::add_hash(uint64_t hash) {
    for (uint64_t i{0}; i < k_; ++i) {
        const uint64_t bit{probe_hash(hash, i) % m_};
        words_[bit / kWordBits] |= (uint64_t{1} << (bit % kWordBits));
    }
    ++n_;
}

bool BloomFilter::contains_hash(uint64_t hash) const {
    for (uint64_t i{0}; i < k_; ++i) {
        const uint64_t bit{probe_hash(hash, i) % m_};
        if ((words_[bit / kWordBits] & (uint64_t{1} << (bit % kWordBits))) == 0) {
            return false;
        }
    }
    return true;
}

void BloomFilter::union_in_place(const BloomFilter& other) {
    if (!is_compatible(other)) {
        throw std::invalid_argument("incompatible bloom filters");
    }
    for (size_t i{0}; i < words_.size(); ++i) {
        words_[i] |= other.words_[i];
    }
    n_ += other.n_;
}

double BloomFilter::false_positive_rate() const {
    const auto k{static_cast<double>(k_)};
    const auto n{static_cast<double>(n_)};
    const auto m{static_cast<double>(m_)};
    return std::pow(1.0 - std::exp(-k * (n + 0.5) / (m - 1)), k);
}

static uint64_t load_be64(const uint8_t* data) {
    uint64_t value{0};
    for (size_t i{0}; i < 8; ++i) {
        value = (value << 8) | data[i];
    }
    return value;
}

static uint64_t fnv1a_64(ByteView data) {
    uint64_t hash{0xcbf29ce484222325};
    for (const auto b : data) {
        hash ^= b;
        hash *= 0x100000001b3;
    }
    return hash;
}

uint64_t bloom_hash(const StateKey& key) {
    const size_t offset{bloom_hasher_offset()};
    const uint64_t base{load_be64(key.account_hash().bytes + offset)};
    switch (key.kind()) {
        case StateKey::Kind::kStorage:
            return base ^ load_be64(key.slot_hash().bytes + offset);
        case StateKey::Kind::kTrieNode:
            return base ^ fnv1a_64(key.path());
        case StateKey::Kind::kAccount:
        case StateKey::Kind::kDestruct:
            break;
    }
    return base;
}

}  // namespace strata::snapshot
