// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#include "util.hpp"

#include <cstdio>
#include <cstring>

#include <evmc/hex.hpp>

namespace strata {

std::string to_hex(ByteView bytes, bool with_prefix) {
    static const char* kHexDigits{"0123456789abcdef"};
    std::string out(bytes.size() * 2 + (with_prefix ? 2 : 0), '\0');
    char* dest{&out[0]};
    if (with_prefix) {
        *dest++ = '0';
        *dest++ = 'x';
    }
    for (const auto& b : bytes) {
        *dest++ = kHexDigits[b >> 4];    // Hi
        *dest++ = kHexDigits[b & 0x0f];  // Lo
    }
    return out;
}

std::optional<Bytes> from_hex(std::string_view hex) noexcept {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }
    return evmc::from_hex(hex);
}

std::string human_size(uint64_t bytes, const char* unit) {
    static const char* suffix[]{"", "K", "M", "G", "T"};
    static const uint32_t items{sizeof(suffix) / sizeof(suffix[0])};
    uint32_t index{0};
    double value{static_cast<double>(bytes)};
    while (value >= kKibi) {
        value /= kKibi;
        if (++index == (items - 1)) {
            break;
        }
    }
    static constexpr size_t kBufferSize{64};
    thread_local char output[kBufferSize];
    std::snprintf(output, kBufferSize, "%.02lf %s%s", value, suffix[index], unit);
    return output;
}

evmc::bytes32 keccak256_as_bytes32(ByteView view) {
    const ethash::hash256 digest{keccak256(view)};
    evmc::bytes32 out;
    std::memcpy(out.bytes, digest.bytes, kHashLength);
    return out;
}

}  // namespace strata
