// Copyright (c) 2025 The spvproof developers
// Distributed under the MIT software license

#pragma once

#include "util/uint.hpp"

#include <cstdint>
#include <optional>
#include <span>

namespace spvproof {
namespace util {

/*
 Byte-order normalizer

 Bitcoin serializes hashes least-significant byte first ("internal" order).
 Explorers, RPC output and the height->hash store use the reverse ("display")
 order. Comparisons between the two representations go through these helpers.
*/

// Reverse a 16-byte blob
[[nodiscard]] uint128 ReverseBytes(const uint128 &in) noexcept;

// Reverse a 32-byte blob: both 16-byte halves reversed, then swapped
[[nodiscard]] uint256 ReverseBytes(const uint256 &in) noexcept;

// Reverse an untrusted buffer. Returns std::nullopt unless it is exactly
// 32 bytes long.
[[nodiscard]] std::optional<uint256>
ReverseHash(std::span<const uint8_t> bytes) noexcept;

} // namespace util
} // namespace spvproof
