// Copyright (c) 2025 The spvproof developers
// Distributed under the MIT software license

#include "util/byte_order.hpp"

#include <algorithm>

namespace spvproof {
namespace util {

uint128 ReverseBytes(const uint128 &in) noexcept {
  uint128 out;
  std::reverse_copy(in.begin(), in.end(), out.begin());
  return out;
}

uint256 ReverseBytes(const uint256 &in) noexcept {
  constexpr size_t HALF = uint128::size();

  const uint128 low(std::span<const unsigned char>(in.begin(), HALF));
  const uint128 high(std::span<const unsigned char>(in.begin() + HALF, HALF));

  // reverse(low ++ high) == reverse(high) ++ reverse(low)
  const uint128 first = ReverseBytes(high);
  const uint128 second = ReverseBytes(low);

  uint256 out;
  std::copy(first.begin(), first.end(), out.begin());
  std::copy(second.begin(), second.end(), out.begin() + HALF);
  return out;
}

std::optional<uint256> ReverseHash(std::span<const uint8_t> bytes) noexcept {
  if (bytes.size() != uint256::size()) {
    return std::nullopt;
  }
  return ReverseBytes(uint256(bytes));
}

} // namespace util
} // namespace spvproof
