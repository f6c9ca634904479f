// Copyright (c) 2014-2022 The Bitcoin Core developers
// Copyright (c) 2025 The spvproof developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.
#pragma once

#include <bit>
#include <cstdint>
#include <cstring>

namespace endian {

// Byteswap for C++20 (C++23 has std::byteswap)
inline uint32_t byteswap32(uint32_t x) {
  return ((x >> 24) & 0x000000FF) | ((x >> 8) & 0x0000FF00) |
         ((x << 8) & 0x00FF0000) | ((x << 24) & 0xFF000000);
}

// Bitcoin header scalars (version, time, bits, nonce) are little-endian on the wire
inline uint32_t ReadLE32(const uint8_t *ptr) {
  uint32_t result;
  std::memcpy(&result, ptr, sizeof(result));
  if constexpr (std::endian::native == std::endian::big) {
    result = byteswap32(result);
  }
  return result;
}

inline void WriteLE32(uint8_t *ptr, uint32_t value) {
  if constexpr (std::endian::native == std::endian::big) {
    value = byteswap32(value);
  }
  std::memcpy(ptr, &value, sizeof(value));
}

} // namespace endian
