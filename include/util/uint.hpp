// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-present The Bitcoin Core developers
// Copyright (c) 2025 The spvproof developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#pragma once

#include <algorithm>
#include <array>
#include <cassert>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <string_view>

/** Template base class for fixed-sized opaque blobs. */
template <unsigned int BITS> class base_blob {
protected:
  static constexpr int WIDTH = BITS / 8;
  static_assert(BITS % 8 == 0,
                "base_blob currently only supports whole bytes.");
  std::array<uint8_t, WIDTH> m_data;
  static_assert(WIDTH == sizeof(m_data), "Sanity check");

public:
  /* construct 0 value by default */
  constexpr base_blob() : m_data() {}

  /* constructor for constants between 1 and 255 */
  constexpr explicit base_blob(uint8_t v) : m_data{v} {}

  // Caller guarantees vch.size() == WIDTH; use ReverseHash()/SafeParse* for
  // untrusted input
  constexpr explicit base_blob(std::span<const unsigned char> vch) {
    assert(vch.size() == WIDTH);
    std::copy(vch.begin(), vch.end(), m_data.begin());
  }

  constexpr bool IsNull() const {
    return std::all_of(m_data.begin(), m_data.end(),
                       [](uint8_t val) { return val == 0; });
  }

  constexpr void SetNull() { std::fill(m_data.begin(), m_data.end(), 0); }

  /** Lexicographic ordering over the stored bytes */
  constexpr int Compare(const base_blob &other) const {
    return std::memcmp(m_data.data(), other.m_data.data(), WIDTH);
  }

  friend constexpr bool operator==(const base_blob &a, const base_blob &b) {
    return a.Compare(b) == 0;
  }
  friend constexpr bool operator!=(const base_blob &a, const base_blob &b) {
    return a.Compare(b) != 0;
  }
  friend constexpr bool operator<(const base_blob &a, const base_blob &b) {
    return a.Compare(b) < 0;
  }

  /** @name Hex representation
   *
   * GetHex(), ToString() and SetHex() show the bytes of the blob in reverse
   * order, which is how Bitcoin displays hashes: a block hash stored in
   * internal byte order prints as "000000000019d6...". Use HexStr() from
   * util/string_parsing.hpp to print the stored bytes as they are.
   *
   * @{*/
  std::string GetHex() const;
  std::string ToString() const;

  /** Set from hex string. Supports optional "0x" prefix. */
  void SetHex(const char *psz);
  void SetHex(std::string_view str);
  /**@}*/

  constexpr const unsigned char *data() const { return m_data.data(); }
  constexpr unsigned char *data() { return m_data.data(); }

  constexpr unsigned char *begin() { return m_data.data(); }
  constexpr unsigned char *end() { return m_data.data() + WIDTH; }

  constexpr const unsigned char *begin() const { return m_data.data(); }
  constexpr const unsigned char *end() const { return m_data.data() + WIDTH; }

  static constexpr unsigned int size() { return WIDTH; }
};

/** 128-bit opaque blob. Half of a hash, the unit the byte-order normalizer
 * reverses. */
class uint128 : public base_blob<128> {
public:
  constexpr uint128() = default;
  constexpr explicit uint128(std::span<const unsigned char> vch)
      : base_blob<128>(vch) {}
};

/** 256-bit opaque blob.
 * @note This type is called uint256 for historical reasons only. It is an
 * opaque blob of 256 bits (a SHA-256 digest) and has no integer operations.
 */
class uint256 : public base_blob<256> {
public:
  constexpr uint256() = default;
  constexpr explicit uint256(uint8_t v) : base_blob<256>(v) {}
  constexpr explicit uint256(std::span<const unsigned char> vch)
      : base_blob<256>(vch) {}

  static const uint256 ZERO;
  static const uint256 ONE;
};

/* uint256 from const char *.
 * This is a separate function because the constructor uint256(const char*) can
 * result in dangerously catching uint256(0).
 */
inline uint256 uint256S(const char *str) {
  uint256 rv;
  rv.SetHex(str);
  return rv;
}

inline uint256 uint256S(std::string_view str) {
  uint256 rv;
  rv.SetHex(str);
  return rv;
}
