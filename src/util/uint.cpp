// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2020 The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/uint.hpp"

#include <iomanip>
#include <sstream>
#include <string>

namespace {

int HexDigit(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

} // namespace

template <unsigned int BITS> std::string base_blob<BITS>::GetHex() const {
  std::stringstream ss;
  ss << std::hex << std::setfill('0');
  // Most significant byte (last in memory) first
  for (int i = WIDTH - 1; i >= 0; --i) {
    ss << std::setw(2) << static_cast<unsigned int>(m_data[i]);
  }
  return ss.str();
}

template <unsigned int BITS> void base_blob<BITS>::SetHex(const char *psz) {
  SetNull();

  if (psz[0] == '0' && (psz[1] == 'x' || psz[1] == 'X')) {
    psz += 2;
  }

  const char *pbegin = psz;
  while (HexDigit(*psz) != -1) {
    psz++;
  }
  psz--;

  // The string is most-significant first, fill from the last digit backwards
  unsigned char *p1 = begin();
  unsigned char *pend = end();
  while (psz >= pbegin && p1 < pend) {
    *p1 = HexDigit(*psz--);
    if (psz >= pbegin) {
      *p1 |= ((unsigned char)HexDigit(*psz--) << 4);
      p1++;
    }
  }
}

template <unsigned int BITS>
void base_blob<BITS>::SetHex(std::string_view str) {
  // string_view is not guaranteed to be NUL-terminated
  SetHex(std::string(str).c_str());
}

template <unsigned int BITS> std::string base_blob<BITS>::ToString() const {
  return GetHex();
}

template std::string base_blob<128>::GetHex() const;
template void base_blob<128>::SetHex(const char *);
template void base_blob<128>::SetHex(std::string_view);
template std::string base_blob<128>::ToString() const;

template std::string base_blob<256>::GetHex() const;
template void base_blob<256>::SetHex(const char *);
template void base_blob<256>::SetHex(std::string_view);
template std::string base_blob<256>::ToString() const;

const uint256 uint256::ZERO(0);
const uint256 uint256::ONE(1);
