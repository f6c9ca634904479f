#include "util/string_parsing.hpp"
#include <cctype>
#include <cstdint>
#include <limits>

namespace spvproof {
namespace util {

namespace {

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::string_view StripHexPrefix(std::string_view str) {
  if (str.size() >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
    str.remove_prefix(2);
  }
  return str;
}

} // namespace

std::optional<uint32_t> SafeParseUInt32(const std::string& str) {
  // Decimal digits only: no sign, whitespace or base prefix
  if (str.empty() || str.size() > 10) {
    return std::nullopt;
  }
  uint64_t value = 0;
  for (char c : str) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    value = value * 10 + static_cast<uint64_t>(c - '0');
  }
  if (value > std::numeric_limits<uint32_t>::max()) {
    return std::nullopt;
  }
  return static_cast<uint32_t>(value);
}

bool IsValidHex(const std::string& str) {
  if (str.empty()) {
    return false;
  }

  for (char c : str) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

std::optional<uint256> SafeParseHash(const std::string& str) {
  std::string_view digits = StripHexPrefix(str);
  if (digits.size() != 64 || !IsValidHex(std::string(digits))) {
    return std::nullopt;
  }

  uint256 hash;
  hash.SetHex(std::string(digits));
  return hash;
}

std::optional<std::vector<uint8_t>> ParseHex(std::string_view str) {
  str = StripHexPrefix(str);
  if (str.size() % 2 != 0) {
    return std::nullopt;
  }

  std::vector<uint8_t> out;
  out.reserve(str.size() / 2);
  for (size_t i = 0; i < str.size(); i += 2) {
    int hi = HexValue(str[i]);
    int lo = HexValue(str[i + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    out.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return out;
}

std::optional<uint256> SafeParseRawHash(const std::string& str) {
  auto bytes = ParseHex(str);
  if (!bytes || bytes->size() != uint256::size()) {
    return std::nullopt;
  }
  return uint256(*bytes);
}

std::string HexStr(std::span<const uint8_t> bytes) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (uint8_t b : bytes) {
    out.push_back(kDigits[b >> 4]);
    out.push_back(kDigits[b & 0x0f]);
  }
  return out;
}

} // namespace util
} // namespace spvproof
