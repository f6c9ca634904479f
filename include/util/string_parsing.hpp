#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Safe parsing of command-line and file input to numeric and byte types
 - Returns std::nullopt on any parsing error (no exceptions thrown)
 - Every hex parser accepts an optional "0x" prefix

 Hex conventions:
 - SafeParseHash: display order ("000000000019d6..."), reversed into the
   blob's internal byte order, like uint256::SetHex
 - ParseHex / SafeParseRawHash: bytes exactly as written, no reversal
*/

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "util/uint.hpp"

namespace spvproof {
namespace util {

/**
 * Parse unsigned 32-bit value (block heights, transaction indexes)
 *
 *   SafeParseUInt32("807525") -> 807525
 *   SafeParseUInt32("-1") -> std::nullopt
 *   SafeParseUInt32("4294967296") -> std::nullopt (overflow)
 *   SafeParseUInt32("+1") -> std::nullopt (digits only)
 */
std::optional<uint32_t> SafeParseUInt32(const std::string& str);

/**
 * Validate hexadecimal string (non-empty, all characters [0-9a-fA-F])
 */
bool IsValidHex(const std::string& str);

/**
 * Parse 64-character display-order hash (reversed into internal order).
 * Accepts an optional "0x" prefix, like ParseHex.
 */
std::optional<uint256> SafeParseHash(const std::string& str);

/**
 * Decode an even-length hex string into bytes, keeping the written order.
 * Accepts an optional "0x" prefix. The empty string decodes to no bytes.
 *
 *   ParseHex("0xdead") -> {0xde, 0xad}
 *   ParseHex("abc") -> std::nullopt (odd length)
 */
std::optional<std::vector<uint8_t>> ParseHex(std::string_view str);

/**
 * Decode exactly 32 bytes of hex, keeping the written order
 */
std::optional<uint256> SafeParseRawHash(const std::string& str);

/**
 * Lower-case hex of the bytes in memory order
 */
std::string HexStr(std::span<const uint8_t> bytes);

} // namespace util
} // namespace spvproof
