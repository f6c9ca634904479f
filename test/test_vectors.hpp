// Copyright (c) 2025 The spvproof developers
// Distributed under the MIT software license
// Real Bitcoin headers and transactions shared by the unit tests

#pragma once

#include "util/string_parsing.hpp"
#include "util/uint.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace spvproof {
namespace test {

// Mainnet block 0
inline constexpr const char *MAIN_GENESIS_HEADER =
    "0100000000000000000000000000000000000000000000000000000000000000"
    "000000003ba3edfd7a7b12b27ac72c3e67768f617fc81bc3888a51323a9fb8aa"
    "4b1e5e4a29ab5f49ffff001d1dac2b7c";
inline constexpr const char *MAIN_GENESIS_HASH =
    "000000000019d6689c085ae165831e934ff763ae46a2a6c172b3f1b60a8ce26f";
inline constexpr const char *GENESIS_COINBASE_TXID =
    "4a5e1e4baab89f3a32518a88c31bc87f618f76673e2cc77ab2127b7afdeda33b";

// Mainnet block 1
inline constexpr const char *MAIN_BLOCK1_HEADER =
    "010000006fe28c0ab6f1b372c1a6a246ae63f74f931e8365e15a089c68d61900"
    "00000000982051fd1e4ba744bbbe680e1fee14677ba1a3c3540bf7b1cdb606e8"
    "57233e0e61bc6649ffff001d01e36299";
inline constexpr const char *MAIN_BLOCK1_HASH =
    "00000000839a8e6886ab5951d76f411475428afc90947ee320161bbf18eb6048";

// Mainnet block 100000 (four transactions)
inline constexpr uint32_t BLOCK100K_HEIGHT = 100000;
inline constexpr const char *MAIN_BLOCK100K_HEADER =
    "0100000050120119172a610421a6c3011dd330d9df07b63616c2cc1f1cd00200"
    "000000006657a9252aacd5c0b2940996ecff952228c3067cc38d4885efb5a4ac"
    "4247e9f337221b4d4c86041b0f2b5710";
inline constexpr const char *MAIN_BLOCK100K_HASH =
    "000000000003ba27aa200b1cecaad478d2b00432346c3f1f3986da1afd33e506";
inline constexpr const char *MAIN_BLOCK100K_MERKLE_ROOT =
    "f3e94742aca4b5ef85488dc37c06c3282295ffec960994b2c0d5ac2a25a95766";
inline const std::vector<std::string> MAIN_BLOCK100K_TXIDS = {
    "8c14f0db3df150123e6f3dbbf30f8b955a8249b62ac1d1ff16284aefa3d06d87",
    "fff2525b8931402dd09222c50775608f75787bd2b87e56995a7bdd30f79702c4",
    "6359f0868171b1d194cbee1af2f16ea598ae8fad666d9b012c8ed2b79a236ec4",
    "e9a66845e05d5abc0ad04ec80f774a7e585c6e8db975962d069a522137b80c1d",
};
// Level-1 nodes of block 100000's tree, internal byte order as hex
inline constexpr const char *BLOCK100K_NODE_01 =
    "15b88c5107195bf09eb9da89b83d95b3d070079a3c5c5d3d17d0dcd873fbdacc";
inline constexpr const char *BLOCK100K_NODE_23 =
    "49aef42d78e3e9999c9e6ec9e1dddd6cb880bf3b076a03be1318ca789089308e";

// Testnet block 100000 (coinbase only)
inline constexpr const char *TEST_BLOCK100K_HEADER =
    "0200000035ab154183570282ce9afc0b494c9fc6a3cfea05aa8c1add2ecc5649"
    "0000000038ba3d78e4500a5a7570dbe61960398add4410d278b21cd9708e6d97"
    "43f374d544fc055227f1001c29c1ea3b";
inline constexpr const char *TEST_BLOCK100K_HASH =
    "00000000009e2958c15ff9290d571bf9459e93b19765c6801ddeccadbb160a1e";
inline constexpr const char *TEST_BLOCK100K_COINBASE_TX =
    "0100000001000000000000000000000000000000000000000000000000000000"
    "0000000000ffffffff3703a08601000427f1001c046a510100522cfabe6d6d00"
    "00000000000000000068692066726f6d20706f6f6c7365727665726aac1eeeed"
    "88ffffffff0100f2052a010000001976a914912e2b234f941f30b18afbb4fa46"
    "171214bf66c888ac00000000";
inline constexpr const char *TEST_BLOCK100K_COINBASE_TXID =
    "d574f343976d8e70d91cb278d21044dd8a396019e6db70755a0a50e4783dba38";

inline constexpr const char *TEST_GENESIS_HASH =
    "000000000933ea01ad0ee984209779baaec3ced90fa3f408719526f8d77f4943";
inline constexpr const char *REGTEST_GENESIS_HASH =
    "0f9188f13cb7b2c71f2a335e3a4fc328bf5beb436012afca590b1a11466e2206";

// Decode fixture hex; fixtures are known-good so failure is a test bug
inline std::vector<uint8_t> FromHex(const std::string &hex) {
  auto bytes = util::ParseHex(hex);
  if (!bytes) {
    throw std::invalid_argument("bad fixture hex: " + hex);
  }
  return *bytes;
}

// Display-order hash as stored in the height -> hash index
inline uint256 DisplayHash(const std::string &hex) {
  auto hash = util::SafeParseRawHash(hex);
  if (!hash) {
    throw std::invalid_argument("bad fixture hash: " + hex);
  }
  return *hash;
}

// Internal-order txids of block 100000 (Merkle leaves)
inline std::vector<uint256> Block100kLeaves() {
  std::vector<uint256> leaves;
  for (const auto &txid : MAIN_BLOCK100K_TXIDS) {
    leaves.push_back(uint256S(txid));
  }
  return leaves;
}

} // namespace test
} // namespace spvproof
