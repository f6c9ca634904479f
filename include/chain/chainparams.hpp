// Copyright (c) 2025 The spvproof developers
// Distributed under the MIT software license

#pragma once

#include "chain/block_header.hpp"
#include "util/uint.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace spvproof {
namespace chain {

/**
 * Chain type enumeration
 */
enum class ChainType {
  MAIN,    // Bitcoin mainnet
  TESTNET, // Bitcoin testnet3
  REGTEST  // Regression test (local testing)
};

/**
 * Hard-coded header hash trusted for a given height.
 * hash is the block hash in internal byte order (uint256S of the
 * explorer string).
 */
struct Checkpoint {
  uint32_t height;
  uint256 hash;
};

/**
 * ChainParams - per-network constants the verifier needs
 * Simplified version of Bitcoin's CChainParams
 */
class ChainParams {
public:
  ChainParams() = default;
  virtual ~ChainParams() = default;

  const CBlockHeader &GenesisBlock() const { return genesis; }
  const uint256 &GenesisHash() const { return hashGenesisBlock; }
  ChainType GetChainType() const { return chainType; }
  std::string GetChainTypeString() const;
  const std::vector<Checkpoint> &Checkpoints() const { return vCheckpoints; }

  // Factory methods
  static std::unique_ptr<ChainParams> CreateMainNet();
  static std::unique_ptr<ChainParams> CreateTestNet();
  static std::unique_ptr<ChainParams> CreateRegTest();

protected:
  ChainType chainType{ChainType::MAIN};
  CBlockHeader genesis;
  uint256 hashGenesisBlock;
  std::vector<Checkpoint> vCheckpoints;
};

/**
 * MainNet parameters
 */
class CMainParams : public ChainParams {
public:
  CMainParams();
};

/**
 * TestNet parameters
 */
class CTestNetParams : public ChainParams {
public:
  CTestNetParams();
};

/**
 * RegTest parameters
 */
class CRegTestParams : public ChainParams {
public:
  CRegTestParams();
};

/**
 * Global chain params singleton
 * Simple alternative to Bitcoin's global pointer
 */
class GlobalChainParams {
public:
  static void Select(ChainType chain);
  static const ChainParams &Get();
  static bool IsInitialized();

private:
  static std::unique_ptr<ChainParams> instance;
};

// Helper to create the Bitcoin genesis header (shared coinbase, so every
// network has the same Merkle root)
CBlockHeader CreateGenesisBlock(uint32_t nTime, uint32_t nNonce, uint32_t nBits,
                                int32_t nVersion = 1);

// Parse "main", "test"/"testnet" or "regtest". Returns false on anything else.
bool ParseChainType(const std::string &name, ChainType &out);

} // namespace chain
} // namespace spvproof
