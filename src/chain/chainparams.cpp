// Copyright (c) 2025 The spvproof developers
// Distributed under the MIT software license

#include "chain/chainparams.hpp"
#include "util/logging.hpp"
#include <stdexcept>

namespace spvproof {
namespace chain {

// Static instance
std::unique_ptr<ChainParams> GlobalChainParams::instance = nullptr;

CBlockHeader CreateGenesisBlock(uint32_t nTime, uint32_t nNonce, uint32_t nBits,
                                int32_t nVersion) {
  CBlockHeader genesis;
  genesis.nVersion = nVersion;
  genesis.hashPrevBlock.SetNull();
  // txid of the "The Times 03/Jan/2009" coinbase, the only transaction
  genesis.hashMerkleRoot = uint256S(
      "4a5e1e4baab89f3a32518a88c31bc87f618f76673e2cc77ab2127b7afdeda33b");
  genesis.nTime = nTime;
  genesis.nBits = nBits;
  genesis.nNonce = nNonce;
  return genesis;
}

std::string ChainParams::GetChainTypeString() const {
  switch (chainType) {
  case ChainType::MAIN:
    return "main";
  case ChainType::TESTNET:
    return "test";
  case ChainType::REGTEST:
    return "regtest";
  }
  return "unknown";
}

bool ParseChainType(const std::string &name, ChainType &out) {
  if (name == "main" || name == "mainnet") {
    out = ChainType::MAIN;
  } else if (name == "test" || name == "testnet") {
    out = ChainType::TESTNET;
  } else if (name == "regtest") {
    out = ChainType::REGTEST;
  } else {
    return false;
  }
  return true;
}

std::unique_ptr<ChainParams> ChainParams::CreateMainNet() {
  return std::make_unique<CMainParams>();
}

std::unique_ptr<ChainParams> ChainParams::CreateTestNet() {
  return std::make_unique<CTestNetParams>();
}

std::unique_ptr<ChainParams> ChainParams::CreateRegTest() {
  return std::make_unique<CRegTestParams>();
}

// ============================================================================
// MainNet Parameters
// ============================================================================

CMainParams::CMainParams() {
  chainType = ChainType::MAIN;

  genesis = CreateGenesisBlock(1231006505, 2083236893, 0x1d00ffff, 1);
  hashGenesisBlock = genesis.GetHash();
  if (hashGenesisBlock !=
      uint256S("000000000019d6689c085ae165831e934ff763ae46a2a6c172b3f1b60a8ce26f")) {
    LOG_CHAIN_ERROR("Mainnet genesis hash mismatch: {}", hashGenesisBlock.GetHex());
  }

  vCheckpoints = {
      {0, uint256S("000000000019d6689c085ae165831e934ff763ae46a2a6c172b3f1b60a8ce26f")},
      {1, uint256S("00000000839a8e6886ab5951d76f411475428afc90947ee320161bbf18eb6048")},
      {100000, uint256S("000000000003ba27aa200b1cecaad478d2b00432346c3f1f3986da1afd33e506")},
  };
}

// ============================================================================
// TestNet Parameters
// ============================================================================

CTestNetParams::CTestNetParams() {
  chainType = ChainType::TESTNET;

  genesis = CreateGenesisBlock(1296688602, 414098458, 0x1d00ffff, 1);
  hashGenesisBlock = genesis.GetHash();
  if (hashGenesisBlock !=
      uint256S("000000000933ea01ad0ee984209779baaec3ced90fa3f408719526f8d77f4943")) {
    LOG_CHAIN_ERROR("Testnet genesis hash mismatch: {}", hashGenesisBlock.GetHex());
  }

  vCheckpoints = {
      {0, uint256S("000000000933ea01ad0ee984209779baaec3ced90fa3f408719526f8d77f4943")},
      {100000, uint256S("00000000009e2958c15ff9290d571bf9459e93b19765c6801ddeccadbb160a1e")},
  };
}

// ============================================================================
// RegTest Parameters
// ============================================================================

CRegTestParams::CRegTestParams() {
  chainType = ChainType::REGTEST;

  genesis = CreateGenesisBlock(1296688602, 2, 0x207fffff, 1);
  hashGenesisBlock = genesis.GetHash();

  // Regtest chains are local; only genesis is known in advance
  vCheckpoints = {
      {0, hashGenesisBlock},
  };
}

void GlobalChainParams::Select(ChainType chain) {
  switch (chain) {
  case ChainType::MAIN:
    instance = ChainParams::CreateMainNet();
    break;
  case ChainType::TESTNET:
    instance = ChainParams::CreateTestNet();
    break;
  case ChainType::REGTEST:
    instance = ChainParams::CreateRegTest();
    break;
  }
}

const ChainParams &GlobalChainParams::Get() {
  if (!instance) {
    throw std::runtime_error(
        "GlobalChainParams not initialized - call Select() first");
  }
  return *instance;
}

bool GlobalChainParams::IsInitialized() { return instance != nullptr; }

} // namespace chain
} // namespace spvproof
