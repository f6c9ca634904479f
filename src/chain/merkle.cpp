// Copyright (c) 2025 The spvproof developers
// Distributed under the MIT software license

#include "chain/merkle.hpp"
#include "util/hash.hpp"
#include "util/logging.hpp"

namespace spvproof {
namespace chain {

uint256 ComputeMerkleRoot(std::vector<uint256> leaves, bool *mutated) {
  bool mutation = false;
  if (leaves.empty()) {
    if (mutated) *mutated = false;
    return uint256();
  }

  while (leaves.size() > 1) {
    for (size_t pos = 0; pos + 1 < leaves.size(); pos += 2) {
      if (leaves[pos] == leaves[pos + 1]) mutation = true;
    }
    if (leaves.size() & 1) {
      leaves.push_back(leaves.back());
    }
    for (size_t pos = 0; 2 * pos < leaves.size(); ++pos) {
      leaves[pos] = Hash256(leaves[2 * pos], leaves[2 * pos + 1]);
    }
    leaves.resize(leaves.size() / 2);
  }

  if (mutated) *mutated = mutation;
  return leaves[0];
}

std::optional<MerkleProof> BuildMerkleProof(const std::vector<uint256> &leaves,
                                            uint32_t index) {
  if (index >= leaves.size()) {
    LOG_SPV_DEBUG("BuildMerkleProof: index {} out of range ({} leaves)", index,
                  leaves.size());
    return std::nullopt;
  }

  MerkleProof proof;
  proof.tx_index = index;

  std::vector<uint256> level = leaves;
  size_t pos = index;
  while (level.size() > 1) {
    if (proof.hashes.size() == MAX_MERKLE_PROOF_DEPTH) {
      LOG_SPV_DEBUG("BuildMerkleProof: {} leaves exceed maximum depth {}",
                    leaves.size(), MAX_MERKLE_PROOF_DEPTH);
      return std::nullopt;
    }
    if (level.size() & 1) {
      level.push_back(level.back());
    }

    proof.hashes.push_back(level[pos ^ 1]);

    std::vector<uint256> parent;
    parent.reserve(level.size() / 2);
    for (size_t i = 0; i < level.size(); i += 2) {
      parent.push_back(Hash256(level[i], level[i + 1]));
    }
    level = std::move(parent);
    pos >>= 1;
  }

  proof.tree_depth = static_cast<uint32_t>(proof.hashes.size());
  return proof;
}

} // namespace chain
} // namespace spvproof
