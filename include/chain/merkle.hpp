// Copyright (c) 2025 The spvproof developers
// Distributed under the MIT software license

#pragma once

#include "util/uint.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace spvproof {
namespace chain {

// Longest sibling list a proof may carry. 14 levels cover blocks of up to
// 16384 transactions and bound verification to 14 double-hashes.
static constexpr uint32_t MAX_MERKLE_PROOF_DEPTH = 14;

/**
 * Inclusion proof for one transaction of a block.
 *
 * hashes[i] is the sibling at level i, counted from the leaves, in internal
 * byte order. Bit i of tx_index (least significant first) tells whether the
 * running hash is the right child at level i.
 *
 * Well-formed iff hashes.size() == tree_depth, tree_depth <=
 * MAX_MERKLE_PROOF_DEPTH and tx_index < 2^tree_depth. VerifyMerkleProof()
 * enforces this; the struct itself is plain data.
 */
struct MerkleProof {
  uint32_t tx_index{0};
  std::vector<uint256> hashes;
  uint32_t tree_depth{0};
};

/**
 * Bitcoin Merkle root of a list of leaves (txids in internal byte order).
 *
 * A level with an odd number of nodes pairs its last node with itself.
 * Returns the null hash for an empty list. If mutated is non-null it is set
 * when two identical nodes were hashed together at some level where the
 * duplicate was not the odd trailing node (CVE-2012-2459 style mutation).
 */
[[nodiscard]] uint256 ComputeMerkleRoot(std::vector<uint256> leaves,
                                        bool *mutated = nullptr);

/**
 * Extract the sibling path for leaves[index].
 *
 * Returns std::nullopt if index is out of range or the tree is deeper than
 * MAX_MERKLE_PROOF_DEPTH.
 */
[[nodiscard]] std::optional<MerkleProof>
BuildMerkleProof(const std::vector<uint256> &leaves, uint32_t index);

} // namespace chain
} // namespace spvproof
