// Copyright (c) 2025 The spvproof developers
// Distributed under the MIT software license

#include "chain/validation.hpp"
#include "chain/block_header.hpp"
#include "chain/header_hash_store.hpp"
#include "util/byte_order.hpp"
#include "util/hash.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"

namespace spvproof {
namespace validation {

std::string ValidationState::ToString() const {
  if (IsValid()) {
    return "valid";
  }
  if (debug_message_.empty()) {
    return reject_reason_;
  }
  return reject_reason_ + ", " + debug_message_;
}

bool VerifyBlockHeader(std::span<const uint8_t> header, uint32_t height,
                       const chain::HeaderHashProvider &store) {
  if (header.size() != CBlockHeader::HEADER_SIZE) {
    LOG_SPV_DEBUG("VerifyBlockHeader: header is {} bytes", header.size());
    return false;
  }

  auto recorded = store.GetHeaderHash(height);
  if (!recorded) {
    LOG_SPV_DEBUG("VerifyBlockHeader: no header hash recorded at height {}",
                  height);
    return false;
  }

  uint256 computed = util::ReverseBytes(Hash256(header));
  if (computed != *recorded) {
    LOG_SPV_DEBUG("VerifyBlockHeader: height {} expects {}, header hashes to {}",
                  height, util::HexStr(*recorded), util::HexStr(computed));
    return false;
  }
  return true;
}

bool VerifyMerkleProof(const uint256 &leaf, const uint256 &root,
                       const chain::MerkleProof &proof, ValidationState &state) {
  const uint32_t depth = proof.tree_depth;

  // A path longer than the cap cannot be checked; reported like a proof
  // that is missing siblings.
  if (depth > chain::MAX_MERKLE_PROOF_DEPTH) {
    return state.Error(reject::MERKLE_PROOF_TOO_SHORT,
                       "tree depth " + std::to_string(depth) +
                           " exceeds maximum " +
                           std::to_string(chain::MAX_MERKLE_PROOF_DEPTH));
  }
  if (proof.hashes.size() < depth) {
    return state.Error(reject::MERKLE_PROOF_TOO_SHORT,
                       std::to_string(proof.hashes.size()) +
                           " sibling hashes for depth " +
                           std::to_string(depth));
  }
  if (proof.hashes.size() > depth) {
    return state.Error(reject::MERKLE_PROOF_TOO_LONG,
                       std::to_string(proof.hashes.size()) +
                           " sibling hashes for depth " +
                           std::to_string(depth));
  }
  // depth <= 14, so the shift cannot overflow
  if (proof.tx_index >= (uint32_t{1} << depth)) {
    return state.Error(reject::MERKLE_PROOF_BAD_INDEX,
                       "index " + std::to_string(proof.tx_index) +
                           " out of range for depth " + std::to_string(depth));
  }

  uint256 current = leaf;
  for (uint32_t level = 0; level < depth; ++level) {
    const uint256 &sibling = proof.hashes[level];
    const bool current_is_right = ((proof.tx_index >> level) & 1) != 0;
    if (current_is_right) {
      current = Hash256(sibling, current);
    } else {
      current = Hash256(current, sibling);
    }
    LOG_SPV_TRACE("VerifyMerkleProof: level {} {} -> {}", level,
                  current_is_right ? "right" : "left", current.GetHex());
  }

  if (current != root) {
    return state.Invalid(reject::MERKLE_ROOT_MISMATCH,
                         "computed " + current.GetHex() + ", header has " +
                             root.GetHex());
  }
  return true;
}

bool WasTxMined(uint32_t height, const uint256 &txid,
                std::span<const uint8_t> header, const chain::MerkleProof &proof,
                const chain::HeaderHashProvider &store, ValidationState &state) {
  auto root = ExtractMerkleRoot(header);
  if (!root) {
    return state.Error(reject::INVALID_HEADER_LENGTH,
                       "header is " + std::to_string(header.size()) +
                           " bytes, expected " +
                           std::to_string(CBlockHeader::HEADER_SIZE));
  }

  if (!VerifyBlockHeader(header, height, store)) {
    return state.Invalid(reject::HEADER_HEIGHT_MISMATCH,
                         "header does not match height " +
                             std::to_string(height));
  }

  ValidationState proof_state;
  if (!VerifyMerkleProof(util::ReverseBytes(txid), *root, proof, proof_state)) {
    if (proof_state.IsError()) {
      return state.Error(proof_state.GetRejectReason(),
                         proof_state.GetDebugMessage());
    }
    return state.Invalid(reject::INVALID_MERKLE_PROOF,
                         proof_state.GetDebugMessage());
  }

  LOG_SPV_DEBUG("Transaction {} verified in block at height {}",
                util::HexStr(txid), height);
  return true;
}

uint256 GetTxid(std::span<const uint8_t> raw_tx) {
  return util::ReverseBytes(Hash256(raw_tx));
}

bool WasTxMinedRaw(uint32_t height, std::span<const uint8_t> raw_tx,
                   std::span<const uint8_t> header,
                   const chain::MerkleProof &proof,
                   const chain::HeaderHashProvider &store,
                   ValidationState &state) {
  if (raw_tx.empty()) {
    return state.Error(reject::INVALID_TRANSACTION, "empty transaction");
  }
  return WasTxMined(height, GetTxid(raw_tx), header, proof, store, state);
}

} // namespace validation
} // namespace spvproof
