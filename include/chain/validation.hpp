// Copyright (c) 2025 The spvproof developers
// Distributed under the MIT software license

#pragma once

#include "chain/merkle.hpp"
#include "util/uint.hpp"
#include <cstdint>
#include <span>
#include <string>

namespace spvproof {

namespace chain {
class HeaderHashProvider;
} // namespace chain

namespace validation {

/**
 * ============================================================================
 * SPV PROOF VERIFICATION
 * ============================================================================
 *
 * Answers "was transaction T mined in the block at height H?" from:
 * - the 80-byte header of the block,
 * - a Merkle path from T's txid up to the header's Merkle root,
 * - a trusted height -> header hash mapping (HeaderHashProvider).
 *
 * VerifyBlockHeader()  : header hashes to the hash recorded for H
 * VerifyMerkleProof()  : leaf folds up to root along the sibling path
 * WasTxMined()         : both of the above, for a display-order txid
 * WasTxMinedRaw()      : same, txid computed from the raw transaction
 *
 * BYTE ORDER:
 * - txids passed to WasTxMined and hashes in the store: display order
 * - leaf/root/siblings seen by VerifyMerkleProof: internal order
 * ============================================================================
 */

/**
 * Validation state - tracks why verification failed
 * Simplified from Bitcoin Core's BlockValidationState
 *
 * INVALID: well-formed input that does not prove inclusion
 * ERROR:   malformed input (bad lengths, oversized or truncated proofs)
 */
class ValidationState {
public:
  enum class Result {
    VALID,
    INVALID, // Proof does not hold
    ERROR    // Malformed input
  };

  ValidationState() : result_(Result::VALID) {}

  bool IsValid() const { return result_ == Result::VALID; }
  bool IsInvalid() const { return result_ == Result::INVALID; }
  bool IsError() const { return result_ == Result::ERROR; }
  Result GetResult() const { return result_; }

  bool Invalid(const std::string &reject_reason,
               const std::string &debug_message = "") {
    result_ = Result::INVALID;
    reject_reason_ = reject_reason;
    debug_message_ = debug_message;
    return false;
  }

  bool Error(const std::string &reject_reason,
             const std::string &debug_message = "") {
    result_ = Result::ERROR;
    reject_reason_ = reject_reason;
    debug_message_ = debug_message;
    return false;
  }

  const std::string& GetRejectReason() const { return reject_reason_; }
  const std::string& GetDebugMessage() const { return debug_message_; }

  std::string ToString() const;

private:
  Result result_;
  std::string reject_reason_;
  std::string debug_message_;
};

// Reject reasons (stable strings, part of the CLI output)
namespace reject {
inline constexpr const char *INVALID_HEADER_LENGTH = "invalid-header-length";
inline constexpr const char *HEADER_HEIGHT_MISMATCH = "header-height-mismatch";
inline constexpr const char *INVALID_MERKLE_PROOF = "invalid-merkle-proof";
inline constexpr const char *MERKLE_ROOT_MISMATCH = "merkle-root-mismatch";
inline constexpr const char *MERKLE_PROOF_TOO_SHORT = "merkle-proof-too-short";
inline constexpr const char *MERKLE_PROOF_TOO_LONG = "merkle-proof-too-long";
inline constexpr const char *MERKLE_PROOF_BAD_INDEX = "merkle-proof-bad-index";
inline constexpr const char *INVALID_TRANSACTION = "invalid-transaction";
} // namespace reject

// True iff header is 80 bytes and ReverseBytes(Hash256(header)) equals the
// hash recorded for height. An unrecorded height is false, not an error.
bool VerifyBlockHeader(std::span<const uint8_t> header, uint32_t height,
                       const chain::HeaderHashProvider &store);

// Fold leaf up the sibling path and compare with root (both internal order).
// Bit i of proof.tx_index set means the running hash is the right child at
// level i.
bool VerifyMerkleProof(const uint256 &leaf, const uint256 &root,
                       const chain::MerkleProof &proof, ValidationState &state);

// txid in display order (as printed by explorers)
bool WasTxMined(uint32_t height, const uint256 &txid,
                std::span<const uint8_t> header, const chain::MerkleProof &proof,
                const chain::HeaderHashProvider &store, ValidationState &state);

// Display-order txid of a serialized transaction: ReverseBytes(Hash256(tx)).
// Segwit transactions must be passed without witness data.
uint256 GetTxid(std::span<const uint8_t> raw_tx);

bool WasTxMinedRaw(uint32_t height, std::span<const uint8_t> raw_tx,
                   std::span<const uint8_t> header,
                   const chain::MerkleProof &proof,
                   const chain::HeaderHashProvider &store,
                   ValidationState &state);

} // namespace validation
} // namespace spvproof
