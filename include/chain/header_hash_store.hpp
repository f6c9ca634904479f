// Copyright (c) 2025 The spvproof developers
// Distributed under the MIT software license

#pragma once

#include "util/uint.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <string>

namespace spvproof {
namespace chain {

class ChainParams;

/**
 * Read side of the height -> header hash mapping consumed by the verifier.
 *
 * Hashes are in display byte order: the bytes of the string a block
 * explorer prints, i.e. ReverseBytes(Hash256(header)).
 */
class HeaderHashProvider {
public:
  virtual ~HeaderHashProvider() = default;

  // std::nullopt when nothing is recorded for height
  virtual std::optional<uint256> GetHeaderHash(uint32_t height) const = 0;
};

// HeaderHashIndex - in-memory append-only store of trusted header hashes
//
// Fed by a single upstream writer (relayer / CLI), read concurrently by
// verifiers. At most one hash per height: recording the same hash again is
// a no-op, recording a different one is refused.
//
// THREAD SAFETY: all public methods lock mutex_.
class HeaderHashIndex : public HeaderHashProvider {
public:
  enum class RecordResult {
    ADDED,     // New height recorded
    DUPLICATE, // Same hash already recorded at this height
    CONFLICT   // Different hash already recorded; nothing changed
  };

  HeaderHashIndex() = default;

  std::optional<uint256> GetHeaderHash(uint32_t height) const override;

  RecordResult RecordHeaderHash(uint32_t height, const uint256 &hash);

  // Record ReverseBytes(Hash256(header)). False if the header is not 80
  // bytes or the height already holds a different hash.
  bool RecordHeader(uint32_t height, std::span<const uint8_t> header);

  bool Contains(uint32_t height) const;
  size_t Size() const;
  std::optional<uint32_t> GetMaxHeight() const;

  // Record every checkpoint of the network. Returns the number of
  // checkpoints that conflicted with already recorded hashes.
  size_t SeedCheckpoints(const ChainParams &params);

  // Persist as JSON (atomic replace)
  bool Save(const std::string &filepath) const;

  // Merge the file's entries into the index. Entries already recorded with
  // the same hash are accepted. A malformed file, or one that contradicts a
  // recorded hash, is refused: false is returned and the index is untouched.
  bool Load(const std::string &filepath);

#ifdef SPVPROOF_ENABLE_DEBUG_INSERT
  // Overwrite unconditionally. Test builds only.
  void DebugInsertHeaderHash(uint32_t height, const uint256 &hash);
#endif

private:
  mutable std::mutex mutex_;
  std::map<uint32_t, uint256> hashes_;
};

// <datadir>/<chain>/headers.json, one file per network
std::filesystem::path GetHeaderFilePath(const std::filesystem::path &datadir,
                                        const ChainParams &params);

// Seed the network checkpoints, then merge the header file at path if it
// exists. Checkpoints are recorded first so a file cannot override them.
// False if the file could not be loaded.
bool OpenHeaderHashIndex(HeaderHashIndex &store, const ChainParams &params,
                         const std::filesystem::path &path);

} // namespace chain
} // namespace spvproof
