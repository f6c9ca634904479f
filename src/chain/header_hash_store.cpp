// Copyright (c) 2025 The spvproof developers
// Distributed under the MIT software license

#include "chain/header_hash_store.hpp"
#include "chain/block_header.hpp"
#include "chain/chainparams.hpp"
#include "util/byte_order.hpp"
#include "util/files.hpp"
#include "util/hash.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include <nlohmann/json.hpp>

namespace spvproof {
namespace chain {

namespace {
constexpr int HEADER_FILE_VERSION = 1;
}

std::optional<uint256> HeaderHashIndex::GetHeaderHash(uint32_t height) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = hashes_.find(height);
  if (it == hashes_.end()) {
    return std::nullopt;
  }
  return it->second;
}

HeaderHashIndex::RecordResult
HeaderHashIndex::RecordHeaderHash(uint32_t height, const uint256 &hash) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto [it, inserted] = hashes_.emplace(height, hash);
  if (inserted) {
    LOG_CHAIN_TRACE("Recorded header hash at height {}: {}", height,
                    util::HexStr(hash));
    return RecordResult::ADDED;
  }
  if (it->second == hash) {
    return RecordResult::DUPLICATE;
  }
  LOG_CHAIN_WARN("Refusing conflicting header hash at height {}: have {}, got {}",
                 height, util::HexStr(it->second), util::HexStr(hash));
  return RecordResult::CONFLICT;
}

bool HeaderHashIndex::RecordHeader(uint32_t height,
                                   std::span<const uint8_t> header) {
  if (header.size() != CBlockHeader::HEADER_SIZE) {
    LOG_CHAIN_DEBUG("RecordHeader: header at height {} is {} bytes, expected {}",
                    height, header.size(), CBlockHeader::HEADER_SIZE);
    return false;
  }
  uint256 hash = util::ReverseBytes(Hash256(header));
  return RecordHeaderHash(height, hash) != RecordResult::CONFLICT;
}

bool HeaderHashIndex::Contains(uint32_t height) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return hashes_.count(height) > 0;
}

size_t HeaderHashIndex::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return hashes_.size();
}

std::optional<uint32_t> HeaderHashIndex::GetMaxHeight() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (hashes_.empty()) {
    return std::nullopt;
  }
  return hashes_.rbegin()->first;
}

size_t HeaderHashIndex::SeedCheckpoints(const ChainParams &params) {
  size_t conflicts = 0;
  for (const auto &cp : params.Checkpoints()) {
    if (RecordHeaderHash(cp.height, util::ReverseBytes(cp.hash)) ==
        RecordResult::CONFLICT) {
      ++conflicts;
    }
  }
  LOG_CHAIN_DEBUG("Seeded {} {} checkpoints ({} conflicts)",
                  params.Checkpoints().size(), params.GetChainTypeString(),
                  conflicts);
  return conflicts;
}

#ifdef SPVPROOF_ENABLE_DEBUG_INSERT
void HeaderHashIndex::DebugInsertHeaderHash(uint32_t height,
                                            const uint256 &hash) {
  std::lock_guard<std::mutex> lock(mutex_);
  LOG_CHAIN_WARN("DEBUG insert of header hash at height {}", height);
  hashes_[height] = hash;
}
#endif

bool HeaderHashIndex::Save(const std::string &filepath) const {
  using json = nlohmann::json;

  try {
    json root;
    json headers = json::array();
    {
      std::lock_guard<std::mutex> lock(mutex_);
      LOG_CHAIN_TRACE("Saving {} header hashes to {}", hashes_.size(), filepath);
      root["version"] = HEADER_FILE_VERSION;
      root["count"] = hashes_.size();
      // std::map iterates in height order, which keeps the file diffable
      for (const auto &[height, hash] : hashes_) {
        json entry;
        entry["height"] = height;
        entry["hash"] = util::HexStr(hash);
        headers.push_back(entry);
      }
    }
    root["headers"] = headers;

    if (!util::atomic_write_file(filepath, root.dump(2))) {
      LOG_CHAIN_ERROR("Failed to write header file: {}", filepath);
      return false;
    }

    LOG_CHAIN_TRACE("Successfully saved header hashes");
    return true;

  } catch (const std::exception &e) {
    LOG_CHAIN_ERROR("Exception during Save: {}", e.what());
    return false;
  }
}

bool HeaderHashIndex::Load(const std::string &filepath) {
  using json = nlohmann::json;

  try {
    LOG_CHAIN_TRACE("Loading header hashes from {}", filepath);

    auto contents = util::read_file_string(filepath);
    if (!contents) {
      LOG_CHAIN_TRACE("Header file not found: {}", filepath);
      return false;
    }

    json root = json::parse(*contents);
    if (!root.is_object()) {
      LOG_CHAIN_ERROR("Header file is not a JSON object");
      return false;
    }

    int version = root.value("version", 0);
    if (version != HEADER_FILE_VERSION) {
      LOG_CHAIN_ERROR("Unsupported header file version: {}", version);
      return false;
    }

    if (!root.contains("headers") || !root["headers"].is_array()) {
      LOG_CHAIN_ERROR("Header file missing 'headers' array");
      return false;
    }
    const json &headers = root["headers"];

    size_t count = root.value("count", static_cast<size_t>(0));
    if (count != headers.size()) {
      LOG_CHAIN_ERROR("Header count mismatch: file says {}, array has {}",
                      count, headers.size());
      return false;
    }

    std::map<uint32_t, uint256> loaded;
    for (const auto &entry : headers) {
      if (!entry.is_object() || !entry.contains("height") ||
          !entry.contains("hash")) {
        LOG_CHAIN_ERROR("Header entry missing 'height' or 'hash'");
        return false;
      }
      if (!entry["height"].is_number_unsigned() || !entry["hash"].is_string()) {
        LOG_CHAIN_ERROR("Header entry has wrong field types");
        return false;
      }
      uint64_t height = entry["height"].get<uint64_t>();
      if (height > UINT32_MAX) {
        LOG_CHAIN_ERROR("Header height out of range: {}", height);
        return false;
      }
      auto hash = util::SafeParseRawHash(entry["hash"].get<std::string>());
      if (!hash) {
        LOG_CHAIN_ERROR("Invalid hash at height {}", height);
        return false;
      }
      if (!loaded.emplace(static_cast<uint32_t>(height), *hash).second) {
        LOG_CHAIN_ERROR("Duplicate height in header file: {}", height);
        return false;
      }
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (const auto &[height, hash] : loaded) {
        auto it = hashes_.find(height);
        if (it != hashes_.end() && it->second != hash) {
          LOG_CHAIN_ERROR("Header file contradicts recorded hash at height {}: "
                          "have {}, file has {}",
                          height, util::HexStr(it->second), util::HexStr(hash));
          return false;
        }
      }
      hashes_.insert(loaded.begin(), loaded.end());
      LOG_CHAIN_TRACE("Successfully loaded {} header hashes ({} total)",
                      loaded.size(), hashes_.size());
    }
    return true;

  } catch (const std::exception &e) {
    LOG_CHAIN_ERROR("Exception during Load: {}", e.what());
    return false;
  }
}

std::filesystem::path GetHeaderFilePath(const std::filesystem::path &datadir,
                                        const ChainParams &params) {
  return datadir / params.GetChainTypeString() / "headers.json";
}

bool OpenHeaderHashIndex(HeaderHashIndex &store, const ChainParams &params,
                         const std::filesystem::path &path) {
  size_t conflicts = store.SeedCheckpoints(params);
  if (conflicts > 0) {
    LOG_CHAIN_WARN("{} recorded header hashes contradict {} checkpoints",
                   conflicts, params.GetChainTypeString());
  }

  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    LOG_CHAIN_DEBUG("No header file at {}, using {} checkpoints only",
                    path.string(), params.GetChainTypeString());
    return true;
  }
  if (!store.Load(path.string())) {
    LOG_CHAIN_ERROR("Failed to load {} header file {}",
                    params.GetChainTypeString(), path.string());
    return false;
  }
  return true;
}

} // namespace chain
} // namespace spvproof
