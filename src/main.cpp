// Copyright (c) 2025 The spvproof developers
// Distributed under the MIT software license

#include "chain/block_header.hpp"
#include "chain/chainparams.hpp"
#include "chain/header_hash_store.hpp"
#include "chain/merkle.hpp"
#include "chain/validation.hpp"
#include "util/byte_order.hpp"
#include "util/files.hpp"
#include "util/hash.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <filesystem>
#include <iostream> // Keep for CLI output and early errors before logger initialized
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using json = nlohmann::json;
using spvproof::validation::ValidationState;

namespace {

// Exit codes
constexpr int EXIT_VERIFIED = 0;
constexpr int EXIT_REJECTED = 1;
constexpr int EXIT_MALFORMED = 2;

struct ToolConfig {
  std::filesystem::path datadir = spvproof::util::get_default_datadir();
  std::filesystem::path headers_file; // empty = <datadir>/<chain>/headers.json
  spvproof::chain::ChainType chain_type = spvproof::chain::ChainType::MAIN;
  std::string log_level = "warn";
  std::vector<std::string> debug_components;
  bool verbose = false;

  std::filesystem::path HeadersPath() const {
    if (!headers_file.empty()) {
      return headers_file;
    }
    return spvproof::chain::GetHeaderFilePath(
        datadir, spvproof::chain::GlobalChainParams::Get());
  }
};

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options] <command> [params]\n"
      << "\n"
      << "Options:\n"
      << "  --datadir=<path>     Data directory (default: ~/.spvproof)\n"
      << "  --headers=<file>     Header hash file (default: <datadir>/<chain>/headers.json)\n"
      << "  --chain=<name>       main, test or regtest (default: main)\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: warn\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: spv, chain, crypto, app, all\n"
      << "                       Can be comma-separated: --debug=spv,chain\n"
      << "  --verbose            Equivalent to --loglevel=debug\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << "\n"
      << "Commands:\n"
      << "  verifyheader <height> <header-hex>\n"
      << "  verifymerkleproof <leaf> <root> <tx-index> <depth> [hash...]\n"
      << "  wastxmined <height> <txid> <header-hex> <tx-index> <depth> [hash...]\n"
      << "  wastxminedraw <height> <tx-hex> <header-hex> <tx-index> <depth> [hash...]\n"
      << "  buildproof <tx-index> <txid>...\n"
      << "  recordheader <height> <header-hex>\n"
      << "  getheaderhash <height>\n"
      << "\n"
      << "Hashes (txids, roots, siblings) are given as block explorers print them.\n"
      << "Exit status: 0 verified, 1 rejected, 2 malformed input.\n"
      << std::endl;
}

int Malformed(const std::string &message) {
  std::cerr << "Error: " << message << std::endl;
  return EXIT_MALFORMED;
}

// Print the verdict as JSON and map it to an exit code
int Report(bool ok, const ValidationState &state, json out = json::object()) {
  out["result"] = ok;
  if (!ok) {
    out["reason"] = state.GetRejectReason();
    if (!state.GetDebugMessage().empty()) {
      out["debug"] = state.GetDebugMessage();
    }
  }
  std::cout << out.dump(2) << std::endl;
  if (ok) {
    return EXIT_VERIFIED;
  }
  return state.IsError() ? EXIT_MALFORMED : EXIT_REJECTED;
}

// <tx-index> <depth> [hash...] starting at args[pos]
bool ParseProof(const std::vector<std::string> &args, size_t pos,
                spvproof::chain::MerkleProof &proof, std::string &error) {
  if (args.size() < pos + 2) {
    error = "missing <tx-index> <depth>";
    return false;
  }
  auto index = spvproof::util::SafeParseUInt32(args[pos]);
  if (!index) {
    error = "invalid tx index: " + args[pos];
    return false;
  }
  auto depth = spvproof::util::SafeParseUInt32(args[pos + 1]);
  if (!depth) {
    error = "invalid depth: " + args[pos + 1];
    return false;
  }
  proof.tx_index = *index;
  proof.tree_depth = *depth;
  proof.hashes.clear();
  for (size_t i = pos + 2; i < args.size(); ++i) {
    auto hash = spvproof::util::SafeParseHash(args[i]);
    if (!hash) {
      error = "invalid sibling hash: " + args[i];
      return false;
    }
    proof.hashes.push_back(*hash);
  }
  return true;
}

// Network checkpoints plus the chain's header file, if any
bool OpenStore(const ToolConfig &config, spvproof::chain::HeaderHashIndex &store) {
  const auto path = config.HeadersPath();
  if (!spvproof::chain::OpenHeaderHashIndex(
          store, spvproof::chain::GlobalChainParams::Get(), path)) {
    std::cerr << "Error: failed to load header file " << path << std::endl;
    return false;
  }
  return true;
}

int CmdVerifyHeader(const ToolConfig &config, const std::vector<std::string> &args) {
  if (args.size() != 2) {
    return Malformed("usage: verifyheader <height> <header-hex>");
  }
  auto height = spvproof::util::SafeParseUInt32(args[0]);
  if (!height) {
    return Malformed("invalid height: " + args[0]);
  }
  auto header = spvproof::util::ParseHex(args[1]);
  if (!header) {
    return Malformed("invalid header hex");
  }

  spvproof::chain::HeaderHashIndex store;
  if (!OpenStore(config, store)) {
    return EXIT_MALFORMED;
  }

  ValidationState state;
  if (header->size() != CBlockHeader::HEADER_SIZE) {
    state.Error(spvproof::validation::reject::INVALID_HEADER_LENGTH,
                "header is " + std::to_string(header->size()) + " bytes");
    return Report(false, state);
  }
  json out;
  out["height"] = *height;
  out["hash"] = spvproof::util::HexStr(spvproof::util::ReverseBytes(Hash256(*header)));
  bool ok = spvproof::validation::VerifyBlockHeader(*header, *height, store);
  if (!ok) {
    state.Invalid(spvproof::validation::reject::HEADER_HEIGHT_MISMATCH);
  }
  return Report(ok, state, out);
}

int CmdVerifyMerkleProof(const std::vector<std::string> &args) {
  if (args.size() < 4) {
    return Malformed("usage: verifymerkleproof <leaf> <root> <tx-index> <depth> [hash...]");
  }
  auto leaf = spvproof::util::SafeParseHash(args[0]);
  auto root = spvproof::util::SafeParseHash(args[1]);
  if (!leaf || !root) {
    return Malformed("invalid leaf or root hash");
  }
  spvproof::chain::MerkleProof proof;
  std::string error;
  if (!ParseProof(args, 2, proof, error)) {
    return Malformed(error);
  }

  ValidationState state;
  bool ok = spvproof::validation::VerifyMerkleProof(*leaf, *root, proof, state);
  return Report(ok, state);
}

int CmdWasTxMined(const ToolConfig &config, const std::vector<std::string> &args,
                  bool raw) {
  if (args.size() < 5) {
    return Malformed(std::string("usage: ") +
                     (raw ? "wastxminedraw <height> <tx-hex>" : "wastxmined <height> <txid>") +
                     " <header-hex> <tx-index> <depth> [hash...]");
  }
  auto height = spvproof::util::SafeParseUInt32(args[0]);
  if (!height) {
    return Malformed("invalid height: " + args[0]);
  }
  auto header = spvproof::util::ParseHex(args[2]);
  if (!header) {
    return Malformed("invalid header hex");
  }
  spvproof::chain::MerkleProof proof;
  std::string error;
  if (!ParseProof(args, 3, proof, error)) {
    return Malformed(error);
  }

  spvproof::chain::HeaderHashIndex store;
  if (!OpenStore(config, store)) {
    return EXIT_MALFORMED;
  }

  ValidationState state;
  json out;
  out["height"] = *height;
  bool ok = false;
  if (raw) {
    auto tx = spvproof::util::ParseHex(args[1]);
    if (!tx) {
      return Malformed("invalid transaction hex");
    }
    if (!tx->empty()) {
      out["txid"] = spvproof::util::HexStr(spvproof::validation::GetTxid(*tx));
    }
    ok = spvproof::validation::WasTxMinedRaw(*height, *tx, *header, proof, store, state);
  } else {
    // Display order, exactly as typed
    auto txid = spvproof::util::SafeParseRawHash(args[1]);
    if (!txid) {
      return Malformed("invalid txid: " + args[1]);
    }
    out["txid"] = spvproof::util::HexStr(*txid);
    ok = spvproof::validation::WasTxMined(*height, *txid, *header, proof, store, state);
  }
  return Report(ok, state, out);
}

int CmdBuildProof(const std::vector<std::string> &args) {
  if (args.size() < 2) {
    return Malformed("usage: buildproof <tx-index> <txid>...");
  }
  auto index = spvproof::util::SafeParseUInt32(args[0]);
  if (!index) {
    return Malformed("invalid tx index: " + args[0]);
  }
  std::vector<uint256> leaves;
  leaves.reserve(args.size() - 1);
  for (size_t i = 1; i < args.size(); ++i) {
    auto txid = spvproof::util::SafeParseHash(args[i]);
    if (!txid) {
      return Malformed("invalid txid: " + args[i]);
    }
    leaves.push_back(*txid);
  }

  auto proof = spvproof::chain::BuildMerkleProof(leaves, *index);
  if (!proof) {
    return Malformed("index out of range or tree deeper than " +
                     std::to_string(spvproof::chain::MAX_MERKLE_PROOF_DEPTH));
  }
  bool mutated = false;
  uint256 root = spvproof::chain::ComputeMerkleRoot(leaves, &mutated);

  json out;
  out["merkle_root"] = root.GetHex();
  out["mutated"] = mutated;
  out["txid"] = leaves[*index].GetHex();
  out["tx_index"] = proof->tx_index;
  out["tree_depth"] = proof->tree_depth;
  json hashes = json::array();
  for (const auto &hash : proof->hashes) {
    hashes.push_back(hash.GetHex());
  }
  out["hashes"] = hashes;
  std::cout << out.dump(2) << std::endl;
  return EXIT_VERIFIED;
}

int CmdRecordHeader(const ToolConfig &config, const std::vector<std::string> &args) {
  if (args.size() != 2) {
    return Malformed("usage: recordheader <height> <header-hex>");
  }
  auto height = spvproof::util::SafeParseUInt32(args[0]);
  if (!height) {
    return Malformed("invalid height: " + args[0]);
  }
  auto header = spvproof::util::ParseHex(args[1]);
  if (!header || header->size() != CBlockHeader::HEADER_SIZE) {
    return Malformed("header must be 80 bytes of hex");
  }

  spvproof::chain::HeaderHashIndex store;
  if (!OpenStore(config, store)) {
    return EXIT_MALFORMED;
  }

  uint256 hash = spvproof::util::ReverseBytes(Hash256(*header));
  auto result = store.RecordHeaderHash(*height, hash);

  json out;
  out["height"] = *height;
  out["hash"] = spvproof::util::HexStr(hash);
  switch (result) {
  case spvproof::chain::HeaderHashIndex::RecordResult::ADDED:
    out["result"] = "added";
    break;
  case spvproof::chain::HeaderHashIndex::RecordResult::DUPLICATE:
    out["result"] = "duplicate";
    break;
  case spvproof::chain::HeaderHashIndex::RecordResult::CONFLICT:
    out["result"] = "conflict";
    std::cout << out.dump(2) << std::endl;
    return EXIT_REJECTED;
  }

  // Save creates the chain directory on first use
  const auto path = config.HeadersPath();
  if (!store.Save(path.string())) {
    return Malformed("failed to write " + path.string());
  }
  std::cout << out.dump(2) << std::endl;
  return EXIT_VERIFIED;
}

int CmdGetHeaderHash(const ToolConfig &config, const std::vector<std::string> &args) {
  if (args.size() != 1) {
    return Malformed("usage: getheaderhash <height>");
  }
  auto height = spvproof::util::SafeParseUInt32(args[0]);
  if (!height) {
    return Malformed("invalid height: " + args[0]);
  }

  spvproof::chain::HeaderHashIndex store;
  if (!OpenStore(config, store)) {
    return EXIT_MALFORMED;
  }

  json out;
  out["height"] = *height;
  auto hash = store.GetHeaderHash(*height);
  if (!hash) {
    out["hash"] = nullptr;
    std::cout << out.dump(2) << std::endl;
    return EXIT_REJECTED;
  }
  out["hash"] = spvproof::util::HexStr(*hash);
  std::cout << out.dump(2) << std::endl;
  return EXIT_VERIFIED;
}

} // namespace

int main(int argc, char *argv[]) {
  try {
    // Parse command line arguments
    ToolConfig config;
    std::string command;
    std::vector<std::string> params;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (!command.empty()) {
        params.push_back(arg);
      } else if (arg == "--help") {
        print_usage(argv[0]);
        return EXIT_VERIFIED;
      } else if (arg == "--version") {
        std::cout << spvproof::GetFullVersionString() << std::endl;
        std::cout << spvproof::GetCopyrightString() << std::endl;
        return EXIT_VERIFIED;
      } else if (arg.find("--datadir=") == 0) {
        config.datadir = arg.substr(10);
      } else if (arg.find("--headers=") == 0) {
        config.headers_file = arg.substr(10);
      } else if (arg.find("--chain=") == 0) {
        if (!spvproof::chain::ParseChainType(arg.substr(8), config.chain_type)) {
          std::cerr << "Error: Unknown chain: " << arg.substr(8) << std::endl;
          return EXIT_MALFORMED;
        }
      } else if (arg == "--verbose") {
        config.verbose = true;
        config.log_level = "debug";
      } else if (arg.find("--loglevel=") == 0) {
        config.log_level = arg.substr(11);
      } else if (arg.find("--debug=") == 0) {
        // Parse comma-separated components: --debug=spv,chain
        std::string components = arg.substr(8);
        size_t pos = 0;
        while (pos < components.length()) {
          size_t comma = components.find(',', pos);
          if (comma == std::string::npos) {
            config.debug_components.push_back(components.substr(pos));
            break;
          }
          config.debug_components.push_back(components.substr(pos, comma - pos));
          pos = comma + 1;
        }
      } else if (arg.find("--") == 0) {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return EXIT_MALFORMED;
      } else {
        command = arg;
      }
    }

    if (command.empty()) {
      print_usage(argv[0]);
      return EXIT_MALFORMED;
    }

    // Console logging goes to stderr; stdout carries the JSON result
    spvproof::util::LogManager::Initialize(config.log_level, false);

    for (const auto &component : config.debug_components) {
      if (component == "all") {
        spvproof::util::LogManager::SetLogLevel("trace");
      } else {
        spvproof::util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    spvproof::chain::GlobalChainParams::Select(config.chain_type);
    LOG_DEBUG("{} on {} chain, headers file {}", spvproof::GetFullVersionString(),
              spvproof::chain::GlobalChainParams::Get().GetChainTypeString(),
              config.HeadersPath().string());

    int rc = EXIT_MALFORMED;
    if (command == "verifyheader") {
      rc = CmdVerifyHeader(config, params);
    } else if (command == "verifymerkleproof") {
      rc = CmdVerifyMerkleProof(params);
    } else if (command == "wastxmined") {
      rc = CmdWasTxMined(config, params, false);
    } else if (command == "wastxminedraw") {
      rc = CmdWasTxMined(config, params, true);
    } else if (command == "buildproof") {
      rc = CmdBuildProof(params);
    } else if (command == "recordheader") {
      rc = CmdRecordHeader(config, params);
    } else if (command == "getheaderhash") {
      rc = CmdGetHeaderHash(config, params);
    } else {
      std::cerr << "Unknown command: " << command << std::endl;
      print_usage(argv[0]);
    }

    spvproof::util::LogManager::Shutdown();
    return rc;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    spvproof::util::LogManager::Shutdown();
    return EXIT_MALFORMED;
  }
}
