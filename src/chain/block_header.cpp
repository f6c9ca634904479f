// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The spvproof developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chain/block_header.hpp"
#include "chain/endian.hpp"
#include "util/hash.hpp"
#include <algorithm>
#include <sstream>

uint256 CBlockHeader::GetHash() const {
  const auto s = SerializeFixed();
  return Hash256(s);
}

CBlockHeader::HeaderBytes CBlockHeader::SerializeFixed() const noexcept {
  HeaderBytes data{};

  endian::WriteLE32(data.data() + OFF_VERSION, static_cast<uint32_t>(nVersion));
  std::copy(hashPrevBlock.begin(), hashPrevBlock.end(), data.begin() + OFF_PREV);
  std::copy(hashMerkleRoot.begin(), hashMerkleRoot.end(), data.begin() + OFF_MERKLE);
  endian::WriteLE32(data.data() + OFF_TIME, nTime);
  endian::WriteLE32(data.data() + OFF_BITS, nBits);
  endian::WriteLE32(data.data() + OFF_NONCE, nNonce);

  return data;
}

std::vector<uint8_t> CBlockHeader::Serialize() const {
  auto arr = SerializeFixed();
  return std::vector<uint8_t>(arr.begin(), arr.end());
}

bool CBlockHeader::Deserialize(std::span<const uint8_t> bytes) noexcept {
  if (bytes.size() != HEADER_SIZE) {
    return false;
  }
  const uint8_t *data = bytes.data();

  nVersion = static_cast<int32_t>(endian::ReadLE32(data + OFF_VERSION));
  std::copy(data + OFF_PREV, data + OFF_PREV + UINT256_BYTES,
            hashPrevBlock.begin());
  std::copy(data + OFF_MERKLE, data + OFF_MERKLE + UINT256_BYTES,
            hashMerkleRoot.begin());
  nTime = endian::ReadLE32(data + OFF_TIME);
  nBits = endian::ReadLE32(data + OFF_BITS);
  nNonce = endian::ReadLE32(data + OFF_NONCE);

  return true;
}

std::string CBlockHeader::ToString() const {
  std::stringstream s;
  s << "CBlockHeader(\n";
  s << "  version=" << nVersion << "\n";
  s << "  hashPrevBlock=" << hashPrevBlock.GetHex() << "\n";
  s << "  hashMerkleRoot=" << hashMerkleRoot.GetHex() << "\n";
  s << "  nTime=" << nTime << "\n";
  s << "  nBits=0x" << std::hex << nBits << std::dec << "\n";
  s << "  nNonce=" << nNonce << "\n";
  s << "  hash=" << GetHash().GetHex() << "\n";
  s << ")\n";
  return s.str();
}

std::optional<uint256> ExtractMerkleRoot(std::span<const uint8_t> header) noexcept {
  if (header.size() != CBlockHeader::HEADER_SIZE) {
    return std::nullopt;
  }
  return uint256(header.subspan(CBlockHeader::OFF_MERKLE, CBlockHeader::UINT256_BYTES));
}
