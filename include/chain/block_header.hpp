// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The spvproof developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#pragma once

#include "util/uint.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

// CBlockHeader - Bitcoin block header as relayed on the wire (80 bytes)
//
// Only the Merkle root is needed to verify inclusion proofs; the remaining
// fields are decoded for display and for building test fixtures.
class CBlockHeader
{
public:
    int32_t nVersion{0};
    uint256 hashPrevBlock{};        // internal byte order, as on the wire
    uint256 hashMerkleRoot{};       // internal byte order, as on the wire
    uint32_t nTime{0};              // Unix timestamp
    uint32_t nBits{0};              // Difficulty target (compact format)
    uint32_t nNonce{0};

    static constexpr size_t UINT256_BYTES = 32;

    // Serialized header size: 4 + 32 + 32 + 4 + 4 + 4 = 80 bytes
    static constexpr size_t HEADER_SIZE =
        4 +                          // nVersion (int32_t)
        UINT256_BYTES +              // hashPrevBlock
        UINT256_BYTES +              // hashMerkleRoot
        4 +                          // nTime (uint32_t)
        4 +                          // nBits (uint32_t)
        4;                           // nNonce (uint32_t)

    // Field offsets within the 80-byte header
    static constexpr size_t OFF_VERSION = 0;
    static constexpr size_t OFF_PREV    = OFF_VERSION + 4;
    static constexpr size_t OFF_MERKLE  = OFF_PREV + UINT256_BYTES;   // 36
    static constexpr size_t OFF_TIME    = OFF_MERKLE + UINT256_BYTES; // 68
    static constexpr size_t OFF_BITS    = OFF_TIME + 4;
    static constexpr size_t OFF_NONCE   = OFF_BITS + 4;

    static_assert(sizeof(uint256) == UINT256_BYTES, "uint256 must be 32 bytes");
    static_assert(HEADER_SIZE == 80, "Bitcoin header size must be 80 bytes");
    static_assert(OFF_MERKLE == 36 && OFF_TIME == 68, "Merkle root occupies [36, 68)");
    static_assert(OFF_NONCE + 4 == HEADER_SIZE, "offset math must be correct");

    using HeaderBytes = std::array<uint8_t, HEADER_SIZE>;

    void SetNull() noexcept
    {
        nVersion = 0;
        hashPrevBlock.SetNull();
        hashMerkleRoot.SetNull();
        nTime = 0;
        nBits = 0;
        nNonce = 0;
    }

    [[nodiscard]] bool IsNull() const noexcept
    {
        return nBits == 0;
    }

    // hash256 of the serialized header, internal byte order.
    // GetHash().GetHex() prints the familiar "0000..." block hash.
    [[nodiscard]] uint256 GetHash() const;

    // Serialize to wire format (fixed-size, no heap allocation)
    [[nodiscard]] HeaderBytes SerializeFixed() const noexcept;

    [[nodiscard]] std::vector<uint8_t> Serialize() const;

    // Deserialize from wire format. Rejects anything but exactly 80 bytes.
    [[nodiscard]] bool Deserialize(std::span<const uint8_t> bytes) noexcept;

    [[nodiscard]] int64_t GetBlockTime() const noexcept
    {
        return static_cast<int64_t>(nTime);
    }

    [[nodiscard]] std::string ToString() const;
};

// Read the Merkle root field (bytes [36, 68)) straight out of a raw header,
// without decoding the other fields. Internal byte order.
// Returns std::nullopt if the buffer is not exactly HEADER_SIZE bytes.
[[nodiscard]] std::optional<uint256> ExtractMerkleRoot(std::span<const uint8_t> header) noexcept;
