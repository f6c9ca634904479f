// Copyright (c) 2025 The spvproof developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "util/hash.hpp"
#include "util/string_parsing.hpp"
#include "test_vectors.hpp"
#include <string>
#include <vector>

using namespace spvproof::util;
using namespace spvproof::test;

namespace {

std::string Sha256Hex(const std::string& input)
{
    unsigned char out[CSHA256::OUTPUT_SIZE];
    CSHA256().Write(reinterpret_cast<const unsigned char*>(input.data()), input.size()).Finalize(out);
    return HexStr(out);
}

} // namespace

TEST_CASE("CSHA256 known answers", "[hash]")
{
    SECTION("Empty input")
    {
        REQUIRE(Sha256Hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    }

    SECTION("abc")
    {
        REQUIRE(Sha256Hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    }

    SECTION("Two-block message")
    {
        REQUIRE(Sha256Hex("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq") ==
                "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
    }

    SECTION("Incremental writes match a single write")
    {
        const std::string msg = "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq";
        unsigned char out[CSHA256::OUTPUT_SIZE];
        CSHA256 sha;
        sha.Write(reinterpret_cast<const unsigned char*>(msg.data()), 10)
            .Write(reinterpret_cast<const unsigned char*>(msg.data()) + 10, msg.size() - 10)
            .Finalize(out);
        REQUIRE(HexStr(out) == Sha256Hex(msg));
    }

    SECTION("Reset starts a fresh digest")
    {
        unsigned char out[CSHA256::OUTPUT_SIZE];
        CSHA256 sha;
        sha.Write(reinterpret_cast<const unsigned char*>("junk"), 4);
        sha.Reset().Write(reinterpret_cast<const unsigned char*>("abc"), 3).Finalize(out);
        REQUIRE(HexStr(out) == Sha256Hex("abc"));
    }
}

TEST_CASE("Hash256 is double SHA-256", "[hash]")
{
    SECTION("Empty input")
    {
        REQUIRE(HexStr(Hash256(std::vector<uint8_t>{})) ==
                "5df6e0e2761359d30a8275058e299fcc0381534545f55cf43e41983f5d4c9456");
    }

    SECTION("Equals SHA-256 of the SHA-256 digest")
    {
        const std::string msg = "abc";
        unsigned char first[CSHA256::OUTPUT_SIZE];
        unsigned char second[CSHA256::OUTPUT_SIZE];
        CSHA256().Write(reinterpret_cast<const unsigned char*>(msg.data()), msg.size()).Finalize(first);
        CSHA256().Write(first, sizeof(first)).Finalize(second);

        std::vector<uint8_t> input(msg.begin(), msg.end());
        REQUIRE(HexStr(Hash256(input)) == HexStr(second));
    }

    SECTION("Genesis header hashes to the genesis block hash")
    {
        auto header = FromHex(MAIN_GENESIS_HEADER);
        REQUIRE(Hash256(header).GetHex() == MAIN_GENESIS_HASH);
    }

    SECTION("CHash256 accepts the input in pieces")
    {
        auto header = FromHex(MAIN_BLOCK1_HEADER);
        uint256 result;
        CHash256()
            .Write(std::span<const unsigned char>(header.data(), 36))
            .Write(std::span<const unsigned char>(header.data() + 36, header.size() - 36))
            .Finalize(result);
        REQUIRE(result.GetHex() == MAIN_BLOCK1_HASH);
    }
}

TEST_CASE("Hash256 of two nodes", "[hash]")
{
    auto leaves = Block100kLeaves();

    SECTION("Equals hashing the 64-byte concatenation")
    {
        std::vector<uint8_t> concat(leaves[0].begin(), leaves[0].end());
        concat.insert(concat.end(), leaves[1].begin(), leaves[1].end());
        REQUIRE(Hash256(leaves[0], leaves[1]) == Hash256(concat));
    }

    SECTION("Reproduces the level-1 nodes of block 100000")
    {
        REQUIRE(HexStr(Hash256(leaves[0], leaves[1])) == BLOCK100K_NODE_01);
        REQUIRE(HexStr(Hash256(leaves[2], leaves[3])) == BLOCK100K_NODE_23);
    }

    SECTION("Order matters")
    {
        REQUIRE(Hash256(leaves[0], leaves[1]) != Hash256(leaves[1], leaves[0]));
    }
}
