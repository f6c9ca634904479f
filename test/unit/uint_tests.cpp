// Copyright (c) 2025 The spvproof developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "util/uint.hpp"
#include <algorithm>
#include <array>

TEST_CASE("uint256 basic operations", "[uint]")
{
    SECTION("Default constructor creates zero")
    {
        uint256 zero;
        REQUIRE(zero.IsNull());
        REQUIRE(zero == uint256::ZERO);
    }

    SECTION("Constructor with value")
    {
        uint256 one(1);
        REQUIRE_FALSE(one.IsNull());
        REQUIRE(one == uint256::ONE);
        REQUIRE(*one.begin() == 0x01);
    }

    SECTION("SetNull works correctly")
    {
        uint256 test(1);
        REQUIRE_FALSE(test.IsNull());
        test.SetNull();
        REQUIRE(test.IsNull());
    }

    SECTION("Comparison operators")
    {
        uint256 zero;
        uint256 one(1);
        uint256 another_zero;

        REQUIRE(zero == another_zero);
        REQUIRE(zero != one);
        REQUIRE(zero < one);
    }

    SECTION("Construct from 32-byte span")
    {
        std::array<unsigned char, 32> bytes{};
        for (size_t i = 0; i < bytes.size(); ++i) {
            bytes[i] = static_cast<unsigned char>(i);
        }
        uint256 test(bytes);
        REQUIRE(std::equal(test.begin(), test.end(), bytes.begin()));
        REQUIRE(test.data()[31] == 31);
    }
}

TEST_CASE("uint256 hex representation", "[uint]")
{
    SECTION("Hex conversion - basic")
    {
        uint256 test;
        test.SetHex("0000000000000000000000000000000000000000000000000000000000000001");

        REQUIRE(test.GetHex() == "0000000000000000000000000000000000000000000000000000000000000001");
        // Most significant digit pair lands in the last byte
        REQUIRE(*test.begin() == 0x01);
    }

    SECTION("Hex conversion - with 0x prefix")
    {
        uint256 test;
        test.SetHex("0x00000000000000000000000000000000000000000000000000000000000000ff");

        REQUIRE(test.GetHex() == "00000000000000000000000000000000000000000000000000000000000000ff");
    }

    SECTION("Hex conversion - block hash")
    {
        const char* hash = "000000000019d6689c085ae165831e934ff763ae46a2a6c172b3f1b60a8ce26f";
        uint256 test;
        test.SetHex(hash);

        REQUIRE(test.GetHex() == hash);
        // Stored little-endian: leading zeros of the display string are at the end
        REQUIRE(test.data()[0] == 0x6f);
        REQUIRE(test.data()[31] == 0x00);
    }

    SECTION("Short string fills low bytes")
    {
        uint256 test;
        test.SetHex("abcd");
        REQUIRE(test.data()[0] == 0xcd);
        REQUIRE(test.data()[1] == 0xab);
        REQUIRE(test.GetHex() == "000000000000000000000000000000000000000000000000000000000000abcd");
    }

    SECTION("ToString returns GetHex")
    {
        uint256 test;
        test.SetHex("0123456789abcdef0123456789abcdef0123456789abcdef0123456789abcdef");

        REQUIRE(test.ToString() == test.GetHex());
    }
}

TEST_CASE("uint128 operations", "[uint]")
{
    SECTION("Default constructor creates zero")
    {
        uint128 zero;
        REQUIRE(zero.IsNull());
    }

    SECTION("Hex conversion works")
    {
        uint128 test;
        test.SetHex("0102030405060708090a0b0c0d0e0f10");

        REQUIRE(test.GetHex() == "0102030405060708090a0b0c0d0e0f10");
    }

    SECTION("Size is correct")
    {
        REQUIRE(uint128::size() == 16);
        REQUIRE(uint256::size() == 32);
    }
}

TEST_CASE("uint256S helper function", "[uint]")
{
    SECTION("Creates uint256 from string")
    {
        uint256 test = uint256S("deadbeef00000000000000000000000000000000000000000000000000000000");
        REQUIRE(test.GetHex() == "deadbeef00000000000000000000000000000000000000000000000000000000");
    }

    SECTION("Handles const char*")
    {
        const char* hex_str = "1234567890abcdef1234567890abcdef1234567890abcdef1234567890abcdef";
        uint256 test = uint256S(hex_str);
        REQUIRE(test.GetHex() == hex_str);
    }

    SECTION("Handles std::string")
    {
        std::string hex_str = "00000000839a8e6886ab5951d76f411475428afc90947ee320161bbf18eb6048";
        REQUIRE(uint256S(hex_str).GetHex() == hex_str);
    }
}
