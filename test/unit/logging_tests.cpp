// Copyright (c) 2025 The spvproof developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "util/logging.hpp"

using spvproof::util::LogManager;

TEST_CASE("LogManager component loggers", "[logging]") {
    SECTION("Known components have their own logger") {
        for (const char* name : {"spv", "chain", "crypto", "app"}) {
            auto logger = LogManager::GetLogger(name);
            REQUIRE(logger != nullptr);
            REQUIRE(logger->name() == name);
        }
    }

    SECTION("Unknown components fall back to default") {
        auto logger = LogManager::GetLogger("no-such-component");
        REQUIRE(logger != nullptr);
        REQUIRE(logger->name() == "default");
    }

    SECTION("Component level can be changed independently") {
        auto spv = LogManager::GetLogger("spv");
        auto chain = LogManager::GetLogger("chain");
        const auto spv_before = spv->level();
        const auto chain_before = chain->level();

        LogManager::SetComponentLevel("spv", "trace");
        REQUIRE(spv->level() == spdlog::level::trace);
        REQUIRE(chain->level() == chain_before);

        // Restore so other tests stay quiet
        spv->set_level(spv_before);
    }

    SECTION("Macros are safe to call at any level") {
        LOG_SPV_TRACE("trace {}", 1);
        LOG_CHAIN_DEBUG("debug {}", 2);
        LOG_CRYPTO_DEBUG("crypto {}", 3);
        LOG_INFO("info {}", 4);
        SUCCEED();
    }
}
