// Copyright (c) 2025 The spvproof developers
// Distributed under the MIT software license
// Test logging initialization helpers

#include "util/logging.hpp"
#include <string>

// Initialize logging for tests (console only, no file)
void InitializeTestLogging(const std::string& level) {
    spvproof::util::LogManager::Initialize(level, false, "");

    // If level is "trace", also enable TRACE for all components
    // This ensures LOG_SPV_TRACE, LOG_CHAIN_TRACE, etc. all work
    if (level == "trace") {
        spvproof::util::LogManager::SetComponentLevel("spv", "trace");
        spvproof::util::LogManager::SetComponentLevel("chain", "trace");
        spvproof::util::LogManager::SetComponentLevel("crypto", "trace");
        spvproof::util::LogManager::SetComponentLevel("app", "trace");
    }
}

// Shutdown logging system after tests complete
void ShutdownTestLogging() {
    spvproof::util::LogManager::Shutdown();
}
