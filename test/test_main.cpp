// Copyright (c) 2025 The spvproof developers
// Distributed under the MIT software license

#include <catch2/catch_session.hpp>
#include <cstdlib>
#include <string>

void InitializeTestLogging(const std::string& level);
void ShutdownTestLogging();

// SPVPROOF_TEST_LOGLEVEL=trace ./spvproof_tests to see verifier logs
int main(int argc, char* argv[]) {
    const char* level = std::getenv("SPVPROOF_TEST_LOGLEVEL");
    InitializeTestLogging(level ? level : "off");

    int result = Catch::Session().run(argc, argv);

    ShutdownTestLogging();
    return result;
}
