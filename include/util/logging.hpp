// Copyright (c) 2025 The spvproof developers
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace spvproof {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and easy access
 * to loggers throughout the verifier and the command-line tool.
 *
 * Thread-safety: All methods are thread-safe. Initialization is
 * performed exactly once using std::call_once. Logger access is
 * protected by mutex for safe concurrent use.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical, off)
   * @param log_to_file If true, log to a rotating file instead of the console
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Thread-safe: Uses std::call_once internally. Only the first call
   * performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "debug.log");

  /**
   * Shutdown logging system (flushes buffers)
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name ("spv", "chain", "crypto", "app", "default")
   *
   * Auto-initializes if not initialized. Unknown names map to "default".
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  /**
   * Set log level at runtime (all components)
   */
  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for a specific component
   */
  static void SetComponentLevel(const std::string &component, const std::string &level);
};

} // namespace util
} // namespace spvproof

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  spvproof::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  spvproof::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  spvproof::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  spvproof::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  spvproof::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Proof verification
#define LOG_SPV_TRACE(...)                                                     \
  spvproof::util::LogManager::GetLogger("spv")->trace(__VA_ARGS__)
#define LOG_SPV_DEBUG(...)                                                     \
  spvproof::util::LogManager::GetLogger("spv")->debug(__VA_ARGS__)
#define LOG_SPV_INFO(...)                                                      \
  spvproof::util::LogManager::GetLogger("spv")->info(__VA_ARGS__)
#define LOG_SPV_WARN(...)                                                      \
  spvproof::util::LogManager::GetLogger("spv")->warn(__VA_ARGS__)

// Height -> header hash store and network parameters
#define LOG_CHAIN_TRACE(...)                                                   \
  spvproof::util::LogManager::GetLogger("chain")->trace(__VA_ARGS__)
#define LOG_CHAIN_DEBUG(...)                                                   \
  spvproof::util::LogManager::GetLogger("chain")->debug(__VA_ARGS__)
#define LOG_CHAIN_INFO(...)                                                    \
  spvproof::util::LogManager::GetLogger("chain")->info(__VA_ARGS__)
#define LOG_CHAIN_WARN(...)                                                    \
  spvproof::util::LogManager::GetLogger("chain")->warn(__VA_ARGS__)
#define LOG_CHAIN_ERROR(...)                                                   \
  spvproof::util::LogManager::GetLogger("chain")->error(__VA_ARGS__)

// Hashing backend (OpenSSL)
#define LOG_CRYPTO_DEBUG(...)                                                  \
  spvproof::util::LogManager::GetLogger("crypto")->debug(__VA_ARGS__)
#define LOG_CRYPTO_ERROR(...)                                                  \
  spvproof::util::LogManager::GetLogger("crypto")->error(__VA_ARGS__)
