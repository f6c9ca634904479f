// Copyright (c) 2025 The spvproof developers
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace spvproof {
namespace util {

/**
 * Atomic file write for crash-safe persistence of the header-hash store
 *
 * 1. Write to a temporary file (.tmp.<random> suffix)
 * 2. fsync() the file
 * 3. fsync() the directory
 * 4. rename() over the target
 *
 * Either the old or the new file is visible afterwards, never a torn one.
 * Returns true on success, false on failure (temp file removed).
 */
bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data,
                       int mode = 0644);

/**
 * Read entire file into a string
 * Returns std::nullopt if the file is missing, unreadable or larger than
 * 100MB
 */
std::optional<std::string> read_file_string(const std::filesystem::path &path);

/**
 * Create directory if it doesn't exist (recursive)
 * Returns true on success or if already exists
 */
bool ensure_directory(const std::filesystem::path &dir);

/**
 * Default data directory: ~/.spvproof
 */
std::filesystem::path get_default_datadir();

} // namespace util
} // namespace spvproof
