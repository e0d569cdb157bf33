// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace cartograph {
namespace util {

// Write data to path atomically: temp file in the same directory, fsync,
// rename over the target. Creates the parent directory if needed.
// Returns false (and logs) on any failure; the target is left untouched.
bool atomic_write_file(const std::filesystem::path& path, const std::string& data, int mode = 0644);

// Read a whole file. Returns nullopt if it cannot be opened or exceeds 64 MB.
std::optional<std::string> read_file_string(const std::filesystem::path& path);

// Create directory (and parents). Returns true if it exists afterwards.
bool ensure_directory(const std::filesystem::path& dir);

}  // namespace util
}  // namespace cartograph
