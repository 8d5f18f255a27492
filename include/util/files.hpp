// Copyright (c) 2025 The pgprobe developers
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace pgprobe {
namespace util {

// Write a file via temp file + fsync + rename, so readers never observe a
// half-written report. Returns false (and logs) on any failure.
bool atomic_write_file(const std::filesystem::path& path, const std::string& data, int mode = 0644);

// Read a whole text file. Returns nullopt if it cannot be read or exceeds max_size.
std::optional<std::string> read_file_string(const std::filesystem::path& path, size_t max_size = 16 * 1024 * 1024);

// Create directory (and parents). Returns true if it exists afterwards.
bool ensure_directory(const std::filesystem::path& dir);

}  // namespace util
}  // namespace pgprobe
