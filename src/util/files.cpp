// Copyright (c) 2025 The pgprobe developers
// Distributed under the MIT software license

#include "util/files.hpp"

#include "util/logging.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <random>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>

namespace pgprobe {
namespace util {

namespace {

bool sync_directory(const std::filesystem::path& dir) {
  int fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (fd < 0)
    return false;
  bool result = fsync(fd) == 0;
  close(fd);
  return result;
}

std::string random_suffix() {
  static thread_local std::mt19937_64 gen(std::random_device{}());
  std::ostringstream oss;
  oss << std::hex << gen();
  return oss.str();
}

}  // anonymous namespace

bool atomic_write_file(const std::filesystem::path& path, const std::string& data, int mode) {
  auto parent = path.parent_path();
  if (!parent.empty() && !ensure_directory(parent)) {
    LOG_ERROR("atomic_write_file: cannot create parent directory {}", parent.string());
    return false;
  }

  auto temp_path = path;
  temp_path += ".tmp." + random_suffix();

  // O_EXCL | O_NOFOLLOW: never reuse or follow a pre-planted temp path
  int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW, mode);
  if (fd < 0) {
    LOG_ERROR("atomic_write_file: cannot create temp file {}: {}", temp_path.string(), std::strerror(errno));
    return false;
  }

  size_t total = 0;
  while (total < data.size()) {
    ssize_t n = write(fd, data.data() + total, data.size() - total);
    if (n <= 0) {
      LOG_ERROR("atomic_write_file: write to {} failed after {}/{} bytes: {}", temp_path.string(), total, data.size(),
                std::strerror(errno));
      close(fd);
      std::filesystem::remove(temp_path);
      return false;
    }
    total += static_cast<size_t>(n);
  }

  if (fsync(fd) != 0) {
    LOG_ERROR("atomic_write_file: fsync of {} failed: {}", temp_path.string(), std::strerror(errno));
    close(fd);
    std::filesystem::remove(temp_path);
    return false;
  }
  close(fd);

  std::error_code ec;
  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    LOG_ERROR("atomic_write_file: rename {} -> {} failed: {}", temp_path.string(), path.string(), ec.message());
    std::filesystem::remove(temp_path);
    return false;
  }

  if (!parent.empty() && !sync_directory(parent)) {
    LOG_WARN("atomic_write_file: fsync of directory {} failed: {}", parent.string(), std::strerror(errno));
  }

  return true;
}

std::optional<std::string> read_file_string(const std::filesystem::path& path, size_t max_size) {
  std::error_code ec;
  auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    LOG_ERROR("read_file_string: cannot stat {}: {}", path.string(), ec.message());
    return std::nullopt;
  }
  if (size > max_size) {
    LOG_ERROR("read_file_string: {} is {} bytes (limit {})", path.string(), size, max_size);
    return std::nullopt;
  }

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    LOG_ERROR("read_file_string: cannot open {}: {}", path.string(), std::strerror(errno));
    return std::nullopt;
  }

  std::string data(size, '\0');
  file.read(data.data(), static_cast<std::streamsize>(size));
  if (!file) {
    LOG_ERROR("read_file_string: short read from {}", path.string());
    return std::nullopt;
  }
  return data;
}

bool ensure_directory(const std::filesystem::path& dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  return !ec || std::filesystem::exists(dir);
}

}  // namespace util
}  // namespace pgprobe
