// Copyright (c) 2025 The pgprobe developers
// Distributed under the MIT software license

#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pgprobe {
namespace harness {

/**
 * SentinelTable - one group-unique value per group, fixed for the run.
 *
 * Values derive from a per-run salt: sentinels sit at even offsets, the
 * throwaway values used by write probes at odd offsets, so a probe write can
 * never be mistaken for any group's sentinel. OwnerOf() maps a value read
 * back from a probe contract to the group whose sentinel it is, which is how
 * cross-group leakage is detected.
 *
 * The value table is immutable after construction. Each committed flag is
 * set once by its group's own worker and only read afterwards.
 */
class SentinelTable {
public:
  SentinelTable(const std::vector<std::string>& group_names, uint64_t salt);

  static uint64_t RandomSalt();

  // Throws std::out_of_range for an unknown group.
  uint64_t Sentinel(const std::string& group) const;

  // n-th throwaway value for group (odd, never a sentinel).
  uint64_t Throwaway(const std::string& group, uint32_t n) const;

  // Group whose sentinel equals value (decimal string), if any.
  std::optional<std::string> OwnerOf(const std::string& value) const;

  void MarkCommitted(const std::string& group);
  bool IsCommitted(const std::string& group) const;

  uint64_t salt() const { return base_; }

private:
  static constexpr uint64_t THROWAWAY_STRIDE = 1u << 16;

  uint64_t base_;
  std::map<std::string, size_t> index_;
  std::map<std::string, std::string> owners_;  // decimal sentinel -> group
  std::vector<std::atomic<bool>> committed_;
};

}  // namespace harness
}  // namespace pgprobe
