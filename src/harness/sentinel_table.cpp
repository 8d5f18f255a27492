// Copyright (c) 2025 The pgprobe developers
// Distributed under the MIT software license

#include "harness/sentinel_table.hpp"

#include <random>
#include <stdexcept>

namespace pgprobe {
namespace harness {

SentinelTable::SentinelTable(const std::vector<std::string>& group_names, uint64_t salt)
    // Keep well below 2^63 so base + offsets never wraps; force even
    : base_((salt & 0x0000FFFFFFFFFFFFULL) & ~uint64_t{1}), committed_(group_names.size()) {
  for (size_t i = 0; i < group_names.size(); ++i) {
    if (!index_.emplace(group_names[i], i).second) {
      throw std::invalid_argument("duplicate group in sentinel table: " + group_names[i]);
    }
    owners_.emplace(std::to_string(base_ + 2 * THROWAWAY_STRIDE * i), group_names[i]);
  }
}

uint64_t SentinelTable::RandomSalt() {
  std::random_device rd;
  std::mt19937_64 gen(rd());
  return gen();
}

uint64_t SentinelTable::Sentinel(const std::string& group) const {
  return base_ + 2 * THROWAWAY_STRIDE * index_.at(group);
}

uint64_t SentinelTable::Throwaway(const std::string& group, uint32_t n) const {
  return Sentinel(group) + 2 * (n % (THROWAWAY_STRIDE - 1)) + 1;
}

std::optional<std::string> SentinelTable::OwnerOf(const std::string& value) const {
  auto it = owners_.find(value);
  if (it == owners_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void SentinelTable::MarkCommitted(const std::string& group) {
  committed_[index_.at(group)].store(true, std::memory_order_release);
}

bool SentinelTable::IsCommitted(const std::string& group) const {
  return committed_[index_.at(group)].load(std::memory_order_acquire);
}

}  // namespace harness
}  // namespace pgprobe
