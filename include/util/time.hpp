// Copyright (c) 2025 The pgprobe developers
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <string>

namespace pgprobe {
namespace util {

// Current unix time in seconds, or the mock time when one is set.
int64_t GetTime();

// Set mock time (0 disables mocking). Used by tests for stable report timestamps.
void SetMockTime(int64_t time);

int64_t GetMockTime();

// Format unix time as "YYYY-MM-DD HH:MM:SS UTC".
std::string FormatTime(int64_t unix_time);

// Restores the previous mock time on scope exit
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_(GetMockTime()) { SetMockTime(time); }
  ~MockTimeScope() { SetMockTime(previous_); }

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;

private:
  int64_t previous_;
};

}  // namespace util
}  // namespace pgprobe
