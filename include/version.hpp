// Copyright (c) 2025 The pgprobe developers
// Distributed under the MIT software license

#pragma once

#include <string>

#define PGPROBE_VERSION_MAJOR 1
#define PGPROBE_VERSION_MINOR 0
#define PGPROBE_VERSION_PATCH 0

namespace pgprobe {

inline std::string GetVersionString() {
  return std::to_string(PGPROBE_VERSION_MAJOR) + "." + std::to_string(PGPROBE_VERSION_MINOR) + "." +
         std::to_string(PGPROBE_VERSION_PATCH);
}

inline std::string GetFullVersionString() { return "pgprobe version v" + GetVersionString(); }

inline std::string GetCopyrightString() { return "Copyright (c) 2025 The pgprobe developers"; }

inline std::string GetStartupBanner() {
  return "pgprobe v" + GetVersionString() + " - privacy group authorization verification\n";
}

}  // namespace pgprobe
