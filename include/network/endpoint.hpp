// Copyright (c) 2025 The pgprobe developers
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace pgprobe {
namespace network {

// HTTP endpoint of an execution node's JSON-RPC interface
struct Endpoint {
  std::string host;
  uint16_t port{80};
  std::string path{"/"};

  std::string ToString() const;
};

// Parse "http://host[:port][/path]". Returns nullopt for other schemes,
// empty hosts and out-of-range ports. IPv6 hosts use brackets ("http://[::1]:8545").
std::optional<Endpoint> ParseEndpoint(const std::string& url);

}  // namespace network
}  // namespace pgprobe
