// Copyright (c) 2025 The pgprobe developers
// Distributed under the MIT software license

#include "network/endpoint.hpp"

#include <charconv>
#include <string_view>

namespace pgprobe {
namespace network {

std::string Endpoint::ToString() const {
  std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
  return "http://" + h + ":" + std::to_string(port) + path;
}

std::optional<Endpoint> ParseEndpoint(const std::string& url) {
  constexpr std::string_view kScheme = "http://";
  if (!url.starts_with(kScheme)) {
    return std::nullopt;
  }

  std::string rest = url.substr(kScheme.size());
  Endpoint ep;

  size_t slash = rest.find('/');
  std::string authority = rest.substr(0, slash);
  if (slash != std::string::npos) {
    ep.path = rest.substr(slash);
  }

  std::string port_str;
  if (authority.starts_with("[")) {
    size_t close = authority.find(']');
    if (close == std::string::npos) {
      return std::nullopt;
    }
    ep.host = authority.substr(1, close - 1);
    std::string tail = authority.substr(close + 1);
    if (!tail.empty()) {
      if (tail[0] != ':') {
        return std::nullopt;
      }
      port_str = tail.substr(1);
    }
  } else {
    size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
      ep.host = authority.substr(0, colon);
      port_str = authority.substr(colon + 1);
    } else {
      ep.host = authority;
    }
  }

  if (ep.host.empty()) {
    return std::nullopt;
  }

  if (!port_str.empty()) {
    unsigned value = 0;
    auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), value);
    if (ec != std::errc() || ptr != port_str.data() + port_str.size() || value == 0 || value > 65535) {
      return std::nullopt;
    }
    ep.port = static_cast<uint16_t>(value);
  }

  return ep;
}

}  // namespace network
}  // namespace pgprobe
