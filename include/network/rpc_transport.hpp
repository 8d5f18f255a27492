// Copyright (c) 2025 The pgprobe developers
// Distributed under the MIT software license

#pragma once

#include "network/endpoint.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace pgprobe {
namespace network {

// Raw outcome of one HTTP exchange. ok=false means the request never produced
// an HTTP response (refused, timed out, reset, oversized, unparsable framing).
struct TransportResponse {
  bool ok{false};
  int http_status{0};
  std::string body;
  std::string error;
};

// RpcTransport - abstract request/response channel to a node.
// HttpTransport is the production implementation; tests substitute an
// in-memory platform. Implementations must be safe for concurrent use and
// must report failures through the return value, never by throwing.
class RpcTransport {
public:
  virtual ~RpcTransport() = default;

  // POST a JSON body and wait for the full response, bounded by timeout.
  virtual TransportResponse Post(const Endpoint& endpoint, const std::string& body,
                                 std::chrono::milliseconds timeout) = 0;

  // Check that the endpoint accepts connections. Returns an error message, or nullopt if reachable.
  virtual std::optional<std::string> Probe(const Endpoint& endpoint, std::chrono::milliseconds timeout) = 0;
};

using RpcTransportPtr = std::shared_ptr<RpcTransport>;

}  // namespace network
}  // namespace pgprobe
