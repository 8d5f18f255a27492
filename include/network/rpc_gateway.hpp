// Copyright (c) 2025 The pgprobe developers
// Distributed under the MIT software license

#pragma once

#include "network/node_topology.hpp"
#include "network/rpc_transport.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace pgprobe {
namespace network {

// Why a gateway call did not produce a value.
//
// Transport: the exchange itself failed (refused, timeout, malformed body) or
//            the node answered with an error the harness cannot attribute to
//            authorization (unclassified).
// Rejected:  the node understood the request and refused it, either through a
//            configured structured error code or a denial phrase match.
struct GatewayError {
  enum class Kind { Transport, Rejected };

  Kind kind{Kind::Transport};
  std::string reason;
  std::optional<int64_t> code;
  bool pattern_matched{false};  // Rejected via the phrase table, not a structured code
  bool unclassified{false};     // Transport: application error with no known denial shape
};

class GatewayResult {
public:
  static GatewayResult Ok(nlohmann::json value);
  static GatewayResult Transport(std::string reason);
  static GatewayResult Unclassified(std::string reason, std::optional<int64_t> code);
  static GatewayResult Rejected(std::string reason, std::optional<int64_t> code, bool pattern_matched);

  bool IsOk() const { return !error_.has_value(); }
  bool IsTransport() const { return error_ && error_->kind == GatewayError::Kind::Transport; }
  bool IsRejected() const { return error_ && error_->kind == GatewayError::Kind::Rejected; }

  // Only a genuine transport fault is worth retrying
  bool IsRetryable() const { return IsTransport() && !error_->unclassified; }

  const nlohmann::json& value() const { return value_; }
  const GatewayError& error() const { return *error_; }

  int attempts() const { return attempts_; }
  void set_attempts(int attempts) { attempts_ = attempts; }

private:
  nlohmann::json value_;
  std::optional<GatewayError> error_;
  int attempts_{1};
};

// Compatibility shim until the platform reports membership failures with a
// structured error code: case-insensitive substrings that mark a free-text
// error message as an authorization denial.
const std::vector<std::string>& DenialPhrases();

// Returns the matched phrase, or nullopt.
std::optional<std::string> MatchDenialPhrase(const std::string& message);

// RpcGateway - uniform JSON-RPC 2.0 request/response to a node.
//
// Keeps "the network failed" apart from "access was denied": every outcome is
// a GatewayResult, remote failures never surface as exceptions. Genuine
// transport faults are retried (bounded, exponential backoff); rejections and
// unclassified application errors are returned as-is, since a retry could
// turn an intermittent authorization outcome into a different answer.
class RpcGateway {
public:
  struct Config {
    int transport_retries;
    std::chrono::milliseconds retry_backoff;
    std::set<int64_t> denial_codes;  // structured denial codes, if the platform has any

    Config() : transport_retries(1), retry_backoff(500) {}
  };

  explicit RpcGateway(const NodeTopology& topology, const Config& config = Config{});

  GatewayResult Invoke(const std::string& node_id, const std::string& method, const nlohmann::json& params);

  // Classify one raw HTTP exchange for a request with the given id.
  GatewayResult Classify(const TransportResponse& response, uint64_t request_id) const;

  // Classify an application error (JSON-RPC error object or failed receipt message).
  GatewayResult ClassifyApplicationError(const std::string& message, std::optional<int64_t> code) const;

private:
  const NodeTopology& topology_;
  Config config_;
  std::atomic<uint64_t> next_id_{1};
};

}  // namespace network
}  // namespace pgprobe
