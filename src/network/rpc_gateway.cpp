// Copyright (c) 2025 The pgprobe developers
// Distributed under the MIT software license

#include "network/rpc_gateway.hpp"

#include "util/logging.hpp"

#include <algorithm>
#include <cctype>
#include <thread>

namespace pgprobe {
namespace network {

GatewayResult GatewayResult::Ok(nlohmann::json value) {
  GatewayResult r;
  r.value_ = std::move(value);
  return r;
}

GatewayResult GatewayResult::Transport(std::string reason) {
  GatewayResult r;
  GatewayError e;
  e.kind = GatewayError::Kind::Transport;
  e.reason = std::move(reason);
  r.error_ = std::move(e);
  return r;
}

GatewayResult GatewayResult::Unclassified(std::string reason, std::optional<int64_t> code) {
  GatewayResult r;
  GatewayError e;
  e.kind = GatewayError::Kind::Transport;
  e.reason = std::move(reason);
  e.code = code;
  e.unclassified = true;
  r.error_ = std::move(e);
  return r;
}

GatewayResult GatewayResult::Rejected(std::string reason, std::optional<int64_t> code, bool pattern_matched) {
  GatewayResult r;
  GatewayError e;
  e.kind = GatewayError::Kind::Rejected;
  e.reason = std::move(reason);
  e.code = code;
  e.pattern_matched = pattern_matched;
  r.error_ = std::move(e);
  return r;
}

const std::vector<std::string>& DenialPhrases() {
  static const std::vector<std::string> phrases = {
      "not a member",      "not authorized", "unauthorized", "access denied",
      "access_denied",     "permission denied", "forbidden",  "privacy group not found",
  };
  return phrases;
}

std::optional<std::string> MatchDenialPhrase(const std::string& message) {
  std::string lower = message;
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
  for (const auto& phrase : DenialPhrases()) {
    if (lower.find(phrase) != std::string::npos) {
      return phrase;
    }
  }
  return std::nullopt;
}

RpcGateway::RpcGateway(const NodeTopology& topology, const Config& config) : topology_(topology), config_(config) {}

GatewayResult RpcGateway::Invoke(const std::string& node_id, const std::string& method,
                                 const nlohmann::json& params) {
  auto handle = topology_.Connection(node_id);
  if (!handle) {
    return GatewayResult::Transport("no connection to node " + node_id);
  }

  const int max_attempts = 1 + std::max(0, config_.transport_retries);
  auto backoff = config_.retry_backoff;
  GatewayResult result = GatewayResult::Transport("not attempted");

  for (int attempt = 1; attempt <= max_attempts; ++attempt) {
    uint64_t id = next_id_.fetch_add(1, std::memory_order_relaxed);
    nlohmann::json request = {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};

    LOG_RPC_TRACE("-> {} {} {}", node_id, method, request.dump());
    result = Classify(handle->Post(request.dump()), id);
    result.set_attempts(attempt);

    if (!result.IsRetryable()) {
      break;
    }
    if (attempt < max_attempts) {
      LOG_RPC_DEBUG("{} on {} failed ({}), retrying in {}ms", method, node_id, result.error().reason,
                    backoff.count());
      std::this_thread::sleep_for(backoff);
      backoff *= 2;
    }
  }

  if (result.IsTransport()) {
    LOG_RPC_DEBUG("{} on {} gave up after {} attempt(s): {}", method, node_id, result.attempts(),
                  result.error().reason);
  } else if (result.IsRejected()) {
    LOG_RPC_DEBUG("{} on {} rejected: {}", method, node_id, result.error().reason);
  }
  return result;
}

GatewayResult RpcGateway::Classify(const TransportResponse& response, uint64_t request_id) const {
  if (!response.ok) {
    return GatewayResult::Transport(response.error);
  }

  nlohmann::json body = nlohmann::json::parse(response.body, nullptr, false);
  if (body.is_discarded() || !body.is_object()) {
    if (response.http_status < 200 || response.http_status >= 300) {
      return GatewayResult::Transport("HTTP " + std::to_string(response.http_status));
    }
    return GatewayResult::Transport("malformed JSON-RPC response");
  }

  if (body.contains("id") && !body["id"].is_null()) {
    const auto& id = body["id"];
    if (!id.is_number_unsigned() || id.get<uint64_t>() != request_id) {
      return GatewayResult::Transport("JSON-RPC response id mismatch");
    }
  }

  if (body.contains("error") && !body["error"].is_null()) {
    const auto& err = body["error"];
    std::optional<int64_t> code;
    std::string message;
    if (err.is_object()) {
      if (err.contains("code") && err["code"].is_number_integer()) {
        code = err["code"].get<int64_t>();
      }
      if (err.contains("message") && err["message"].is_string()) {
        message = err["message"].get<std::string>();
      }
    } else if (err.is_string()) {
      message = err.get<std::string>();
    } else {
      message = err.dump();
    }
    return ClassifyApplicationError(message, code);
  }

  if (!body.contains("result")) {
    return GatewayResult::Transport("JSON-RPC response has neither result nor error");
  }
  return GatewayResult::Ok(body["result"]);
}

GatewayResult RpcGateway::ClassifyApplicationError(const std::string& message, std::optional<int64_t> code) const {
  if (code && config_.denial_codes.count(*code)) {
    return GatewayResult::Rejected(message, code, false);
  }
  if (auto phrase = MatchDenialPhrase(message)) {
    return GatewayResult::Rejected(message, code, true);
  }
  return GatewayResult::Unclassified(message.empty() ? "application error without message" : message, code);
}

}  // namespace network
}  // namespace pgprobe
