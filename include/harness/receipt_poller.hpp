// Copyright (c) 2025 The pgprobe developers
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

namespace pgprobe {

namespace network {
class RpcGateway;
}

namespace harness {

static constexpr std::chrono::milliseconds DEFAULT_COMMIT_TIMEOUT{std::chrono::seconds(30)};
static constexpr std::chrono::milliseconds DEFAULT_COMMIT_POLL_INTERVAL{std::chrono::seconds(1)};

struct ReceiptResult {
  enum class Status {
    Confirmed,       // receipt present, success=true
    Failed,          // receipt present, success=false (or receipt query rejected)
    Timeout,         // no receipt before the deadline
    TransportError,  // deadline hit while the node was not answering
  };

  Status status{Status::Timeout};
  nlohmann::json receipt;
  std::string reason;
  bool denied{false};           // Failed with a recognised authorization denial
  bool pattern_matched{false};  // ... recognised through the phrase table

  bool IsConfirmed() const { return status == Status::Confirmed; }
};

/**
 * ReceiptPoller - the commit barrier.
 *
 * Polls ptx_getTransactionReceipt on the submitting node until a receipt
 * appears or the bounded wait elapses. Used for the probe deployment and for
 * every store() call, so nothing downstream observes an unconfirmed write.
 * Failure messages are classified with the gateway's denial rules.
 */
class ReceiptPoller {
public:
  struct Config {
    std::chrono::milliseconds timeout;
    std::chrono::milliseconds poll_interval;

    Config() : timeout(DEFAULT_COMMIT_TIMEOUT), poll_interval(DEFAULT_COMMIT_POLL_INTERVAL) {}
  };

  explicit ReceiptPoller(network::RpcGateway& gateway, const Config& config = Config{});

  ReceiptResult Await(const std::string& node_id, const std::string& tx_id) const;

  const Config& config() const { return config_; }

private:
  network::RpcGateway& gateway_;
  Config config_;
};

}  // namespace harness
}  // namespace pgprobe
