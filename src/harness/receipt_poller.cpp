// Copyright (c) 2025 The pgprobe developers
// Distributed under the MIT software license

#include "harness/receipt_poller.hpp"

#include "network/rpc_gateway.hpp"
#include "util/logging.hpp"

#include <algorithm>
#include <thread>

namespace pgprobe {
namespace harness {

ReceiptPoller::ReceiptPoller(network::RpcGateway& gateway, const Config& config) : gateway_(gateway), config_(config) {}

ReceiptResult ReceiptPoller::Await(const std::string& node_id, const std::string& tx_id) const {
  using clock = std::chrono::steady_clock;
  const auto deadline = clock::now() + config_.timeout;

  ReceiptResult result;
  std::string last_transport_error;

  while (true) {
    auto response = gateway_.Invoke(node_id, "ptx_getTransactionReceipt", nlohmann::json::array({tx_id}));

    if (response.IsRejected()) {
      result.status = ReceiptResult::Status::Failed;
      result.reason = response.error().reason;
      result.denied = true;
      result.pattern_matched = response.error().pattern_matched;
      return result;
    }

    if (response.IsTransport()) {
      last_transport_error = response.error().reason;
    } else if (response.value().is_object()) {
      const auto& receipt = response.value();
      result.receipt = receipt;
      auto success = receipt.find("success");
      if (success != receipt.end() && success->is_boolean() && success->get<bool>()) {
        result.status = ReceiptResult::Status::Confirmed;
        return result;
      }

      std::string message;
      auto failure = receipt.find("failureMessage");
      if (failure != receipt.end() && failure->is_string()) {
        message = failure->get<std::string>();
      }
      auto classified = gateway_.ClassifyApplicationError(message, std::nullopt);
      result.status = ReceiptResult::Status::Failed;
      result.reason = message.empty() ? "transaction reverted without message" : message;
      result.denied = classified.IsRejected();
      result.pattern_matched = classified.IsRejected() && classified.error().pattern_matched;
      return result;
    } else {
      // null: not yet confirmed
      last_transport_error.clear();
    }

    auto now = clock::now();
    if (now >= deadline) {
      break;
    }
    std::this_thread::sleep_for(std::min<clock::duration>(config_.poll_interval, deadline - now));
  }

  if (!last_transport_error.empty()) {
    result.status = ReceiptResult::Status::TransportError;
    result.reason = "receipt for " + tx_id + " unavailable: " + last_transport_error;
  } else {
    result.status = ReceiptResult::Status::Timeout;
    result.reason = "no receipt for " + tx_id + " after " + std::to_string(config_.timeout.count()) + "ms";
  }
  LOG_HARNESS_DEBUG("{}", result.reason);
  return result;
}

}  // namespace harness
}  // namespace pgprobe
