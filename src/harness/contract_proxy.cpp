// Copyright (c) 2025 The pgprobe developers
// Distributed under the MIT software license

#include "harness/contract_proxy.hpp"

#include "harness/probe_contract.hpp"
#include "harness/receipt_poller.hpp"
#include "network/rpc_gateway.hpp"
#include "util/logging.hpp"

namespace pgprobe {
namespace harness {

namespace {

ActualOutcome FromGatewayError(const network::GatewayResult& result) {
  if (result.IsRejected()) {
    return ActualOutcome::Denied(result.error().reason, result.error().pattern_matched);
  }
  return ActualOutcome::TransportError(result.error().reason);
}

}  // namespace

ContractProxy::ContractProxy(network::RpcGateway& gateway, const ReceiptPoller& receipts, const Config& config)
    : gateway_(gateway), receipts_(receipts), config_(config) {}

std::string ContractProxy::Ref(const Identity& identity) const {
  return config_.identity_ref == IdentityRef::Address ? identity.address : identity.signing_handle;
}

ActualOutcome ContractProxy::Write(const PrivacyGroup& group, const Identity& identity, uint64_t value) const {
  if (!group.IsTestable()) {
    return ActualOutcome::TransportError("group " + group.name + " has no probe contract");
  }

  nlohmann::json tx = {{"domain", config_.domain},
                       {"group", group.id},
                       {"from", Ref(identity)},
                       {"to", *group.contract_address},
                       {"function", probe::StoreAbi()},
                       {"input", probe::StoreInput(value)}};
  auto submitted = gateway_.Invoke(identity.home_node_id, "pgroup_sendTransaction", nlohmann::json::array({tx}));
  if (!submitted.IsOk()) {
    return FromGatewayError(submitted);
  }
  if (!submitted.value().is_string() || submitted.value().get<std::string>().empty()) {
    return ActualOutcome::TransportError("store() returned no transaction id");
  }
  const std::string tx_id = submitted.value().get<std::string>();

  // Commit barrier
  auto receipt = receipts_.Await(identity.home_node_id, tx_id);
  ActualOutcome outcome;
  switch (receipt.status) {
  case ReceiptResult::Status::Confirmed:
    outcome = ActualOutcome::Success({}, tx_id);
    break;
  case ReceiptResult::Status::Failed:
    if (receipt.denied) {
      outcome = ActualOutcome::Denied(receipt.reason, receipt.pattern_matched);
    } else {
      outcome = ActualOutcome::TransportError("store() reverted: " + receipt.reason);
    }
    break;
  case ReceiptResult::Status::Timeout:
  case ReceiptResult::Status::TransportError:
    outcome = ActualOutcome::TransportError(receipt.reason);
    break;
  }
  outcome.tx_id = tx_id;

  LOG_HARNESS_TRACE("{} store({}) on {} -> {}", identity.name, value, group.name, ToString(outcome.kind));
  return outcome;
}

ActualOutcome ContractProxy::Read(const PrivacyGroup& group, const Identity& identity) const {
  if (!group.IsTestable()) {
    return ActualOutcome::TransportError("group " + group.name + " has no probe contract");
  }

  nlohmann::json call = {{"domain", config_.domain},
                         {"group", group.id},
                         {"from", Ref(identity)},
                         {"to", *group.contract_address},
                         {"function", probe::RetrieveAbi()},
                         {"input", nlohmann::json::object()}};
  auto result = gateway_.Invoke(identity.home_node_id, "pgroup_call", nlohmann::json::array({call}));
  if (!result.IsOk()) {
    return FromGatewayError(result);
  }

  auto value = probe::DecodeRetrieveOutput(result.value());
  if (!value) {
    return ActualOutcome::TransportError("undecodable retrieve() output: " + result.value().dump());
  }

  LOG_HARNESS_TRACE("{} retrieve() on {} -> {}", identity.name, group.name, *value);
  return ActualOutcome::Success(*value);
}

}  // namespace harness
}  // namespace pgprobe
