// Copyright (c) 2025 The pgprobe developers
// Distributed under the MIT software license

#include "harness/privacy_group_manager.hpp"

#include "errors.hpp"
#include "harness/probe_contract.hpp"
#include "harness/receipt_poller.hpp"
#include "network/node_topology.hpp"
#include "network/rpc_gateway.hpp"
#include "util/logging.hpp"

#include <algorithm>
#include <thread>

namespace pgprobe {
namespace harness {

namespace {

std::string StringField(const nlohmann::json& object, const char* key) {
  if (!object.is_object()) {
    return {};
  }
  auto it = object.find(key);
  if (it == object.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

}  // namespace

PrivacyGroupManager::PrivacyGroupManager(network::RpcGateway& gateway, const network::NodeTopology& topology,
                                         const ReceiptPoller& receipts, const Config& config)
    : gateway_(gateway), topology_(topology), receipts_(receipts), config_(config) {}

std::string PrivacyGroupManager::Ref(const Identity& identity) const {
  return config_.identity_ref == IdentityRef::Address ? identity.address : identity.signing_handle;
}

PrivacyGroup PrivacyGroupManager::Create(const std::string& name, const std::vector<Identity>& members) {
  if (members.empty()) {
    throw ConfigError("group " + name + " has no members");
  }

  std::vector<std::string> nodes;
  for (const auto& member : members) {
    nodes.push_back(member.home_node_id);
  }
  topology_.RequireReachable(nodes, "group " + name);

  nlohmann::json refs = nlohmann::json::array();
  PrivacyGroup group;
  group.name = name;
  group.status = GroupStatus::Creating;
  group.creating_node = members.front().home_node_id;
  for (const auto& member : members) {
    if (!member.IsResolved()) {
      throw ResolutionError("group " + name + ": member " + member.name + " is not resolved");
    }
    if (!group.members.insert(member.name).second) {
      continue;
    }
    group.member_order.push_back(member.name);
    refs.push_back(Ref(member));
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (groups_.count(name)) {
      throw ConfigError("duplicate group: " + name);
    }
    groups_.emplace(name, Entry{group, members});
    order_.push_back(name);
  }

  nlohmann::json request = {{"domain", config_.domain},
                            {"name", name},
                            {"type", config_.domain},
                            {"members", refs},
                            {"configuration", config_.group_configuration}};
  auto result = gateway_.Invoke(group.creating_node, "pgroup_createGroup", nlohmann::json::array({request}));

  std::string id;
  if (result.IsOk()) {
    const auto& value = result.value();
    if (value.is_string()) {
      id = value.get<std::string>();
    } else if (value.is_object() && value.contains("id") && value["id"].is_string()) {
      id = value["id"].get<std::string>();
    }
  }
  if (id.empty()) {
    std::string reason = result.IsOk() ? "pgroup_createGroup returned no group id" : result.error().reason;
    MarkFailed(name, reason);
    throw DeploymentError("group " + name + " creation failed: " + reason);
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = groups_.at(name);
    entry.group.id = id;
    group = entry.group;
  }
  LOG_HARNESS_INFO("group {} submitted via {} as {} ({} members)", name, group.creating_node, id,
                   group.members.size());
  return group;
}

PrivacyGroup PrivacyGroupManager::AwaitReady(const std::string& name) {
  return AwaitReady(name, config_.ready_timeout);
}

PrivacyGroup PrivacyGroupManager::AwaitReady(const std::string& name, std::chrono::milliseconds timeout) {
  using clock = std::chrono::steady_clock;
  const auto deadline = clock::now() + timeout;

  Entry entry = Snapshot(name);
  if (entry.group.status == GroupStatus::Ready) {
    return entry.group;
  }
  if (entry.group.status == GroupStatus::Failed) {
    throw DeploymentError("group " + name + " already failed: " + entry.group.failure_reason);
  }

  std::string last_error;
  while (true) {
    if (QueryGenesis(entry, last_error)) {
      LOG_HARNESS_DEBUG("group {} confirmed, deploying probe", name);
      const Identity& deployer = entry.members.front();
      DeployProbe(name, deployer);
      return Snapshot(name).group;
    }

    auto now = clock::now();
    if (now >= deadline) {
      break;
    }
    std::this_thread::sleep_for(std::min<clock::duration>(config_.poll_interval, deadline - now));
  }

  std::string reason = "not confirmed within " + std::to_string(timeout.count()) + "ms";
  if (!last_error.empty()) {
    reason += " (last error: " + last_error + ")";
  }
  MarkFailed(name, reason);
  LOG_HARNESS_WARN("group {} FAILED: {}; excluded from testing", name, reason);
  throw ConfirmationTimeoutError("group " + name + " " + reason);
}

std::optional<std::string> PrivacyGroupManager::QueryGenesis(const Entry& entry, std::string& last_error) {
  auto result = gateway_.Invoke(entry.group.creating_node, "pgroup_getGroupById",
                                nlohmann::json::array({config_.domain, entry.group.id}));
  if (!result.IsOk()) {
    // "not found" while the group propagates looks like a denial; keep polling
    last_error = result.error().reason;
    return std::nullopt;
  }

  std::string address = StringField(result.value(), "contractAddress");
  if (address.empty()) {
    return std::nullopt;
  }
  return address;
}

std::string PrivacyGroupManager::DeployProbe(const std::string& name, const Identity& deployer) {
  Entry entry;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = groups_.find(name);
    if (it == groups_.end()) {
      throw ConfigError("unknown group: " + name);
    }
    auto& current = it->second;
    if (current.group.contract_address.has_value()) {
      LOG_HARNESS_DEBUG("group {} already has probe {}", name, *current.group.contract_address);
      return *current.group.contract_address;
    }
    if (current.group.status == GroupStatus::Failed) {
      throw DeploymentError("group " + name + " already failed: " + current.group.failure_reason);
    }
    if (current.deploying) {
      throw DeploymentError("group " + name + ": probe deployment already in progress");
    }
    current.deploying = true;
    entry = current;
  }

  auto fail = [&](const std::string& reason) -> std::string {
    MarkFailed(name, reason);
    LOG_HARNESS_WARN("group {} FAILED: {}; excluded from testing", name, reason);
    throw DeploymentError("group " + name + ": " + reason);
  };

  if (!entry.group.IsMember(deployer.name)) {
    return fail("deployer " + deployer.name + " is not a member");
  }
  if (config_.probe_bytecode.empty()) {
    return fail("no probe bytecode configured");
  }

  nlohmann::json tx = {{"domain", config_.domain},
                       {"group", entry.group.id},
                       {"from", Ref(deployer)},
                       {"bytecode", config_.probe_bytecode},
                       {"function", probe::ConstructorAbi()},
                       {"input", nlohmann::json::object()}};
  auto submitted = gateway_.Invoke(deployer.home_node_id, "pgroup_sendTransaction", nlohmann::json::array({tx}));
  if (!submitted.IsOk()) {
    return fail("probe deployment rejected: " + submitted.error().reason);
  }
  if (!submitted.value().is_string() || submitted.value().get<std::string>().empty()) {
    return fail("probe deployment returned no transaction id");
  }
  const std::string tx_id = submitted.value().get<std::string>();

  auto receipt = receipts_.Await(deployer.home_node_id, tx_id);
  if (!receipt.IsConfirmed()) {
    return fail("probe deployment " + tx_id + " not confirmed: " + receipt.reason);
  }

  std::string address = StringField(receipt.receipt, "contractAddress");
  if (address.empty()) {
    auto domain_receipt = gateway_.Invoke(deployer.home_node_id, "ptx_getDomainReceipt",
                                          nlohmann::json::array({config_.domain, tx_id}));
    if (domain_receipt.IsOk() && domain_receipt.value().is_object()) {
      auto inner = domain_receipt.value().find("receipt");
      if (inner != domain_receipt.value().end()) {
        address = StringField(*inner, "contractAddress");
      }
    }
  }
  if (address.empty()) {
    return fail("probe deployment " + tx_id + " confirmed without a contract address");
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& current = groups_.at(name);
    current.deploying = false;
    current.group.contract_address = address;
    current.group.status = GroupStatus::Ready;
  }
  LOG_HARNESS_INFO("group {} ready, probe at {}", name, address);
  return address;
}

std::optional<PrivacyGroup> PrivacyGroupManager::Find(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = groups_.find(name);
  if (it == groups_.end()) {
    return std::nullopt;
  }
  return it->second.group;
}

std::vector<PrivacyGroup> PrivacyGroupManager::Groups() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<PrivacyGroup> out;
  out.reserve(order_.size());
  for (const auto& name : order_) {
    out.push_back(groups_.at(name).group);
  }
  return out;
}

PrivacyGroupManager::Entry PrivacyGroupManager::Snapshot(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = groups_.find(name);
  if (it == groups_.end()) {
    throw ConfigError("unknown group: " + name);
  }
  return it->second;
}

void PrivacyGroupManager::MarkFailed(const std::string& name, const std::string& reason) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = groups_.find(name);
  if (it == groups_.end()) {
    return;
  }
  it->second.group.status = GroupStatus::Failed;
  it->second.group.failure_reason = reason;
  it->second.deploying = false;
}

}  // namespace harness
}  // namespace pgprobe
