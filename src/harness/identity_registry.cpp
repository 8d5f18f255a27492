// Copyright (c) 2025 The pgprobe developers
// Distributed under the MIT software license

#include "harness/identity_registry.hpp"

#include "errors.hpp"
#include "network/node_topology.hpp"
#include "network/rpc_gateway.hpp"
#include "util/logging.hpp"

#include <nlohmann/json.hpp>

namespace pgprobe {
namespace harness {

IdentityRegistry::IdentityRegistry(network::RpcGateway& gateway, const network::NodeTopology& topology,
                                   const Config& config)
    : gateway_(gateway), topology_(topology), config_(config) {}

void IdentityRegistry::Declare(const IdentityConfig& declaration) {
  if (declaration.name.empty()) {
    throw ConfigError("identity with empty name");
  }
  if (!topology_.IsKnown(declaration.node)) {
    throw ConfigError("identity " + declaration.name + " names unknown node " + declaration.node);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (identities_.count(declaration.name)) {
    throw ConfigError("duplicate identity: " + declaration.name);
  }
  Identity identity;
  identity.name = declaration.name;
  identity.home_node_id = declaration.node;
  identity.signing_handle = declaration.name;
  identities_.emplace(declaration.name, std::move(identity));
  order_.push_back(declaration.name);
}

Identity IdentityRegistry::Resolve(const std::string& name, const std::string& node_id) {
  nlohmann::json params = nlohmann::json::array({name, config_.key_algorithm, config_.verifier_type});
  auto result = gateway_.Invoke(node_id, "ptx_resolveVerifier", params);

  if (!result.IsOk()) {
    throw ResolutionError("cannot resolve " + name + " on node " + node_id + ": " + result.error().reason);
  }
  if (!result.value().is_string() || result.value().get<std::string>().empty()) {
    throw ResolutionError("node " + node_id + " returned no address for " + name);
  }

  Identity identity;
  identity.name = name;
  identity.home_node_id = node_id;
  identity.address = result.value().get<std::string>();
  identity.signing_handle = name;

  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = identities_.find(name);
    if (it == identities_.end()) {
      order_.push_back(name);
      identities_.emplace(name, identity);
    } else if (it->second.IsResolved() && it->second.address != identity.address) {
      throw ResolutionError("identity " + name + " resolved to " + identity.address + ", previously " +
                            it->second.address);
    } else {
      it->second = identity;
    }
  }

  LOG_HARNESS_DEBUG("resolved {}@{} -> {}", name, node_id, identity.address);
  return identity;
}

size_t IdentityRegistry::ResolveAll() {
  size_t resolved = 0;
  for (const auto& identity : Declared()) {
    if (!topology_.IsReachable(identity.home_node_id)) {
      LOG_HARNESS_WARN("identity {} not resolved: home node {} is unreachable", identity.name,
                       identity.home_node_id);
      continue;
    }
    Resolve(identity.name, identity.home_node_id);
    ++resolved;
  }
  LOG_HARNESS_INFO("resolved {} identities", resolved);
  return resolved;
}

std::optional<Identity> IdentityRegistry::Find(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = identities_.find(name);
  if (it == identities_.end()) {
    return std::nullopt;
  }
  return it->second;
}

Identity IdentityRegistry::Get(const std::string& name) const {
  auto identity = Find(name);
  if (!identity) {
    throw ConfigError("unknown identity: " + name);
  }
  return *identity;
}

bool IdentityRegistry::IsDeclared(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return identities_.count(name) > 0;
}

std::vector<Identity> IdentityRegistry::Declared() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Identity> out;
  out.reserve(order_.size());
  for (const auto& name : order_) {
    out.push_back(identities_.at(name));
  }
  return out;
}

std::vector<Identity> IdentityRegistry::Resolved() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Identity> out;
  for (const auto& name : order_) {
    const auto& identity = identities_.at(name);
    if (identity.IsResolved()) {
      out.push_back(identity);
    }
  }
  return out;
}

}  // namespace harness
}  // namespace pgprobe
