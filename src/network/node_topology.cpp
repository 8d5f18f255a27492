// Copyright (c) 2025 The pgprobe developers
// Distributed under the MIT software license

#include "network/node_topology.hpp"

#include "errors.hpp"
#include "util/logging.hpp"

namespace pgprobe {
namespace network {

ConnectionHandle::ConnectionHandle(std::string node_id, Endpoint endpoint, RpcTransportPtr transport,
                                   std::chrono::milliseconds request_timeout)
    : node_id_(std::move(node_id)), endpoint_(std::move(endpoint)), transport_(std::move(transport)),
      request_timeout_(request_timeout) {}

TransportResponse ConnectionHandle::Post(const std::string& body) const {
  return transport_->Post(endpoint_, body, request_timeout_);
}

NodeTopology::NodeTopology(const std::vector<NodeConfig>& nodes, RpcTransportPtr transport, const Config& config)
    : transport_(std::move(transport)), config_(config) {
  if (!transport_) {
    throw ConfigError("NodeTopology requires a transport");
  }

  for (const auto& nc : nodes) {
    if (nc.id.empty()) {
      throw ConfigError("node with empty id");
    }
    if (entries_.count(nc.id)) {
      throw ConfigError("duplicate node id: " + nc.id);
    }
    auto endpoint = ParseEndpoint(nc.endpoint);
    if (!endpoint) {
      throw ConfigError("node " + nc.id + " has invalid endpoint: " + nc.endpoint);
    }

    Entry entry;
    entry.node = Node{nc.id, nc.endpoint, false};
    entry.endpoint = *endpoint;
    entries_.emplace(nc.id, std::move(entry));
    order_.push_back(nc.id);
  }
}

ConnectionHandlePtr NodeTopology::Connect(const std::string& node_id) {
  Endpoint endpoint;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(node_id);
    if (it == entries_.end()) {
      throw ConfigError("unknown node: " + node_id);
    }
    if (it->second.handle) {
      return it->second.handle;
    }
    if (it->second.probed && !it->second.node.reachable) {
      throw UnreachableError("node " + node_id + " was marked unreachable");
    }
    endpoint = it->second.endpoint;
  }

  // Probe outside the lock; it blocks for up to connect_timeout
  auto error = transport_->Probe(endpoint, config_.connect_timeout);

  std::lock_guard<std::mutex> lock(mutex_);
  auto& entry = entries_.at(node_id);
  entry.probed = true;
  if (error) {
    entry.node.reachable = false;
    LOG_RPC_WARN("node {} unreachable: {}", node_id, *error);
    throw UnreachableError("node " + node_id + " unreachable: " + *error);
  }

  entry.node.reachable = true;
  entry.handle = std::make_shared<const ConnectionHandle>(node_id, endpoint, transport_, config_.request_timeout);
  LOG_RPC_INFO("connected to node {} at {}", node_id, endpoint.ToString());
  return entry.handle;
}

size_t NodeTopology::ConnectAll() {
  size_t reachable = 0;
  for (const auto& id : order_) {
    try {
      Connect(id);
      ++reachable;
    } catch (const UnreachableError& e) {
      LOG_RPC_WARN("excluding node {}: {}", id, e.what());
    }
  }
  return reachable;
}

ConnectionHandlePtr NodeTopology::Connection(const std::string& node_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(node_id);
  if (it == entries_.end()) {
    return nullptr;
  }
  return it->second.handle;
}

bool NodeTopology::IsKnown(const std::string& node_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.count(node_id) > 0;
}

bool NodeTopology::IsReachable(const std::string& node_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(node_id);
  return it != entries_.end() && it->second.node.reachable;
}

void NodeTopology::RequireReachable(const std::vector<std::string>& node_ids, const std::string& context) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& id : node_ids) {
    auto it = entries_.find(id);
    if (it == entries_.end()) {
      throw TopologyError(context + ": unknown node " + id);
    }
    if (!it->second.node.reachable) {
      throw TopologyError(context + ": node " + id + " is unreachable");
    }
  }
}

std::vector<Node> NodeTopology::Nodes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Node> nodes;
  nodes.reserve(order_.size());
  for (const auto& id : order_) {
    nodes.push_back(entries_.at(id).node);
  }
  return nodes;
}

size_t NodeTopology::ReachableCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t count = 0;
  for (const auto& [id, entry] : entries_) {
    if (entry.node.reachable)
      ++count;
  }
  return count;
}

}  // namespace network
}  // namespace pgprobe
