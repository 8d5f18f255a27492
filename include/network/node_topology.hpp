// Copyright (c) 2025 The pgprobe developers
// Distributed under the MIT software license

#pragma once

#include "network/endpoint.hpp"
#include "network/rpc_transport.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pgprobe {
namespace network {

// Default configuration constants
static constexpr std::chrono::milliseconds DEFAULT_CONNECT_TIMEOUT{std::chrono::seconds(5)};
static constexpr std::chrono::milliseconds DEFAULT_REQUEST_TIMEOUT{std::chrono::seconds(30)};

// Static node declaration from the run plan
struct NodeConfig {
  std::string id;
  std::string endpoint;  // http://host:port[/path]
};

// Node as seen by the harness. Reachability is decided once at startup.
struct Node {
  std::string id;
  std::string endpoint;
  bool reachable{false};
};

// ConnectionHandle - read-only access path to one node, shared by every
// identity homed on that node. Holds no per-request state.
class ConnectionHandle {
public:
  ConnectionHandle(std::string node_id, Endpoint endpoint, RpcTransportPtr transport,
                   std::chrono::milliseconds request_timeout);

  TransportResponse Post(const std::string& body) const;

  const std::string& node_id() const { return node_id_; }
  const Endpoint& endpoint() const { return endpoint_; }

private:
  std::string node_id_;
  Endpoint endpoint_;
  RpcTransportPtr transport_;
  std::chrono::milliseconds request_timeout_;
};

using ConnectionHandlePtr = std::shared_ptr<const ConnectionHandle>;

// NodeTopology - the set of execution endpoints for one run.
//
// Connect() probes a node and hands out its shared ConnectionHandle. A node
// that fails the probe is marked unreachable for the rest of the run; group
// creation naming one of its identities fails fast with TopologyError
// (see RequireReachable).
class NodeTopology {
public:
  struct Config {
    std::chrono::milliseconds connect_timeout;
    std::chrono::milliseconds request_timeout;

    Config() : connect_timeout(DEFAULT_CONNECT_TIMEOUT), request_timeout(DEFAULT_REQUEST_TIMEOUT) {}
  };

  // Throws ConfigError on duplicate ids or unparsable endpoints.
  NodeTopology(const std::vector<NodeConfig>& nodes, RpcTransportPtr transport, const Config& config = Config{});

  // Probe the node and return its handle. Throws UnreachableError (and marks
  // the node unreachable) on refusal or timeout, ConfigError on unknown id.
  ConnectionHandlePtr Connect(const std::string& node_id);

  // Connect every node, logging failures. Returns the number of reachable nodes.
  size_t ConnectAll();

  // Handle for an already-connected node, nullptr if unknown or unreachable.
  ConnectionHandlePtr Connection(const std::string& node_id) const;

  bool IsKnown(const std::string& node_id) const;
  bool IsReachable(const std::string& node_id) const;

  // Throws TopologyError naming the first unreachable node in node_ids.
  void RequireReachable(const std::vector<std::string>& node_ids, const std::string& context) const;

  std::vector<Node> Nodes() const;
  size_t ReachableCount() const;

private:
  struct Entry {
    Node node;
    Endpoint endpoint;
    ConnectionHandlePtr handle;
    bool probed{false};
  };

  RpcTransportPtr transport_;
  Config config_;
  std::vector<std::string> order_;  // declaration order

  mutable std::mutex mutex_;
  std::map<std::string, Entry> entries_;
};

}  // namespace network
}  // namespace pgprobe
