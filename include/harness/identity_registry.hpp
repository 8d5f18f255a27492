// Copyright (c) 2025 The pgprobe developers
// Distributed under the MIT software license

#pragma once

#include "harness/types.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pgprobe {

namespace network {
class NodeTopology;
class RpcGateway;
}  // namespace network

namespace harness {

// Static identity declaration from the run plan
struct IdentityConfig {
  std::string name;
  std::string node;
};

/**
 * IdentityRegistry - symbolic identity names to node affiliation and address
 *
 * Identities are declared up front and resolved once against their home node
 * (ptx_resolveVerifier). A resolved Identity is immutable for the run.
 * Resolution is never retried: without a ground-truth address every later
 * expected-vs-actual comparison is meaningless, so failure is fatal.
 *
 * Identities homed on an unreachable node stay declared but unresolved; they
 * are not part of the test universe and any group naming them fails with
 * TopologyError.
 */
class IdentityRegistry {
public:
  struct Config {
    std::string key_algorithm;
    std::string verifier_type;

    Config() : key_algorithm("ecdsa:secp256k1"), verifier_type("eth_address") {}
  };

  IdentityRegistry(network::RpcGateway& gateway, const network::NodeTopology& topology,
                   const Config& config = Config{});

  // Throws ConfigError on duplicate name or unknown node.
  void Declare(const IdentityConfig& declaration);

  // Resolve name on node. Throws ResolutionError if the node cannot produce
  // an address for it.
  Identity Resolve(const std::string& name, const std::string& node_id);

  // Resolve every declared identity whose home node is reachable.
  // Returns the number resolved; throws ResolutionError on the first failure.
  size_t ResolveAll();

  std::optional<Identity> Find(const std::string& name) const;

  // Throws ConfigError for an undeclared name.
  Identity Get(const std::string& name) const;

  bool IsDeclared(const std::string& name) const;

  // All declared identities, declaration order.
  std::vector<Identity> Declared() const;

  // Resolved identities, declaration order. This is the test universe.
  std::vector<Identity> Resolved() const;

private:
  network::RpcGateway& gateway_;
  const network::NodeTopology& topology_;
  Config config_;

  mutable std::mutex mutex_;
  std::map<std::string, Identity> identities_;
  std::vector<std::string> order_;
};

}  // namespace harness
}  // namespace pgprobe
