// Copyright (c) 2025 The pgprobe developers
// Distributed under the MIT software license

#pragma once

#include "harness/types.hpp"

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace pgprobe {

namespace network {
class NodeTopology;
class RpcGateway;
}  // namespace network

namespace harness {

class ReceiptPoller;

static constexpr std::chrono::milliseconds DEFAULT_GROUP_READY_TIMEOUT{std::chrono::seconds(60)};
static constexpr std::chrono::milliseconds DEFAULT_GROUP_POLL_INTERVAL{std::chrono::seconds(2)};
static constexpr const char* DEFAULT_DOMAIN = "pente";

// Static group declaration from the run plan
struct GroupConfig {
  std::string name;
  std::vector<std::string> members;  // identity names
};

// How group members and transaction senders are named on the wire
enum class IdentityRef {
  Address,  // resolved address
  Name,     // symbolic lookup name, resolved by the node
};

/**
 * PrivacyGroupManager - group lifecycle: Creating -> Ready | Failed
 *
 * Create() submits pgroup_createGroup through the first member's home node.
 * AwaitReady() polls pgroup_getGroupById until the group carries its genesis
 * contract address, then deploys the probe contract from the first member.
 * A group only becomes Ready with a probe contract address set; any failure
 * on the way leaves it Failed and excluded from testing.
 *
 * Membership is fixed at creation. A different member set is a different
 * group.
 */
class PrivacyGroupManager {
public:
  struct Config {
    std::string domain;
    IdentityRef identity_ref;
    std::string probe_bytecode;
    nlohmann::json group_configuration;  // passed through as pgroup_createGroup "configuration"
    std::chrono::milliseconds ready_timeout;
    std::chrono::milliseconds poll_interval;

    Config()
        : domain(DEFAULT_DOMAIN), identity_ref(IdentityRef::Address),
          group_configuration({{"evmVersion", "shanghai"}, {"externalCallsEnabled", "true"}}),
          ready_timeout(DEFAULT_GROUP_READY_TIMEOUT), poll_interval(DEFAULT_GROUP_POLL_INTERVAL) {}
  };

  PrivacyGroupManager(network::RpcGateway& gateway, const network::NodeTopology& topology,
                      const ReceiptPoller& receipts, const Config& config = Config{});

  // Submit the group. Throws TopologyError if a member's home node is
  // unreachable, ResolutionError for an unresolved member, ConfigError for a
  // duplicate name or empty member list, DeploymentError if the node refuses.
  PrivacyGroup Create(const std::string& name, const std::vector<Identity>& members);

  // Poll until the group is confirmed or the timeout elapses, then deploy the
  // probe. The timeout bounds confirmation only; the deployment receipt is
  // awaited on the receipt poller's own timeout, so the worst case is about
  // ready_timeout + commit timeout.
  // Throws ConfirmationTimeoutError or DeploymentError; the group is Failed.
  PrivacyGroup AwaitReady(const std::string& name);
  PrivacyGroup AwaitReady(const std::string& name, std::chrono::milliseconds timeout);

  // Deploy the probe contract from deployer (a member). Returns its address.
  // A group keeps exactly one probe: once deployed, the existing address is
  // returned without sending anything. Throws DeploymentError; the group is
  // Failed, except when a deployment for it is already in flight.
  std::string DeployProbe(const std::string& name, const Identity& deployer);

  std::optional<PrivacyGroup> Find(const std::string& name) const;
  std::vector<PrivacyGroup> Groups() const;

  // Wire reference for an identity per Config::identity_ref
  std::string Ref(const Identity& identity) const;

  const Config& config() const { return config_; }

private:
  struct Entry {
    PrivacyGroup group;
    std::vector<Identity> members;  // resolved, declaration order
    bool deploying{false};
  };

  Entry Snapshot(const std::string& name) const;
  void MarkFailed(const std::string& name, const std::string& reason);
  std::optional<std::string> QueryGenesis(const Entry& entry, std::string& last_error);

  network::RpcGateway& gateway_;
  const network::NodeTopology& topology_;
  const ReceiptPoller& receipts_;
  Config config_;

  mutable std::mutex mutex_;
  std::map<std::string, Entry> groups_;
  std::vector<std::string> order_;
};

}  // namespace harness
}  // namespace pgprobe
