// Copyright (c) 2025 The pgprobe developers
// Distributed under the MIT software license

#pragma once

#include "harness/privacy_group_manager.hpp"
#include "harness/identity_registry.hpp"
#include "harness/receipt_poller.hpp"
#include "harness/test_orchestrator.hpp"
#include "network/node_topology.hpp"

#include <chrono>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace pgprobe {
namespace harness {

static constexpr int DEFAULT_TRANSPORT_RETRIES = 1;
static constexpr std::chrono::milliseconds DEFAULT_RETRY_BACKOFF{500};

/**
 * Run plan: everything one harness run needs, loaded from a JSON file.
 *
 * {
 *   "nodes":      [{"id": "node1", "endpoint": "http://localhost:31548"}],
 *   "identities": [{"name": "member@node1", "node": "node1"}],
 *   "groups":     [{"name": "g1", "members": ["member@node1"]}],
 *   "probe":      {"bytecode": "0x..."},
 *   ... optional tuning, see defaults below
 * }
 */
struct RunConfig {
  std::vector<network::NodeConfig> nodes;
  std::vector<IdentityConfig> identities;
  std::vector<GroupConfig> groups;

  std::string domain;
  IdentityRef identity_ref;
  std::string key_algorithm;
  std::string verifier_type;
  std::string probe_bytecode;
  nlohmann::json group_configuration;

  std::chrono::milliseconds connect_timeout;
  std::chrono::milliseconds request_timeout;
  int transport_retries;
  std::chrono::milliseconds retry_backoff;
  std::chrono::milliseconds group_ready_timeout;
  std::chrono::milliseconds group_poll_interval;
  std::chrono::milliseconds commit_timeout;
  std::chrono::milliseconds commit_poll_interval;

  size_t max_group_workers;
  size_t read_concurrency;
  int read_repeats;
  std::set<int64_t> denial_codes;
  uint64_t salt;  // 0: random

  RunConfig()
      : domain(DEFAULT_DOMAIN), identity_ref(IdentityRef::Address), key_algorithm("ecdsa:secp256k1"),
        verifier_type("eth_address"),
        group_configuration({{"evmVersion", "shanghai"}, {"externalCallsEnabled", "true"}}),
        connect_timeout(network::DEFAULT_CONNECT_TIMEOUT), request_timeout(network::DEFAULT_REQUEST_TIMEOUT),
        transport_retries(DEFAULT_TRANSPORT_RETRIES), retry_backoff(DEFAULT_RETRY_BACKOFF),
        group_ready_timeout(DEFAULT_GROUP_READY_TIMEOUT), group_poll_interval(DEFAULT_GROUP_POLL_INTERVAL),
        commit_timeout(DEFAULT_COMMIT_TIMEOUT), commit_poll_interval(DEFAULT_COMMIT_POLL_INTERVAL),
        max_group_workers(0), read_concurrency(DEFAULT_READ_CONCURRENCY), read_repeats(DEFAULT_READ_REPEATS),
        salt(0) {}
};

// Parse and validate. Throws ConfigError naming the offending field.
RunConfig ParseRunConfig(const nlohmann::json& j);

// Read, parse and validate a run plan file. Throws ConfigError.
RunConfig LoadRunConfig(const std::string& path);

// Cross-reference checks (unique names, known nodes and identities).
// Throws ConfigError.
void ValidateRunConfig(const RunConfig& config);

}  // namespace harness
}  // namespace pgprobe
