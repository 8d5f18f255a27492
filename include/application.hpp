// Copyright (c) 2025 The pgprobe developers
// Distributed under the MIT software license

#pragma once

#include "harness/reporter.hpp"
#include "harness/run_config.hpp"
#include "network/rpc_transport.hpp"

#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace pgprobe {

namespace network {
class NodeTopology;
class RpcGateway;
}  // namespace network

namespace harness {
class ContractProxy;
class IdentityRegistry;
class PrivacyGroupManager;
class ReceiptPoller;
class TestOrchestrator;
}  // namespace harness

namespace app {

struct AppConfig {
  harness::RunConfig run;
  std::string report_path;  // empty: text report only
};

/**
 * Application - one harness run, start to report.
 *
 * initialize() builds the component stack (topology -> gateway -> registry
 * -> groups -> proxy -> orchestrator). run() connects every node, resolves
 * identities, drives the matrix and emits the report. The transport is
 * injectable so the whole run can execute against a simulated platform.
 */
class Application {
public:
  explicit Application(const AppConfig& config, network::RpcTransportPtr transport = nullptr,
                       std::ostream& out = std::cout);
  ~Application();

  Application(const Application&) = delete;
  Application& operator=(const Application&) = delete;

  // Throws ConfigError if the run plan does not fit together.
  void initialize();

  // Returns EXIT_CLEAN, EXIT_FINDINGS or EXIT_FATAL. ResolutionError and an
  // empty topology are reported and mapped to EXIT_FATAL.
  int run();

  const std::optional<harness::Report>& report() const { return report_; }

private:
  bool connect_nodes();
  void resolve_identities();

  AppConfig config_;
  network::RpcTransportPtr transport_;
  std::ostream& out_;

  std::unique_ptr<network::NodeTopology> topology_;
  std::unique_ptr<network::RpcGateway> gateway_;
  std::unique_ptr<harness::IdentityRegistry> registry_;
  std::unique_ptr<harness::ReceiptPoller> receipts_;
  std::unique_ptr<harness::PrivacyGroupManager> groups_;
  std::unique_ptr<harness::ContractProxy> proxy_;
  std::unique_ptr<harness::TestOrchestrator> orchestrator_;

  std::optional<harness::Report> report_;
};

}  // namespace app
}  // namespace pgprobe
