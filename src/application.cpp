// Copyright (c) 2025 The pgprobe developers
// Distributed under the MIT software license

#include "application.hpp"

#include "errors.hpp"
#include "harness/contract_proxy.hpp"
#include "harness/identity_registry.hpp"
#include "harness/privacy_group_manager.hpp"
#include "harness/receipt_poller.hpp"
#include "harness/test_orchestrator.hpp"
#include "network/http_transport.hpp"
#include "network/node_topology.hpp"
#include "network/rpc_gateway.hpp"
#include "util/logging.hpp"
#include "version.hpp"

namespace pgprobe {
namespace app {

Application::Application(const AppConfig& config, network::RpcTransportPtr transport, std::ostream& out)
    : config_(config), transport_(transport ? std::move(transport) : std::make_shared<network::HttpTransport>()),
      out_(out) {}

Application::~Application() = default;

void Application::initialize() {
  const auto& run = config_.run;
  harness::ValidateRunConfig(run);

  network::NodeTopology::Config topology_config;
  topology_config.connect_timeout = run.connect_timeout;
  topology_config.request_timeout = run.request_timeout;
  topology_ = std::make_unique<network::NodeTopology>(run.nodes, transport_, topology_config);

  network::RpcGateway::Config gateway_config;
  gateway_config.transport_retries = run.transport_retries;
  gateway_config.retry_backoff = run.retry_backoff;
  gateway_config.denial_codes = run.denial_codes;
  gateway_ = std::make_unique<network::RpcGateway>(*topology_, gateway_config);

  harness::IdentityRegistry::Config registry_config;
  registry_config.key_algorithm = run.key_algorithm;
  registry_config.verifier_type = run.verifier_type;
  registry_ = std::make_unique<harness::IdentityRegistry>(*gateway_, *topology_, registry_config);
  for (const auto& identity : run.identities) {
    registry_->Declare(identity);
  }

  harness::ReceiptPoller::Config receipt_config;
  receipt_config.timeout = run.commit_timeout;
  receipt_config.poll_interval = run.commit_poll_interval;
  receipts_ = std::make_unique<harness::ReceiptPoller>(*gateway_, receipt_config);

  harness::PrivacyGroupManager::Config group_config;
  group_config.domain = run.domain;
  group_config.identity_ref = run.identity_ref;
  group_config.probe_bytecode = run.probe_bytecode;
  group_config.group_configuration = run.group_configuration;
  group_config.ready_timeout = run.group_ready_timeout;
  group_config.poll_interval = run.group_poll_interval;
  groups_ = std::make_unique<harness::PrivacyGroupManager>(*gateway_, *topology_, *receipts_, group_config);

  harness::ContractProxy::Config proxy_config;
  proxy_config.domain = run.domain;
  proxy_config.identity_ref = run.identity_ref;
  proxy_ = std::make_unique<harness::ContractProxy>(*gateway_, *receipts_, proxy_config);

  harness::TestOrchestrator::Config orchestrator_config;
  orchestrator_config.max_group_workers = run.max_group_workers;
  orchestrator_config.read_concurrency = run.read_concurrency;
  orchestrator_config.read_repeats = run.read_repeats;
  orchestrator_config.salt = run.salt;
  orchestrator_ =
      std::make_unique<harness::TestOrchestrator>(*registry_, *groups_, *proxy_, *topology_, orchestrator_config);

  LOG_INFO("Initialized: {} nodes, {} identities, {} groups", run.nodes.size(), run.identities.size(),
           run.groups.size());
}

bool Application::connect_nodes() {
  size_t reachable = topology_->ConnectAll();
  LOG_INFO("{}/{} nodes reachable", reachable, config_.run.nodes.size());
  return reachable > 0;
}

void Application::resolve_identities() {
  size_t resolved = registry_->ResolveAll();
  if (resolved == 0) {
    throw ResolutionError("no identity could be resolved");
  }
}

int Application::run() {
  if (!orchestrator_) {
    initialize();
  }

  LOG_INFO("{}", GetFullVersionString());

  if (!connect_nodes()) {
    LOG_ERROR("No reachable node, nothing to test");
    out_ << "Error: no reachable node\n";
    return harness::EXIT_FATAL;
  }

  try {
    resolve_identities();
  } catch (const ResolutionError& e) {
    LOG_ERROR("Identity resolution failed, aborting run: {}", e.what());
    out_ << "Error: " << e.what() << "\n";
    return harness::EXIT_FATAL;
  }

  harness::MatrixResult matrix;
  try {
    matrix = orchestrator_->Run(config_.run.groups);
  } catch (const ResolutionError& e) {
    LOG_ERROR("Identity resolution failed during group setup, aborting run: {}", e.what());
    out_ << "Error: " << e.what() << "\n";
    return harness::EXIT_FATAL;
  }

  report_ = harness::BuildReport(std::move(matrix.cases), std::move(matrix.excluded));
  out_ << harness::RenderText(*report_) << std::flush;

  if (!config_.report_path.empty() && !harness::WriteJson(*report_, config_.report_path)) {
    out_ << "Error: could not write report to " << config_.report_path << "\n";
    return harness::EXIT_FATAL;
  }

  int code = harness::ExitCode(*report_);
  if (code == harness::EXIT_CLEAN) {
    LOG_INFO("Run clean: declared membership verified");
  } else {
    LOG_WARN("Run has findings: {} breach, {} leakage, {} inconclusive",
             harness::Count(report_->totals, harness::Classification::Breach),
             harness::Count(report_->totals, harness::Classification::Leakage),
             harness::Count(report_->totals, harness::Classification::Inconclusive));
  }
  return code;
}

}  // namespace app
}  // namespace pgprobe
