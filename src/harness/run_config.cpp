// Copyright (c) 2025 The pgprobe developers
// Distributed under the MIT software license

#include "harness/run_config.hpp"

#include "errors.hpp"
#include "network/endpoint.hpp"
#include "util/files.hpp"

#include <map>

namespace pgprobe {
namespace harness {

namespace {

const nlohmann::json& Require(const nlohmann::json& j, const char* key, const std::string& where) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    throw ConfigError(where + ": missing \"" + key + "\"");
  }
  return *it;
}

std::string RequireString(const nlohmann::json& j, const char* key, const std::string& where) {
  const auto& v = Require(j, key, where);
  if (!v.is_string() || v.get<std::string>().empty()) {
    throw ConfigError(where + ": \"" + key + "\" must be a non-empty string");
  }
  return v.get<std::string>();
}

std::string OptString(const nlohmann::json& j, const char* key, const std::string& fallback) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return fallback;
  }
  if (!it->is_string()) {
    throw ConfigError(std::string("\"") + key + "\" must be a string");
  }
  return it->get<std::string>();
}

int64_t OptInt(const nlohmann::json& j, const char* key, int64_t fallback, int64_t min_value) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return fallback;
  }
  if (!it->is_number_integer()) {
    throw ConfigError(std::string("\"") + key + "\" must be an integer");
  }
  int64_t v = it->get<int64_t>();
  if (v < min_value) {
    throw ConfigError(std::string("\"") + key + "\" must be >= " + std::to_string(min_value));
  }
  return v;
}

std::chrono::milliseconds OptMs(const nlohmann::json& j, const char* key, std::chrono::milliseconds fallback) {
  return std::chrono::milliseconds(OptInt(j, key, fallback.count(), 1));
}

const nlohmann::json& RequireArray(const nlohmann::json& j, const char* key) {
  const auto& v = Require(j, key, "run plan");
  if (!v.is_array() || v.empty()) {
    throw ConfigError(std::string("run plan: \"") + key + "\" must be a non-empty array");
  }
  return v;
}

}  // namespace

RunConfig ParseRunConfig(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw ConfigError("run plan must be a JSON object");
  }

  RunConfig config;

  for (const auto& n : RequireArray(j, "nodes")) {
    config.nodes.push_back({RequireString(n, "id", "node"), RequireString(n, "endpoint", "node")});
  }
  for (const auto& i : RequireArray(j, "identities")) {
    config.identities.push_back({RequireString(i, "name", "identity"), RequireString(i, "node", "identity")});
  }
  for (const auto& g : RequireArray(j, "groups")) {
    GroupConfig group;
    group.name = RequireString(g, "name", "group");
    const auto& members = Require(g, "members", "group " + group.name);
    if (!members.is_array()) {
      throw ConfigError("group " + group.name + ": \"members\" must be an array");
    }
    for (const auto& m : members) {
      if (!m.is_string()) {
        throw ConfigError("group " + group.name + ": member names must be strings");
      }
      group.members.push_back(m.get<std::string>());
    }
    config.groups.push_back(std::move(group));
  }

  const auto& probe = Require(j, "probe", "run plan");
  config.probe_bytecode = RequireString(probe, "bytecode", "probe");

  config.domain = OptString(j, "domain", config.domain);
  config.key_algorithm = OptString(j, "key_algorithm", config.key_algorithm);
  config.verifier_type = OptString(j, "verifier_type", config.verifier_type);

  std::string ref = OptString(j, "identity_ref", "address");
  if (ref == "address") {
    config.identity_ref = IdentityRef::Address;
  } else if (ref == "name") {
    config.identity_ref = IdentityRef::Name;
  } else {
    throw ConfigError("\"identity_ref\" must be \"address\" or \"name\", got \"" + ref + "\"");
  }

  if (auto it = j.find("group_configuration"); it != j.end() && !it->is_null()) {
    if (!it->is_object()) {
      throw ConfigError("\"group_configuration\" must be an object");
    }
    config.group_configuration = *it;
  }

  config.connect_timeout = OptMs(j, "connect_timeout_ms", config.connect_timeout);
  config.request_timeout = OptMs(j, "request_timeout_ms", config.request_timeout);
  config.transport_retries = static_cast<int>(OptInt(j, "transport_retries", config.transport_retries, 0));
  config.retry_backoff = std::chrono::milliseconds(OptInt(j, "retry_backoff_ms", config.retry_backoff.count(), 0));
  config.group_ready_timeout = OptMs(j, "group_ready_timeout_ms", config.group_ready_timeout);
  config.group_poll_interval = OptMs(j, "group_poll_interval_ms", config.group_poll_interval);
  config.commit_timeout = OptMs(j, "commit_timeout_ms", config.commit_timeout);
  config.commit_poll_interval = OptMs(j, "commit_poll_interval_ms", config.commit_poll_interval);
  config.max_group_workers = static_cast<size_t>(OptInt(j, "max_group_workers", 0, 0));
  config.read_concurrency =
      static_cast<size_t>(OptInt(j, "read_concurrency", static_cast<int64_t>(config.read_concurrency), 1));
  config.read_repeats = static_cast<int>(OptInt(j, "read_repeats", config.read_repeats, 1));
  config.salt = static_cast<uint64_t>(OptInt(j, "salt", 0, 0));

  if (auto it = j.find("denial_codes"); it != j.end() && !it->is_null()) {
    if (!it->is_array()) {
      throw ConfigError("\"denial_codes\" must be an array of integers");
    }
    for (const auto& code : *it) {
      if (!code.is_number_integer()) {
        throw ConfigError("\"denial_codes\" must be an array of integers");
      }
      config.denial_codes.insert(code.get<int64_t>());
    }
  }

  ValidateRunConfig(config);
  return config;
}

RunConfig LoadRunConfig(const std::string& path) {
  auto content = util::read_file_string(path);
  if (!content) {
    throw ConfigError("cannot read run plan " + path);
  }
  nlohmann::json j = nlohmann::json::parse(*content, nullptr, false);
  if (j.is_discarded()) {
    throw ConfigError("run plan " + path + " is not valid JSON");
  }
  return ParseRunConfig(j);
}

void ValidateRunConfig(const RunConfig& config) {
  std::map<std::string, bool> nodes;
  for (const auto& n : config.nodes) {
    if (!nodes.emplace(n.id, true).second) {
      throw ConfigError("duplicate node id: " + n.id);
    }
    if (!network::ParseEndpoint(n.endpoint)) {
      throw ConfigError("node " + n.id + ": invalid endpoint " + n.endpoint);
    }
  }

  std::map<std::string, std::string> identities;
  for (const auto& i : config.identities) {
    if (!nodes.count(i.node)) {
      throw ConfigError("identity " + i.name + " names unknown node " + i.node);
    }
    if (!identities.emplace(i.name, i.node).second) {
      throw ConfigError("duplicate identity: " + i.name);
    }
  }

  std::map<std::string, bool> groups;
  for (const auto& g : config.groups) {
    if (!groups.emplace(g.name, true).second) {
      throw ConfigError("duplicate group: " + g.name);
    }
    if (g.members.empty()) {
      throw ConfigError("group " + g.name + " has no members");
    }
    std::map<std::string, bool> seen;
    for (const auto& m : g.members) {
      if (!identities.count(m)) {
        throw ConfigError("group " + g.name + " names undeclared identity " + m);
      }
      if (!seen.emplace(m, true).second) {
        throw ConfigError("group " + g.name + " lists " + m + " twice");
      }
    }
  }
}

}  // namespace harness
}  // namespace pgprobe
