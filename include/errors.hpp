// Copyright (c) 2025 The pgprobe developers
// Distributed under the MIT software license

#pragma once

#include <stdexcept>
#include <string>

namespace pgprobe {

// Identity could not be resolved on its home node. Fatal for the run.
class ResolutionError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Connection refused or timed out while probing a node.
class UnreachableError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Group creation named an identity homed on an unreachable node. Fatal for that group only.
class TopologyError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Group did not confirm within its deadline. The group is marked Failed.
class ConfirmationTimeoutError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Group creation or probe deployment was refused or failed on the platform.
// The group is marked Failed.
class DeploymentError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Run plan is malformed or inconsistent.
class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

}  // namespace pgprobe
