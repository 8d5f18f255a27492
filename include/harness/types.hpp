// Copyright (c) 2025 The pgprobe developers
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace pgprobe {
namespace harness {

enum class Operation { Write, Read };

/**
 * Ground truth for one (group, identity, operation) cell, derived only from
 * declared membership. Never obtained by asking the platform.
 */
enum class ExpectedOutcome { Allow, Deny };

/**
 * What the platform actually did for one call.
 *
 * Success:        the call completed (writes: committed receipt; reads: value decoded).
 * Denied:         the node explicitly refused the call.
 * TransportError: anything the harness cannot attribute to authorization.
 */
struct ActualOutcome {
  enum class Kind { Success, Denied, TransportError };

  Kind kind{Kind::TransportError};
  std::string value;   // decoded read value (Success on Read)
  std::string reason;  // Denied / TransportError detail
  std::string tx_id;   // write transaction id, when one was assigned
  bool pattern_matched{false};  // Denied via the phrase table rather than a structured code

  static ActualOutcome Success(std::string value = {}, std::string tx_id = {});
  static ActualOutcome Denied(std::string reason, bool pattern_matched = false);
  static ActualOutcome TransportError(std::string reason);

  bool IsSuccess() const { return kind == Kind::Success; }
  bool IsDenied() const { return kind == Kind::Denied; }
  bool IsTransportError() const { return kind == Kind::TransportError; }
};

enum class Classification { Pass, UnexpectedDenial, Breach, Leakage, Inconclusive };

enum class GroupStatus { Creating, Ready, Failed };

// How a successful read's value relates to the sentinel table
enum class ValueCheck {
  NotApplicable,  // not a successful read
  Match,          // own group's committed sentinel
  Mismatch,       // neither own nor any other group's sentinel
  Leaked,         // another group's sentinel
  Unverified,     // own sentinel write never committed
};

struct Identity {
  std::string name;
  std::string home_node_id;
  std::string address;         // resolved on-chain address, empty until resolved
  std::string signing_handle;  // key lookup name the home node signs with

  bool IsResolved() const { return !address.empty(); }
};

struct PrivacyGroup {
  std::string id;    // platform group id, empty until creation was accepted
  std::string name;  // declared name, unique within a run
  std::set<std::string> members;          // identity names, fixed at creation
  std::vector<std::string> member_order;  // same names, declaration order
  std::optional<std::string> contract_address;
  GroupStatus status{GroupStatus::Creating};
  std::string creating_node;  // node the group was created through
  std::string failure_reason;

  bool IsMember(const std::string& identity_name) const { return members.count(identity_name) > 0; }

  // Only Ready groups with a probe contract enter the test matrix
  bool IsTestable() const { return status == GroupStatus::Ready && contract_address.has_value(); }
};

struct TestCase {
  std::string group_id;
  std::string group_name;
  std::string identity_name;
  Operation operation{Operation::Read};
  ExpectedOutcome expected{ExpectedOutcome::Deny};
  ActualOutcome actual;
  Classification classification{Classification::Inconclusive};
  ValueCheck value_check{ValueCheck::NotApplicable};
  bool nondeterministic{false};  // repeated identical reads disagreed
  int repeats{1};
  std::string note;
  std::string leaked_from_group;  // set when a read returned another group's sentinel
};

// A declared group that never entered the test matrix
struct ExcludedGroup {
  std::string name;
  GroupStatus status{GroupStatus::Failed};
  std::string reason;
};

std::string ToString(Operation op);
std::string ToString(ExpectedOutcome expected);
std::string ToString(ActualOutcome::Kind kind);
std::string ToString(Classification classification);
std::string ToString(GroupStatus status);
std::string ToString(ValueCheck check);

}  // namespace harness
}  // namespace pgprobe
