// Copyright (c) 2025 The pgprobe developers
// Distributed under the MIT software license

#include "harness/types.hpp"

namespace pgprobe {
namespace harness {

ActualOutcome ActualOutcome::Success(std::string value, std::string tx_id) {
  ActualOutcome o;
  o.kind = Kind::Success;
  o.value = std::move(value);
  o.tx_id = std::move(tx_id);
  return o;
}

ActualOutcome ActualOutcome::Denied(std::string reason, bool pattern_matched) {
  ActualOutcome o;
  o.kind = Kind::Denied;
  o.reason = std::move(reason);
  o.pattern_matched = pattern_matched;
  return o;
}

ActualOutcome ActualOutcome::TransportError(std::string reason) {
  ActualOutcome o;
  o.kind = Kind::TransportError;
  o.reason = std::move(reason);
  return o;
}

std::string ToString(Operation op) {
  switch (op) {
  case Operation::Write:
    return "write";
  case Operation::Read:
    return "read";
  default:
    return "unknown";
  }
}

std::string ToString(ExpectedOutcome expected) {
  switch (expected) {
  case ExpectedOutcome::Allow:
    return "allow";
  case ExpectedOutcome::Deny:
    return "deny";
  default:
    return "unknown";
  }
}

std::string ToString(ActualOutcome::Kind kind) {
  switch (kind) {
  case ActualOutcome::Kind::Success:
    return "success";
  case ActualOutcome::Kind::Denied:
    return "denied";
  case ActualOutcome::Kind::TransportError:
    return "transport-error";
  default:
    return "unknown";
  }
}

std::string ToString(Classification classification) {
  switch (classification) {
  case Classification::Pass:
    return "PASS";
  case Classification::UnexpectedDenial:
    return "UNEXPECTED_DENIAL";
  case Classification::Breach:
    return "BREACH";
  case Classification::Leakage:
    return "LEAKAGE";
  case Classification::Inconclusive:
    return "INCONCLUSIVE";
  default:
    return "UNKNOWN";
  }
}

std::string ToString(GroupStatus status) {
  switch (status) {
  case GroupStatus::Creating:
    return "creating";
  case GroupStatus::Ready:
    return "ready";
  case GroupStatus::Failed:
    return "failed";
  default:
    return "unknown";
  }
}

std::string ToString(ValueCheck check) {
  switch (check) {
  case ValueCheck::NotApplicable:
    return "n/a";
  case ValueCheck::Match:
    return "match";
  case ValueCheck::Mismatch:
    return "mismatch";
  case ValueCheck::Leaked:
    return "leaked";
  case ValueCheck::Unverified:
    return "unverified";
  default:
    return "unknown";
  }
}

}  // namespace harness
}  // namespace pgprobe
