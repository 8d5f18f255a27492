// Copyright (c) 2025 The pgprobe developers
// Distributed under the MIT software license

#include "harness/authorization_oracle.hpp"

namespace pgprobe {
namespace harness {

ExpectedOutcome Expect(const PrivacyGroup& group, const Identity& identity, Operation /*op*/) {
  return group.IsMember(identity.name) ? ExpectedOutcome::Allow : ExpectedOutcome::Deny;
}

}  // namespace harness
}  // namespace pgprobe
