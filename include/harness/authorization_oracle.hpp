// Copyright (c) 2025 The pgprobe developers
// Distributed under the MIT software license

#pragma once

#include "harness/types.hpp"

namespace pgprobe {
namespace harness {

// Expected decision for (group, identity, op): Allow iff the identity is a
// declared member, for both operations. No I/O. This is the reference the
// platform is checked against, so it must never consult the platform.
ExpectedOutcome Expect(const PrivacyGroup& group, const Identity& identity, Operation op);

}  // namespace harness
}  // namespace pgprobe
