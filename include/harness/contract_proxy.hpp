// Copyright (c) 2025 The pgprobe developers
// Distributed under the MIT software license

#pragma once

#include "harness/privacy_group_manager.hpp"
#include "harness/types.hpp"

#include <cstdint>
#include <string>

namespace pgprobe {

namespace network {
class RpcGateway;
}

namespace harness {

class ReceiptPoller;

/**
 * ContractProxy - store()/retrieve() against a group's probe contract, sent
 * from a given identity through its home node.
 *
 * Stateless: the group is a plain value carrying id and contract address,
 * the connection comes from the identity. Outcomes map as
 *   gateway Ok + confirmed receipt / decoded value -> Success
 *   gateway Rejected or denial-classified receipt   -> Denied
 *   everything else                                 -> TransportError
 *
 * Write() includes the commit barrier: it only returns Success once the
 * receipt is confirmed.
 */
class ContractProxy {
public:
  struct Config {
    std::string domain;
    IdentityRef identity_ref;

    Config() : domain(DEFAULT_DOMAIN), identity_ref(IdentityRef::Address) {}
  };

  ContractProxy(network::RpcGateway& gateway, const ReceiptPoller& receipts, const Config& config = Config{});

  ActualOutcome Write(const PrivacyGroup& group, const Identity& identity, uint64_t value) const;
  ActualOutcome Read(const PrivacyGroup& group, const Identity& identity) const;

private:
  std::string Ref(const Identity& identity) const;

  network::RpcGateway& gateway_;
  const ReceiptPoller& receipts_;
  Config config_;
};

}  // namespace harness
}  // namespace pgprobe
