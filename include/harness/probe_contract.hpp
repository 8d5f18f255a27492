// Copyright (c) 2025 The pgprobe developers
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace pgprobe {
namespace harness {
namespace probe {

// The probe contract is a single uint256 slot:
//   constructor()
//   store(uint256 num)            nonpayable
//   retrieve() returns (uint256)  view
// Bytecode comes from the run plan; the ABI fragments are fixed here.

nlohmann::json ConstructorAbi();
nlohmann::json StoreAbi();
nlohmann::json RetrieveAbi();

// Named input object for store(num)
nlohmann::json StoreInput(uint64_t value);

// Normalize a pgroup_call result for retrieve() to a decimal string.
// Accepts {"0": v}, {"num"|"value"|"": v}, single-entry objects, bare
// numbers, decimal strings and 0x-prefixed hex. Returns nullopt when the
// shape is unrecognised.
std::optional<std::string> DecodeRetrieveOutput(const nlohmann::json& result);

// Canonical decimal form of a numeric string ("0x2a" -> "42", "007" -> "7").
// Hex wider than 64 bits is returned lowercased with the prefix kept.
std::optional<std::string> NormalizeUint(const std::string& text);

}  // namespace probe
}  // namespace harness
}  // namespace pgprobe
