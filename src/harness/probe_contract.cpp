// Copyright (c) 2025 The pgprobe developers
// Distributed under the MIT software license

#include "harness/probe_contract.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace pgprobe {
namespace harness {
namespace probe {

nlohmann::json ConstructorAbi() {
  return {{"type", "constructor"}, {"inputs", nlohmann::json::array()}, {"stateMutability", "nonpayable"}};
}

nlohmann::json StoreAbi() {
  return {{"type", "function"},
          {"name", "store"},
          {"inputs", nlohmann::json::array({{{"name", "num"}, {"type", "uint256"}, {"internalType", "uint256"}}})},
          {"outputs", nlohmann::json::array()},
          {"stateMutability", "nonpayable"}};
}

nlohmann::json RetrieveAbi() {
  return {{"type", "function"},
          {"name", "retrieve"},
          {"inputs", nlohmann::json::array()},
          {"outputs", nlohmann::json::array({{{"name", ""}, {"type", "uint256"}, {"internalType", "uint256"}}})},
          {"stateMutability", "view"}};
}

nlohmann::json StoreInput(uint64_t value) {
  // uint256 travels as a decimal string; JSON numbers lose precision past 2^53
  return {{"num", std::to_string(value)}};
}

std::optional<std::string> NormalizeUint(const std::string& text) {
  if (text.empty()) {
    return std::nullopt;
  }

  if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
    std::string digits = text.substr(2);
    if (!std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isxdigit(c); })) {
      return std::nullopt;
    }
    size_t first = digits.find_first_not_of('0');
    if (first == std::string::npos) {
      return std::string("0");
    }
    digits = digits.substr(first);
    if (digits.size() > 16) {
      std::transform(digits.begin(), digits.end(), digits.begin(), [](unsigned char c) { return std::tolower(c); });
      return "0x" + digits;
    }
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value, 16);
    if (ec != std::errc() || ptr != digits.data() + digits.size()) {
      return std::nullopt;
    }
    return std::to_string(value);
  }

  if (!std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
    return std::nullopt;
  }
  size_t first = text.find_first_not_of('0');
  if (first == std::string::npos) {
    return std::string("0");
  }
  return text.substr(first);
}

std::optional<std::string> DecodeRetrieveOutput(const nlohmann::json& result) {
  if (result.is_number_unsigned()) {
    return std::to_string(result.get<uint64_t>());
  }
  if (result.is_number_integer()) {
    int64_t v = result.get<int64_t>();
    if (v < 0)
      return std::nullopt;
    return std::to_string(v);
  }
  if (result.is_string()) {
    return NormalizeUint(result.get<std::string>());
  }
  if (result.is_array() && result.size() == 1) {
    return DecodeRetrieveOutput(result[0]);
  }
  if (result.is_object()) {
    for (const char* key : {"0", "num", "value", ""}) {
      auto it = result.find(key);
      if (it != result.end()) {
        return DecodeRetrieveOutput(*it);
      }
    }
    if (result.size() == 1) {
      return DecodeRetrieveOutput(result.begin().value());
    }
  }
  return std::nullopt;
}

}  // namespace probe
}  // namespace harness
}  // namespace pgprobe
