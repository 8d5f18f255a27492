// Copyright (c) 2025 The pgprobe developers
// Distributed under the MIT software license

#pragma once

#include "harness/types.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace pgprobe {
namespace harness {

// Exit codes of a completed run
static constexpr int EXIT_CLEAN = 0;
static constexpr int EXIT_FINDINGS = 1;
static constexpr int EXIT_FATAL = 2;

// Counts indexed by Classification
using ClassificationCounts = std::array<size_t, 5>;

struct GroupSummary {
  std::string name;
  std::string id;
  ClassificationCounts counts{};
  size_t total{0};
};

struct Report {
  std::vector<TestCase> cases;  // findings first (see SortCases)
  std::vector<GroupSummary> groups;
  ClassificationCounts totals{};
  std::vector<ExcludedGroup> excluded;
  bool clean{false};
  int64_t generated_at{0};
};

// Expected vs actual -> classification.
//   Deny  + Success                         -> Breach (even if the value leaked)
//   Deny  + Denied                          -> Pass
//   Allow + Success, value checks out       -> Pass
//   Allow + Success, other group's sentinel -> Leakage
//   Allow + Denied                          -> UnexpectedDenial
//   anything through TransportError, a value mismatch, an unverified
//   sentinel or disagreeing repeats         -> Inconclusive
Classification Classify(const TestCase& tc);

// Severity rank for ordering: Breach, Leakage, Inconclusive, UnexpectedDenial, Pass
int Severity(Classification c);

void SortCases(std::vector<TestCase>& cases);

// Classify every case, sort, aggregate per group and overall.
Report BuildReport(std::vector<TestCase> cases, std::vector<ExcludedGroup> excluded);

std::string RenderText(const Report& report);
nlohmann::json ToJson(const Report& report);

// Atomically write the JSON report. Returns false on I/O failure.
bool WriteJson(const Report& report, const std::string& path);

inline int ExitCode(const Report& report) { return report.clean ? EXIT_CLEAN : EXIT_FINDINGS; }

inline size_t Count(const ClassificationCounts& counts, Classification c) { return counts[static_cast<size_t>(c)]; }

}  // namespace harness
}  // namespace pgprobe
