// Copyright (c) 2025 The pgprobe developers
// Distributed under the MIT software license

#include "harness/reporter.hpp"

#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"

#include <algorithm>
#include <map>
#include <tuple>

namespace pgprobe {
namespace harness {

namespace {

constexpr Classification ALL_CLASSIFICATIONS[] = {Classification::Breach, Classification::Leakage,
                                                   Classification::Inconclusive, Classification::UnexpectedDenial,
                                                   Classification::Pass};

bool IsFinding(Classification c) {
  return c == Classification::Breach || c == Classification::Leakage || c == Classification::Inconclusive;
}

std::string DescribeActual(const ActualOutcome& actual) {
  switch (actual.kind) {
  case ActualOutcome::Kind::Success:
    return actual.value.empty() ? "success" : "success(" + actual.value + ")";
  case ActualOutcome::Kind::Denied:
    return "denied(" + actual.reason + ")";
  case ActualOutcome::Kind::TransportError:
    return "transport-error(" + actual.reason + ")";
  default:
    return "unknown";
  }
}

std::string FormatCounts(const ClassificationCounts& counts) {
  return fmt::format("breach={} leakage={} inconclusive={} unexpected_denial={} pass={}",
                     Count(counts, Classification::Breach), Count(counts, Classification::Leakage),
                     Count(counts, Classification::Inconclusive), Count(counts, Classification::UnexpectedDenial),
                     Count(counts, Classification::Pass));
}

nlohmann::json CountsToJson(const ClassificationCounts& counts) {
  nlohmann::json j = nlohmann::json::object();
  for (auto c : ALL_CLASSIFICATIONS) {
    j[ToString(c)] = Count(counts, c);
  }
  return j;
}

}  // namespace

Classification Classify(const TestCase& tc) {
  const auto& actual = tc.actual;

  if (tc.expected == ExpectedOutcome::Deny) {
    if (actual.IsSuccess()) {
      return Classification::Breach;
    }
    if (tc.nondeterministic || actual.IsTransportError()) {
      return Classification::Inconclusive;
    }
    return Classification::Pass;
  }

  if (actual.IsTransportError() || tc.nondeterministic) {
    return Classification::Inconclusive;
  }
  if (actual.IsDenied()) {
    return Classification::UnexpectedDenial;
  }
  switch (tc.value_check) {
  case ValueCheck::Leaked:
    return Classification::Leakage;
  case ValueCheck::Mismatch:
  case ValueCheck::Unverified:
    return Classification::Inconclusive;
  case ValueCheck::Match:
  case ValueCheck::NotApplicable:
    break;
  }
  return Classification::Pass;
}

int Severity(Classification c) {
  switch (c) {
  case Classification::Breach:
    return 0;
  case Classification::Leakage:
    return 1;
  case Classification::Inconclusive:
    return 2;
  case Classification::UnexpectedDenial:
    return 3;
  case Classification::Pass:
    return 4;
  }
  return 5;
}

void SortCases(std::vector<TestCase>& cases) {
  std::stable_sort(cases.begin(), cases.end(), [](const TestCase& a, const TestCase& b) {
    return std::make_tuple(Severity(a.classification), a.group_name, a.identity_name, static_cast<int>(a.operation)) <
           std::make_tuple(Severity(b.classification), b.group_name, b.identity_name, static_cast<int>(b.operation));
  });
}

Report BuildReport(std::vector<TestCase> cases, std::vector<ExcludedGroup> excluded) {
  Report report;
  report.generated_at = util::GetTime();
  report.excluded = std::move(excluded);

  std::map<std::string, GroupSummary> per_group;
  for (auto& tc : cases) {
    tc.classification = Classify(tc);
    auto idx = static_cast<size_t>(tc.classification);
    report.totals[idx]++;

    auto& summary = per_group[tc.group_name];
    summary.name = tc.group_name;
    summary.id = tc.group_id;
    summary.counts[idx]++;
    summary.total++;
  }

  SortCases(cases);
  report.cases = std::move(cases);
  for (auto& [name, summary] : per_group) {
    report.groups.push_back(std::move(summary));
  }

  report.clean = Count(report.totals, Classification::Breach) == 0 &&
                 Count(report.totals, Classification::Leakage) == 0 &&
                 Count(report.totals, Classification::Inconclusive) == 0;

  for (const auto& tc : report.cases) {
    if (tc.classification == Classification::Breach) {
      LOG_REPORT_ERROR("BREACH: {} {} on group {} expected deny, got {}", tc.identity_name, ToString(tc.operation),
                       tc.group_name, DescribeActual(tc.actual));
    } else if (tc.classification == Classification::Leakage) {
      LOG_REPORT_ERROR("LEAKAGE: {} read group {}'s sentinel from group {}", tc.identity_name, tc.leaked_from_group,
                       tc.group_name);
    }
  }
  return report;
}

std::string RenderText(const Report& report) {
  std::string out;
  out += fmt::format("pgprobe authorization report ({})\n", util::FormatTime(report.generated_at));
  out += fmt::format("Result: {}\n", report.clean ? "CLEAN - declared membership verified" : "FINDINGS - not verified");
  out += fmt::format("Overall: {} test cases, {}\n", report.cases.size(), FormatCounts(report.totals));

  bool any_finding = false;
  for (const auto& tc : report.cases) {
    if (!IsFinding(tc.classification) && tc.classification != Classification::UnexpectedDenial) {
      continue;
    }
    if (!any_finding) {
      out += "\nFindings:\n";
      any_finding = true;
    }
    out += fmt::format("  [{}] group={} identity={} op={} expected={} actual={}", ToString(tc.classification),
                       tc.group_name, tc.identity_name, ToString(tc.operation), ToString(tc.expected),
                       DescribeActual(tc.actual));
    if (!tc.note.empty()) {
      out += " note=\"" + tc.note + "\"";
    }
    out += "\n";
  }

  if (!report.groups.empty()) {
    out += "\nPer group:\n";
    for (const auto& g : report.groups) {
      out += fmt::format("  {} ({}): {} cases, {}\n", g.name, g.id, g.total, FormatCounts(g.counts));
    }
  }

  if (!report.excluded.empty()) {
    out += "\nExcluded groups (not tested):\n";
    for (const auto& e : report.excluded) {
      out += fmt::format("  {} [{}]: {}\n", e.name, ToString(e.status), e.reason);
    }
  }

  out += "\nAll test cases:\n";
  for (const auto& tc : report.cases) {
    out += fmt::format("  {:<17} {:<20} {:<16} {:<5} {:<5} {}\n", ToString(tc.classification), tc.group_name,
                       tc.identity_name, ToString(tc.operation), ToString(tc.expected), DescribeActual(tc.actual));
  }
  return out;
}

nlohmann::json ToJson(const Report& report) {
  nlohmann::json j;
  j["generated_at"] = util::FormatTime(report.generated_at);
  j["clean"] = report.clean;
  j["totals"] = CountsToJson(report.totals);

  j["groups"] = nlohmann::json::array();
  for (const auto& g : report.groups) {
    j["groups"].push_back({{"name", g.name}, {"id", g.id}, {"total", g.total}, {"counts", CountsToJson(g.counts)}});
  }

  j["excluded_groups"] = nlohmann::json::array();
  for (const auto& e : report.excluded) {
    j["excluded_groups"].push_back({{"name", e.name}, {"status", ToString(e.status)}, {"reason", e.reason}});
  }

  j["cases"] = nlohmann::json::array();
  for (const auto& tc : report.cases) {
    nlohmann::json c = {{"group", tc.group_name},
                        {"group_id", tc.group_id},
                        {"identity", tc.identity_name},
                        {"operation", ToString(tc.operation)},
                        {"expected", ToString(tc.expected)},
                        {"actual", ToString(tc.actual.kind)},
                        {"classification", ToString(tc.classification)},
                        {"value_check", ToString(tc.value_check)},
                        {"repeats", tc.repeats}};
    if (!tc.actual.value.empty())
      c["value"] = tc.actual.value;
    if (!tc.actual.reason.empty())
      c["reason"] = tc.actual.reason;
    if (!tc.actual.tx_id.empty())
      c["tx_id"] = tc.actual.tx_id;
    if (tc.actual.IsDenied())
      c["denial_source"] = tc.actual.pattern_matched ? "message" : "code";
    if (tc.nondeterministic)
      c["nondeterministic"] = true;
    if (!tc.leaked_from_group.empty())
      c["leaked_from_group"] = tc.leaked_from_group;
    if (!tc.note.empty())
      c["note"] = tc.note;
    j["cases"].push_back(std::move(c));
  }
  return j;
}

bool WriteJson(const Report& report, const std::string& path) {
  if (!util::atomic_write_file(path, ToJson(report).dump(2) + "\n")) {
    LOG_REPORT_ERROR("failed to write report to {}", path);
    return false;
  }
  LOG_REPORT_INFO("report written to {}", path);
  return true;
}

}  // namespace harness
}  // namespace pgprobe
