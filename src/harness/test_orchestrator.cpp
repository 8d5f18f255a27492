// Copyright (c) 2025 The pgprobe developers
// Distributed under the MIT software license

#include "harness/test_orchestrator.hpp"

#include "errors.hpp"
#include "harness/authorization_oracle.hpp"
#include "harness/contract_proxy.hpp"
#include "harness/identity_registry.hpp"
#include "harness/sentinel_table.hpp"
#include "network/node_topology.hpp"
#include "util/logging.hpp"

#include <algorithm>
#include <exception>
#include <iterator>
#include <optional>

#include <asio/post.hpp>
#include <asio/thread_pool.hpp>

namespace pgprobe {
namespace harness {

namespace {

TestCase MakeCase(const PrivacyGroup& group, const Identity& identity, Operation op) {
  TestCase tc;
  tc.group_id = group.id;
  tc.group_name = group.name;
  tc.identity_name = identity.name;
  tc.operation = op;
  tc.expected = Expect(group, identity, op);
  return tc;
}

bool SameOutcome(const ActualOutcome& a, const ActualOutcome& b) {
  return a.kind == b.kind && (a.kind != ActualOutcome::Kind::Success || a.value == b.value);
}

std::string Describe(const ActualOutcome& o) {
  return o.IsSuccess() ? "success(" + o.value + ")" : ToString(o.kind);
}

void AppendNote(TestCase& tc, const std::string& text) {
  if (!tc.note.empty())
    tc.note += "; ";
  tc.note += text;
}

struct GroupSlot {
  std::vector<TestCase> cases;
  std::optional<PrivacyGroup> tested;
  std::optional<ExcludedGroup> excluded;
  std::exception_ptr fatal;
};

}  // namespace

TestOrchestrator::TestOrchestrator(const IdentityRegistry& registry, PrivacyGroupManager& groups,
                                   const ContractProxy& proxy, const network::NodeTopology& topology,
                                   const Config& config)
    : registry_(registry), groups_(groups), proxy_(proxy), topology_(topology), config_(config) {}

size_t TestOrchestrator::WorkerCount() const {
  if (config_.max_group_workers > 0) {
    return config_.max_group_workers;
  }
  return std::max<size_t>(1, topology_.ReachableCount());
}

MatrixResult TestOrchestrator::Run(const std::vector<GroupConfig>& declared) {
  MatrixResult result;
  const std::vector<Identity> universe = registry_.Resolved();

  std::vector<std::string> names;
  names.reserve(declared.size());
  for (const auto& g : declared) {
    names.push_back(g.name);
  }
  result.salt = config_.salt != 0 ? config_.salt : SentinelTable::RandomSalt();
  SentinelTable sentinels(names, result.salt);

  LOG_HARNESS_INFO("testing {} groups x {} identities with {} workers", declared.size(), universe.size(),
                   WorkerCount());

  std::vector<GroupSlot> slots(declared.size());
  {
    asio::thread_pool pool(WorkerCount());
    for (size_t i = 0; i < declared.size(); ++i) {
      asio::post(pool, [this, &declared, &universe, &sentinels, &slots, i]() {
        const auto& decl = declared[i];
        auto& slot = slots[i];
        try {
          PrivacyGroup group;
          auto existing = groups_.Find(decl.name);
          if (existing && existing->status == GroupStatus::Ready) {
            LOG_HARNESS_DEBUG("group {} already ready, reusing probe {}", decl.name, *existing->contract_address);
            group = *existing;
          } else {
            if (!existing) {
              std::vector<Identity> members;
              for (const auto& name : decl.members) {
                members.push_back(registry_.Get(name));
              }
              groups_.Create(decl.name, members);
            }
            group = groups_.AwaitReady(decl.name);
          }
          slot.cases = EvaluateGroup(group, universe, sentinels);
          slot.tested = group;
        } catch (const TopologyError& e) {
          LOG_HARNESS_WARN("group {} FAILED (topology): {}; excluded from testing", decl.name, e.what());
          slot.excluded = ExcludedGroup{decl.name, GroupStatus::Failed, e.what()};
        } catch (const ConfirmationTimeoutError& e) {
          slot.excluded = ExcludedGroup{decl.name, GroupStatus::Failed, e.what()};
        } catch (const DeploymentError& e) {
          slot.excluded = ExcludedGroup{decl.name, GroupStatus::Failed, e.what()};
        } catch (...) {
          // Run-fatal; rethrown on the calling thread once the pool is drained
          slot.fatal = std::current_exception();
        }
      });
    }
    pool.join();
  }

  for (auto& slot : slots) {
    if (slot.fatal) {
      std::rethrow_exception(slot.fatal);
    }
  }
  for (auto& slot : slots) {
    if (slot.tested) {
      result.tested.push_back(std::move(*slot.tested));
      std::move(slot.cases.begin(), slot.cases.end(), std::back_inserter(result.cases));
    }
    if (slot.excluded) {
      result.excluded.push_back(std::move(*slot.excluded));
    }
  }

  LOG_HARNESS_INFO("matrix complete: {} cases from {} groups, {} excluded", result.cases.size(),
                   result.tested.size(), result.excluded.size());
  return result;
}

MatrixResult TestOrchestrator::RunReady() {
  std::vector<GroupConfig> ready;
  for (const auto& group : groups_.Groups()) {
    if (group.status == GroupStatus::Ready) {
      ready.push_back(GroupConfig{group.name, group.member_order});
    }
  }
  return Run(ready);
}

std::vector<TestCase> TestOrchestrator::EvaluateGroup(const PrivacyGroup& group, const std::vector<Identity>& universe,
                                                      SentinelTable& sentinels) const {
  std::vector<TestCase> cases;

  const Identity* writer = nullptr;
  for (const auto& name : group.member_order) {
    auto it = std::find_if(universe.begin(), universe.end(), [&](const Identity& id) { return id.name == name; });
    if (it != universe.end()) {
      writer = &*it;
      break;
    }
  }
  if (!writer) {
    LOG_HARNESS_WARN("group {} has no resolved member to write its sentinel", group.name);
    return cases;
  }

  // 1. sentinel write; Write() returns only after the commit barrier
  const uint64_t sentinel = sentinels.Sentinel(group.name);
  TestCase write = MakeCase(group, *writer, Operation::Write);
  write.actual = proxy_.Write(group, *writer, sentinel);
  write.note = "sentinel write";
  if (write.actual.IsSuccess()) {
    sentinels.MarkCommitted(group.name);
    LOG_HARNESS_DEBUG("group {} sentinel {} committed by {}", group.name, sentinel, writer->name);
  } else {
    LOG_HARNESS_WARN("group {} sentinel write by {} not confirmed ({}): reads cannot be verified", group.name,
                     writer->name, write.actual.reason);
  }
  cases.push_back(std::move(write));

  // 2. reads, concurrent across identities
  std::vector<TestCase> reads(universe.size());
  {
    size_t threads = std::max<size_t>(1, std::min(config_.read_concurrency, universe.size()));
    asio::thread_pool read_pool(threads);
    for (size_t i = 0; i < universe.size(); ++i) {
      asio::post(read_pool, [this, &group, &universe, &sentinels, &reads, i]() {
        reads[i] = ReadCase(group, universe[i], sentinels);
      });
    }
    read_pool.join();
  }
  std::move(reads.begin(), reads.end(), std::back_inserter(cases));

  // 3. write probes with throwaway values, after every read has finished
  uint32_t probe = 0;
  for (const auto& identity : universe) {
    if (identity.name == writer->name) {
      continue;
    }
    TestCase tc = MakeCase(group, identity, Operation::Write);
    tc.actual = proxy_.Write(group, identity, sentinels.Throwaway(group.name, probe++));
    tc.note = "throwaway write probe";
    cases.push_back(std::move(tc));
  }

  return cases;
}

TestCase TestOrchestrator::ReadCase(const PrivacyGroup& group, const Identity& identity,
                                    const SentinelTable& sentinels) const {
  TestCase tc = MakeCase(group, identity, Operation::Read);

  const int repeats = std::max(1, config_.read_repeats);
  std::vector<ActualOutcome> outcomes;
  outcomes.reserve(repeats);
  for (int r = 0; r < repeats; ++r) {
    outcomes.push_back(proxy_.Read(group, identity));
  }
  tc.repeats = repeats;

  bool agree = std::all_of(outcomes.begin(), outcomes.end(),
                           [&](const ActualOutcome& o) { return SameOutcome(o, outcomes.front()); });
  auto success = std::find_if(outcomes.begin(), outcomes.end(), [](const ActualOutcome& o) { return o.IsSuccess(); });

  // A single success on a denied-expected read is enough for a breach
  if (tc.expected == ExpectedOutcome::Deny && success != outcomes.end()) {
    tc.actual = *success;
  } else {
    tc.actual = outcomes.front();
  }

  if (!agree) {
    tc.nondeterministic = true;
    std::string seen;
    for (const auto& o : outcomes) {
      if (!seen.empty())
        seen += ", ";
      seen += Describe(o);
    }
    AppendNote(tc, "repeated reads disagreed: " + seen);
  }

  if (tc.actual.IsSuccess()) {
    auto owner = sentinels.OwnerOf(tc.actual.value);
    if (owner && *owner != group.name) {
      tc.value_check = ValueCheck::Leaked;
      tc.leaked_from_group = *owner;
      AppendNote(tc, "returned group " + *owner + "'s sentinel");
    } else if (!sentinels.IsCommitted(group.name)) {
      tc.value_check = ValueCheck::Unverified;
      AppendNote(tc, "sentinel write not confirmed");
    } else if (owner) {
      tc.value_check = ValueCheck::Match;
    } else {
      tc.value_check = ValueCheck::Mismatch;
      AppendNote(tc, "expected sentinel " + std::to_string(sentinels.Sentinel(group.name)) + ", read " +
                         tc.actual.value);
    }
  }

  return tc;
}

}  // namespace harness
}  // namespace pgprobe
