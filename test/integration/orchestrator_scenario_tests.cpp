#include <catch2/catch_test_macros.hpp>

#include "errors.hpp"
#include "harness/reporter.hpp"
#include "harness/sentinel_table.hpp"
#include "infra/simulated_deployment.hpp"

#include <algorithm>
#include <string>

using namespace pgprobe;
using namespace pgprobe::harness;
using pgprobe::test::SimulatedDeployment;

namespace {

// alice@node1, bob@node2, carol@node1, dave@node3
void Populate(SimulatedDeployment& d) {
    d.AddIdentity("alice", "node1");
    d.AddIdentity("bob", "node2");
    d.AddIdentity("carol", "node1");
    d.AddIdentity("dave", "node3");
}

const TestCase& Find(const std::vector<TestCase>& cases, const std::string& group, const std::string& identity,
                     Operation op) {
    auto it = std::find_if(cases.begin(), cases.end(), [&](const TestCase& tc) {
        return tc.group_name == group && tc.identity_name == identity && tc.operation == op;
    });
    REQUIRE(it != cases.end());
    return *it;
}

size_t CasesFor(const std::vector<TestCase>& cases, const std::string& group) {
    return static_cast<size_t>(
        std::count_if(cases.begin(), cases.end(), [&](const TestCase& tc) { return tc.group_name == group; }));
}

}  // namespace

TEST_CASE("Scenario: correct platform yields a clean report", "[scenario]") {
    SimulatedDeployment d;
    Populate(d);
    d.Start();

    auto matrix = d.orchestrator->Run({{"g1", {"alice", "bob"}}, {"g2", {"carol"}}});
    REQUIRE(matrix.excluded.empty());
    REQUIRE(matrix.tested.size() == 2);
    // 1 sentinel write + 4 reads + 3 write probes per group
    REQUIRE(CasesFor(matrix.cases, "g1") == 8);
    REQUIRE(CasesFor(matrix.cases, "g2") == 8);

    const auto& sentinel = matrix.cases.front();
    REQUIRE(sentinel.group_name == "g1");
    REQUIRE(sentinel.identity_name == "alice");
    REQUIRE(sentinel.operation == Operation::Write);
    REQUIRE(sentinel.note == "sentinel write");
    REQUIRE(sentinel.actual.IsSuccess());

    // Scenario A: X writes, Y reads the same value back
    SentinelTable sentinels({"g1", "g2"}, matrix.salt);
    const auto& bob_read = Find(matrix.cases, "g1", "bob", Operation::Read);
    REQUIRE(bob_read.expected == ExpectedOutcome::Allow);
    REQUIRE(bob_read.actual.value == std::to_string(sentinels.Sentinel("g1")));
    REQUIRE(bob_read.value_check == ValueCheck::Match);
    REQUIRE(bob_read.repeats == DEFAULT_READ_REPEATS);

    const auto& carol_read = Find(matrix.cases, "g1", "carol", Operation::Read);
    REQUIRE(carol_read.expected == ExpectedOutcome::Deny);
    REQUIRE(carol_read.actual.IsDenied());

    const auto& bob_probe = Find(matrix.cases, "g1", "bob", Operation::Write);
    REQUIRE(bob_probe.note == "throwaway write probe");
    REQUIRE(bob_probe.actual.IsSuccess());

    auto report = BuildReport(matrix.cases, matrix.excluded);
    REQUIRE(report.clean);
    REQUIRE(Count(report.totals, Classification::Pass) == 16);
    REQUIRE(ExitCode(report) == EXIT_CLEAN);
}

TEST_CASE("Scenario: same-node non-member access is a breach", "[scenario]") {
    SimulatedDeployment d;
    Populate(d);
    d.platform->SetNodeLevelMembership(true);
    d.Start();

    auto matrix = d.orchestrator->Run({{"g1", {"alice", "bob"}}});
    auto report = BuildReport(matrix.cases, matrix.excluded);

    // Scenario B: carol shares node1 with alice
    REQUIRE_FALSE(report.clean);
    REQUIRE(Count(report.totals, Classification::Breach) == 2);
    REQUIRE(report.cases[0].classification == Classification::Breach);
    REQUIRE(report.cases[0].identity_name == "carol");
    REQUIRE(report.cases[1].classification == Classification::Breach);
    REQUIRE(report.cases[1].identity_name == "carol");

    // dave's node hosts no member, so the defect does not reach him
    REQUIRE(Find(report.cases, "g1", "dave", Operation::Read).classification == Classification::Pass);
}

TEST_CASE("Scenario: targeted bypass on another node", "[scenario]") {
    SimulatedDeployment d;
    Populate(d);
    d.platform->GrantBypass("g1", "dave");
    d.Start();

    auto matrix = d.orchestrator->Run({{"g1", {"alice", "bob"}}});
    auto report = BuildReport(matrix.cases, matrix.excluded);

    REQUIRE(Find(report.cases, "g1", "dave", Operation::Read).classification == Classification::Breach);
    REQUIRE(Find(report.cases, "g1", "dave", Operation::Write).classification == Classification::Breach);
    REQUIRE(Find(report.cases, "g1", "carol", Operation::Read).classification == Classification::Pass);
    REQUIRE(ExitCode(report) == EXIT_FINDINGS);
}

TEST_CASE("Scenario: group naming an unreachable node's identity is excluded", "[scenario]") {
    SimulatedDeployment d;
    Populate(d);
    d.platform->SetUnreachable("node3");
    d.Start();

    auto matrix = d.orchestrator->Run({{"g1", {"alice", "bob"}}, {"g3", {"alice", "dave"}}});

    // Scenario C
    REQUIRE(matrix.tested.size() == 1);
    REQUIRE(matrix.excluded.size() == 1);
    REQUIRE(matrix.excluded[0].name == "g3");
    REQUIRE(matrix.excluded[0].reason.find("node3") != std::string::npos);
    REQUIRE(CasesFor(matrix.cases, "g3") == 0);
    REQUIRE(d.platform->CallCount("pgroup_createGroup") == 1);

    // dave is outside the universe: 1 + 3 reads + 2 probes
    REQUIRE(CasesFor(matrix.cases, "g1") == 6);

    auto report = BuildReport(matrix.cases, matrix.excluded);
    REQUIRE(report.clean);
    REQUIRE(RenderText(report).find("Excluded groups (not tested):") != std::string::npos);
}

TEST_CASE("Scenario: group that never confirms contributes no cases", "[scenario]") {
    SimulatedDeployment d;
    d.group_config.ready_timeout = std::chrono::milliseconds(40);
    Populate(d);
    d.platform->SetNeverReady("g2");
    d.Start();

    auto matrix = d.orchestrator->Run({{"g1", {"alice", "bob"}}, {"g2", {"carol"}}});

    // Scenario D
    REQUIRE(matrix.excluded.size() == 1);
    REQUIRE(matrix.excluded[0].name == "g2");
    REQUIRE(matrix.excluded[0].status == GroupStatus::Failed);
    REQUIRE(matrix.excluded[0].reason.find("not confirmed") != std::string::npos);
    REQUIRE(CasesFor(matrix.cases, "g2") == 0);
    REQUIRE(CasesFor(matrix.cases, "g1") == 8);
    REQUIRE(d.groups->Find("g2")->status == GroupStatus::Failed);

    auto report = BuildReport(matrix.cases, matrix.excluded);
    REQUIRE(Count(report.totals, Classification::Breach) == 0);
    REQUIRE(report.clean);
}

TEST_CASE("Scenario: another group's sentinel read back is leakage", "[scenario]") {
    SimulatedDeployment d;
    // Sequential groups: alpha is complete before beta is read
    d.orchestrator_config.max_group_workers = 1;
    Populate(d);
    d.platform->LeakStorage("alpha", "beta");
    d.Start();

    auto matrix = d.orchestrator->Run({{"alpha", {"alice"}}, {"beta", {"bob"}}});
    auto report = BuildReport(matrix.cases, matrix.excluded);

    const auto& leaked = Find(report.cases, "beta", "bob", Operation::Read);
    REQUIRE(leaked.classification == Classification::Leakage);
    REQUIRE(leaked.value_check == ValueCheck::Leaked);
    REQUIRE(leaked.leaked_from_group == "alpha");
    REQUIRE(report.cases[0].classification == Classification::Leakage);
    REQUIRE(ExitCode(report) == EXIT_FINDINGS);

    auto j = ToJson(report);
    REQUIRE(j["cases"][0]["leaked_from_group"] == "alpha");
}

TEST_CASE("Scenario: disagreeing repeated reads", "[scenario]") {
    SimulatedDeployment d;
    Populate(d);
    d.platform->SetFlakyRead("g1", "carol");
    d.platform->SetFlakyRead("g1", "bob");
    d.Start();

    auto matrix = d.orchestrator->Run({{"g1", {"alice", "bob"}}});
    auto report = BuildReport(matrix.cases, matrix.excluded);

    // Non-member: one success among the repeats is enough
    const auto& carol = Find(report.cases, "g1", "carol", Operation::Read);
    REQUIRE(carol.nondeterministic);
    REQUIRE(carol.classification == Classification::Breach);
    REQUIRE(carol.note.find("repeated reads disagreed") != std::string::npos);

    // Member: cannot be verified either way
    const auto& bob = Find(report.cases, "g1", "bob", Operation::Read);
    REQUIRE(bob.nondeterministic);
    REQUIRE(bob.classification == Classification::Inconclusive);
}

TEST_CASE("Scenario: unconfirmed sentinel leaves reads unverified", "[scenario]") {
    SimulatedDeployment d;
    d.receipt_config.timeout = std::chrono::milliseconds(30);
    Populate(d);
    d.platform->SetNeverConfirmWrites(true);
    d.Start();

    auto matrix = d.orchestrator->Run({{"g1", {"alice", "bob"}}});
    auto report = BuildReport(matrix.cases, matrix.excluded);

    const auto& write = Find(report.cases, "g1", "alice", Operation::Write);
    REQUIRE(write.actual.IsTransportError());
    REQUIRE(write.classification == Classification::Inconclusive);

    const auto& read = Find(report.cases, "g1", "bob", Operation::Read);
    REQUIRE(read.actual.IsSuccess());
    REQUIRE(read.value_check == ValueCheck::Unverified);
    REQUIRE(read.classification == Classification::Inconclusive);

    // Denials are still meaningful
    REQUIRE(Find(report.cases, "g1", "carol", Operation::Read).classification == Classification::Pass);
    REQUIRE_FALSE(report.clean);
}

TEST_CASE("Scenario: unrecognised refusals are inconclusive, not passes", "[scenario]") {
    SimulatedDeployment d;
    Populate(d);
    d.platform->SetDenialStyle(pgprobe::test::SimulatedPlatform::DenialStyle::Unrecognised);
    d.Start();

    auto matrix = d.orchestrator->Run({{"g1", {"alice", "bob"}}});
    auto report = BuildReport(matrix.cases, matrix.excluded);

    REQUIRE(Find(report.cases, "g1", "carol", Operation::Read).classification == Classification::Inconclusive);
    REQUIRE(Find(report.cases, "g1", "alice", Operation::Read).classification == Classification::Pass);
    REQUIRE_FALSE(report.clean);
}

TEST_CASE("Scenario: re-running against the same ready groups is repeatable", "[scenario]") {
    SimulatedDeployment d;
    d.orchestrator_config.salt = 0xfeed1234;
    Populate(d);
    // carol shares node1 with alice, so g1 carries a breach on every run
    d.platform->SetNodeLevelMembership(true);
    d.platform->SetNeverReady("g3");
    d.Start();

    const std::vector<GroupConfig> declared = {
        {"g1", {"alice", "bob"}}, {"g2", {"bob", "dave"}}, {"g3", {"alice"}}};
    auto first_matrix = d.orchestrator->Run(declared);
    REQUIRE(first_matrix.salt == 0xfeed1234);
    REQUIRE(first_matrix.tested.size() == 2);
    REQUIRE(first_matrix.excluded.size() == 1);
    auto first = BuildReport(first_matrix.cases, first_matrix.excluded);
    REQUIRE(Find(first.cases, "g1", "carol", Operation::Read).classification == Classification::Breach);

    auto compare = [&](const Report& again) {
        REQUIRE(again.cases.size() == first.cases.size());
        for (size_t i = 0; i < first.cases.size(); ++i) {
            REQUIRE(again.cases[i].group_name == first.cases[i].group_name);
            REQUIRE(again.cases[i].identity_name == first.cases[i].identity_name);
            REQUIRE(again.cases[i].operation == first.cases[i].operation);
            REQUIRE(again.cases[i].classification == first.cases[i].classification);
            REQUIRE(again.cases[i].actual.value == first.cases[i].actual.value);
        }
    };

    SECTION("Same declaration reuses the groups and their contracts") {
        auto matrix = d.orchestrator->Run(declared);
        REQUIRE(matrix.excluded.size() == 1);
        REQUIRE(matrix.excluded.front().name == "g3");
        REQUIRE(matrix.tested.size() == 2);
        for (size_t i = 0; i < matrix.tested.size(); ++i) {
            REQUIRE(matrix.tested[i].contract_address == first_matrix.tested[i].contract_address);
        }
        compare(BuildReport(matrix.cases, matrix.excluded));
        REQUIRE(d.platform->CallCount("pgroup_createGroup") == 3);
    }

    SECTION("RunReady covers only the ready groups") {
        auto matrix = d.orchestrator->RunReady();
        REQUIRE(matrix.excluded.empty());
        REQUIRE(matrix.tested.size() == 2);
        auto again = BuildReport(matrix.cases, matrix.excluded);
        REQUIRE(again.excluded.empty());
        compare(again);
        REQUIRE(d.platform->CallCount("pgroup_createGroup") == 3);
    }
}

TEST_CASE("Scenario: run-fatal errors escape the worker pool", "[scenario]") {
    SimulatedDeployment d;
    Populate(d);
    d.Start();

    REQUIRE(d.orchestrator->WorkerCount() == 3);
    REQUIRE_THROWS_AS(d.orchestrator->Run({{"g1", {"alice"}}, {"g2", {"nobody"}}}), ConfigError);
}
