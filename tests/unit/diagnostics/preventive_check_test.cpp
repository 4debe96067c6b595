#include <gtest/gtest.h>

#include "common/fakes.h"

#include <nimbus/diagnostics/PreventiveCheckOrchestrator.h>

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

using namespace nimbus;
using namespace nimbus::diagnostics;

namespace {

class PreventiveCheckTest : public ::testing::Test {
protected:
    void SetUp() override {
        orchestrator.progress().subscribe(
            [this](const PreventiveCheckProgress& p) { progress.push_back(p); });
    }

    bool anyContains(const std::vector<std::string>& lines, const std::string& needle) {
        return std::any_of(lines.begin(), lines.end(), [&](const std::string& l) {
            return l.find(needle) != std::string::npos;
        });
    }

    static EngineConfig withPorts(std::shared_ptr<ILocalPortInspector> ports) {
        EngineConfig config;
        config.checks.ports = std::move(ports);
        return config;
    }

    bool hasCheck(const StageReport& stage, const std::string& name) {
        return std::any_of(stage.checks.begin(), stage.checks.end(),
                           [&](const CheckReport& c) { return c.name == name; });
    }

    std::shared_ptr<test::FakeFacts> facts = std::make_shared<test::FakeFacts>();
    std::shared_ptr<test::FakePortInspector> ports = std::make_shared<test::FakePortInspector>();
    DiagnosticEngine engine{facts, withPorts(ports)};
    PreventiveCheckOrchestrator orchestrator{engine};
    std::vector<PreventiveCheckProgress> progress;
};

} // namespace

TEST_F(PreventiveCheckTest, ReadyWhenEveryPrerequisiteHolds) {
    auto result = orchestrator.run("i-0abc");
    EXPECT_EQ(result.status, PreventiveStatus::Ready);
    EXPECT_TRUE(result.authoritative);
    EXPECT_FALSE(result.shouldAbortConnection);
    EXPECT_EQ(result.likelihood.percentage, 95);
    ASSERT_EQ(result.stages.size(), 4u);
    for (const auto& stage : result.stages) {
        EXPECT_EQ(stage.status, CheckStatus::Completed);
    }
    EXPECT_TRUE(result.troubleshooting.empty());
    EXPECT_TRUE(result.suggestedCommands.empty());
    ASSERT_EQ(result.recommendations.size(), 1u);
}

TEST_F(PreventiveCheckTest, ProgressIsReportedPerStage) {
    orchestrator.run("i-0abc");
    ASSERT_EQ(progress.size(), 4u);
    EXPECT_EQ(progress[0].stage, "instance_state");
    EXPECT_EQ(progress[1].stage, "agent_registration");
    EXPECT_EQ(progress[2].stage, "permissions");
    EXPECT_EQ(progress[3].stage, "network");
    for (std::size_t i = 0; i < progress.size(); ++i) {
        EXPECT_EQ(progress[i].index, i + 1);
        EXPECT_EQ(progress[i].total, 4u);
        EXPECT_EQ(progress[i].target, "i-0abc");
    }
    // Interim findings accumulate.
    EXPECT_LT(progress[0].findings.size(), progress[3].findings.size());
}

TEST_F(PreventiveCheckTest, CriticalAgentFindingAbortsRemainingStages) {
    facts->setAgent(test::FakeFacts::unregistered());

    auto result = orchestrator.run("i-0abc");
    EXPECT_EQ(result.status, PreventiveStatus::Aborted);
    EXPECT_TRUE(result.shouldAbortConnection);
    EXPECT_FALSE(result.authoritative);

    ASSERT_EQ(result.stages.size(), 4u);
    EXPECT_EQ(result.stages[0].status, CheckStatus::Completed);
    EXPECT_EQ(result.stages[1].status, CheckStatus::Completed);
    EXPECT_EQ(result.stages[2].status, CheckStatus::Skipped);
    EXPECT_EQ(result.stages[3].status, CheckStatus::Skipped);
    for (const auto& check : result.stages[2].checks) {
        EXPECT_EQ(check.status, CheckStatus::Skipped);
    }
    EXPECT_EQ(progress.size(), 2u);

    ASSERT_TRUE(result.troubleshooting.count(CheckCategory::Agent));
    EXPECT_NE(result.troubleshooting.at(CheckCategory::Agent).find("1) "), std::string::npos);
    EXPECT_TRUE(anyContains(result.suggestedCommands, "describe-instance-information"));
    EXPECT_EQ(result.likelihood.percentage, 10);
}

TEST_F(PreventiveCheckTest, WithoutAbortEveryStageRuns) {
    facts->setInstanceState(InstanceState::Terminated);

    PreventiveOptions options;
    options.abortOnCritical = false;
    auto result = orchestrator.run("i-0abc", options);

    EXPECT_EQ(result.status, PreventiveStatus::Critical);
    EXPECT_TRUE(result.shouldAbortConnection);
    EXPECT_TRUE(result.authoritative);
    EXPECT_EQ(progress.size(), 4u);
    for (const auto& stage : result.stages) {
        EXPECT_EQ(stage.status, CheckStatus::Completed);
    }
}

TEST_F(PreventiveCheckTest, ErrorFindingDowngradesToWarning) {
    facts->denyPermission("ssm:StartSession");

    auto result = orchestrator.run("i-0abc");
    EXPECT_EQ(result.status, PreventiveStatus::Warning);
    EXPECT_FALSE(result.shouldAbortConnection);
    EXPECT_TRUE(result.authoritative);
    EXPECT_EQ(result.likelihood.percentage, 40);
    EXPECT_EQ(result.likelihood.blockingIssues.size(), 1u);

    EXPECT_TRUE(anyContains(result.recommendations, "ssm:StartSession"));
    ASSERT_TRUE(result.troubleshooting.count(CheckCategory::Permissions));
    EXPECT_FALSE(result.troubleshooting.count(CheckCategory::Network));
    EXPECT_TRUE(anyContains(result.suggestedCommands, "simulate-principal-policy"));
}

TEST_F(PreventiveCheckTest, FindingsFollowStageOrder) {
    facts->setInstanceState(InstanceState::Stopped);
    facts->denyPermission("ec2:DescribeInstances");

    auto result = orchestrator.run("i-0abc");
    ASSERT_FALSE(result.findings.empty());
    EXPECT_EQ(result.findings.front().checkName, "instance_state");
    EXPECT_EQ(checkCategory(result.findings.back().kind), CheckCategory::Network);

    auto firstNetwork = std::find_if(result.findings.begin(), result.findings.end(),
                                     [](const DiagnosticFinding& f) {
                                         return checkCategory(f.kind) == CheckCategory::Network;
                                     });
    auto lastPermission = std::find_if(result.findings.rbegin(), result.findings.rend(),
                                       [](const DiagnosticFinding& f) {
                                           return checkCategory(f.kind) ==
                                                  CheckCategory::Permissions;
                                       });
    ASSERT_NE(firstNetwork, result.findings.end());
    ASSERT_NE(lastPermission, result.findings.rend());
    EXPECT_LT(lastPermission.base() - result.findings.begin(),
              firstNetwork - result.findings.begin() + 1);
}

TEST_F(PreventiveCheckTest, RecommendationsAreDeduplicated) {
    auto stale = test::FakeFacts::online();
    stale.pingStatus = "ConnectionLost";
    facts->setAgent(stale);
    facts->setInstanceState(InstanceState::Pending);

    auto result = orchestrator.run("i-0abc");
    EXPECT_EQ(result.status, PreventiveStatus::Warning);
    auto sorted = result.recommendations;
    std::sort(sorted.begin(), sorted.end());
    EXPECT_EQ(std::adjacent_find(sorted.begin(), sorted.end()), sorted.end());
    EXPECT_EQ(result.recommendations.size(), 2u);
}

TEST_F(PreventiveCheckTest, NetworkStageChecksTheLocalPortWhenGiven) {
    auto without = orchestrator.run("i-0abc");
    ASSERT_EQ(without.stages.size(), 4u);
    EXPECT_FALSE(hasCheck(without.stages[3], "local_port_availability"));
    EXPECT_TRUE(ports->inspected().empty());

    PreventiveOptions options;
    options.localPort = 2222;
    auto with = orchestrator.run("i-0abc", options);
    EXPECT_EQ(with.status, PreventiveStatus::Ready);
    ASSERT_EQ(with.stages.size(), 4u);
    EXPECT_TRUE(hasCheck(with.stages[3], "local_port_availability"));
    EXPECT_EQ(with.stages[3].checks.size(), without.stages[3].checks.size() + 1);
    EXPECT_EQ(ports->inspected(), std::vector<std::uint16_t>{2222});
}

TEST_F(PreventiveCheckTest, BusyLocalPortOnlyWarns) {
    ports->occupy(2222, test::FakePortInspector::process("nc", 42));
    PreventiveOptions options;
    options.localPort = 2222;

    auto result = orchestrator.run("i-0abc", options);
    EXPECT_EQ(result.status, PreventiveStatus::Warning);
    EXPECT_FALSE(result.shouldAbortConnection);
    EXPECT_TRUE(result.authoritative);
    EXPECT_TRUE(anyContains(result.recommendations, "Use a free local port instead: 2221, 2223"));
    EXPECT_TRUE(anyContains(result.suggestedCommands, "sport = :2222"));
    EXPECT_TRUE(result.troubleshooting.count(CheckCategory::Network));
}

TEST_F(PreventiveCheckTest, AbortedPipelineSkipsTheLocalPort) {
    facts->setAgent(test::FakeFacts::unregistered());
    PreventiveOptions options;
    options.localPort = 2222;

    auto result = orchestrator.run("i-0abc", options);
    EXPECT_EQ(result.status, PreventiveStatus::Aborted);
    ASSERT_EQ(result.stages.size(), 4u);
    EXPECT_EQ(result.stages[3].status, CheckStatus::Skipped);
    EXPECT_TRUE(hasCheck(result.stages[3], "local_port_availability"));
    EXPECT_TRUE(ports->inspected().empty());
}
