#include <gtest/gtest.h>

#include "common/errors.h"
#include "orchestrator/evaluation_orchestrator.h"

using namespace PatchArbiter;

class EvaluationOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* id : {"proj__a-1", "proj__b-2", "proj__c-3", "proj__d-4"}) {
            Instance instance;
            instance.instance_id = id;
            instance.base_commit = "abc";
            instances_.push_back(instance);
        }
        for (const char* id : {"proj__a-1", "proj__b-2", "proj__c-3"}) {
            CandidateLog log;
            log.instance_id = id;
            log.patches = {"+x"};
            log.success_id = {1};
            candidates_[id] = log;
        }
        pool_options_.workers = 2;
    }

    // a resolves, b leaves a group unresolved, c throws.
    static std::vector<GroupOutcome> Runner(const Instance& instance, const CandidateLog& log) {
        if (log.instance_id != instance.instance_id) return {};
        if (instance.instance_id == "proj__b-2") {
            return {GroupOutcome::kResolved, GroupOutcome::kUnresolved};
        }
        if (instance.instance_id == "proj__c-3") {
            throw SandboxStartFailure("no image");
        }
        return {GroupOutcome::kTrivial, GroupOutcome::kSkippedExisting, GroupOutcome::kResolved};
    }

    std::vector<Instance> instances_;
    std::unordered_map<std::string, CandidateLog> candidates_;
    WorkerPoolOptions pool_options_;
};

TEST_F(EvaluationOrchestratorTest, RunAllTalliesOutcomes) {
    EvaluationOrchestrator orchestrator(instances_, candidates_, Runner, pool_options_);
    OrchestratorSummary summary = orchestrator.RunAll();

    EXPECT_EQ(summary.missing_candidates, 1u);
    EXPECT_EQ(summary.total, 3u);
    EXPECT_EQ(summary.succeeded, 1u);
    EXPECT_EQ(summary.partial, 1u);
    EXPECT_EQ(summary.failed, 1u);
    EXPECT_FALSE(summary.AllSucceeded());
    ASSERT_EQ(summary.reports.size(), 3u);
    EXPECT_EQ(summary.reports[0].name, "proj__a-1");
    EXPECT_EQ(summary.reports[1].status, TaskStatus::kPartial);
}

TEST_F(EvaluationOrchestratorTest, RunOneInProcess) {
    int calls = 0;
    EvaluationOrchestrator orchestrator(instances_, candidates_,
            [&calls](const Instance& instance, const CandidateLog& log) {
                ++calls;
                return Runner(instance, log);
            }, pool_options_);

    auto outcomes = orchestrator.RunOne("proj__b-2");
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(EvaluationOrchestrator::ExitCodeFor(outcomes), kPartialExitCode);
    EXPECT_THROW(orchestrator.RunOne("proj__c-3"), SandboxStartFailure);
    EXPECT_THROW(orchestrator.RunOne("proj__d-4"), DatasetError);
    EXPECT_THROW(orchestrator.RunOne("proj__zzz-9"), DatasetError);
}

TEST_F(EvaluationOrchestratorTest, ExitCodes) {
    EXPECT_EQ(EvaluationOrchestrator::ExitCodeFor({}), 0);
    EXPECT_EQ(EvaluationOrchestrator::ExitCodeFor({GroupOutcome::kTrivial, GroupOutcome::kResolved}), 0);
    EXPECT_EQ(EvaluationOrchestrator::ExitCodeFor({GroupOutcome::kSkippedExisting}), 0);
    EXPECT_EQ(EvaluationOrchestrator::ExitCodeFor({GroupOutcome::kResolved, GroupOutcome::kUnresolved}),
            kPartialExitCode);
}
