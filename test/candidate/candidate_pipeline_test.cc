#include <gtest/gtest.h>

#include "candidate/candidate_pipeline.h"
#include "common/errors.h"

using namespace PatchArbiter;

class CandidatePipelineTest : public ::testing::Test {
protected:
    CandidateGroup MakeGroup(std::vector<std::string> patches,
            std::vector<std::vector<std::string>> regressions,
            std::vector<int> success) {
        CandidateGroup group;
        group.instance_id = "proj__repo-1";
        group.issue = "it breaks";
        group.patches = std::move(patches);
        group.regressions = std::move(regressions);
        group.success_id = std::move(success);
        return group;
    }
};

TEST_F(CandidatePipelineTest, PartitionSlicesAlongsideFlags) {
    CandidateLog log;
    log.instance_id = "i";
    log.patches = {"p0", "p1", "p2", "p3", "p4"};
    log.regressions = {{}, {"t1"}, {}, {}, {}};
    log.success_id = {0, 1, 0, 1, 1};

    auto groups = PartitionGroups(log, 5, 2);
    ASSERT_EQ(groups.size(), 3u);
    EXPECT_EQ(groups[0].group_id, 0);
    EXPECT_EQ(groups[1].patches, (std::vector<std::string>{"p2", "p3"}));
    EXPECT_EQ(groups[0].regressions[1], (std::vector<std::string>{"t1"}));
    EXPECT_EQ(groups[2].patches, (std::vector<std::string>{"p4"}));
    EXPECT_EQ(groups[2].success_id, (std::vector<int>{1}));
}

TEST_F(CandidatePipelineTest, PartitionCapsAtAvailablePatches) {
    CandidateLog log;
    log.instance_id = "i";
    log.patches = {"p0", "p1", "p2"};
    log.regressions.resize(3);
    log.success_id = {0, 0, 1};

    EXPECT_EQ(PartitionGroups(log, 10, 10).size(), 1u);
    EXPECT_EQ(PartitionGroups(log, 10, 10)[0].size(), 3u);
    EXPECT_EQ(PartitionGroups(log, 2, 10)[0].size(), 2u);
    EXPECT_TRUE(PartitionGroups(log, 0, 10).empty());
    EXPECT_THROW(PartitionGroups(log, 3, 0), ArbiterError);
}

TEST_F(CandidatePipelineTest, ClassifyGroup) {
    EXPECT_EQ(ClassifyGroup(MakeGroup({"a", "b", "c"}, {{}, {}, {}}, {1, 1, 1})), GroupVerdict::kAllSuccess);
    EXPECT_EQ(ClassifyGroup(MakeGroup({"a", "b"}, {{}, {}}, {0, 0})), GroupVerdict::kAllFailed);
    EXPECT_EQ(ClassifyGroup(MakeGroup({"a", "b"}, {{}, {}}, {0, 1})), GroupVerdict::kNeedsSelection);
    EXPECT_THROW(ClassifyGroup(MakeGroup({}, {}, {})), ArbiterError);
}

TEST_F(CandidatePipelineTest, EmptyDiffsAreDropped) {
    auto set = BuildWorkingSet(MakeGroup({"", "+a\n-b", "  \n"}, {{}, {}, {}}, {0, 1, 0}));
    ASSERT_EQ(set.size(), 1u);
    EXPECT_EQ(set[0].id, 1);
    EXPECT_TRUE(set[0].ground_truth_success);
}

TEST_F(CandidatePipelineTest, RegressionFilterKeepsCleanCandidates) {
    auto set = BuildWorkingSet(MakeGroup({"+a", "+b", "+c"}, {{"t"}, {}, {"u", "v"}}, {1, 0, 0}));
    ASSERT_EQ(set.size(), 1u);
    EXPECT_EQ(set[0].id, 1);
    EXPECT_TRUE(set[0].regression_clean);
}

TEST_F(CandidatePipelineTest, RegressionFilterNeverEmptiesTheSet) {
    auto set = BuildWorkingSet(MakeGroup({"+a", "+b"}, {{"t"}, {"u"}}, {1, 0}));
    ASSERT_EQ(set.size(), 2u);
    EXPECT_EQ(set[0].id, 0);
    EXPECT_EQ(set[1].id, 1);
}

TEST_F(CandidatePipelineTest, DeduplicatesBySignatureKeepingFirst) {
    auto set = BuildWorkingSet(MakeGroup(
            {"+x = 1", "+x = 2", "+x  =  1   # same", "+x = 2"},
            {{}, {}, {}, {}}, {0, 1, 0, 1}));
    ASSERT_EQ(set.size(), 2u);
    EXPECT_EQ(set[0].id, 0);
    EXPECT_EQ(set[1].id, 1);
    EXPECT_EQ(set[0].signature, "+x=1");
}

TEST_F(CandidatePipelineTest, AllEmptyKeepsFirstCandidate) {
    auto set = BuildWorkingSet(MakeGroup({"", " "}, {{}, {}}, {0, 1}));
    ASSERT_EQ(set.size(), 1u);
    EXPECT_EQ(set[0].id, 0);
    EXPECT_FALSE(set[0].ground_truth_success);
}

TEST_F(CandidatePipelineTest, ExampleGroupCollapsesToOneCandidate) {
    auto set = BuildWorkingSet(MakeGroup({"", "+a\n-b", "+a # c\n-b"}, {{}, {}, {}}, {0, 1, 1}));
    ASSERT_EQ(set.size(), 1u);
    EXPECT_EQ(set[0].id, 1);
    EXPECT_EQ(set[0].patch, "+a\n-b");
}
