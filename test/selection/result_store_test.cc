#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "common/json_utils.h"
#include "mocks.h"
#include "selection/result_store.h"

using namespace PatchArbiter;

class ResultStoreTest : public ::testing::Test {
protected:
    ResultStoreTest()
        : store_(dir_.Sub("patches"), dir_.Sub("statistics"), dir_.Sub("trajectories"), dir_.Sub("logs")) {}

    static std::string Slurp(const std::string& path) {
        std::ifstream in(path);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    TempDir dir_;
    ResultStore store_;
};

TEST_F(ResultStoreTest, PatchFilesTakeFirstUnusedIndex) {
    std::string first = store_.SavePatch("proj__repo-1", 0, "+a\n");
    std::string second = store_.SavePatch("proj__repo-1", 0, "+b\n");
    EXPECT_EQ(first, dir_.Sub("patches/group_0/proj__repo-1_1.patch"));
    EXPECT_EQ(second, dir_.Sub("patches/group_0/proj__repo-1_2.patch"));
    EXPECT_EQ(Slurp(first), "+a\n");
    EXPECT_EQ(Slurp(second), "+b\n");

    EXPECT_EQ(store_.SavePatch("proj__repo-1", 1, "+c"), dir_.Sub("patches/group_1/proj__repo-1_1.patch"));
}

TEST_F(ResultStoreTest, StatisticsRoundTrip) {
    EXPECT_FALSE(store_.StatisticsExists("proj__repo-1", 2));
    EXPECT_FALSE(store_.LoadStatistics("proj__repo-1", 2).has_value());

    StatisticsRecord record;
    record.instance_id = "proj__repo-1";
    record.patch_id = 3;
    record.is_success = 1;
    store_.SaveStatistics(2, record);

    ASSERT_TRUE(store_.StatisticsExists("proj__repo-1", 2));
    EXPECT_EQ(store_.StatisticsPath("proj__repo-1", 2), dir_.Sub("statistics/group_2/proj__repo-1.json"));
    auto loaded = store_.LoadStatistics("proj__repo-1", 2);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->patch_id, 3);
    EXPECT_EQ(loaded->is_success, 1);
    EXPECT_FALSE(loaded->is_all_success);
    EXPECT_FALSE(loaded->is_all_failed);
}

TEST_F(ResultStoreTest, StatisticsFileFormat) {
    StatisticsRecord record;
    record.instance_id = "proj__repo-1";
    record.is_all_failed = true;
    store_.SaveStatistics(0, record);

    const std::string path = store_.StatisticsPath("proj__repo-1", 0);
    Json::Value root = ReadJsonFile(path);
    EXPECT_EQ(root["instance_id"].asString(), "proj__repo-1");
    EXPECT_EQ(root["patch_id"].asInt(), 0);
    EXPECT_EQ(root["is_success"].asInt(), 0);
    EXPECT_FALSE(root["is_all_success"].asBool());
    EXPECT_TRUE(root["is_all_failed"].asBool());
    EXPECT_NE(Slurp(path).find("\n    \"instance_id\": \"proj__repo-1\""), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(path + ".tmp"));
}

TEST_F(ResultStoreTest, EmptyStatisticsFileDoesNotCount) {
    const std::string path = store_.StatisticsPath("proj__repo-1", 0);
    std::filesystem::create_directories(std::filesystem::path(path).parent_path());
    std::ofstream(path).close();
    EXPECT_FALSE(store_.StatisticsExists("proj__repo-1", 0));
}

TEST_F(ResultStoreTest, TrajectoryPathsAreAbsoluteAndUnique) {
    std::string path = store_.TrajectoryPath("proj__repo-1", 1, 0);
    EXPECT_TRUE(std::filesystem::path(path).is_absolute());
    EXPECT_EQ(std::filesystem::path(path).filename().string(), "proj__repo-1_voting_0_trail_1.json");
    EXPECT_TRUE(std::filesystem::is_directory(dir_.Sub("trajectories/group_1")));

    std::ofstream(path) << "{}";
    EXPECT_EQ(std::filesystem::path(store_.TrajectoryPath("proj__repo-1", 1, 0)).filename().string(),
            "proj__repo-1_voting_0_trail_2.json");
    EXPECT_EQ(std::filesystem::path(store_.TrajectoryPath("proj__repo-1", 1, 1)).filename().string(),
            "proj__repo-1_voting_1_trail_1.json");
}

TEST_F(ResultStoreTest, GroupLogPath) {
    EXPECT_EQ(store_.GroupLogPath("proj__repo-1", 4), dir_.Sub("logs/group_4/proj__repo-1.log"));
}
