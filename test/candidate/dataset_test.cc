#include <gtest/gtest.h>

#include <fstream>

#include "candidate/dataset.h"
#include "common/errors.h"
#include "mocks.h"

using namespace PatchArbiter;

class DatasetTest : public ::testing::Test {
protected:
    std::string Write(const std::string& name, const std::string& content) {
        std::string path = dir_.Sub(name);
        std::ofstream out(path);
        out << content;
        return path;
    }

    TempDir dir_;
};

TEST_F(DatasetTest, ParsesInstanceList) {
    auto instances = ParseInstances(R"([
        {"instance_id": "a__b-1", "base_commit": "abc123", "problem_statement": "boom"},
        {"instance_id": "a__b-2", "base_commit": "def456", "problem_statement": "bang", "extra": 1}
    ])", "inline");
    ASSERT_EQ(instances.size(), 2u);
    EXPECT_EQ(instances[1].instance_id, "a__b-2");
    EXPECT_EQ(instances[0].base_commit, "abc123");
    EXPECT_EQ(instances[1].problem_statement, "bang");
}

TEST_F(DatasetTest, RejectsMalformedInstances) {
    EXPECT_THROW(ParseInstances("{}", "inline"), DatasetError);
    EXPECT_THROW(ParseInstances("[{\"instance_id\": \"x\"}]", "inline"), DatasetError);
    EXPECT_THROW(ParseInstances("[", "inline"), DatasetError);
}

TEST_F(DatasetTest, MissingRegressionsDefaultToEmpty) {
    auto log = ParseCandidateLogLine(
            R"({"instance_id": "x-1", "issue": "i", "patches": ["+a", "+b"], "success_id": [0, 1]})",
            "line 1");
    ASSERT_EQ(log.regressions.size(), 2u);
    EXPECT_TRUE(log.regressions[0].empty());
    EXPECT_TRUE(log.regressions[1].empty());
    EXPECT_EQ(log.success_id, (std::vector<int>{0, 1}));
}

TEST_F(DatasetTest, BooleanSuccessFlags) {
    auto log = ParseCandidateLogLine(
            R"({"instance_id": "x-1", "patches": ["+a", "+b"], "regressions": [["t"], []], "success_id": [true, false]})",
            "line 1");
    EXPECT_EQ(log.success_id, (std::vector<int>{1, 0}));
    EXPECT_EQ(log.regressions[0], (std::vector<std::string>{"t"}));
}

TEST_F(DatasetTest, MismatchedSuccessFlagsAreRejected) {
    EXPECT_THROW(ParseCandidateLogLine(
            R"({"instance_id": "x-1", "patches": ["+a", "+b"], "success_id": [1]})", "line 1"),
            DatasetError);
}

TEST_F(DatasetTest, LoadsJsonLinesSkippingBlanks) {
    std::string path = Write("candidates.jsonl",
            "{\"instance_id\": \"x-1\", \"issue\": \"i\", \"patches\": [\"+a\"], \"success_id\": [1]}\n"
            "\n"
            "{\"instance_id\": \"x-2\", \"issue\": \"j\", \"patches\": [\"+b\", \"+c\"], \"success_id\": [0, 1]}\n");
    auto logs = LoadCandidateLogs(path);
    ASSERT_EQ(logs.size(), 2u);
    EXPECT_EQ(logs.at("x-2").patches.size(), 2u);
    EXPECT_EQ(logs.at("x-1").issue, "i");
}

TEST_F(DatasetTest, MalformedLineNamesItsLineNumber) {
    std::string path = Write("bad.jsonl",
            "{\"instance_id\": \"x-1\", \"patches\": [\"+a\"], \"success_id\": [1]}\n"
            "{not json\n");
    try {
        LoadCandidateLogs(path);
        FAIL() << "expected DatasetError";
    } catch (const DatasetError& e) {
        EXPECT_NE(std::string(e.what()).find(":2"), std::string::npos) << e.what();
    }

    const std::vector<std::string> wrong_types = {
        "{\"instance_id\": \"x-2\", \"patches\": [\"+a\"], \"success_id\": [\"1\"]}",
        "{\"instance_id\": \"x-2\", \"issue\": {\"t\": 1}, \"patches\": [\"+a\"], \"success_id\": [1]}",
        "{\"instance_id\": \"x-2\", \"patches\": [\"+a\"], \"regressions\": [[{\"t\": 1}]], \"success_id\": [1]}",
        "{\"instance_id\": \"x-2\", \"patches\": [\"+a\"], \"success_id\": [1.5]}",
    };
    for (const auto& second : wrong_types) {
        path = Write("bad.jsonl",
                "{\"instance_id\": \"x-1\", \"patches\": [\"+a\"], \"success_id\": [1]}\n" + second + "\n");
        try {
            LoadCandidateLogs(path);
            ADD_FAILURE() << "expected DatasetError for " << second;
        } catch (const DatasetError& e) {
            EXPECT_NE(std::string(e.what()).find(":2"), std::string::npos) << e.what();
        }
    }
}

TEST_F(DatasetTest, MissingFile) {
    EXPECT_THROW(LoadInstances(dir_.Sub("absent.json")), DatasetError);
    EXPECT_THROW(LoadCandidateLogs(dir_.Sub("absent.jsonl")), DatasetError);
}
