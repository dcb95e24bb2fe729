#include <gtest/gtest.h>

#include "common/cancellation.h"
#include "common/errors.h"
#include "common/subprocess.h"

using namespace PatchArbiter;

class SubprocessTest : public ::testing::Test {
protected:
    void TearDown() override { ClearCancellation(); }
};

TEST_F(SubprocessTest, CapturesMergedOutputAndExitCode) {
    CommandResult r = RunCommand({"/bin/sh", "-c", "echo out; echo err 1>&2; exit 3"},
            std::chrono::seconds(10));
    EXPECT_FALSE(r.timed_out);
    EXPECT_EQ(r.exit_code, 3);
    EXPECT_NE(r.output.find("out"), std::string::npos);
    EXPECT_NE(r.output.find("err"), std::string::npos);
    EXPECT_FALSE(r.ok());
}

TEST_F(SubprocessTest, KillsOnTimeout) {
    auto start = std::chrono::steady_clock::now();
    CommandResult r = RunCommand({"/bin/sh", "-c", "echo begin; sleep 30"}, std::chrono::seconds(1));
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_TRUE(r.timed_out);
    EXPECT_LT(elapsed, std::chrono::seconds(10));
}

TEST_F(SubprocessTest, MissingBinaryExits127) {
    CommandResult r = RunCommand({"patcharbiter-no-such-binary"}, std::chrono::seconds(5));
    EXPECT_EQ(r.exit_code, 127);
}

TEST_F(SubprocessTest, CancellationThrowsUnlessDisabled) {
    RequestCancellation();
    EXPECT_THROW(RunCommand({"/bin/sh", "-c", "sleep 5"}, std::chrono::seconds(10)), AttemptCancelled);
    CommandResult r = RunCommand({"/bin/sh", "-c", "exit 0"}, std::chrono::seconds(10), false);
    EXPECT_TRUE(r.ok());
}

TEST_F(SubprocessTest, TrimWhitespace) {
    EXPECT_EQ(TrimWhitespace("  a b \n"), "a b");
    EXPECT_EQ(TrimWhitespace("\t\n"), "");
}
