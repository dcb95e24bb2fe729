#include <gtest/gtest.h>

#include "common/cancellation.h"
#include "common/errors.h"
#include "sandbox/shell_session.h"

using namespace PatchArbiter;

/**
 * Runs a real local bash on a pseudo-terminal.
 */
class ShellSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        ShellOptions options;
        options.startup_timeout = std::chrono::seconds(10);
        session_ = PtyShellSession::Spawn({"/bin/bash", "--norc", "--noprofile"}, options);
    }

    void TearDown() override {
        ClearCancellation();
    }

    std::unique_ptr<PtyShellSession> session_;
};

TEST_F(ShellSessionTest, RunsCommandAndReturnsOutput) {
    ShellOutput out = session_->Execute("echo hello", std::chrono::seconds(10));
    EXPECT_FALSE(out.recoverable);
    EXPECT_EQ(out.text, "hello");
}

TEST_F(ShellSessionTest, OutputHasNoEchoPromptsOrCarriageReturns) {
    ShellOutput out = session_->Execute("printf 'a\\nb\\n'", std::chrono::seconds(10));
    EXPECT_EQ(out.text, "a\nb");
    EXPECT_EQ(out.text.find('\r'), std::string::npos);
    EXPECT_EQ(out.text.find("printf"), std::string::npos);
    EXPECT_EQ(out.text.find("__PA_"), std::string::npos);
}

TEST_F(ShellSessionTest, StatePersistsAcrossCommands) {
    session_->Execute("cd /tmp && export PA_TEST_VALUE=42", std::chrono::seconds(10));
    EXPECT_EQ(session_->Execute("pwd", std::chrono::seconds(10)).text, "/tmp");
    EXPECT_EQ(session_->Execute("echo $PA_TEST_VALUE", std::chrono::seconds(10)).text, "42");
}

TEST_F(ShellSessionTest, CommandWithoutOutput) {
    ShellOutput out = session_->Execute("true", std::chrono::seconds(10));
    EXPECT_FALSE(out.recoverable);
    EXPECT_EQ(out.text, "");
}

TEST_F(ShellSessionTest, TimeoutReturnsRecoverableObservationWithPartialOutput) {
    ShellOutput out = session_->Execute("echo started; sleep 30", std::chrono::seconds(1));
    EXPECT_TRUE(out.recoverable);
    EXPECT_NE(out.text.find("### Observation: Error: Command 'echo started; sleep 30' timed out after 1 seconds. Partial output:"),
            std::string::npos) << out.text;
    EXPECT_NE(out.text.find("started"), std::string::npos);
    EXPECT_FALSE(session_->IsAlive());

    ShellOutput after = session_->Execute("echo again", std::chrono::seconds(1));
    EXPECT_TRUE(after.recoverable);
}

TEST_F(ShellSessionTest, ShellExitIsRecoverable) {
    ShellOutput out = session_->Execute("exit 3", std::chrono::seconds(10));
    EXPECT_TRUE(out.recoverable);
    EXPECT_FALSE(session_->IsAlive());
}

TEST_F(ShellSessionTest, CloseIsIdempotent) {
    session_->Close();
    EXPECT_FALSE(session_->IsAlive());
    session_->Close();
}

TEST_F(ShellSessionTest, CancellationInterruptsExecute) {
    RequestCancellation();
    EXPECT_THROW(session_->Execute("sleep 5", std::chrono::seconds(10)), AttemptCancelled);
}

TEST(ShellSessionSpawnTest, FailsWithoutPrompt) {
    ShellOptions options;
    options.startup_timeout = std::chrono::seconds(2);
    EXPECT_THROW(PtyShellSession::Spawn({"/nonexistent/shell"}, options), ShellError);
    EXPECT_THROW(PtyShellSession::Spawn({}, options), ShellError);
}
