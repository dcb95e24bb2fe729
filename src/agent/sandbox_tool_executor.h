#ifndef PATCHARBITER_SRC_AGENT_SANDBOX_TOOL_EXECUTOR_H_
#define PATCHARBITER_SRC_AGENT_SANDBOX_TOOL_EXECUTOR_H_

#include <chrono>
#include <memory>
#include <string>

#include "common/configuration.h"
#include "sandbox/sandbox.h"
#include "tool_executor.h"

namespace PatchArbiter {

struct ToolExecutorOptions {
	std::string tools_dir = "/home/swe-bench/tools/";
	std::string tool_python = "/home/swe-bench/py312/bin/python3";
	std::chrono::seconds command_timeout{60};

	static ToolExecutorOptions FromConfig(const PatchArbiterConfig& config);
};

extern const char kUnknownToolMessage[];

/**
 * Executes tool calls through the tool scripts installed in a sandbox.
 *
 * Owns the episode's shell session: opened and hard-reset in Prepare(),
 * replaced whenever a command comes back as a recoverable observation, and
 * reset and closed in Finish(). The sandbox must outlive the executor.
 */
class SandboxToolExecutor : public IToolExecutor {
public:
	SandboxToolExecutor(ISandbox& sandbox, ToolExecutorOptions options);
	~SandboxToolExecutor() override;

	void Prepare() override;
	ToolResult Execute(const ToolCall& call) override;
	void Finish() override;

	// Full shell command for a call; throws ToolArgumentError.
	std::string BuildCommand(const std::string& script, const Json::Value& arguments) const;

	// Splits the script's "Tool Call Status:" line from its output.
	static ToolResult ParseToolOutput(const ToolCall& call, const std::string& output);

	int sessions_opened() const { return sessions_opened_; }

private:
	// Runs one command, reopening the session after a recoverable result.
	ShellOutput Run(const std::string& command);
	void OpenSession();
	void ResetWorkingTree();

	ISandbox& sandbox_;
	ToolExecutorOptions options_;
	std::unique_ptr<IShellSession> session_;
	int sessions_opened_ = 0;
};

}  // namespace PatchArbiter

#endif  // PATCHARBITER_SRC_AGENT_SANDBOX_TOOL_EXECUTOR_H_
