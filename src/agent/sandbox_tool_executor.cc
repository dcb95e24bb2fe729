#include "sandbox_tool_executor.h"

#include <sstream>
#include <vector>

#include <glog/logging.h>

#include "common/errors.h"
#include "common/subprocess.h"
#include "selector_tools.h"
#include "tool_arguments.h"

namespace PatchArbiter {

const char kUnknownToolMessage[] =
	"The tool name you provided is not in the list. Please choose one from `str_replace_editor` or `bash`!";

namespace {

constexpr char kStatusPrefix[] = "Tool Call Status:";
constexpr char kFailedStatus[] = "Tool Call Status: -1";

ToolResult Failure(const ToolCall& call, const std::string& message) {
	ToolResult r;
	r.call_id = call.call_id;
	r.name = call.name;
	r.success = false;
	r.error = message;
	return r;
}

}  // namespace

ToolExecutorOptions ToolExecutorOptions::FromConfig(const PatchArbiterConfig& config) {
	ToolExecutorOptions options;
	options.tools_dir = config.sandbox.tools_dir.get();
	if (!options.tools_dir.empty() && options.tools_dir.back() != '/') {
		options.tools_dir += '/';
	}
	options.tool_python = config.sandbox.tool_python.get();
	options.command_timeout = std::chrono::seconds(config.sandbox.command_timeout_s.get());
	return options;
}

SandboxToolExecutor::SandboxToolExecutor(ISandbox& sandbox, ToolExecutorOptions options)
	: sandbox_(sandbox), options_(std::move(options)) {}

SandboxToolExecutor::~SandboxToolExecutor() {
	if (session_) session_->Close();
}

void SandboxToolExecutor::OpenSession() {
	if (session_) session_->Close();
	session_ = sandbox_.OpenSession();
	++sessions_opened_;
	VLOG(1) << "Opened shell session " << sessions_opened_ << " on " << sandbox_.Name();
}

ShellOutput SandboxToolExecutor::Run(const std::string& command) {
	if (!session_ || !session_->IsAlive()) {
		OpenSession();
	}
	ShellOutput out = session_->Execute(command, options_.command_timeout);
	if (out.recoverable) {
		LOG(WARNING) << "Shell on " << sandbox_.Name() << " needs a restart after: " << command;
		OpenSession();
	}
	return out;
}

void SandboxToolExecutor::ResetWorkingTree() {
	std::string command = "git reset --hard HEAD";
	if (!sandbox_.ProjectPath().empty()) {
		command = "cd " + ShellQuote(sandbox_.ProjectPath()) + " && " + command;
	}
	ShellOutput out = Run(command);
	if (out.recoverable) {
		LOG(WARNING) << "Working tree reset did not complete: " << out.text;
	} else {
		VLOG(1) << out.text;
	}
}

void SandboxToolExecutor::Prepare() {
	OpenSession();
	ResetWorkingTree();
}

void SandboxToolExecutor::Finish() {
	if (!session_) return;
	ResetWorkingTree();
	session_->Close();
	session_.reset();
}

std::string SandboxToolExecutor::BuildCommand(const std::string& script,
		const Json::Value& arguments) const {
	std::string command = "cd " + options_.tools_dir + " && " + options_.tool_python + " " + script;
	command += EncodeToolArguments(arguments);
	command += " > " + options_.tools_dir + "log.out 2>&1";
	return command;
}

ToolResult SandboxToolExecutor::ParseToolOutput(const ToolCall& call, const std::string& output) {
	std::vector<std::string> lines;
	std::istringstream in(output);
	std::string line;
	while (std::getline(in, line)) lines.push_back(line);

	std::string status;
	for (auto it = lines.begin(); it != lines.end(); ++it) {
		if (TrimWhitespace(*it).rfind(kStatusPrefix, 0) == 0) {
			status = TrimWhitespace(*it);
			lines.erase(it);
			break;
		}
	}
	std::string content;
	for (size_t i = 0; i < lines.size(); ++i) {
		if (i) content += '\n';
		content += lines[i];
	}

	ToolResult r;
	r.call_id = call.call_id;
	r.name = call.name;
	r.success = status != kFailedStatus;
	r.result = content;
	if (!r.success) r.error = content;
	return r;
}

ToolResult SandboxToolExecutor::Execute(const ToolCall& call) {
	std::string script;
	if (call.name == kEditToolName) {
		script = "execute_str_replace_editor.py";
	} else if (call.name == kBashToolName) {
		script = "execute_bash.py";
	} else {
		LOG(WARNING) << "Unknown tool requested: " << call.name;
		return Failure(call, kUnknownToolMessage);
	}

	std::string command;
	try {
		command = BuildCommand(script, call.arguments);
	} catch (const ToolArgumentError& e) {
		LOG(WARNING) << "Rejected arguments for " << call.name << ": " << e.what();
		return Failure(call, std::string("Failed call tool. ") + e.what() +
				"; you need to check the definition of the tool.");
	}

	VLOG(1) << "tool " << call.name << ": " << command;
	ShellOutput run = Run(command);
	if (run.recoverable) {
		return Failure(call, run.text);
	}
	ShellOutput log = Run("cat " + options_.tools_dir + "log.out");
	if (log.recoverable) {
		return Failure(call, log.text);
	}
	ToolResult result = ParseToolOutput(call, log.text);
	VLOG(1) << "tool " << call.name << " success=" << result.success
		<< " (" << result.result.size() << " bytes)";
	return result;
}

}  // namespace PatchArbiter
