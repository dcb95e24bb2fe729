#include "selector_agent.h"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <iterator>

#include <glog/logging.h>

#include "common/errors.h"
#include "common/subprocess.h"
#include "selector_tools.h"

namespace PatchArbiter {

const char kContinueNudge[] =
	"It seems the task is not completed yet. Continue the evaluation with the available tools, "
	"or submit your final report in the required format.";

namespace {

std::string ToLower(std::string s) {
	std::transform(s.begin(), s.end(), s.begin(),
			[](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return s;
}

bool StartsWithAt(const std::string& s, size_t pos, const char* word) {
	return s.compare(pos, std::strlen(word), word) == 0;
}

size_t SkipSpace(const std::string& s, size_t pos) {
	while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) ++pos;
	return pos;
}

// Skips blanks and an optional "###" heading marker.
size_t SkipHeading(const std::string& s, size_t pos) {
	pos = SkipSpace(s, pos);
	if (StartsWithAt(s, pos, "###")) pos = SkipSpace(s, pos + 3);
	return pos;
}

// "Status: succeed" on one line followed by a "Result:" line. |lower| is the
// case-folded reply.
bool HasSuccessStatus(const std::string& lower) {
	static const char* const kSuccessWords[] = {"success", "succeed", "successfully", "successful"};
	for (size_t pos = lower.find("status:"); pos != std::string::npos; pos = lower.find("status:", pos + 1)) {
		const size_t word = SkipSpace(lower, pos + 7);
		size_t end = word;
		while (end < lower.size() && std::isalpha(static_cast<unsigned char>(lower[end]))) ++end;
		const std::string status = lower.substr(word, end - word);
		if (std::find(std::begin(kSuccessWords), std::end(kSuccessWords), status) == std::end(kSuccessWords)) {
			continue;
		}
		const size_t next = SkipSpace(lower, end);
		if (lower.find('\n', end) >= next) continue;
		if (StartsWithAt(lower, SkipHeading(lower, next), "result:")) return true;
	}
	return false;
}

// Text of the first "Result:" entry that is followed by "Analysis:", either
// later on the same line or at the start of a following line.
std::optional<std::string> FindResultText(const std::string& reply, const std::string& lower) {
	for (size_t pos = lower.find("result:"); pos != std::string::npos; pos = lower.find("result:", pos + 1)) {
		const size_t begin = SkipSpace(lower, pos + 7);
		const size_t eol = std::min(lower.find('\n', begin), lower.size());
		if (begin >= eol) continue;
		std::string text;
		const size_t stop = lower.find("analysis:", begin + 1);
		if (stop != std::string::npos && stop < eol) {
			text = reply.substr(begin, stop - begin);
		} else if (StartsWithAt(lower, SkipHeading(lower, eol), "analysis:")) {
			text = reply.substr(begin, eol - begin);
		} else {
			continue;
		}
		text = TrimWhitespace(text);
		if (text.size() > 3 && text.compare(text.size() - 3, 3, "###") == 0) {
			text = TrimWhitespace(text.substr(0, text.size() - 3));
		}
		return text;
	}
	return std::nullopt;
}

}  // namespace

const char* AgentStateName(AgentState state) {
	switch (state) {
		case AgentState::kInit: return "INIT";
		case AgentState::kThinking: return "THINKING";
		case AgentState::kWaitingOnTool: return "WAITING_ON_TOOL";
		case AgentState::kDecided: return "DECIDED";
		case AgentState::kExhausted: return "EXHAUSTED";
	}
	return "UNKNOWN";
}

std::string BuildSystemPrompt(size_t candidate_count) {
	std::string prompt =
		"# ROLE: Act as an expert code evaluator. Given a codebase, an github issue and **" +
		std::to_string(candidate_count) +
		" candidate patches** proposed by your colleagues, your responsibility is to **select the correct one** to solve the issue.\n"
		"\n"
		"# WORK PROCESS:\n"
		"You are given a software issue and multiple candidate patches. Your goal is to identify the patch that correctly resolves the issue.\n"
		"\n"
		"Follow these steps methodically:\n"
		"\n"
		"**1. Understand the Issue and Codebase**\n"
		"Carefully read the issue description to comprehend the problem. You may need to examine the codebase for context, including:\n"
		"    (1) Code referenced in the issue description;\n"
		"    (2) The original code modified by each patch;\n"
		"    (3) Unchanged parts of the same file;\n"
		"    (4) Related files, functions, or modules that interact with the affected code.\n"
		"\n"
		"**2. Analyze the Candidate Patches**\n"
		"For each patch, analyze its logic and intended fix. Consider whether the changes align with the issue description and coding conventions.\n"
		"\n"
		"**3. Validate Functionality (Optional but Recommended)**\n"
		"If needed, write and run unit tests to evaluate the correctness and potential side effects of each patch.\n"
		"\n"
		"**4. Select the Best Patch**\n"
		"Choose the patch that best resolves the issue with minimal risk of introducing new problems.\n"
		"\n"
		"# FINAL REPORT: If you have successfully selected the correct patch, submit your answer in the following format:\n"
		"### Status: succeed\n"
		"### Result: Patch-x\n"
		"### Analysis: [Explain why Patch-x is correct.]\n"
		"\n"
		"# IMPORTANT TIPS:\n"
		"1. Never avoid making a selection.\n"
		"2. Do not propose new patches.\n"
		"3. There must be at least one correct patch.\n";
	return prompt;
}

std::string BuildUserPrompt(const std::string& project_path, const std::string& issue,
		const std::vector<CandidatePatch>& candidates) {
	std::string prompt = "\n[Codebase path]:\n" + project_path +
		"\n\n[Github issue description]:\n```\n" + issue + "\n```\n\n[Candidate Patches]:";
	for (size_t i = 0; i < candidates.size(); ++i) {
		prompt += "\nPatch-" + std::to_string(i + 1) + ":\n```\n" + candidates[i].patch + "\n```";
	}
	return prompt;
}

std::optional<size_t> ParseDecision(const std::string& reply, size_t candidate_count) {
	const std::string lower = ToLower(reply);
	if (!HasSuccessStatus(lower)) {
		return std::nullopt;
	}
	const std::optional<std::string> found = FindResultText(reply, lower);
	if (!found) {
		return std::nullopt;
	}
	const std::string& result = *found;
	const size_t marker = ToLower(result).rfind("patch-");
	const std::string index = marker == std::string::npos ? result : result.substr(marker + 6);
	for (size_t k = 1; k <= candidate_count; ++k) {
		if (index == std::to_string(k)) return k - 1;
	}
	LOG(WARNING) << "Unrecognized selection '" << result.substr(0, 200)
		<< "'; falling back to the first candidate";
	return 0;
}

SelectorAgent::SelectorAgent(IChatClient& chat, IToolExecutor& executor,
		TrajectoryRecorder* recorder, std::vector<CandidatePatch> candidates,
		std::string project_path, std::string issue, int max_turn)
	: chat_(chat), executor_(executor), recorder_(recorder),
	  candidates_(std::move(candidates)), project_path_(std::move(project_path)),
	  issue_(std::move(issue)), max_turn_(max_turn) {}

void SelectorAgent::Transition(AgentState next) {
	VLOG(2) << "agent: " << AgentStateName(state_) << " -> " << AgentStateName(next);
	state_ = next;
}

EpisodeResult SelectorAgent::Run() {
	if (candidates_.empty()) {
		throw ArbiterError("SelectorAgent needs at least one candidate");
	}
	if (state_ != AgentState::kInit) {
		throw ArbiterError("SelectorAgent::Run called twice");
	}

	executor_.Prepare();
	conversation_.push_back({"system", BuildSystemPrompt(candidates_.size()), {}, std::nullopt});
	conversation_.push_back({"user", BuildUserPrompt(project_path_, issue_, candidates_), {}, std::nullopt});
	VLOG(1) << "User prompt:\n" << conversation_.back().content;

	const std::vector<ToolSpec> tools = SelectorToolSpecs();
	EpisodeResult result;
	result.chosen_id = candidates_[0].id;
	result.patch = candidates_[0].patch;
	size_t recorded = 0;

	while (result.turns < max_turn_) {
		++result.turns;
		Transition(AgentState::kThinking);
		ChatResponse response = chat_.Chat(conversation_, tools);
		if (recorder_) {
			std::vector<Message> fresh(conversation_.begin() + recorded, conversation_.end());
			recorder_->RecordInteraction(fresh, response, tools);
		}
		LOG(INFO) << "Selector answer (" << result.turns << "/" << max_turn_ << "): "
			<< response.content;

		Message reply{"assistant", response.content, response.tool_calls, std::nullopt};
		std::optional<size_t> decision = ParseDecision(response.content, candidates_.size());
		if (decision) {
			conversation_.push_back(std::move(reply));
			const CandidatePatch& chosen = candidates_[*decision];
			result.chosen_id = chosen.id;
			result.patch = chosen.patch;
			Transition(AgentState::kDecided);
			LOG(INFO) << "Selected Patch-" << (*decision + 1) << " (candidate " << chosen.id << ")";
			break;
		}

		conversation_.push_back(std::move(reply));
		// The assistant turn is part of the recorded response.
		recorded = conversation_.size();
		if (!response.tool_calls.empty()) {
			Transition(AgentState::kWaitingOnTool);
			for (const auto& call : response.tool_calls) {
				ToolResult tool_result = executor_.Execute(call);
				std::string content = tool_result.success ? tool_result.result : tool_result.error;
				conversation_.push_back({"tool", content, {}, std::move(tool_result)});
			}
		} else {
			conversation_.push_back({"user", kContinueNudge, {}, std::nullopt});
		}
	}

	if (state_ != AgentState::kDecided) {
		Transition(AgentState::kExhausted);
		LOG(WARNING) << "No decision after " << max_turn_ << " turns; selecting candidate "
			<< result.chosen_id;
	}
	result.final_state = state_;

	if (recorder_) recorder_->Finalize(state_ == AgentState::kDecided, result.patch);
	executor_.Finish();
	return result;
}

}  // namespace PatchArbiter
