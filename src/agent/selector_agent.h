#ifndef PATCHARBITER_SRC_AGENT_SELECTOR_AGENT_H_
#define PATCHARBITER_SRC_AGENT_SELECTOR_AGENT_H_

#include <optional>
#include <string>
#include <vector>

#include "candidate/candidate_pipeline.h"
#include "chat_types.h"
#include "tool_executor.h"
#include "trajectory_recorder.h"

namespace PatchArbiter {

enum class AgentState {
	kInit,
	kThinking,
	kWaitingOnTool,
	kDecided,
	kExhausted,
};

const char* AgentStateName(AgentState state);

struct EpisodeResult {
	int chosen_id = 0;          // group-local candidate id
	std::string patch;
	AgentState final_state = AgentState::kInit;
	int turns = 0;
};

extern const char kContinueNudge[];

std::string BuildSystemPrompt(size_t candidate_count);
std::string BuildUserPrompt(const std::string& project_path, const std::string& issue,
		const std::vector<CandidatePatch>& candidates);

/**
 * Looks for the final report in a reply. Returns nullopt when the reply is
 * not a decision; otherwise the working-set position of "Patch-k", or 0 when
 * k does not name a candidate.
 */
std::optional<size_t> ParseDecision(const std::string& reply, size_t candidate_count);

/**
 * One selection episode over a working set.
 *
 * INIT -> THINKING <-> WAITING_ON_TOOL -> DECIDED | EXHAUSTED. Every turn
 * sends the running conversation with the tool definitions; a final report
 * ends the episode, tool calls are executed and answered, anything else gets
 * a nudge. Running out of turns selects the first candidate. Errors from the
 * chat client or the executor propagate.
 */
class SelectorAgent {
public:
	SelectorAgent(IChatClient& chat, IToolExecutor& executor, TrajectoryRecorder* recorder,
			std::vector<CandidatePatch> candidates, std::string project_path,
			std::string issue, int max_turn);

	EpisodeResult Run();

	AgentState state() const { return state_; }
	const std::vector<Message>& conversation() const { return conversation_; }

private:
	void Transition(AgentState next);

	IChatClient& chat_;
	IToolExecutor& executor_;
	TrajectoryRecorder* recorder_;
	std::vector<CandidatePatch> candidates_;
	std::string project_path_;
	std::string issue_;
	int max_turn_;
	AgentState state_ = AgentState::kInit;
	std::vector<Message> conversation_;
};

}  // namespace PatchArbiter

#endif  // PATCHARBITER_SRC_AGENT_SELECTOR_AGENT_H_
