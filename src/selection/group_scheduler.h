#ifndef PATCHARBITER_SRC_SELECTION_GROUP_SCHEDULER_H_
#define PATCHARBITER_SRC_SELECTION_GROUP_SCHEDULER_H_

#include <functional>
#include <memory>
#include <vector>

#include "agent/chat_types.h"
#include "agent/tool_executor.h"
#include "candidate/candidate_pipeline.h"
#include "common/configuration.h"
#include "result_store.h"
#include "sandbox/sandbox.h"

namespace PatchArbiter {

enum class GroupOutcome {
	kSkippedExisting,  // statistics already on disk
	kTrivial,          // all-success or all-failed shortcut
	kResolved,
	kUnresolved,       // every attempt failed; eligible for a later pass
};

const char* GroupOutcomeName(GroupOutcome outcome);

struct SchedulerOptions {
	int max_retry = 3;
	int max_turn = 50;
	int num_candidate = 10;
	int group_size = 10;
	bool majority_voting = true;

	static SchedulerOptions FromConfig(const PatchArbiterConfig& config);
};

using ToolExecutorFactory = std::function<std::unique_ptr<IToolExecutor>(ISandbox&)>;

/**
 * Processes an instance group by group. Each group is skipped when its
 * statistics exist, short-circuited when its ground truth is uniform, and
 * otherwise attempted up to max_retry times: working set, fresh sandbox,
 * consensus over selector episodes, patch and statistics persisted.
 * Cancellation stops the sandbox and propagates without retry.
 */
class GroupScheduler {
public:
	GroupScheduler(SchedulerOptions options, SandboxFactory sandbox_factory,
			IChatClient& chat, ToolExecutorFactory executor_factory,
			const ResultStore& store);

	std::vector<GroupOutcome> RunInstance(const Instance& instance, const CandidateLog& log);
	GroupOutcome RunGroup(const Instance& instance, const CandidateGroup& group, size_t num_groups);

private:
	// One full attempt; throws on any failure.
	void Attempt(const Instance& instance, const CandidateGroup& group, int attempt);
	void Persist(const CandidateGroup& group, int chosen_id, const std::string& patch,
			const std::vector<CandidatePatch>& working_set);

	SchedulerOptions options_;
	SandboxFactory sandbox_factory_;
	IChatClient& chat_;
	ToolExecutorFactory executor_factory_;
	const ResultStore& store_;
};

}  // namespace PatchArbiter

#endif  // PATCHARBITER_SRC_SELECTION_GROUP_SCHEDULER_H_
