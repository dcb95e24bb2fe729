#ifndef PATCHARBITER_SRC_ORCHESTRATOR_EVALUATION_ORCHESTRATOR_H_
#define PATCHARBITER_SRC_ORCHESTRATOR_EVALUATION_ORCHESTRATOR_H_

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "candidate/dataset.h"
#include "selection/group_scheduler.h"
#include "worker_pool.h"

namespace PatchArbiter {

struct OrchestratorSummary {
	size_t total = 0;
	size_t succeeded = 0;
	size_t partial = 0;
	size_t failed = 0;
	size_t crashed = 0;
	size_t timed_out = 0;
	size_t not_started = 0;
	size_t missing_candidates = 0;
	std::vector<TaskReport> reports;

	bool AllSucceeded() const { return succeeded == total; }
};

// Processes every group of one instance. Runs inside the worker process.
using InstanceRunner =
	std::function<std::vector<GroupOutcome>(const Instance&, const CandidateLog&)>;

/**
 * Fans instances out over a WorkerPool, one worker process per instance,
 * and tallies the outcome of each. An instance without a candidate log is
 * reported and skipped.
 */
class EvaluationOrchestrator {
public:
	EvaluationOrchestrator(std::vector<Instance> instances,
			std::unordered_map<std::string, CandidateLog> candidates,
			InstanceRunner runner, WorkerPoolOptions pool_options);

	OrchestratorSummary RunAll();

	// Runs a single instance in the calling process. Throws DatasetError for
	// an unknown instance id.
	std::vector<GroupOutcome> RunOne(const std::string& instance_id);

	// 0 when every group finished, kPartialExitCode when any is unresolved.
	static int ExitCodeFor(const std::vector<GroupOutcome>& outcomes);

private:
	std::vector<Instance> instances_;
	std::unordered_map<std::string, CandidateLog> candidates_;
	InstanceRunner runner_;
	WorkerPoolOptions pool_options_;
};

}  // namespace PatchArbiter

#endif  // PATCHARBITER_SRC_ORCHESTRATOR_EVALUATION_ORCHESTRATOR_H_
