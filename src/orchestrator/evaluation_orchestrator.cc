#include "evaluation_orchestrator.h"

#include <glog/logging.h>

#include "common/errors.h"

namespace PatchArbiter {

EvaluationOrchestrator::EvaluationOrchestrator(std::vector<Instance> instances,
		std::unordered_map<std::string, CandidateLog> candidates,
		InstanceRunner runner, WorkerPoolOptions pool_options)
	: instances_(std::move(instances)), candidates_(std::move(candidates)),
	  runner_(std::move(runner)), pool_options_(pool_options) {}

int EvaluationOrchestrator::ExitCodeFor(const std::vector<GroupOutcome>& outcomes) {
	for (GroupOutcome outcome : outcomes) {
		if (outcome == GroupOutcome::kUnresolved) return kPartialExitCode;
	}
	return 0;
}

OrchestratorSummary EvaluationOrchestrator::RunAll() {
	OrchestratorSummary summary;
	WorkerPool pool(pool_options_);
	for (const auto& instance : instances_) {
		auto it = candidates_.find(instance.instance_id);
		if (it == candidates_.end()) {
			LOG(WARNING) << "No candidate log for " << instance.instance_id << "; skipping";
			++summary.missing_candidates;
			continue;
		}
		const Instance* inst = &instance;
		const CandidateLog* log = &it->second;
		pool.Submit(instance.instance_id, [this, inst, log]() {
			return ExitCodeFor(runner_(*inst, *log));
		});
	}

	summary.reports = pool.Run([](const TaskReport& report, size_t done, size_t total) {
		LOG(INFO) << "Processing instances: " << done << "/" << total
			<< " (completed: " << report.name << ", " << TaskStatusName(report.status) << ")";
	});
	summary.total = summary.reports.size();
	for (const auto& report : summary.reports) {
		switch (report.status) {
			case TaskStatus::kSucceeded: ++summary.succeeded; break;
			case TaskStatus::kPartial: ++summary.partial; break;
			case TaskStatus::kFailed: ++summary.failed; break;
			case TaskStatus::kCrashed: ++summary.crashed; break;
			case TaskStatus::kTimedOut: ++summary.timed_out; break;
			case TaskStatus::kNotStarted: ++summary.not_started; break;
		}
	}
	LOG(INFO) << "Finished " << summary.total << " instances: " << summary.succeeded << " succeeded, "
		<< summary.partial << " partial, " << summary.failed << " failed, " << summary.crashed
		<< " crashed, " << summary.timed_out << " timed out, " << summary.not_started << " not started";
	return summary;
}

std::vector<GroupOutcome> EvaluationOrchestrator::RunOne(const std::string& instance_id) {
	for (const auto& instance : instances_) {
		if (instance.instance_id != instance_id) continue;
		auto it = candidates_.find(instance_id);
		if (it == candidates_.end()) {
			throw DatasetError("No candidate log for " + instance_id);
		}
		return runner_(instance, it->second);
	}
	throw DatasetError("Unknown instance " + instance_id);
}

}  // namespace PatchArbiter
