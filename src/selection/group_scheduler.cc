#include "group_scheduler.h"

#include <glog/logging.h>

#include "agent/selector_agent.h"
#include "agent/trajectory_recorder.h"
#include "common/cancellation.h"
#include "common/errors.h"
#include "common/group_log_sink.h"
#include "consensus_runner.h"

namespace PatchArbiter {

const char* GroupOutcomeName(GroupOutcome outcome) {
	switch (outcome) {
		case GroupOutcome::kSkippedExisting: return "skipped";
		case GroupOutcome::kTrivial: return "trivial";
		case GroupOutcome::kResolved: return "resolved";
		case GroupOutcome::kUnresolved: return "unresolved";
	}
	return "unknown";
}

SchedulerOptions SchedulerOptions::FromConfig(const PatchArbiterConfig& config) {
	SchedulerOptions options;
	options.max_retry = config.selector.max_retry.get();
	options.max_turn = config.selector.max_turn.get();
	options.num_candidate = config.selector.num_candidate.get();
	options.group_size = config.selector.group_size.get();
	options.majority_voting = config.selector.majority_voting.get();
	return options;
}

GroupScheduler::GroupScheduler(SchedulerOptions options, SandboxFactory sandbox_factory,
		IChatClient& chat, ToolExecutorFactory executor_factory, const ResultStore& store)
	: options_(options), sandbox_factory_(std::move(sandbox_factory)), chat_(chat),
	  executor_factory_(std::move(executor_factory)), store_(store) {}

std::vector<GroupOutcome> GroupScheduler::RunInstance(const Instance& instance,
		const CandidateLog& log) {
	std::vector<CandidateGroup> groups = PartitionGroups(log, options_.num_candidate, options_.group_size);
	std::vector<GroupOutcome> outcomes;
	outcomes.reserve(groups.size());
	for (const auto& group : groups) {
		outcomes.push_back(RunGroup(instance, group, groups.size()));
	}
	LOG(INFO) << "finished: " << instance.instance_id;
	return outcomes;
}

GroupOutcome GroupScheduler::RunGroup(const Instance& instance, const CandidateGroup& group,
		size_t num_groups) {
	const std::string tag = "[Group " + std::to_string(group.group_id) + "/" +
		std::to_string(num_groups) + "] " + instance.instance_id;
	LOG(INFO) << tag << ": processing";

	if (store_.StatisticsExists(instance.instance_id, group.group_id)) {
		LOG(INFO) << tag << ": already processed, skipping";
		return GroupOutcome::kSkippedExisting;
	}

	const GroupVerdict verdict = ClassifyGroup(group);
	if (verdict != GroupVerdict::kNeedsSelection) {
		const bool all_success = verdict == GroupVerdict::kAllSuccess;
		LOG(INFO) << tag << ": " << GroupVerdictName(verdict) << ", skipping selection";
		store_.SavePatch(instance.instance_id, group.group_id, group.patches[0]);
		StatisticsRecord record;
		record.instance_id = instance.instance_id;
		record.patch_id = 0;
		record.is_success = all_success ? 1 : 0;
		record.is_all_success = all_success;
		record.is_all_failed = !all_success;
		store_.SaveStatistics(group.group_id, record);
		return GroupOutcome::kTrivial;
	}

	ScopedGroupLogSink sink(store_.GroupLogPath(instance.instance_id, group.group_id));
	for (int attempt = 1; attempt <= options_.max_retry; ++attempt) {
		LOG(INFO) << tag << ": attempt " << attempt << "/" << options_.max_retry;
		try {
			Attempt(instance, group, attempt);
			return GroupOutcome::kResolved;
		} catch (const AttemptCancelled& e) {
			LOG(WARNING) << tag << ": cancelled: " << e.what();
			throw;
		} catch (const std::exception& e) {
			LOG(ERROR) << tag << ": attempt " << attempt << " failed: " << e.what();
		}
	}
	LOG(ERROR) << tag << ": all " << options_.max_retry << " attempts failed; group left unresolved";
	return GroupOutcome::kUnresolved;
}

void GroupScheduler::Attempt(const Instance& instance, const CandidateGroup& group, int attempt) {
	const std::vector<CandidatePatch> working_set = BuildWorkingSet(group);
	VLOG(1) << "[Retry No:" << attempt << "] working set ready (" << working_set.size() << ")";

	if (working_set.size() == 1) {
		LOG(INFO) << "Single candidate " << working_set[0].id << " left; selected without an agent";
		Persist(group, working_set[0].id, working_set[0].patch, working_set);
		return;
	}

	ThrowIfCancelled("group attempt");
	// Destruction stops the container on every exit path.
	std::unique_ptr<ISandbox> sandbox = sandbox_factory_(instance);
	sandbox->Start();
	const std::string project_path = sandbox->ProjectPath();
	const std::string issue = instance.problem_statement.empty() ? group.issue : instance.problem_statement;
	VLOG(1) << "[Retry No:" << attempt << "] sandbox " << sandbox->Name() << " ready";

	ConsensusRunner runner(static_cast<int>(group.size()), options_.majority_voting);
	ConsensusResult consensus = runner.Run([&](int round) {
		std::unique_ptr<IToolExecutor> executor = executor_factory_(*sandbox);
		TrajectoryRecorder recorder(
				store_.TrajectoryPath(instance.instance_id, group.group_id, round),
				issue, chat_.Provider(), chat_.Model(), options_.max_turn);
		SelectorAgent agent(chat_, *executor, &recorder, working_set, project_path,
				issue, options_.max_turn);
		return agent.Run();
	});

	Persist(group, consensus.chosen_id, consensus.patch, working_set);
	sandbox->Stop();
}

void GroupScheduler::Persist(const CandidateGroup& group, int chosen_id, const std::string& patch,
		const std::vector<CandidatePatch>& working_set) {
	int is_success = 0;
	for (const auto& candidate : working_set) {
		if (candidate.id == chosen_id) {
			is_success = candidate.ground_truth_success ? 1 : 0;
		}
	}
	store_.SavePatch(group.instance_id, group.group_id, patch);
	StatisticsRecord record;
	record.instance_id = group.instance_id;
	record.patch_id = chosen_id;
	record.is_success = is_success;
	store_.SaveStatistics(group.group_id, record);
}

}  // namespace PatchArbiter
