#include "candidate_pipeline.h"

#include <algorithm>
#include <unordered_set>

#include <glog/logging.h>

#include "common/errors.h"
#include "common/subprocess.h"
#include "patch_canonicalizer.h"

namespace PatchArbiter {

const char* GroupVerdictName(GroupVerdict verdict) {
	switch (verdict) {
		case GroupVerdict::kNeedsSelection: return "needs_selection";
		case GroupVerdict::kAllSuccess: return "all_success";
		case GroupVerdict::kAllFailed: return "all_failed";
	}
	return "unknown";
}

std::vector<CandidateGroup> PartitionGroups(const CandidateLog& log,
		int num_candidate, int group_size) {
	if (group_size < 1) {
		throw ArbiterError("group_size must be at least 1");
	}
	const size_t limit = std::min(log.patches.size(),
			static_cast<size_t>(std::max(num_candidate, 0)));
	if (limit < static_cast<size_t>(std::max(num_candidate, 0))) {
		LOG(WARNING) << log.instance_id << " has " << log.patches.size()
			<< " candidates, fewer than num_candidate=" << num_candidate;
	}

	std::vector<CandidateGroup> groups;
	for (size_t begin = 0; begin < limit; begin += static_cast<size_t>(group_size)) {
		const size_t end = std::min(limit, begin + static_cast<size_t>(group_size));
		CandidateGroup group;
		group.instance_id = log.instance_id;
		group.issue = log.issue;
		group.group_id = static_cast<int>(groups.size());
		group.patches.assign(log.patches.begin() + begin, log.patches.begin() + end);
		group.success_id.assign(log.success_id.begin() + begin, log.success_id.begin() + end);
		for (size_t i = begin; i < end; ++i) {
			group.regressions.push_back(i < log.regressions.size()
					? log.regressions[i] : std::vector<std::string>{});
		}
		groups.push_back(std::move(group));
	}
	return groups;
}

GroupVerdict ClassifyGroup(const CandidateGroup& group) {
	if (group.success_id.empty()) {
		throw ArbiterError("Cannot classify empty group " + std::to_string(group.group_id) +
				" of " + group.instance_id);
	}
	bool all_success = true;
	bool all_failed = true;
	for (int flag : group.success_id) {
		if (flag == 1) {
			all_failed = false;
		} else {
			all_success = false;
		}
	}
	if (all_success) return GroupVerdict::kAllSuccess;
	if (all_failed) return GroupVerdict::kAllFailed;
	return GroupVerdict::kNeedsSelection;
}

std::vector<CandidatePatch> BuildWorkingSet(const CandidateGroup& group) {
	std::vector<CandidatePatch> candidates;
	for (size_t idx = 0; idx < group.patches.size(); ++idx) {
		if (TrimWhitespace(group.patches[idx]).empty()) {
			VLOG(1) << group.instance_id << " candidate " << idx << " has an empty diff; dropped";
			continue;
		}
		CandidatePatch candidate;
		candidate.id = static_cast<int>(idx);
		candidate.patch = group.patches[idx];
		candidate.signature = CanonicalizePatch(candidate.patch);
		candidate.regression_clean = idx >= group.regressions.size() || group.regressions[idx].empty();
		candidate.ground_truth_success = idx < group.success_id.size() && group.success_id[idx] == 1;
		candidates.push_back(std::move(candidate));
	}

	if (candidates.empty()) {
		if (group.patches.empty()) {
			throw ArbiterError("Group " + std::to_string(group.group_id) + " of " +
					group.instance_id + " has no candidates");
		}
		LOG(WARNING) << group.instance_id << " group " << group.group_id
			<< ": every candidate diff is empty; keeping candidate 0";
		CandidatePatch only;
		only.id = 0;
		only.patch = group.patches[0];
		only.signature = CanonicalizePatch(only.patch);
		only.regression_clean = group.regressions.empty() || group.regressions[0].empty();
		only.ground_truth_success = !group.success_id.empty() && group.success_id[0] == 1;
		candidates.push_back(std::move(only));
		return candidates;
	}

	// Regression filter
	std::vector<CandidatePatch> clean;
	std::copy_if(candidates.begin(), candidates.end(), std::back_inserter(clean),
			[](const CandidatePatch& c) { return c.regression_clean; });
	if (!clean.empty()) {
		candidates = std::move(clean);
	} else {
		VLOG(1) << group.instance_id << " group " << group.group_id
			<< ": no regression-clean candidate, keeping all " << candidates.size();
	}

	// Deduplication
	std::vector<CandidatePatch> unique;
	std::unordered_set<std::string> seen;
	for (auto& candidate : candidates) {
		if (seen.insert(candidate.signature).second) {
			unique.push_back(std::move(candidate));
		} else {
			VLOG(1) << group.instance_id << " candidate " << candidate.id << " duplicates an earlier one";
		}
	}

	LOG(INFO) << group.instance_id << " group " << group.group_id << ": working set "
		<< unique.size() << " of " << group.patches.size() << " candidates";
	return unique;
}

}  // namespace PatchArbiter
