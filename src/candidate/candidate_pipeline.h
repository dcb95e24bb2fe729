#ifndef PATCHARBITER_SRC_CANDIDATE_CANDIDATE_PIPELINE_H_
#define PATCHARBITER_SRC_CANDIDATE_CANDIDATE_PIPELINE_H_

#include <string>
#include <vector>

#include "dataset.h"

namespace PatchArbiter {

struct CandidatePatch {
	int id = 0;                        // group-local index, stable across the group
	std::string patch;                 // raw diff shown to the agent
	std::string signature;             // CanonicalizePatch(patch)
	bool regression_clean = false;
	bool ground_truth_success = false; // bookkeeping only, never shown to the agent
};

// A slice of one instance's candidate list, processed and checkpointed alone.
struct CandidateGroup {
	std::string instance_id;
	std::string issue;
	int group_id = 0;
	std::vector<std::string> patches;
	std::vector<std::vector<std::string>> regressions;
	std::vector<int> success_id;

	size_t size() const { return patches.size(); }
};

enum class GroupVerdict {
	kNeedsSelection,
	kAllSuccess,
	kAllFailed,
};

const char* GroupVerdictName(GroupVerdict verdict);

/**
 * Cuts the first min(num_candidate, patches) candidates into consecutive
 * groups of at most group_size.
 */
std::vector<CandidateGroup> PartitionGroups(const CandidateLog& log,
		int num_candidate, int group_size);

/**
 * Trivial-group check: every ground-truth flag 1 or every flag not 1 means
 * no agent run is needed.
 */
GroupVerdict ClassifyGroup(const CandidateGroup& group);

/**
 * Working set for one episode: empty diffs dropped, restricted to
 * regression-clean candidates when any exist, deduplicated by canonical
 * signature keeping the first occurrence. Position i in the result is
 * shown to the agent as Patch-(i+1). Never empty for a non-empty group.
 */
std::vector<CandidatePatch> BuildWorkingSet(const CandidateGroup& group);

}  // namespace PatchArbiter

#endif  // PATCHARBITER_SRC_CANDIDATE_CANDIDATE_PIPELINE_H_
