#ifndef PATCHARBITER_SRC_CANDIDATE_DATASET_H_
#define PATCHARBITER_SRC_CANDIDATE_DATASET_H_

#include <string>
#include <unordered_map>
#include <vector>

namespace PatchArbiter {

struct Instance {
	std::string instance_id;
	std::string base_commit;
	std::string problem_statement;
};

// Every candidate patch proposed for one instance, with its regression
// failures and ground-truth outcome at the same index.
struct CandidateLog {
	std::string instance_id;
	std::string issue;
	std::vector<std::string> patches;
	std::vector<std::vector<std::string>> regressions;
	std::vector<int> success_id;
};

// JSON array of {instance_id, base_commit, problem_statement}.
std::vector<Instance> LoadInstances(const std::string& path);
std::vector<Instance> ParseInstances(const std::string& json_text, const std::string& origin);

// One JSON object per line. A missing "regressions" field becomes one empty
// failure list per patch.
std::unordered_map<std::string, CandidateLog> LoadCandidateLogs(const std::string& path);
CandidateLog ParseCandidateLogLine(const std::string& line, const std::string& origin);

}  // namespace PatchArbiter

#endif  // PATCHARBITER_SRC_CANDIDATE_DATASET_H_
