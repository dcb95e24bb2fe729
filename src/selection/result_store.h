#ifndef PATCHARBITER_SRC_SELECTION_RESULT_STORE_H_
#define PATCHARBITER_SRC_SELECTION_RESULT_STORE_H_

#include <optional>
#include <string>

#include "common/configuration.h"

namespace PatchArbiter {

struct StatisticsRecord {
	std::string instance_id;
	int patch_id = 0;
	int is_success = 0;
	bool is_all_success = false;
	bool is_all_failed = false;
};

/**
 * Output layout, one directory per group under each root:
 *   <patches>/group_<g>/<iid>_<n>.patch
 *   <statistics>/group_<g>/<iid>.json
 *   <trajectories>/group_<g>/<iid>_voting_<round>_trail_<n>.json
 *   <logs>/group_<g>/<iid>.log
 * Indices n start at 1 and take the first unused value.
 */
class ResultStore {
public:
	ResultStore(std::string patches_dir, std::string statistics_dir,
			std::string trajectory_dir, std::string log_dir);

	static ResultStore FromConfiguration(const Configuration& configuration);

	// Returns the written path.
	std::string SavePatch(const std::string& instance_id, int group_id, const std::string& patch) const;

	// Atomic; a reader sees either no file or the complete record.
	void SaveStatistics(int group_id, const StatisticsRecord& record) const;
	bool StatisticsExists(const std::string& instance_id, int group_id) const;
	std::optional<StatisticsRecord> LoadStatistics(const std::string& instance_id, int group_id) const;

	std::string StatisticsPath(const std::string& instance_id, int group_id) const;
	std::string TrajectoryPath(const std::string& instance_id, int group_id, int round) const;
	std::string GroupLogPath(const std::string& instance_id, int group_id) const;

private:
	std::string patches_dir_;
	std::string statistics_dir_;
	std::string trajectory_dir_;
	std::string log_dir_;
};

}  // namespace PatchArbiter

#endif  // PATCHARBITER_SRC_SELECTION_RESULT_STORE_H_
