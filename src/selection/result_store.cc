#include "result_store.h"

#include <filesystem>
#include <fstream>

#include <glog/logging.h>

#include "common/errors.h"
#include "common/json_utils.h"

namespace PatchArbiter {

namespace fs = std::filesystem;

namespace {

fs::path GroupDir(const std::string& root, int group_id) {
	return fs::path(root) / ("group_" + std::to_string(group_id));
}

}  // namespace

ResultStore::ResultStore(std::string patches_dir, std::string statistics_dir,
		std::string trajectory_dir, std::string log_dir)
	: patches_dir_(std::move(patches_dir)), statistics_dir_(std::move(statistics_dir)),
	  trajectory_dir_(std::move(trajectory_dir)), log_dir_(std::move(log_dir)) {}

ResultStore ResultStore::FromConfiguration(const Configuration& configuration) {
	return ResultStore(configuration.patchesDir(), configuration.statisticsDir(),
			configuration.trajectoryDir(), configuration.logDir());
}

std::string ResultStore::SavePatch(const std::string& instance_id, int group_id,
		const std::string& patch) const {
	const fs::path dir = GroupDir(patches_dir_, group_id);
	fs::create_directories(dir);
	int trial = 1;
	fs::path file;
	do {
		file = dir / (instance_id + "_" + std::to_string(trial++) + ".patch");
	} while (fs::exists(file));

	std::ofstream out(file, std::ios::binary | std::ios::trunc);
	if (!out) {
		throw ArbiterError("Cannot write patch file " + file.string());
	}
	out << patch;
	if (!out.flush()) {
		throw ArbiterError("Failed writing patch file " + file.string());
	}
	LOG(INFO) << "Patch saved in " << file.string();
	return file.string();
}

std::string ResultStore::StatisticsPath(const std::string& instance_id, int group_id) const {
	return (GroupDir(statistics_dir_, group_id) / (instance_id + ".json")).string();
}

void ResultStore::SaveStatistics(int group_id, const StatisticsRecord& record) const {
	Json::Value root(Json::objectValue);
	root["instance_id"] = record.instance_id;
	root["patch_id"] = record.patch_id;
	root["is_success"] = record.is_success;
	root["is_all_success"] = record.is_all_success;
	root["is_all_failed"] = record.is_all_failed;
	const std::string path = StatisticsPath(record.instance_id, group_id);
	WriteFileAtomically(path, ToJsonString(root));
	LOG(INFO) << "Statistics saved in " << path;
}

bool ResultStore::StatisticsExists(const std::string& instance_id, int group_id) const {
	std::error_code ec;
	const fs::path path = StatisticsPath(instance_id, group_id);
	if (!fs::is_regular_file(path, ec)) return false;
	auto size = fs::file_size(path, ec);
	return !ec && size > 0;
}

std::optional<StatisticsRecord> ResultStore::LoadStatistics(const std::string& instance_id,
		int group_id) const {
	if (!StatisticsExists(instance_id, group_id)) return std::nullopt;
	Json::Value root = ReadJsonFile(StatisticsPath(instance_id, group_id));
	StatisticsRecord record;
	record.instance_id = root.get("instance_id", "").asString();
	record.patch_id = root.get("patch_id", 0).asInt();
	record.is_success = root.get("is_success", 0).asInt();
	record.is_all_success = root.get("is_all_success", false).asBool();
	record.is_all_failed = root.get("is_all_failed", false).asBool();
	return record;
}

std::string ResultStore::TrajectoryPath(const std::string& instance_id, int group_id, int round) const {
	const fs::path dir = GroupDir(trajectory_dir_, group_id);
	fs::create_directories(dir);
	int trial = 1;
	fs::path file;
	do {
		file = dir / (instance_id + "_voting_" + std::to_string(round) + "_trail_" +
				std::to_string(trial++) + ".json");
	} while (fs::exists(file));
	return fs::absolute(file).string();
}

std::string ResultStore::GroupLogPath(const std::string& instance_id, int group_id) const {
	return (GroupDir(log_dir_, group_id) / (instance_id + ".log")).string();
}

}  // namespace PatchArbiter
