#include "trajectory_recorder.h"

#include <ctime>

#include <glog/logging.h>

#include "common/json_utils.h"

namespace PatchArbiter {

std::string CurrentTimestamp() {
	std::time_t now = std::time(nullptr);
	struct tm local;
	localtime_r(&now, &local);
	char buf[32];
	std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &local);
	return buf;
}

TrajectoryRecorder::TrajectoryRecorder(std::string path, std::string task, std::string provider,
		std::string model, int max_steps)
	: path_(std::move(path)), provider_(std::move(provider)), model_(std::move(model)),
	  trajectory_(Json::objectValue), started_(std::chrono::steady_clock::now()) {
	trajectory_["task"] = task;
	trajectory_["start_time"] = CurrentTimestamp();
	trajectory_["end_time"] = Json::Value();
	trajectory_["provider"] = provider_;
	trajectory_["model"] = model_;
	trajectory_["max_steps"] = max_steps;
	trajectory_["llm_interactions"] = Json::Value(Json::arrayValue);
	trajectory_["success"] = false;
	trajectory_["final_result"] = Json::Value();
	trajectory_["execution_time"] = 0.0;
	Save();
}

void TrajectoryRecorder::RecordInteraction(const std::vector<Message>& input,
		const ChatResponse& response, const std::vector<ToolSpec>& tools) {
	Json::Value interaction(Json::objectValue);
	interaction["timestamp"] = CurrentTimestamp();
	interaction["provider"] = provider_;
	interaction["model"] = model_;
	interaction["input_messages"] = Json::Value(Json::arrayValue);
	for (const auto& message : input) {
		interaction["input_messages"].append(MessageToJson(message));
	}
	interaction["response"] = ResponseToJson(response);
	interaction["tools_available"] = Json::Value(Json::arrayValue);
	for (const auto& tool : tools) {
		interaction["tools_available"].append(tool.name);
	}
	trajectory_["llm_interactions"].append(interaction);
	Save();
}

void TrajectoryRecorder::Finalize(bool success, const std::string& final_result) {
	trajectory_["end_time"] = CurrentTimestamp();
	trajectory_["success"] = success;
	trajectory_["final_result"] = final_result;
	trajectory_["execution_time"] = std::chrono::duration<double>(
			std::chrono::steady_clock::now() - started_).count();
	Save();
}

void TrajectoryRecorder::Save() {
	if (path_.empty()) return;
	WriteFileAtomically(path_, ToJsonString(trajectory_));
}

}  // namespace PatchArbiter
