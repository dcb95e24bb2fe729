#ifndef PATCHARBITER_SRC_AGENT_TRAJECTORY_RECORDER_H_
#define PATCHARBITER_SRC_AGENT_TRAJECTORY_RECORDER_H_

#include <chrono>
#include <string>
#include <vector>

#include <json/json.h>

#include "chat_types.h"

namespace PatchArbiter {

/**
 * Writes one episode's trajectory to a JSON file. The file is rewritten
 * after every interaction so a crashed episode still leaves its turns behind.
 * An empty path disables recording.
 */
class TrajectoryRecorder {
public:
	TrajectoryRecorder(std::string path, std::string task, std::string provider,
			std::string model, int max_steps);

	// `input` holds the messages added to the conversation since the last call.
	void RecordInteraction(const std::vector<Message>& input, const ChatResponse& response,
			const std::vector<ToolSpec>& tools);
	void Finalize(bool success, const std::string& final_result);

	const std::string& path() const { return path_; }
	const Json::Value& trajectory() const { return trajectory_; }

private:
	void Save();

	std::string path_;
	std::string provider_;
	std::string model_;
	Json::Value trajectory_;
	std::chrono::steady_clock::time_point started_;
};

// Local time as "YYYY-MM-DDTHH:MM:SS".
std::string CurrentTimestamp();

}  // namespace PatchArbiter

#endif  // PATCHARBITER_SRC_AGENT_TRAJECTORY_RECORDER_H_
