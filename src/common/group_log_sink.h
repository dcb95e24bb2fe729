#ifndef PATCHARBITER_SRC_COMMON_GROUP_LOG_SINK_H_
#define PATCHARBITER_SRC_COMMON_GROUP_LOG_SINK_H_

#include <fstream>
#include <mutex>
#include <string>

#include <glog/logging.h>

namespace PatchArbiter {

/**
 * Mirrors every glog message into a per-group log file while in scope.
 * Registered with google::AddLogSink on construction and removed on
 * destruction, so a group's log holds exactly what was logged while the
 * group was being processed.
 */
class ScopedGroupLogSink : public google::LogSink {
public:
	explicit ScopedGroupLogSink(const std::string& path);
	~ScopedGroupLogSink() override;

	ScopedGroupLogSink(const ScopedGroupLogSink&) = delete;
	ScopedGroupLogSink& operator=(const ScopedGroupLogSink&) = delete;

	void send(google::LogSeverity severity, const char* full_filename,
			const char* base_filename, int line,
			const struct ::tm* tm_time,
			const char* message, size_t message_len) override;

	const std::string& path() const { return path_; }

private:
	std::string path_;
	std::mutex mutex_;
	std::ofstream out_;
	bool registered_ = false;
};

}  // namespace PatchArbiter

#endif  // PATCHARBITER_SRC_COMMON_GROUP_LOG_SINK_H_
