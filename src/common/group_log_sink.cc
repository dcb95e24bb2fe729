#include "group_log_sink.h"

#include <ctime>
#include <filesystem>

namespace PatchArbiter {

ScopedGroupLogSink::ScopedGroupLogSink(const std::string& path) : path_(path) {
	std::filesystem::path p(path);
	std::error_code ec;
	if (p.has_parent_path()) {
		std::filesystem::create_directories(p.parent_path(), ec);
	}
	out_.open(path, std::ios::out | std::ios::app);
	if (!out_) {
		LOG(WARNING) << "Cannot open group log " << path << "; logging to stderr only";
		return;
	}
	google::AddLogSink(this);
	registered_ = true;
}

ScopedGroupLogSink::~ScopedGroupLogSink() {
	if (registered_) {
		google::RemoveLogSink(this);
	}
}

void ScopedGroupLogSink::send(google::LogSeverity severity, const char* /*full_filename*/,
		const char* base_filename, int line,
		const struct ::tm* tm_time,
		const char* message, size_t message_len) {
	char stamp[32] = {0};
	if (tm_time) {
		std::strftime(stamp, sizeof(stamp), "%Y%m%d %H:%M:%S", tm_time);
	}
	std::lock_guard<std::mutex> lock(mutex_);
	out_ << google::GetLogSeverityName(severity)[0] << stamp << ' '
		<< base_filename << ':' << line << "] ";
	out_.write(message, static_cast<std::streamsize>(message_len));
	out_ << '\n';
	out_.flush();
}

}  // namespace PatchArbiter
