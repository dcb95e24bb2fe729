#ifndef PATCHARBITER_SRC_SANDBOX_SHELL_SESSION_H_
#define PATCHARBITER_SRC_SANDBOX_SHELL_SESSION_H_

#include <chrono>
#include <memory>
#include <regex>
#include <string>
#include <vector>

#include <sys/types.h>

#include "common/scoped_fd.h"
#include "sandbox.h"

namespace PatchArbiter {

struct ShellOptions {
	std::chrono::seconds startup_timeout{10};
	// Matches the tail of the output once the shell is ready for input.
	std::string prompt_pattern = R"([$#>] ?$)";
};

/**
 * Interactive shell on a pseudo-terminal.
 *
 * After the first prompt the session turns echo off and installs a private
 * prompt token. Each Execute() writes the command followed by a printf of a
 * per-command marker; the output is everything before the marker with
 * prompt tokens, carriage returns and terminal escapes removed. A timeout
 * or shell exit yields a recoverable observation and leaves the session
 * dead; callers open a new one.
 */
class PtyShellSession : public IShellSession {
public:
	// Spawns argv on a new pty and waits for the prompt. Throws ShellError.
	static std::unique_ptr<PtyShellSession> Spawn(const std::vector<std::string>& argv,
			const ShellOptions& options);

	~PtyShellSession() override;

	PtyShellSession(const PtyShellSession&) = delete;
	PtyShellSession& operator=(const PtyShellSession&) = delete;

	ShellOutput Execute(const std::string& command, std::chrono::seconds timeout) override;
	void Close() override;
	bool IsAlive() const override { return pid_ > 0 && !broken_; }

	pid_t pid() const { return pid_; }

private:
	PtyShellSession(pid_t pid, ScopedFd master, ShellOptions options);

	enum class ReadStatus { kData, kIdle, kClosed };

	// Reads whatever is available within `wait_ms` into buffer_.
	ReadStatus ReadSome(int wait_ms);
	bool WriteAll(const std::string& data);
	// Reads until `done(buffer_)` or the deadline. False on timeout or EOF.
	template<typename Pred>
	bool ReadUntil(Pred done, std::chrono::steady_clock::time_point deadline, bool* closed);
	void Initialize();
	std::string Clean(const std::string& raw) const;

	pid_t pid_;
	ScopedFd master_;
	ShellOptions options_;
	std::regex prompt_regex_;
	std::string buffer_;
	unsigned long marker_seq_ = 0;
	bool broken_ = false;
};

}  // namespace PatchArbiter

#endif  // PATCHARBITER_SRC_SANDBOX_SHELL_SESSION_H_
