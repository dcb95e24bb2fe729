#ifndef PATCHARBITER_SRC_COMMON_SUBPROCESS_H_
#define PATCHARBITER_SRC_COMMON_SUBPROCESS_H_

#include <chrono>
#include <string>
#include <vector>

namespace PatchArbiter {

struct CommandResult {
	int exit_code = -1;
	std::string output;     // stdout and stderr, interleaved
	bool timed_out = false;

	bool ok() const { return !timed_out && exit_code == 0; }
};

/**
 * Runs argv[0] (looked up in PATH) with the given arguments and waits for it.
 * stdout and stderr are merged. The child is killed when `timeout` elapses.
 * Throws AttemptCancelled if cancellation is requested while waiting (unless
 * `cancellable` is false, as for teardown commands) and ArbiterError if the
 * process cannot be spawned.
 */
CommandResult RunCommand(const std::vector<std::string>& argv,
		std::chrono::seconds timeout, bool cancellable = true);

// Renders argv for log lines.
std::string JoinArgv(const std::vector<std::string>& argv);

// Trims leading and trailing ASCII whitespace.
std::string TrimWhitespace(const std::string& s);

}  // namespace PatchArbiter

#endif  // PATCHARBITER_SRC_COMMON_SUBPROCESS_H_
