#ifndef PATCHARBITER_SRC_ORCHESTRATOR_WORKER_POOL_H_
#define PATCHARBITER_SRC_ORCHESTRATOR_WORKER_POOL_H_

#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace PatchArbiter {

enum class TaskStatus {
	kSucceeded,   // exit 0
	kPartial,     // exit kPartialExitCode
	kFailed,      // any other exit code
	kCrashed,     // killed by a signal
	kTimedOut,    // killed after its deadline
	kNotStarted,  // pool interrupted before launch
};

const char* TaskStatusName(TaskStatus status);

constexpr int kPartialExitCode = 2;

struct TaskReport {
	std::string name;
	TaskStatus status = TaskStatus::kNotStarted;
	int exit_code = -1;
	int signal = 0;
	double seconds = 0.0;
};

struct WorkerPoolOptions {
	int workers = 4;
	std::chrono::seconds task_timeout{0};  // 0 = no deadline
	std::chrono::seconds kill_grace{30};
};

// Body of one task, run in a forked child. The return value is the exit code.
using WorkerTask = std::function<int()>;

/**
 * Bounded pool of forked worker processes, one task per process.
 *
 * A task that throws exits with status 1; a task past its deadline gets
 * SIGTERM and, after the grace period, SIGKILL. When cancellation is
 * requested in the supervising process, running workers get SIGTERM and no
 * further task is launched.
 */
class WorkerPool {
public:
	explicit WorkerPool(WorkerPoolOptions options);

	void Submit(std::string name, WorkerTask task);

	using CompletionCallback = std::function<void(const TaskReport&, size_t done, size_t total)>;
	// Blocks until every task finished; reports are in submission order.
	std::vector<TaskReport> Run(const CompletionCallback& on_complete = nullptr);

private:
	struct Running {
		size_t index;
		pid_t pid;
		std::chrono::steady_clock::time_point started;
		std::chrono::steady_clock::time_point term_sent;
		bool terminated = false;
		bool timed_out = false;
	};

	pid_t Launch(size_t index);

	WorkerPoolOptions options_;
	std::vector<std::pair<std::string, WorkerTask>> tasks_;
};

}  // namespace PatchArbiter

#endif  // PATCHARBITER_SRC_ORCHESTRATOR_WORKER_POOL_H_
