#include "worker_pool.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <thread>

#include <sys/wait.h>
#include <unistd.h>

#include <glog/logging.h>

#include "common/cancellation.h"
#include "common/errors.h"

namespace PatchArbiter {

namespace {

constexpr auto kReapInterval = std::chrono::milliseconds(100);

[[noreturn]] void ExitChild(int code) {
	google::FlushLogFiles(google::GLOG_INFO);
	std::cout.flush();
	std::cerr.flush();
	_exit(code);
}

}  // namespace

const char* TaskStatusName(TaskStatus status) {
	switch (status) {
		case TaskStatus::kSucceeded: return "succeeded";
		case TaskStatus::kPartial: return "partial";
		case TaskStatus::kFailed: return "failed";
		case TaskStatus::kCrashed: return "crashed";
		case TaskStatus::kTimedOut: return "timed_out";
		case TaskStatus::kNotStarted: return "not_started";
	}
	return "unknown";
}

WorkerPool::WorkerPool(WorkerPoolOptions options) : options_(options) {
	if (options_.workers < 1) {
		throw ArbiterError("worker pool needs at least one worker");
	}
}

void WorkerPool::Submit(std::string name, WorkerTask task) {
	tasks_.emplace_back(std::move(name), std::move(task));
}

pid_t WorkerPool::Launch(size_t index) {
	pid_t pid = ::fork();
	if (pid < 0) {
		throw ArbiterError(std::string("fork failed: ") + strerror(errno));
	}
	if (pid > 0) {
		return pid;
	}

	// Child
	ClearCancellation();
	int code = 1;
	try {
		code = tasks_[index].second();
	} catch (const std::exception& e) {
		LOG(ERROR) << "Task " << tasks_[index].first << " failed: " << e.what();
		code = 1;
	} catch (...) {
		LOG(ERROR) << "Task " << tasks_[index].first << " failed with a non-standard exception";
		code = 1;
	}
	ExitChild(code);
}

std::vector<TaskReport> WorkerPool::Run(const CompletionCallback& on_complete) {
	std::vector<TaskReport> reports(tasks_.size());
	for (size_t i = 0; i < tasks_.size(); ++i) reports[i].name = tasks_[i].first;

	std::vector<Running> running;
	size_t next = 0;
	size_t done = 0;
	bool forwarded = false;

	while ((!forwarded && next < tasks_.size()) || !running.empty()) {
		const auto now = std::chrono::steady_clock::now();

		if (CancellationRequested() && !forwarded) {
			LOG(WARNING) << "Interrupted; terminating " << running.size()
				<< " workers, " << tasks_.size() - next << " tasks not started";
			for (auto& r : running) {
				::kill(r.pid, SIGTERM);
				r.terminated = true;
				r.term_sent = now;
			}
			forwarded = true;
		}

		while (!forwarded && next < tasks_.size() &&
				running.size() < static_cast<size_t>(options_.workers)) {
			Running r;
			r.index = next;
			r.started = std::chrono::steady_clock::now();
			r.pid = Launch(next);
			VLOG(1) << "Started " << tasks_[next].first << " as pid " << r.pid;
			running.push_back(r);
			++next;
		}

		for (auto& r : running) {
			if (options_.task_timeout.count() > 0 && !r.terminated &&
					now - r.started > options_.task_timeout) {
				LOG(WARNING) << tasks_[r.index].first << " exceeded "
					<< options_.task_timeout.count() << "s; sending SIGTERM";
				::kill(r.pid, SIGTERM);
				r.terminated = true;
				r.timed_out = true;
				r.term_sent = now;
			} else if (r.terminated && now - r.term_sent > options_.kill_grace) {
				LOG(WARNING) << tasks_[r.index].first << " ignored SIGTERM; sending SIGKILL";
				::kill(r.pid, SIGKILL);
				r.term_sent = now;
			}
		}

		for (auto it = running.begin(); it != running.end();) {
			int status = 0;
			pid_t w = ::waitpid(it->pid, &status, WNOHANG);
			if (w == 0 || (w < 0 && errno == EINTR)) {
				++it;
				continue;
			}
			TaskReport& report = reports[it->index];
			report.seconds = std::chrono::duration<double>(
					std::chrono::steady_clock::now() - it->started).count();
			if (w < 0) {
				LOG(ERROR) << "waitpid for " << report.name << " failed: " << strerror(errno);
				report.status = TaskStatus::kCrashed;
			} else if (WIFEXITED(status)) {
				report.exit_code = WEXITSTATUS(status);
				if (it->timed_out) {
					report.status = TaskStatus::kTimedOut;
				} else if (report.exit_code == 0) {
					report.status = TaskStatus::kSucceeded;
				} else if (report.exit_code == kPartialExitCode) {
					report.status = TaskStatus::kPartial;
				} else {
					report.status = TaskStatus::kFailed;
				}
			} else if (WIFSIGNALED(status)) {
				report.signal = WTERMSIG(status);
				report.status = it->timed_out ? TaskStatus::kTimedOut : TaskStatus::kCrashed;
			}
			if (report.status == TaskStatus::kSucceeded) {
				LOG(INFO) << report.name << " " << TaskStatusName(report.status);
			} else {
				LOG(ERROR) << report.name << " " << TaskStatusName(report.status)
					<< " (exit " << report.exit_code << ", signal " << report.signal << ")";
			}
			++done;
			if (on_complete) on_complete(report, done, tasks_.size());
			it = running.erase(it);
		}

		if (!running.empty()) {
			std::this_thread::sleep_for(kReapInterval);
		}
	}
	return reports;
}

}  // namespace PatchArbiter
