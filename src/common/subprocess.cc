#include "subprocess.h"

#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <glog/logging.h>

#include "cancellation.h"
#include "errors.h"
#include "scoped_fd.h"

namespace PatchArbiter {

namespace {

constexpr int kPollSliceMs = 100;

void KillAndReap(pid_t pid) {
	::kill(pid, SIGKILL);
	int status = 0;
	while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
}

}  // namespace

CommandResult RunCommand(const std::vector<std::string>& argv,
		std::chrono::seconds timeout, bool cancellable) {
	if (argv.empty()) {
		throw ArbiterError("RunCommand called with empty argv");
	}
	VLOG(2) << "exec: " << JoinArgv(argv);

	int pipe_fd[2];
	if (::pipe(pipe_fd) != 0) {
		throw ArbiterError(std::string("pipe failed: ") + strerror(errno));
	}
	ScopedFd read_end(pipe_fd[0]);
	ScopedFd write_end(pipe_fd[1]);

	std::vector<char*> c_argv;
	c_argv.reserve(argv.size() + 1);
	for (const auto& arg : argv) {
		c_argv.push_back(const_cast<char*>(arg.c_str()));
	}
	c_argv.push_back(nullptr);

	pid_t pid = ::fork();
	if (pid < 0) {
		throw ArbiterError(std::string("fork failed: ") + strerror(errno));
	}
	if (pid == 0) {
		::dup2(write_end.get(), STDOUT_FILENO);
		::dup2(write_end.get(), STDERR_FILENO);
		::close(read_end.get());
		::close(write_end.get());
		int devnull = ::open("/dev/null", O_RDONLY);
		if (devnull >= 0) {
			::dup2(devnull, STDIN_FILENO);
			::close(devnull);
		}
		::execvp(c_argv[0], c_argv.data());
		_exit(127);
	}

	write_end.reset();
	::fcntl(read_end.get(), F_SETFL, ::fcntl(read_end.get(), F_GETFL) | O_NONBLOCK);

	CommandResult result;
	const auto deadline = std::chrono::steady_clock::now() + timeout;
	bool eof = false;
	char buffer[4096];

	while (!eof) {
		if (cancellable && CancellationRequested()) {
			KillAndReap(pid);
			throw AttemptCancelled("cancelled while running " + argv[0]);
		}
		if (std::chrono::steady_clock::now() >= deadline) {
			KillAndReap(pid);
			result.timed_out = true;
			LOG(WARNING) << "Command timed out after " << timeout.count() << "s: " << JoinArgv(argv);
			return result;
		}

		struct pollfd pfd;
		pfd.fd = read_end.get();
		pfd.events = POLLIN;
		pfd.revents = 0;
		int ready = ::poll(&pfd, 1, kPollSliceMs);
		if (ready < 0) {
			if (errno == EINTR) continue;
			KillAndReap(pid);
			throw ArbiterError(std::string("poll failed: ") + strerror(errno));
		}
		if (ready == 0) continue;

		while (true) {
			ssize_t n = ::read(read_end.get(), buffer, sizeof(buffer));
			if (n > 0) {
				result.output.append(buffer, static_cast<size_t>(n));
				continue;
			}
			if (n == 0) {
				eof = true;
			} else if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
				eof = true;
			}
			break;
		}
	}

	int status = 0;
	while (::waitpid(pid, &status, 0) < 0) {
		if (errno != EINTR) {
			throw ArbiterError(std::string("waitpid failed: ") + strerror(errno));
		}
	}
	if (WIFEXITED(status)) {
		result.exit_code = WEXITSTATUS(status);
	} else if (WIFSIGNALED(status)) {
		result.exit_code = 128 + WTERMSIG(status);
	}
	VLOG(3) << "exit " << result.exit_code << " from " << argv[0];
	return result;
}

std::string JoinArgv(const std::vector<std::string>& argv) {
	std::string joined;
	for (size_t i = 0; i < argv.size(); ++i) {
		if (i) joined += ' ';
		joined += argv[i];
	}
	return joined;
}

std::string TrimWhitespace(const std::string& s) {
	const char* ws = " \t\r\n\f\v";
	size_t begin = s.find_first_not_of(ws);
	if (begin == std::string::npos) return "";
	size_t end = s.find_last_not_of(ws);
	return s.substr(begin, end - begin + 1);
}

}  // namespace PatchArbiter
