#include "shell_session.h"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <pty.h>
#include <sys/wait.h>
#include <termios.h>
#include <unistd.h>

#include <glog/logging.h>

#include "common/cancellation.h"
#include "common/errors.h"

namespace PatchArbiter {

namespace {

// What bash prints once PS1 is installed. The setup line splits the literal
// so an echoed copy of it never matches.
constexpr char kPromptToken[] = "__PA_PROMPT__> ";
constexpr char kPromptSetup[] =
	"stty -echo; export PS1=\"__PA_\"\"PROMPT__> \" PS2=\"\"; unset PROMPT_COMMAND\n";
constexpr char kMarkerPrefix[] = "__PA_DONE_";
constexpr int kPollSliceMs = 100;
constexpr auto kExitGrace = std::chrono::seconds(2);

const std::regex kEscapeSequence("\x1b\\[[0-9;?]*[A-Za-z]");

void ReplaceAll(std::string& s, const std::string& from, const std::string& to) {
	if (from.empty()) return;
	size_t pos = 0;
	while ((pos = s.find(from, pos)) != std::string::npos) {
		s.replace(pos, from.size(), to);
		pos += to.size();
	}
}

}  // namespace

std::unique_ptr<PtyShellSession> PtyShellSession::Spawn(const std::vector<std::string>& argv,
		const ShellOptions& options) {
	if (argv.empty()) {
		throw ShellError("empty shell command");
	}
	std::vector<char*> c_argv;
	for (const auto& arg : argv) c_argv.push_back(const_cast<char*>(arg.c_str()));
	c_argv.push_back(nullptr);

	struct winsize ws;
	std::memset(&ws, 0, sizeof(ws));
	ws.ws_row = 50;
	ws.ws_col = 512;

	int master = -1;
	pid_t pid = ::forkpty(&master, nullptr, nullptr, &ws);
	if (pid < 0) {
		throw ShellError(std::string("forkpty failed: ") + strerror(errno));
	}
	if (pid == 0) {
		::setenv("TERM", "dumb", 1);
		::execvp(c_argv[0], c_argv.data());
		_exit(127);
	}

	::fcntl(master, F_SETFL, ::fcntl(master, F_GETFL) | O_NONBLOCK);
	std::unique_ptr<PtyShellSession> session(
			new PtyShellSession(pid, ScopedFd(master), options));
	session->Initialize();
	VLOG(1) << "Shell session " << pid << " ready: " << argv[0];
	return session;
}

PtyShellSession::PtyShellSession(pid_t pid, ScopedFd master, ShellOptions options)
	: pid_(pid), master_(std::move(master)), options_(std::move(options)),
	  prompt_regex_(options_.prompt_pattern) {}

PtyShellSession::~PtyShellSession() {
	Close();
}

void PtyShellSession::Initialize() {
	const auto deadline = std::chrono::steady_clock::now() + options_.startup_timeout;
	bool closed = false;
	auto prompt_shown = [this](const std::string& raw) {
		return std::regex_search(Clean(raw), prompt_regex_);
	};
	if (!ReadUntil(prompt_shown, deadline, &closed)) {
		std::string seen = Clean(buffer_);
		Close();
		throw ShellError(std::string(closed ? "shell exited" : "no prompt") +
				" during startup; output: " + seen.substr(0, 512));
	}

	buffer_.clear();
	if (!WriteAll(kPromptSetup)) {
		Close();
		throw ShellError("cannot write to shell");
	}
	auto token_shown = [](const std::string& raw) {
		return raw.find(kPromptToken) != std::string::npos;
	};
	if (!ReadUntil(token_shown, deadline, &closed)) {
		std::string seen = Clean(buffer_);
		Close();
		throw ShellError("shell did not accept prompt setup; output: " + seen.substr(0, 512));
	}
	buffer_.clear();
}

PtyShellSession::ReadStatus PtyShellSession::ReadSome(int wait_ms) {
	struct pollfd pfd;
	pfd.fd = master_.get();
	pfd.events = POLLIN;
	pfd.revents = 0;
	int ready = ::poll(&pfd, 1, wait_ms);
	if (ready < 0) {
		return errno == EINTR ? ReadStatus::kIdle : ReadStatus::kClosed;
	}
	if (ready == 0) return ReadStatus::kIdle;

	bool got_data = false;
	char chunk[8192];
	while (true) {
		ssize_t n = ::read(master_.get(), chunk, sizeof(chunk));
		if (n > 0) {
			buffer_.append(chunk, static_cast<size_t>(n));
			got_data = true;
			continue;
		}
		if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
			break;
		}
		if (n < 0 && errno == EINTR) {
			continue;
		}
		// EIO once the slave side is gone, or EOF
		return got_data ? ReadStatus::kData : ReadStatus::kClosed;
	}
	if (!got_data && (pfd.revents & POLLHUP)) return ReadStatus::kClosed;
	return got_data ? ReadStatus::kData : ReadStatus::kIdle;
}

bool PtyShellSession::WriteAll(const std::string& data) {
	size_t off = 0;
	while (off < data.size()) {
		ssize_t n = ::write(master_.get(), data.data() + off, data.size() - off);
		if (n > 0) {
			off += static_cast<size_t>(n);
			continue;
		}
		if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
			ThrowIfCancelled("shell write");
			std::this_thread::sleep_for(std::chrono::milliseconds(5));
			continue;
		}
		LOG(WARNING) << "Shell " << pid_ << " write failed: " << strerror(errno);
		return false;
	}
	return true;
}

template<typename Pred>
bool PtyShellSession::ReadUntil(Pred done, std::chrono::steady_clock::time_point deadline,
		bool* closed) {
	while (true) {
		if (done(buffer_)) return true;
		ThrowIfCancelled("shell read");
		auto now = std::chrono::steady_clock::now();
		if (now >= deadline) return false;
		auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
		ReadStatus status = ReadSome(static_cast<int>(std::min<long long>(remaining, kPollSliceMs)));
		if (status == ReadStatus::kClosed) {
			*closed = true;
			return done(buffer_);
		}
	}
}

std::string PtyShellSession::Clean(const std::string& raw) const {
	std::string text = std::regex_replace(raw, kEscapeSequence, "");
	ReplaceAll(text, "\r", "");
	ReplaceAll(text, kPromptToken, "");
	return text;
}

ShellOutput PtyShellSession::Execute(const std::string& command, std::chrono::seconds timeout) {
	ShellOutput result;
	if (!IsAlive()) {
		result.recoverable = true;
		result.text = "### Observation: Error: the shell session is no longer available; command '" +
			command + "' was not run.";
		return result;
	}

	// Drop leftovers from the previous command (trailing prompt and the like).
	while (ReadSome(0) == ReadStatus::kData) {}
	buffer_.clear();

	const std::string seq = std::to_string(++marker_seq_);
	const std::string marker = std::string(kMarkerPrefix) + seq + "__";
	std::string payload = command;
	payload += "\nprintf '";
	payload += kMarkerPrefix;
	payload += "%s__\\n' " + seq + "\n";

	VLOG(2) << "shell " << pid_ << " <- " << command;
	bool closed = !WriteAll(payload);
	const auto deadline = std::chrono::steady_clock::now() + timeout;
	bool finished = !closed && ReadUntil(
			[&marker](const std::string& raw) { return raw.find(marker) != std::string::npos; },
			deadline, &closed);

	if (finished) {
		size_t pos = buffer_.find(marker);
		std::string text = Clean(buffer_.substr(0, pos));
		while (!text.empty() && text.back() == '\n') text.pop_back();
		buffer_.erase(0, pos + marker.size());
		result.text = text;
		VLOG(3) << "shell " << pid_ << " -> " << result.text.size() << " bytes";
		return result;
	}

	broken_ = true;
	result.recoverable = true;
	std::string partial = Clean(buffer_);
	if (closed) {
		LOG(WARNING) << "Shell " << pid_ << " exited while running: " << command;
		result.text = "### Observation: Error: the shell exited while running '" + command +
			"'. Partial output:\n" + partial;
	} else {
		LOG(WARNING) << "Shell " << pid_ << " timed out after " << timeout.count() << "s: " << command;
		result.text = "### Observation: Error: Command '" + command + "' timed out after " +
			std::to_string(timeout.count()) + " seconds. Partial output:\n" + partial;
	}
	return result;
}

void PtyShellSession::Close() {
	if (pid_ <= 0) return;

	if (master_.valid() && !broken_) {
		// Best effort; the shell is killed below if it does not exit.
		const char kExit[] = "exit\n";
		if (::write(master_.get(), kExit, sizeof(kExit) - 1) < 0) {
			VLOG(1) << "Shell " << pid_ << " did not take exit: " << strerror(errno);
		}
	}
	const auto deadline = std::chrono::steady_clock::now() + kExitGrace;
	int status = 0;
	bool reaped = false;
	while (std::chrono::steady_clock::now() < deadline) {
		pid_t w = ::waitpid(pid_, &status, WNOHANG);
		if (w == pid_ || (w < 0 && errno == ECHILD)) {
			reaped = true;
			break;
		}
		if (master_.valid()) {
			// Keep the pty drained so the child never blocks on output.
			if (ReadSome(20) == ReadStatus::kClosed) master_.reset();
		} else {
			std::this_thread::sleep_for(std::chrono::milliseconds(20));
		}
	}
	if (!reaped) {
		::kill(-pid_, SIGKILL);
		::kill(pid_, SIGKILL);
		while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
	}
	VLOG(1) << "Shell session " << pid_ << " closed";
	master_.reset();
	buffer_.clear();
	pid_ = -1;
	broken_ = true;
}

}  // namespace PatchArbiter
