#ifndef PATCHARBITER_SRC_COMMON_ERRORS_H_
#define PATCHARBITER_SRC_COMMON_ERRORS_H_

#include <stdexcept>
#include <string>

namespace PatchArbiter {

/**
 * Base of every error raised by the selection engine. Anything deriving from
 * it (or any other std::exception) that reaches GroupScheduler aborts the
 * current attempt.
 */
class ArbiterError : public std::runtime_error {
public:
	explicit ArbiterError(const std::string& what) : std::runtime_error(what) {}
};

// Container could not be created, provisioned or checked out.
class SandboxStartFailure : public ArbiterError {
public:
	explicit SandboxStartFailure(const std::string& what) : ArbiterError(what) {}
};

// Interactive shell could not be spawned or never showed a prompt.
class ShellError : public ArbiterError {
public:
	explicit ShellError(const std::string& what) : ArbiterError(what) {}
};

// Chat service failed after exhausting its own retries.
class ChatError : public ArbiterError {
public:
	explicit ChatError(const std::string& what) : ArbiterError(what) {}
};

// Tool argument has a shape the command-line encoder cannot express.
// Reported back to the agent, never propagated out of an episode.
class ToolArgumentError : public ArbiterError {
public:
	explicit ToolArgumentError(const std::string& what) : ArbiterError(what) {}
};

// Interrupt or deadline observed mid-attempt. Not retried.
class AttemptCancelled : public ArbiterError {
public:
	explicit AttemptCancelled(const std::string& what) : ArbiterError(what) {}
};

// Malformed instance list or candidate log.
class DatasetError : public ArbiterError {
public:
	explicit DatasetError(const std::string& what) : ArbiterError(what) {}
};

}  // namespace PatchArbiter

#endif  // PATCHARBITER_SRC_COMMON_ERRORS_H_
