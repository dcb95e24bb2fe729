#ifndef PATCHARBITER_SRC_SANDBOX_SANDBOX_H_
#define PATCHARBITER_SRC_SANDBOX_SANDBOX_H_

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "candidate/dataset.h"

namespace PatchArbiter {

/**
 * Text produced by one command. `recoverable` marks a timeout or a shell
 * that died mid-command: `text` then carries an observation for the agent
 * and the session must be replaced before the next command.
 */
struct ShellOutput {
	std::string text;
	bool recoverable = false;
};

/**
 * Interface for one live interactive shell inside a sandbox
 */
class IShellSession {
public:
	virtual ~IShellSession() = default;

	virtual ShellOutput Execute(const std::string& command, std::chrono::seconds timeout) = 0;
	virtual void Close() = 0;
	virtual bool IsAlive() const = 0;
};

/**
 * Interface for one container: started once per attempt, serves exactly one
 * episode at a time, stopped on every exit path.
 */
class ISandbox {
public:
	virtual ~ISandbox() = default;

	// Throws SandboxStartFailure; the attempt is then abandoned.
	virtual void Start() = 0;
	// Throws ShellError when no shell could be attached.
	virtual std::unique_ptr<IShellSession> OpenSession() = 0;
	// Idempotent; safe after a partial or failed Start().
	virtual void Stop() = 0;
	// Repository checkout directory inside the container.
	virtual std::string ProjectPath() const = 0;
	virtual std::string Name() const = 0;
};

using SandboxFactory = std::function<std::unique_ptr<ISandbox>(const Instance&)>;

}  // namespace PatchArbiter

#endif  // PATCHARBITER_SRC_SANDBOX_SANDBOX_H_
