#ifndef PATCHARBITER_SRC_SANDBOX_DOCKER_SANDBOX_H_
#define PATCHARBITER_SRC_SANDBOX_DOCKER_SANDBOX_H_

#include <chrono>
#include <memory>
#include <string>

#include "common/configuration.h"
#include "sandbox.h"

namespace PatchArbiter {

struct DockerSandboxOptions {
	std::string docker_binary = "docker";
	std::string image_namespace = "swebench";
	std::string image_prefix = "sweb.eval.x86_64.";
	std::string image_tag = "latest";
	std::string host_mount = "/tmp";
	std::string container_mount = "/tmp";
	std::string tools_path = "./tools";
	std::string tools_destination = "/home/swe-bench/";
	std::string shell = "/bin/bash";
	std::chrono::seconds docker_timeout{300};
	std::chrono::seconds shell_startup_timeout{10};

	static DockerSandboxOptions FromConfig(const PatchArbiterConfig& config);
};

// "<namespace>/<prefix><instance_id with '__' as '_1776_'>:<tag>"
std::string ImageNameFor(const std::string& instance_id, const DockerSandboxOptions& options);

/**
 * One container started from the instance's prebuilt image with the `docker`
 * CLI. The tool scripts are copied in and the base commit checked out on
 * Start(); sessions are `docker exec -it <id> <shell>` on a pty.
 */
class DockerSandbox : public ISandbox {
public:
	DockerSandbox(Instance instance, DockerSandboxOptions options);
	~DockerSandbox() override;

	DockerSandbox(const DockerSandbox&) = delete;
	DockerSandbox& operator=(const DockerSandbox&) = delete;

	void Start() override;
	std::unique_ptr<IShellSession> OpenSession() override;
	void Stop() override;
	std::string ProjectPath() const override { return project_path_; }
	std::string Name() const override;

	const std::string& container_id() const { return container_id_; }

private:
	// Runs a docker subcommand; throws SandboxStartFailure on failure.
	std::string Docker(const std::vector<std::string>& args, const std::string& step);

	Instance instance_;
	DockerSandboxOptions options_;
	std::string image_;
	std::string container_id_;
	std::string project_path_;
};

// Factory producing DockerSandbox instances for GroupScheduler.
SandboxFactory MakeDockerSandboxFactory(const DockerSandboxOptions& options);

}  // namespace PatchArbiter

#endif  // PATCHARBITER_SRC_SANDBOX_DOCKER_SANDBOX_H_
