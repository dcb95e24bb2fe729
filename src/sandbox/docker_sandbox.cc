#include "docker_sandbox.h"

#include <glog/logging.h>

#include "common/errors.h"
#include "common/subprocess.h"
#include "shell_session.h"

namespace PatchArbiter {

DockerSandboxOptions DockerSandboxOptions::FromConfig(const PatchArbiterConfig& config) {
	DockerSandboxOptions options;
	const auto& sb = config.sandbox;
	options.docker_binary = sb.docker_binary.get();
	options.image_namespace = sb.image_namespace.get();
	options.image_prefix = sb.image_prefix.get();
	options.image_tag = sb.image_tag.get();
	options.host_mount = sb.host_mount.get();
	options.container_mount = sb.container_mount.get();
	options.tools_path = sb.tools_path.get();
	options.tools_destination = sb.tools_destination.get();
	options.shell = sb.shell.get();
	options.docker_timeout = std::chrono::seconds(sb.docker_timeout_s.get());
	options.shell_startup_timeout = std::chrono::seconds(sb.shell_startup_timeout_s.get());
	return options;
}

std::string ImageNameFor(const std::string& instance_id, const DockerSandboxOptions& options) {
	std::string name = instance_id;
	size_t pos = 0;
	while ((pos = name.find("__", pos)) != std::string::npos) {
		name.replace(pos, 2, "_1776_");
		pos += 6;
	}
	return options.image_namespace + "/" + options.image_prefix + name + ":" + options.image_tag;
}

DockerSandbox::DockerSandbox(Instance instance, DockerSandboxOptions options)
	: instance_(std::move(instance)), options_(std::move(options)),
	  image_(ImageNameFor(instance_.instance_id, options_)) {}

DockerSandbox::~DockerSandbox() {
	Stop();
}

std::string DockerSandbox::Name() const {
	if (container_id_.empty()) return image_;
	return container_id_.substr(0, 12);
}

std::string DockerSandbox::Docker(const std::vector<std::string>& args, const std::string& step) {
	std::vector<std::string> argv{options_.docker_binary};
	argv.insert(argv.end(), args.begin(), args.end());
	CommandResult result = RunCommand(argv, options_.docker_timeout);
	if (!result.ok()) {
		throw SandboxStartFailure(step + " failed for " + image_ +
				(result.timed_out ? " (timed out)" : " (exit " + std::to_string(result.exit_code) + ")") +
				": " + TrimWhitespace(result.output));
	}
	return result.output;
}

void DockerSandbox::Start() {
	if (!container_id_.empty()) {
		throw SandboxStartFailure("sandbox " + Name() + " already started");
	}
	std::string output = Docker({"run", "-d", "-t", "-i", "--privileged",
			"-v", options_.host_mount + ":" + options_.container_mount, image_}, "docker run");
	// The id is the last line; pull progress may precede it.
	std::string id = TrimWhitespace(output);
	size_t nl = id.find_last_of('\n');
	if (nl != std::string::npos) id = TrimWhitespace(id.substr(nl + 1));
	if (id.empty()) {
		throw SandboxStartFailure("docker run printed no container id for " + image_);
	}
	container_id_ = id;
	LOG(INFO) << "Container " << Name() << " started with image " << image_;

	CommandResult perms = RunCommand({"chmod", "-R", "777", options_.tools_path}, options_.docker_timeout);
	if (!perms.ok()) {
		throw SandboxStartFailure("chmod of " + options_.tools_path + " failed: " +
				TrimWhitespace(perms.output));
	}
	Docker({"cp", options_.tools_path, container_id_ + ":" + options_.tools_destination}, "docker cp");

	std::string checkout = Docker({"exec", container_id_, "git", "checkout", instance_.base_commit},
			"git checkout");
	VLOG(1) << "checkout " << instance_.base_commit << ": " << TrimWhitespace(checkout);

	project_path_ = TrimWhitespace(Docker({"exec", container_id_, "pwd"}, "docker exec pwd"));
	if (project_path_.empty()) {
		throw SandboxStartFailure("could not determine project path in " + Name());
	}
	LOG(INFO) << "Sandbox " << Name() << " ready at " << project_path_;
}

std::unique_ptr<IShellSession> DockerSandbox::OpenSession() {
	if (container_id_.empty()) {
		throw ShellError("Container not started; call Start() first");
	}
	ShellOptions shell_options;
	shell_options.startup_timeout = options_.shell_startup_timeout;
	return PtyShellSession::Spawn(
			{options_.docker_binary, "exec", "-it", container_id_, options_.shell}, shell_options);
}

void DockerSandbox::Stop() {
	if (container_id_.empty()) return;
	const std::string name = Name();
	try {
		CommandResult stop = RunCommand({options_.docker_binary, "stop", container_id_},
				options_.docker_timeout, false);
		CommandResult rm;
		if (stop.ok()) {
			rm = RunCommand({options_.docker_binary, "rm", container_id_}, options_.docker_timeout, false);
		}
		if (!stop.ok() || !rm.ok()) {
			LOG(WARNING) << "Graceful removal of " << name << " failed; forcing";
			CommandResult force = RunCommand({options_.docker_binary, "rm", "-f", container_id_},
					options_.docker_timeout, false);
			if (!force.ok()) {
				LOG(ERROR) << "Could not remove container " << name << ": " << TrimWhitespace(force.output);
			}
		}
	} catch (const std::exception& e) {
		LOG(ERROR) << "Error stopping container " << name << ": " << e.what();
	}
	LOG(INFO) << "Container " << name << " stopped and removed";
	container_id_.clear();
	project_path_.clear();
}

SandboxFactory MakeDockerSandboxFactory(const DockerSandboxOptions& options) {
	return [options](const Instance& instance) -> std::unique_ptr<ISandbox> {
		return std::make_unique<DockerSandbox>(instance, options);
	};
}

}  // namespace PatchArbiter
