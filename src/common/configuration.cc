#include "configuration.h"
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace PatchArbiter {

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoi(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<double> ConfigValue<double>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stod(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        std::string val(env_val);
        std::transform(val.begin(), val.end(), val.begin(), ::tolower);
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        } else if (val == "false" || val == "0" || val == "no" || val == "off") {
            return false;
        }
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        applyYaml(yaml);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        applyYaml(yaml);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

void Configuration::applyYaml(const YAML::Node& yaml) {
    if (!yaml["patcharbiter"]) {
        LOG(WARNING) << "Configuration has no 'patcharbiter' root; using defaults";
        return;
    }
    auto root = yaml["patcharbiter"];

    if (root["selector"]) {
        auto selector = root["selector"];
        if (selector["max_turn"]) config_.selector.max_turn.set(selector["max_turn"].as<int>());
        if (selector["max_retry"]) config_.selector.max_retry.set(selector["max_retry"].as<int>());
        if (selector["num_candidate"]) config_.selector.num_candidate.set(selector["num_candidate"].as<int>());
        if (selector["group_size"]) config_.selector.group_size.set(selector["group_size"].as<int>());
        if (selector["majority_voting"]) config_.selector.majority_voting.set(selector["majority_voting"].as<bool>());
    }

    if (root["sandbox"]) {
        auto sandbox = root["sandbox"];
        if (sandbox["docker_binary"]) config_.sandbox.docker_binary.set(sandbox["docker_binary"].as<std::string>());
        if (sandbox["image_namespace"]) config_.sandbox.image_namespace.set(sandbox["image_namespace"].as<std::string>());
        if (sandbox["image_prefix"]) config_.sandbox.image_prefix.set(sandbox["image_prefix"].as<std::string>());
        if (sandbox["image_tag"]) config_.sandbox.image_tag.set(sandbox["image_tag"].as<std::string>());
        if (sandbox["host_mount"]) config_.sandbox.host_mount.set(sandbox["host_mount"].as<std::string>());
        if (sandbox["container_mount"]) config_.sandbox.container_mount.set(sandbox["container_mount"].as<std::string>());
        if (sandbox["tools_path"]) config_.sandbox.tools_path.set(sandbox["tools_path"].as<std::string>());
        if (sandbox["tools_destination"]) config_.sandbox.tools_destination.set(sandbox["tools_destination"].as<std::string>());
        if (sandbox["tools_dir"]) config_.sandbox.tools_dir.set(sandbox["tools_dir"].as<std::string>());
        if (sandbox["tool_python"]) config_.sandbox.tool_python.set(sandbox["tool_python"].as<std::string>());
        if (sandbox["shell"]) config_.sandbox.shell.set(sandbox["shell"].as<std::string>());
        if (sandbox["command_timeout_s"]) config_.sandbox.command_timeout_s.set(sandbox["command_timeout_s"].as<int>());
        if (sandbox["shell_startup_timeout_s"]) config_.sandbox.shell_startup_timeout_s.set(sandbox["shell_startup_timeout_s"].as<int>());
        if (sandbox["docker_timeout_s"]) config_.sandbox.docker_timeout_s.set(sandbox["docker_timeout_s"].as<int>());
    }

    if (root["llm"]) {
        auto llm = root["llm"];
        if (llm["base_url"]) config_.llm.base_url.set(llm["base_url"].as<std::string>());
        if (llm["api_key"]) config_.llm.api_key.set(llm["api_key"].as<std::string>());
        if (llm["model"]) config_.llm.model.set(llm["model"].as<std::string>());
        if (llm["max_tokens"]) config_.llm.max_tokens.set(llm["max_tokens"].as<int>());
        if (llm["temperature"]) config_.llm.temperature.set(llm["temperature"].as<double>());
        if (llm["top_p"]) config_.llm.top_p.set(llm["top_p"].as<double>());
        if (llm["max_retries"]) config_.llm.max_retries.set(llm["max_retries"].as<int>());
        if (llm["request_timeout_s"]) config_.llm.request_timeout_s.set(llm["request_timeout_s"].as<int>());
        if (llm["parallel_tool_calls"]) config_.llm.parallel_tool_calls.set(llm["parallel_tool_calls"].as<bool>());
    }

    if (root["paths"]) {
        auto paths = root["paths"];
        if (paths["output_dir"]) config_.paths.output_dir.set(paths["output_dir"].as<std::string>());
        if (paths["log_dir"]) config_.paths.log_dir.set(paths["log_dir"].as<std::string>());
        if (paths["patches_dir"]) config_.paths.patches_dir.set(paths["patches_dir"].as<std::string>());
        if (paths["statistics_dir"]) config_.paths.statistics_dir.set(paths["statistics_dir"].as<std::string>());
        if (paths["trajectory_dir"]) config_.paths.trajectory_dir.set(paths["trajectory_dir"].as<std::string>());
    }

    if (root["orchestrator"]) {
        auto orchestrator = root["orchestrator"];
        if (orchestrator["workers"]) config_.orchestrator.workers.set(orchestrator["workers"].as<int>());
        if (orchestrator["instance_timeout_s"]) config_.orchestrator.instance_timeout_s.set(orchestrator["instance_timeout_s"].as<int>());
        if (orchestrator["kill_grace_s"]) config_.orchestrator.kill_grace_s.set(orchestrator["kill_grace_s"].as<int>());
    }
}

std::string Configuration::resolveDir(const std::string& configured, const std::string& name) const {
    if (!configured.empty()) {
        return configured;
    }
    return (std::filesystem::path(config_.paths.output_dir.get()) / name).string();
}

bool Configuration::validate() const {
    validation_errors_.clear();

    if (config_.selector.max_turn.get() < 1) {
        validation_errors_.push_back("selector.max_turn must be at least 1");
    }
    if (config_.selector.max_retry.get() < 1) {
        validation_errors_.push_back("selector.max_retry must be at least 1");
    }
    if (config_.selector.num_candidate.get() < 1) {
        validation_errors_.push_back("selector.num_candidate must be at least 1");
    }
    if (config_.selector.group_size.get() < 1) {
        validation_errors_.push_back("selector.group_size must be at least 1");
    }

    if (config_.sandbox.command_timeout_s.get() < 1) {
        validation_errors_.push_back("sandbox.command_timeout_s must be at least 1");
    }
    if (config_.sandbox.shell_startup_timeout_s.get() < 1) {
        validation_errors_.push_back("sandbox.shell_startup_timeout_s must be at least 1");
    }
    if (config_.sandbox.docker_timeout_s.get() < 1) {
        validation_errors_.push_back("sandbox.docker_timeout_s must be at least 1");
    }

    if (config_.llm.model.get().empty()) {
        validation_errors_.push_back("llm.model must not be empty");
    }
    if (config_.llm.max_retries.get() < 0) {
        validation_errors_.push_back("llm.max_retries cannot be negative");
    }

    if (config_.orchestrator.workers.get() < 1) {
        validation_errors_.push_back("orchestrator.workers must be at least 1");
    }
    if (config_.orchestrator.instance_timeout_s.get() < 0) {
        validation_errors_.push_back("orchestrator.instance_timeout_s cannot be negative");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace PatchArbiter
