#ifndef PATCHARBITER_CONFIGURATION_H_
#define PATCHARBITER_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace YAML {
class Node;
}

namespace PatchArbiter {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

/**
 * Main configuration structure
 */
struct PatchArbiterConfig {
    // Selection loop
    struct Selector {
        ConfigValue<int> max_turn{50, "PATCHARBITER_MAX_TURN"};
        ConfigValue<int> max_retry{3, "PATCHARBITER_MAX_RETRY"};
        // Number of candidates considered per instance; also the voting budget per group.
        ConfigValue<int> num_candidate{10, "PATCHARBITER_NUM_CANDIDATE"};
        ConfigValue<int> group_size{10, "PATCHARBITER_GROUP_SIZE"};
        ConfigValue<bool> majority_voting{true, "PATCHARBITER_MAJORITY_VOTING"};
    } selector;

    // Container sandbox
    struct Sandbox {
        ConfigValue<std::string> docker_binary{"docker", "PATCHARBITER_DOCKER"};
        ConfigValue<std::string> image_namespace{"swebench", "PATCHARBITER_IMAGE_NAMESPACE"};
        ConfigValue<std::string> image_prefix{"sweb.eval.x86_64.", "PATCHARBITER_IMAGE_PREFIX"};
        ConfigValue<std::string> image_tag{"latest", "PATCHARBITER_IMAGE_TAG"};
        ConfigValue<std::string> host_mount{"/tmp", "PATCHARBITER_HOST_MOUNT"};
        ConfigValue<std::string> container_mount{"/tmp", "PATCHARBITER_CONTAINER_MOUNT"};
        // Host directory holding execute_bash.py / execute_str_replace_editor.py
        ConfigValue<std::string> tools_path{"./tools", "PATCHARBITER_TOOLS_PATH"};
        ConfigValue<std::string> tools_destination{"/home/swe-bench/", "PATCHARBITER_TOOLS_DEST"};
        ConfigValue<std::string> tools_dir{"/home/swe-bench/tools/", "PATCHARBITER_TOOLS_DIR"};
        ConfigValue<std::string> tool_python{"/home/swe-bench/py312/bin/python3", "PATCHARBITER_TOOL_PYTHON"};
        ConfigValue<std::string> shell{"/bin/bash", "PATCHARBITER_SHELL"};
        ConfigValue<int> command_timeout_s{60, "PATCHARBITER_COMMAND_TIMEOUT"};
        ConfigValue<int> shell_startup_timeout_s{10, "PATCHARBITER_SHELL_STARTUP_TIMEOUT"};
        ConfigValue<int> docker_timeout_s{300, "PATCHARBITER_DOCKER_TIMEOUT"};
    } sandbox;

    // Chat service (OpenAI-compatible endpoint)
    struct Llm {
        ConfigValue<std::string> base_url{"https://api.openai.com/v1", "PATCHARBITER_LLM_BASE_URL"};
        ConfigValue<std::string> api_key{"", "PATCHARBITER_LLM_API_KEY"};
        ConfigValue<std::string> model{"gpt-4o", "PATCHARBITER_LLM_MODEL"};
        ConfigValue<int> max_tokens{4096, "PATCHARBITER_LLM_MAX_TOKENS"};
        ConfigValue<double> temperature{0.5, "PATCHARBITER_LLM_TEMPERATURE"};
        ConfigValue<double> top_p{1.0, "PATCHARBITER_LLM_TOP_P"};
        ConfigValue<int> max_retries{10, "PATCHARBITER_LLM_MAX_RETRIES"};
        ConfigValue<int> request_timeout_s{600, "PATCHARBITER_LLM_TIMEOUT"};
        ConfigValue<bool> parallel_tool_calls{false, "PATCHARBITER_LLM_PARALLEL_TOOL_CALLS"};
    } llm;

    // Output layout
    struct Paths {
        ConfigValue<std::string> output_dir{"./output", "PATCHARBITER_OUTPUT_DIR"};
        // Empty means <output_dir>/<name>
        ConfigValue<std::string> log_dir{"", "PATCHARBITER_LOG_DIR"};
        ConfigValue<std::string> patches_dir{"", "PATCHARBITER_PATCHES_DIR"};
        ConfigValue<std::string> statistics_dir{"", "PATCHARBITER_STATISTICS_DIR"};
        ConfigValue<std::string> trajectory_dir{"", "PATCHARBITER_TRAJECTORY_DIR"};
    } paths;

    struct Orchestrator {
        ConfigValue<int> workers{4, "PATCHARBITER_WORKERS"};
        // 0 disables the per-instance deadline
        ConfigValue<int> instance_timeout_s{0, "PATCHARBITER_INSTANCE_TIMEOUT"};
        ConfigValue<int> kill_grace_s{30, "PATCHARBITER_KILL_GRACE"};
    } orchestrator;
};

/**
 * Configuration manager singleton
 */
class Configuration {
public:
    static Configuration& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Get the configuration
    const PatchArbiterConfig& config() const { return config_; }
    PatchArbiterConfig& config() { return config_; }

    // Resolved output directories
    std::string logDir() const { return resolveDir(config_.paths.log_dir.get(), "logs"); }
    std::string patchesDir() const { return resolveDir(config_.paths.patches_dir.get(), "patches"); }
    std::string statisticsDir() const { return resolveDir(config_.paths.statistics_dir.get(), "statistics"); }
    std::string trajectoryDir() const { return resolveDir(config_.paths.trajectory_dir.get(), "trajectories"); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

    // Restore defaults (tests reuse the singleton)
    void reset() { config_ = PatchArbiterConfig{}; validation_errors_.clear(); }

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    PatchArbiterConfig config_;
    mutable std::vector<std::string> validation_errors_;

    void applyYaml(const YAML::Node& yaml);
    std::string resolveDir(const std::string& configured, const std::string& name) const;
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<double> ConfigValue<double>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace PatchArbiter

#endif // PATCHARBITER_CONFIGURATION_H_
