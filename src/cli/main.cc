#include <csignal>
#include <cstdlib>
#include <iostream>

#include <curl/curl.h>
#include <cxxopts.hpp>
#include <glog/logging.h>

#include "agent/openai_chat_client.h"
#include "agent/sandbox_tool_executor.h"
#include "candidate/dataset.h"
#include "common/cancellation.h"
#include "common/configuration.h"
#include "common/errors.h"
#include "orchestrator/evaluation_orchestrator.h"
#include "sandbox/docker_sandbox.h"
#include "selection/group_scheduler.h"
#include "selection/result_store.h"

namespace {

using namespace PatchArbiter;

// Builds the whole selection stack for one instance. Called inside the
// worker process so each worker owns its own HTTP handles and containers.
std::vector<GroupOutcome> RunInstance(const Instance& instance, const CandidateLog& log) {
	const Configuration& configuration = Configuration::getInstance();
	const PatchArbiterConfig& config = configuration.config();

	OpenAIChatClient chat(OpenAIChatOptions::FromConfig(config));
	ResultStore store = ResultStore::FromConfiguration(configuration);
	const ToolExecutorOptions executor_options = ToolExecutorOptions::FromConfig(config);

	GroupScheduler scheduler(SchedulerOptions::FromConfig(config),
			MakeDockerSandboxFactory(DockerSandboxOptions::FromConfig(config)),
			chat,
			[executor_options](ISandbox& sandbox) -> std::unique_ptr<IToolExecutor> {
				return std::make_unique<SandboxToolExecutor>(sandbox, executor_options);
			},
			store);
	return scheduler.RunInstance(instance, log);
}

}  // end of namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();

	cxxopts::Options options("patch_arbiter",
			"Selects the correct candidate patch per issue with an LLM agent in a sandbox");

	options.add_options()
		("c,config", "YAML configuration file", cxxopts::value<std::string>())
		("instances", "Instance list (JSON array)", cxxopts::value<std::string>())
		("candidates", "Candidate log (JSON lines)", cxxopts::value<std::string>())
		("o,output", "Output root directory", cxxopts::value<std::string>())
		("w,workers", "Number of worker processes", cxxopts::value<int>())
		("instance_id", "Run only this instance, in-process", cxxopts::value<std::string>())
		("group_size", "Candidates per group", cxxopts::value<int>())
		("num_candidate", "Candidates considered per instance", cxxopts::value<int>())
		("max_retry", "Attempts per group", cxxopts::value<int>())
		("max_turn", "Turns per selection episode", cxxopts::value<int>())
		("no_voting", "Run a single episode per group instead of majority voting")
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
		("h,help", "Print usage");

	auto arguments = options.parse(argc, argv);
	if (arguments.count("help")) {
		std::cout << options.help() << std::endl;
		return EXIT_SUCCESS;
	}

	FLAGS_v = arguments["log_level"].as<int>();
	FLAGS_logtostderr = 1; // log only to console, no files

	Configuration& configuration = Configuration::getInstance();
	if (arguments.count("config")) {
		const std::string path = arguments["config"].as<std::string>();
		if (!configuration.loadFromFile(path)) {
			LOG(ERROR) << "Invalid configuration " << path;
			for (const auto& error : configuration.getValidationErrors()) {
				LOG(ERROR) << "  " << error;
			}
			return EXIT_FAILURE;
		}
		LOG(INFO) << "Loaded configuration from " << path;
	}

	// Command line overrides the file
	PatchArbiterConfig& config = configuration.config();
	if (arguments.count("output")) config.paths.output_dir.set(arguments["output"].as<std::string>());
	if (arguments.count("workers")) config.orchestrator.workers.set(arguments["workers"].as<int>());
	if (arguments.count("group_size")) config.selector.group_size.set(arguments["group_size"].as<int>());
	if (arguments.count("num_candidate")) config.selector.num_candidate.set(arguments["num_candidate"].as<int>());
	if (arguments.count("max_retry")) config.selector.max_retry.set(arguments["max_retry"].as<int>());
	if (arguments.count("max_turn")) config.selector.max_turn.set(arguments["max_turn"].as<int>());
	if (arguments.count("no_voting")) config.selector.majority_voting.set(false);

	if (!configuration.validate()) {
		for (const auto& error : configuration.getValidationErrors()) {
			LOG(ERROR) << "Configuration error: " << error;
		}
		return EXIT_FAILURE;
	}
	if (!arguments.count("instances") || !arguments.count("candidates")) {
		std::cerr << "--instances and --candidates are required\n" << options.help() << std::endl;
		return EXIT_FAILURE;
	}

	std::vector<Instance> instances;
	std::unordered_map<std::string, CandidateLog> candidates;
	try {
		instances = LoadInstances(arguments["instances"].as<std::string>());
		candidates = LoadCandidateLogs(arguments["candidates"].as<std::string>());
	} catch (const DatasetError& e) {
		LOG(ERROR) << e.what();
		return EXIT_FAILURE;
	}

	std::signal(SIGPIPE, SIG_IGN);
	InstallCancellationHandlers();
	curl_global_init(CURL_GLOBAL_DEFAULT);

	WorkerPoolOptions pool_options;
	pool_options.workers = config.orchestrator.workers.get();
	pool_options.task_timeout = std::chrono::seconds(config.orchestrator.instance_timeout_s.get());
	pool_options.kill_grace = std::chrono::seconds(config.orchestrator.kill_grace_s.get());

	EvaluationOrchestrator orchestrator(std::move(instances), std::move(candidates),
			RunInstance, pool_options);

	int exit_code = EXIT_SUCCESS;
	try {
		if (arguments.count("instance_id")) {
			const std::string id = arguments["instance_id"].as<std::string>();
			std::vector<GroupOutcome> outcomes = orchestrator.RunOne(id);
			for (size_t g = 0; g < outcomes.size(); ++g) {
				LOG(INFO) << id << " group " << g << ": " << GroupOutcomeName(outcomes[g]);
			}
			exit_code = EvaluationOrchestrator::ExitCodeFor(outcomes);
		} else {
			OrchestratorSummary summary = orchestrator.RunAll();
			exit_code = summary.AllSucceeded() ? EXIT_SUCCESS : kPartialExitCode;
		}
	} catch (const AttemptCancelled& e) {
		LOG(WARNING) << "Interrupted: " << e.what();
		exit_code = 130;
	} catch (const std::exception& e) {
		LOG(ERROR) << "Fatal: " << e.what();
		exit_code = EXIT_FAILURE;
	}

	curl_global_cleanup();
	return exit_code;
}
