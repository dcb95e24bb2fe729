#include "dataset.h"

#include <fstream>
#include <sstream>

#include <glog/logging.h>

#include "common/errors.h"
#include "common/json_utils.h"
#include "common/subprocess.h"

namespace PatchArbiter {

namespace {

std::string RequireString(const Json::Value& obj, const char* key, const std::string& origin) {
	if (!obj.isMember(key) || !obj[key].isString()) {
		throw DatasetError(origin + ": missing string field '" + key + "'");
	}
	return obj[key].asString();
}

}  // namespace

std::vector<Instance> ParseInstances(const std::string& json_text, const std::string& origin) {
	Json::Value root = ParseJson(json_text, origin);
	if (!root.isArray()) {
		throw DatasetError(origin + ": instance list must be a JSON array");
	}
	std::vector<Instance> instances;
	instances.reserve(root.size());
	for (Json::ArrayIndex i = 0; i < root.size(); ++i) {
		const std::string where = origin + "[" + std::to_string(i) + "]";
		const Json::Value& item = root[i];
		if (!item.isObject()) {
			throw DatasetError(where + ": expected an object");
		}
		Instance instance;
		instance.instance_id = RequireString(item, "instance_id", where);
		instance.base_commit = RequireString(item, "base_commit", where);
		instance.problem_statement = RequireString(item, "problem_statement", where);
		instances.push_back(std::move(instance));
	}
	return instances;
}

std::vector<Instance> LoadInstances(const std::string& path) {
	std::ifstream in(path);
	if (!in) {
		throw DatasetError("Cannot open instance list " + path);
	}
	std::stringstream buffer;
	buffer << in.rdbuf();
	std::vector<Instance> instances = ParseInstances(buffer.str(), path);
	LOG(INFO) << "Loaded " << instances.size() << " instances from " << path;
	return instances;
}

CandidateLog ParseCandidateLogLine(const std::string& line, const std::string& origin) {
	Json::Value item = ParseJson(line, origin);
	if (!item.isObject()) {
		throw DatasetError(origin + ": expected an object");
	}
	CandidateLog log;
	log.instance_id = RequireString(item, "instance_id", origin);
	if (item.isMember("issue") && !item["issue"].isNull()) {
		log.issue = RequireString(item, "issue", origin);
	}

	const Json::Value& patches = item["patches"];
	if (!patches.isArray()) {
		throw DatasetError(origin + ": 'patches' must be an array");
	}
	for (const auto& patch : patches) {
		log.patches.push_back(patch.isString() ? patch.asString() : "");
	}

	if (item.isMember("regressions") && !item["regressions"].isNull()) {
		const Json::Value& regressions = item["regressions"];
		if (!regressions.isArray()) {
			throw DatasetError(origin + ": 'regressions' must be an array");
		}
		for (const auto& failures : regressions) {
			std::vector<std::string> tests;
			if (failures.isArray()) {
				for (const auto& test : failures) {
					if (!test.isString()) {
						throw DatasetError(origin + ": 'regressions' entries must be test names");
					}
					tests.push_back(test.asString());
				}
			}
			log.regressions.push_back(std::move(tests));
		}
	}
	// Pad so every patch has a (possibly empty) failure list.
	log.regressions.resize(log.patches.size());

	const Json::Value& success = item["success_id"];
	if (!success.isArray()) {
		throw DatasetError(origin + ": 'success_id' must be an array");
	}
	for (const auto& flag : success) {
		if (flag.isBool()) {
			log.success_id.push_back(flag.asBool() ? 1 : 0);
		} else if ((flag.type() == Json::intValue || flag.type() == Json::uintValue) && flag.isInt()) {
			log.success_id.push_back(flag.asInt());
		} else {
			throw DatasetError(origin + ": 'success_id' entries must be 0/1 or booleans");
		}
	}
	if (log.success_id.size() != log.patches.size()) {
		throw DatasetError(origin + ": 'success_id' has " + std::to_string(log.success_id.size()) +
				" entries for " + std::to_string(log.patches.size()) + " patches");
	}
	return log;
}

std::unordered_map<std::string, CandidateLog> LoadCandidateLogs(const std::string& path) {
	std::ifstream in(path);
	if (!in) {
		throw DatasetError("Cannot open candidate log " + path);
	}
	std::unordered_map<std::string, CandidateLog> logs;
	std::string line;
	size_t line_no = 0;
	while (std::getline(in, line)) {
		++line_no;
		if (TrimWhitespace(line).empty()) continue;
		CandidateLog log = ParseCandidateLogLine(line, path + ":" + std::to_string(line_no));
		if (logs.count(log.instance_id)) {
			LOG(WARNING) << "Duplicate candidate log for " << log.instance_id
				<< " at line " << line_no << "; keeping the latest";
		}
		std::string id = log.instance_id;
		logs[id] = std::move(log);
	}
	LOG(INFO) << "Loaded candidate logs for " << logs.size() << " instances from " << path;
	return logs;
}

}  // namespace PatchArbiter
