#include "json_utils.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>

#include <glog/logging.h>

#include "errors.h"

namespace PatchArbiter {

namespace fs = std::filesystem;

Json::Value ParseJson(const std::string& text, const std::string& origin) {
	Json::CharReaderBuilder builder;
	builder["collectComments"] = false;
	std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
	Json::Value root;
	std::string errors;
	if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
		throw DatasetError("Invalid JSON in " + origin + ": " + errors);
	}
	return root;
}

Json::Value ReadJsonFile(const std::string& path) {
	std::ifstream in(path);
	if (!in) {
		throw DatasetError("Cannot open " + path);
	}
	std::stringstream buffer;
	buffer << in.rdbuf();
	return ParseJson(buffer.str(), path);
}

std::string ToJsonString(const Json::Value& value, const std::string& indent) {
	Json::StreamWriterBuilder builder;
	builder["indentation"] = indent;
	builder["emitUTF8"] = true;
	builder["enableYAMLCompatibility"] = true;
	return Json::writeString(builder, value);
}

void WriteFileAtomically(const std::string& path, const std::string& content) {
	fs::path target(path);
	if (target.has_parent_path()) {
		fs::create_directories(target.parent_path());
	}
	const std::string tmp = path + ".tmp";
	{
		std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
		if (!out) {
			throw ArbiterError("Cannot open " + tmp + " for writing");
		}
		out << content;
		out.flush();
		if (!out) {
			throw ArbiterError("Failed writing " + tmp);
		}
	}
	if (std::rename(tmp.c_str(), path.c_str()) != 0) {
		const std::string err = strerror(errno);
		std::remove(tmp.c_str());
		throw ArbiterError("rename " + tmp + " -> " + path + " failed: " + err);
	}
	VLOG(2) << "Wrote " << path << " (" << content.size() << " bytes)";
}

}  // namespace PatchArbiter
