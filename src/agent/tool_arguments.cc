#include "tool_arguments.h"

#include "common/errors.h"

namespace PatchArbiter {

namespace {

bool IsSafeShellChar(char c) {
	return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
		c == '@' || c == '%' || c == '+' || c == '=' || c == ':' || c == ',' ||
		c == '.' || c == '/' || c == '_' || c == '-';
}

bool IsInteger(const Json::Value& v) {
	return (v.type() == Json::intValue || v.type() == Json::uintValue) && v.isInt64();
}

// Keys become "--<key>" flags, so they must be plain identifiers.
bool IsArgumentName(const std::string& key) {
	if (key.empty() || (key[0] >= '0' && key[0] <= '9')) return false;
	for (char c : key) {
		if (!((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_')) {
			return false;
		}
	}
	return true;
}

struct ArgumentEncoder {
	std::string operator()(const std::string& s) const { return ShellQuote(s); }
	std::string operator()(int64_t v) const { return std::to_string(v); }
	std::string operator()(bool b) const { return b ? "true" : "false"; }
	std::string operator()(const std::vector<int64_t>& list) const {
		std::string text = "[";
		for (size_t i = 0; i < list.size(); ++i) {
			if (i) text += ", ";
			text += std::to_string(list[i]);
		}
		text += "]";
		return ShellQuote(text);
	}
};

}  // namespace

ToolArgument ToolArgumentFromJson(const std::string& key, const Json::Value& value) {
	if (value.isBool()) {
		return value.asBool();
	}
	if (IsInteger(value)) {
		return static_cast<int64_t>(value.asInt64());
	}
	if (value.isString()) {
		return value.asString();
	}
	if (value.isArray()) {
		std::vector<int64_t> list;
		for (const auto& item : value) {
			if (!IsInteger(item)) {
				throw ToolArgumentError("argument '" + key + "' must be a list of integers");
			}
			list.push_back(item.asInt64());
		}
		return list;
	}
	if (value.isObject()) {
		throw ToolArgumentError("argument '" + key + "' is an object");
	}
	if (value.isNull()) {
		throw ToolArgumentError("argument '" + key + "' is null");
	}
	throw ToolArgumentError("argument '" + key + "' has an unsupported type");
}

std::string ShellQuote(const std::string& s) {
	if (s.empty()) return "''";
	bool safe = true;
	for (char c : s) {
		if (!IsSafeShellChar(c)) {
			safe = false;
			break;
		}
	}
	if (safe) return s;
	std::string quoted = "'";
	for (char c : s) {
		if (c == '\'') {
			quoted += "'\"'\"'";
		} else {
			quoted += c;
		}
	}
	quoted += "'";
	return quoted;
}

std::string EncodeToolArgument(const ToolArgument& argument) {
	return std::visit(ArgumentEncoder{}, argument);
}

std::string EncodeToolArguments(const Json::Value& arguments) {
	if (!arguments.isObject()) {
		throw ToolArgumentError("tool arguments must be a JSON object");
	}
	std::string encoded;
	for (const auto& key : arguments.getMemberNames()) {
		if (!IsArgumentName(key)) {
			throw ToolArgumentError("invalid argument name '" + key + "'");
		}
		encoded += " --" + key + " " + EncodeToolArgument(ToolArgumentFromJson(key, arguments[key]));
	}
	return encoded;
}

}  // namespace PatchArbiter
