#ifndef PATCHARBITER_SRC_AGENT_TOOL_ARGUMENTS_H_
#define PATCHARBITER_SRC_AGENT_TOOL_ARGUMENTS_H_

#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <json/json.h>

namespace PatchArbiter {

// The argument shapes the tool scripts accept on their command line.
using ToolArgument = std::variant<std::string, int64_t, bool, std::vector<int64_t>>;

// Throws ToolArgumentError for objects, floats, nulls and lists holding
// anything but integers.
ToolArgument ToolArgumentFromJson(const std::string& key, const Json::Value& value);

// POSIX shell quoting; strings of safe characters pass through unquoted.
std::string ShellQuote(const std::string& s);

// Command-line text for one value: strings quoted, integers raw, booleans as
// true/false, integer lists as the quoted text "[1, 10]".
std::string EncodeToolArgument(const ToolArgument& argument);

// " --k1 v1 --k2 v2" for every member of `arguments`, in key order.
// Throws ToolArgumentError if `arguments` is not an object or holds an
// unsupported value.
std::string EncodeToolArguments(const Json::Value& arguments);

}  // namespace PatchArbiter

#endif  // PATCHARBITER_SRC_AGENT_TOOL_ARGUMENTS_H_
