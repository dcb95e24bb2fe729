#include "selector_tools.h"

namespace PatchArbiter {

const char kBashToolName[] = "bash";
const char kEditToolName[] = "str_replace_based_edit_tool";

namespace {

Json::Value Property(const char* type, const char* description) {
	Json::Value p(Json::objectValue);
	p["type"] = type;
	p["description"] = description;
	return p;
}

ToolSpec BashTool() {
	ToolSpec spec;
	spec.name = kBashToolName;
	spec.description =
		"Run commands in a bash shell inside the repository container.\n"
		"* State is persistent across command calls.\n"
		"* Long running commands should be run in the background.\n"
		"* Use `restart` to get a fresh shell if the previous one hangs.\n"
		"* Avoid commands that produce very large output; pipe through head or grep.";
	Json::Value params(Json::objectValue);
	params["type"] = "object";
	params["properties"]["command"] = Property("string",
			"The bash command to run. Required unless the tool is being restarted.");
	params["properties"]["restart"] = Property("boolean",
			"Set to true to restart the bash session.");
	params["required"] = Json::Value(Json::arrayValue);
	spec.parameters = params;
	return spec;
}

ToolSpec EditTool() {
	ToolSpec spec;
	spec.name = kEditToolName;
	spec.description =
		"Custom editing tool for viewing, creating and editing files.\n"
		"* `view` on a file prints it with line numbers; on a directory lists it two levels deep.\n"
		"* `create` fails if the path already exists.\n"
		"* `str_replace` replaces `old_str`, which must match exactly one location, with `new_str`.\n"
		"* `insert` adds `new_str` after line `insert_line`.\n"
		"* `undo_edit` reverts the last edit to the file.\n"
		"* Paths are absolute.";
	Json::Value params(Json::objectValue);
	params["type"] = "object";

	Json::Value command = Property("string", "The command to run.");
	for (const char* c : {"view", "create", "str_replace", "insert", "undo_edit"}) {
		command["enum"].append(c);
	}
	params["properties"]["command"] = command;
	params["properties"]["path"] = Property("string", "Absolute path to the file or directory.");
	params["properties"]["file_text"] = Property("string", "Content of the file for `create`.");
	params["properties"]["old_str"] = Property("string", "Text to replace for `str_replace`.");
	params["properties"]["new_str"] = Property("string",
			"Replacement text for `str_replace`, or the text to add for `insert`.");
	params["properties"]["insert_line"] = Property("integer",
			"Line after which `new_str` is inserted for `insert`.");
	Json::Value view_range = Property("array",
			"Optional [start, end] line range for `view` on a file; -1 as end means the last line.");
	view_range["items"]["type"] = "integer";
	params["properties"]["view_range"] = view_range;

	params["required"].append("command");
	params["required"].append("path");
	spec.parameters = params;
	return spec;
}

}  // namespace

std::vector<ToolSpec> SelectorToolSpecs() {
	return {BashTool(), EditTool()};
}

}  // namespace PatchArbiter
