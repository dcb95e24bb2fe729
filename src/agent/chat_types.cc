#include "chat_types.h"

namespace PatchArbiter {

namespace {

Json::Value ToolCallToJson(const ToolCall& call) {
	Json::Value out(Json::objectValue);
	out["call_id"] = call.call_id;
	out["name"] = call.name;
	out["arguments"] = call.arguments;
	return out;
}

Json::Value ToolCallsToJson(const std::vector<ToolCall>& calls) {
	Json::Value out(Json::arrayValue);
	for (const auto& call : calls) out.append(ToolCallToJson(call));
	return out;
}

}  // namespace

Json::Value MessageToJson(const Message& message) {
	Json::Value out(Json::objectValue);
	out["role"] = message.role;
	out["content"] = message.content;
	if (!message.tool_calls.empty()) {
		out["tool_calls"] = ToolCallsToJson(message.tool_calls);
	}
	if (message.tool_result) {
		const ToolResult& r = *message.tool_result;
		Json::Value result(Json::objectValue);
		result["call_id"] = r.call_id;
		result["name"] = r.name;
		result["success"] = r.success;
		result["result"] = r.result;
		result["error"] = r.error.empty() ? Json::Value() : Json::Value(r.error);
		out["tool_result"] = result;
	}
	return out;
}

Json::Value ResponseToJson(const ChatResponse& response) {
	Json::Value out(Json::objectValue);
	out["content"] = response.content;
	out["model"] = response.model;
	out["finish_reason"] = response.finish_reason;
	Json::Value usage(Json::objectValue);
	usage["input_tokens"] = static_cast<Json::Int64>(response.usage.input_tokens);
	usage["output_tokens"] = static_cast<Json::Int64>(response.usage.output_tokens);
	out["usage"] = usage;
	out["tool_calls"] = response.tool_calls.empty() ? Json::Value() : ToolCallsToJson(response.tool_calls);
	return out;
}

Json::Value ToolSpecToJson(const ToolSpec& tool) {
	Json::Value out(Json::objectValue);
	out["name"] = tool.name;
	out["description"] = tool.description;
	out["parameters"] = tool.parameters;
	return out;
}

}  // namespace PatchArbiter
