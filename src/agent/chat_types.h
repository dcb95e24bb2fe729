#ifndef PATCHARBITER_SRC_AGENT_CHAT_TYPES_H_
#define PATCHARBITER_SRC_AGENT_CHAT_TYPES_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <json/json.h>

namespace PatchArbiter {

struct ToolCall {
	std::string call_id;
	std::string name;
	Json::Value arguments;   // object as sent by the model
};

struct ToolResult {
	std::string call_id;
	std::string name;
	bool success = false;
	std::string result;
	std::string error;
};

// One conversation entry. Assistant turns may carry tool_calls; the answer
// to a tool call carries tool_result.
struct Message {
	std::string role;        // "system", "user", "assistant"
	std::string content;
	std::vector<ToolCall> tool_calls;
	std::optional<ToolResult> tool_result;
};

struct ToolSpec {
	std::string name;
	std::string description;
	Json::Value parameters;  // JSON schema object
};

struct ChatUsage {
	int64_t input_tokens = 0;
	int64_t output_tokens = 0;
};

struct ChatResponse {
	std::string content;
	std::vector<ToolCall> tool_calls;
	std::string finish_reason;
	std::string model;
	ChatUsage usage;
};

/**
 * Chat collaborator. Stateless: every call receives the whole conversation.
 * Throws ChatError once its own retries are exhausted.
 */
class IChatClient {
public:
	virtual ~IChatClient() = default;

	virtual ChatResponse Chat(const std::vector<Message>& messages,
			const std::vector<ToolSpec>& tools) = 0;
	virtual std::string Provider() const = 0;
	virtual std::string Model() const = 0;
};

// Trajectory serialization
Json::Value MessageToJson(const Message& message);
Json::Value ResponseToJson(const ChatResponse& response);
Json::Value ToolSpecToJson(const ToolSpec& tool);

}  // namespace PatchArbiter

#endif  // PATCHARBITER_SRC_AGENT_CHAT_TYPES_H_
