#ifndef PATCHARBITER_SRC_AGENT_OPENAI_CHAT_CLIENT_H_
#define PATCHARBITER_SRC_AGENT_OPENAI_CHAT_CLIENT_H_

#include <chrono>
#include <string>
#include <vector>

#include "chat_types.h"
#include "common/configuration.h"

namespace PatchArbiter {

struct OpenAIChatOptions {
	std::string base_url = "https://api.openai.com/v1";
	std::string api_key;
	std::string model = "gpt-4o";
	int max_tokens = 4096;
	double temperature = 0.5;
	double top_p = 1.0;
	int max_retries = 10;
	std::chrono::seconds request_timeout{600};
	bool parallel_tool_calls = false;

	static OpenAIChatOptions FromConfig(const PatchArbiterConfig& config);
};

/**
 * IChatClient over an OpenAI-compatible /chat/completions endpoint using
 * libcurl. Transport errors, 429 and 5xx are retried with exponential
 * backoff; other HTTP errors fail immediately. Transfers abort when
 * cancellation is requested.
 */
class OpenAIChatClient : public IChatClient {
public:
	explicit OpenAIChatClient(OpenAIChatOptions options);

	ChatResponse Chat(const std::vector<Message>& messages,
			const std::vector<ToolSpec>& tools) override;
	std::string Provider() const override { return "openai"; }
	std::string Model() const override { return options_.model; }

	// Wire format, exposed for tests.
	Json::Value BuildRequest(const std::vector<Message>& messages,
			const std::vector<ToolSpec>& tools) const;
	static ChatResponse ParseResponse(const Json::Value& body);

private:
	struct HttpResult {
		bool transport_ok = false;
		long status = 0;
		std::string body;
		std::string error;
	};

	HttpResult Post(const std::string& url, const std::string& payload) const;

	OpenAIChatOptions options_;
};

}  // namespace PatchArbiter

#endif  // PATCHARBITER_SRC_AGENT_OPENAI_CHAT_CLIENT_H_
