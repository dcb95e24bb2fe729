#include "openai_chat_client.h"

#include <algorithm>
#include <thread>

#include <curl/curl.h>
#include <glog/logging.h>

#include "common/cancellation.h"
#include "common/errors.h"
#include "common/json_utils.h"

namespace PatchArbiter {

namespace {

constexpr int kMaxBackoffSeconds = 60;

size_t AppendBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
	auto* body = static_cast<std::string*>(userdata);
	body->append(ptr, size * nmemb);
	return size * nmemb;
}

int AbortOnCancel(void* /*clientp*/, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
	return CancellationRequested() ? 1 : 0;
}

bool Retryable(long status) {
	return status == 429 || status >= 500;
}

void Backoff(int attempt) {
	const int seconds = std::min(kMaxBackoffSeconds, 1 << std::min(attempt, 6));
	const auto until = std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
	while (std::chrono::steady_clock::now() < until) {
		ThrowIfCancelled("chat backoff");
		std::this_thread::sleep_for(std::chrono::milliseconds(100));
	}
}

Json::Value EncodeMessage(const Message& message) {
	Json::Value out(Json::objectValue);
	if (message.tool_result) {
		const ToolResult& r = *message.tool_result;
		out["role"] = "tool";
		out["tool_call_id"] = r.call_id;
		out["content"] = r.success ? r.result : (r.error.empty() ? message.content : r.error);
		return out;
	}
	out["role"] = message.role;
	out["content"] = message.content;
	if (!message.tool_calls.empty()) {
		Json::Value calls(Json::arrayValue);
		for (const auto& call : message.tool_calls) {
			Json::Value c(Json::objectValue);
			c["id"] = call.call_id;
			c["type"] = "function";
			c["function"]["name"] = call.name;
			c["function"]["arguments"] = call.arguments.isString()
				? call.arguments.asString() : ToJsonString(call.arguments, "");
			calls.append(c);
		}
		out["tool_calls"] = calls;
	}
	return out;
}

}  // namespace

OpenAIChatOptions OpenAIChatOptions::FromConfig(const PatchArbiterConfig& config) {
	OpenAIChatOptions options;
	const auto& llm = config.llm;
	options.base_url = llm.base_url.get();
	options.api_key = llm.api_key.get();
	options.model = llm.model.get();
	options.max_tokens = llm.max_tokens.get();
	options.temperature = llm.temperature.get();
	options.top_p = llm.top_p.get();
	options.max_retries = llm.max_retries.get();
	options.request_timeout = std::chrono::seconds(llm.request_timeout_s.get());
	options.parallel_tool_calls = llm.parallel_tool_calls.get();
	return options;
}

OpenAIChatClient::OpenAIChatClient(OpenAIChatOptions options) : options_(std::move(options)) {
	while (!options_.base_url.empty() && options_.base_url.back() == '/') {
		options_.base_url.pop_back();
	}
	if (options_.api_key.empty()) {
		LOG(WARNING) << "No API key configured for " << options_.base_url;
	}
}

Json::Value OpenAIChatClient::BuildRequest(const std::vector<Message>& messages,
		const std::vector<ToolSpec>& tools) const {
	Json::Value request(Json::objectValue);
	request["model"] = options_.model;
	request["max_tokens"] = options_.max_tokens;
	request["temperature"] = options_.temperature;
	request["top_p"] = options_.top_p;

	Json::Value wire_messages(Json::arrayValue);
	for (const auto& message : messages) wire_messages.append(EncodeMessage(message));
	request["messages"] = wire_messages;

	if (!tools.empty()) {
		Json::Value wire_tools(Json::arrayValue);
		for (const auto& tool : tools) {
			Json::Value t(Json::objectValue);
			t["type"] = "function";
			t["function"]["name"] = tool.name;
			t["function"]["description"] = tool.description;
			t["function"]["parameters"] = tool.parameters;
			wire_tools.append(t);
		}
		request["tools"] = wire_tools;
		request["parallel_tool_calls"] = options_.parallel_tool_calls;
	}
	return request;
}

ChatResponse OpenAIChatClient::ParseResponse(const Json::Value& body) {
	const Json::Value& choices = body["choices"];
	if (!choices.isArray() || choices.empty()) {
		throw ChatError("chat response has no choices");
	}
	const Json::Value& choice = choices[0];
	const Json::Value& message = choice["message"];

	ChatResponse response;
	response.content = message["content"].isString() ? message["content"].asString() : "";
	response.finish_reason = choice["finish_reason"].isString() ? choice["finish_reason"].asString() : "";
	response.model = body.get("model", "").asString();
	if (body["usage"].isObject()) {
		response.usage.input_tokens = body["usage"].get("prompt_tokens", 0).asInt64();
		response.usage.output_tokens = body["usage"].get("completion_tokens", 0).asInt64();
	}

	for (const auto& call : message["tool_calls"]) {
		ToolCall tool_call;
		tool_call.call_id = call.get("id", "").asString();
		tool_call.name = call["function"].get("name", "").asString();
		const std::string raw = call["function"].get("arguments", "").asString();
		try {
			tool_call.arguments = raw.empty() ? Json::Value(Json::objectValue) : ParseJson(raw, "tool arguments");
		} catch (const DatasetError& e) {
			// Surfaced to the model as a tool failure by the executor.
			VLOG(1) << "Unparseable tool arguments for " << tool_call.name << ": " << e.what();
			tool_call.arguments = Json::Value(raw);
		}
		response.tool_calls.push_back(std::move(tool_call));
	}
	return response;
}

OpenAIChatClient::HttpResult OpenAIChatClient::Post(const std::string& url,
		const std::string& payload) const {
	HttpResult result;
	CURL* curl = curl_easy_init();
	if (!curl) {
		result.error = "curl init failed";
		return result;
	}
	struct curl_slist* headers = nullptr;
	const std::string auth = "Authorization: Bearer " + options_.api_key;
	headers = curl_slist_append(headers, auth.c_str());
	headers = curl_slist_append(headers, "Content-Type: application/json");

	curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
	curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
	curl_easy_setopt(curl, CURLOPT_POST, 1L);
	curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
	curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
	curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(options_.request_timeout.count()));
	curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
	curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, AppendBody);
	curl_easy_setopt(curl, CURLOPT_WRITEDATA, &result.body);
	curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
	curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, AbortOnCancel);

	CURLcode res = curl_easy_perform(curl);
	curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &result.status);
	curl_slist_free_all(headers);
	curl_easy_cleanup(curl);

	if (res == CURLE_ABORTED_BY_CALLBACK) {
		throw AttemptCancelled("cancelled during chat request");
	}
	if (res != CURLE_OK) {
		result.error = std::string("curl error: ") + curl_easy_strerror(res);
		return result;
	}
	result.transport_ok = true;
	return result;
}

ChatResponse OpenAIChatClient::Chat(const std::vector<Message>& messages,
		const std::vector<ToolSpec>& tools) {
	const std::string url = options_.base_url + "/chat/completions";
	const std::string payload = ToJsonString(BuildRequest(messages, tools), "");

	std::string last_error;
	for (int attempt = 0; attempt <= options_.max_retries; ++attempt) {
		ThrowIfCancelled("chat request");
		if (attempt > 0) {
			LOG(WARNING) << "Chat request failed (" << last_error << "); retry "
				<< attempt << "/" << options_.max_retries;
			Backoff(attempt);
		}

		HttpResult http = Post(url, payload);
		if (!http.transport_ok) {
			last_error = http.error;
			continue;
		}
		if (http.status < 200 || http.status >= 300) {
			last_error = "HTTP " + std::to_string(http.status) + ": " + http.body.substr(0, 512);
			if (Retryable(http.status)) continue;
			throw ChatError(last_error);
		}

		Json::Value body;
		try {
			body = ParseJson(http.body, "chat response");
		} catch (const DatasetError& e) {
			last_error = e.what();
			continue;
		}
		ChatResponse response = ParseResponse(body);
		VLOG(1) << "chat: finish_reason=" << response.finish_reason
			<< " tool_calls=" << response.tool_calls.size()
			<< " tokens=" << response.usage.input_tokens << "/" << response.usage.output_tokens;
		return response;
	}
	throw ChatError("chat request failed after " + std::to_string(options_.max_retries + 1) +
			" attempts: " + last_error);
}

}  // namespace PatchArbiter
