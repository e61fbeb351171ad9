#include "../../include/aeo_engine/ai/LlmClient.h"
#include "../../include/aeo_engine/common/Errors.h"
#include "../../include/Logger.h"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace aeo_engine::ai {

OpenAiLlmClient::OpenAiLlmClient(http::HttpClient& httpClient, Options options)
    : httpClient_(httpClient), options_(std::move(options)) {
    while (!options_.baseUrl.empty() && options_.baseUrl.back() == '/') {
        options_.baseUrl.pop_back();
    }
}

CompletionResponse OpenAiLlmClient::complete(const CompletionRequest& request) {
    if (options_.apiKey.empty()) {
        throw common::LlmServiceError("OPENAI_API_KEY environment variable is required");
    }
    if (request.messages.empty()) {
        throw common::LlmServiceError("messages array is required and must not be empty");
    }

    json messages = json::array();
    for (const auto& message : request.messages) {
        messages.push_back({{"role", message.role}, {"content", message.content}});
    }

    json payload = {
        {"model", request.model.empty() ? options_.model : request.model},
        {"messages", messages},
        {"max_tokens", request.maxTokens > 0 ? request.maxTokens : options_.maxTokens},
        {"temperature", request.temperature}
    };
    if (request.structuredOutput) {
        payload["response_format"] = {{"type", "json_object"}};
    }

    http::HttpRequest httpRequest;
    httpRequest.url = options_.baseUrl + "/chat/completions";
    httpRequest.method = http::HttpMethod::POST;
    httpRequest.timeout = request.timeout;
    httpRequest.headers["Content-Type"] = "application/json";
    httpRequest.headers["Authorization"] = "Bearer " + options_.apiKey;
    httpRequest.body = payload.dump();

    LOG_DEBUG("Requesting completion from " + httpRequest.url + " (" + payload["model"].get<std::string>() + ")");
    http::HttpResponse response = httpClient_.execute(httpRequest);

    if (!response.transportOk()) {
        const bool timedOut = response.curlCode == CURLE_OPERATION_TIMEDOUT;
        throw common::LlmServiceError("OpenAI API error: " + response.errorMessage, timedOut);
    }

    const json body = json::parse(response.body, nullptr, false);
    if (response.statusCode < 200 || response.statusCode >= 300) {
        std::string message = "HTTP " + std::to_string(response.statusCode);
        if (!body.is_discarded() && body.contains("error") && body["error"].is_object()) {
            message += " " + body["error"].value("message", std::string());
        }
        throw common::LlmServiceError("OpenAI API error: " + message);
    }
    if (body.is_discarded() || !body.is_object()) {
        throw common::LlmServiceError("OpenAI API error: response is not JSON");
    }

    CompletionResponse completion;
    completion.model = body.value("model", std::string());
    if (body.contains("choices") && body["choices"].is_array() && !body["choices"].empty()) {
        const json& choice = body["choices"][0];
        if (choice.contains("message") && choice["message"].is_object() && choice["message"].contains("content") &&
            choice["message"]["content"].is_string()) {
            completion.content = choice["message"]["content"].get<std::string>();
        }
        if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
            completion.finishReason = choice["finish_reason"].get<std::string>();
        }
    }
    if (body.contains("usage") && body["usage"].is_object()) {
        const json& usage = body["usage"];
        completion.usage.promptTokens = usage.value("prompt_tokens", 0LL);
        completion.usage.completionTokens = usage.value("completion_tokens", 0LL);
        completion.usage.totalTokens = usage.value("total_tokens", 0LL);
    }

    LOG_DEBUG("Completion finished (" + completion.finishReason + ", " +
              std::to_string(completion.usage.totalTokens) + " tokens)");
    return completion;
}

} // namespace aeo_engine::ai
