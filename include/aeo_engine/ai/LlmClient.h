#pragma once

#include <chrono>
#include <string>
#include <vector>
#include "../http/HttpClient.h"

namespace aeo_engine::ai {

struct ChatMessage {
    std::string role;       // "system", "user" or "assistant"
    std::string content;
};

struct CompletionRequest {
    std::vector<ChatMessage> messages;
    std::string model;      // empty uses the client's default model
    int maxTokens = 0;      // 0 uses the client's default
    double temperature = 0.7;
    bool structuredOutput = false;   // ask for a JSON object response
    std::chrono::milliseconds timeout{60000};
};

struct TokenUsage {
    long long promptTokens = 0;
    long long completionTokens = 0;
    long long totalTokens = 0;
};

struct CompletionResponse {
    std::string content;
    TokenUsage usage;
    std::string model;
    std::string finishReason;
};

// Chat-completion service. Implementations must be safe to call from several threads.
class LlmClient {
public:
    virtual ~LlmClient() = default;

    // Throws LlmServiceError on transport, HTTP or payload errors
    virtual CompletionResponse complete(const CompletionRequest& request) = 0;
};

class OpenAiLlmClient : public LlmClient {
public:
    struct Options {
        std::string apiKey;
        std::string baseUrl = "https://api.openai.com/v1";
        std::string model = "gpt-4-turbo";
        int maxTokens = 2000;
    };

    OpenAiLlmClient(http::HttpClient& httpClient, Options options);

    CompletionResponse complete(const CompletionRequest& request) override;

    const Options& options() const { return options_; }

private:
    http::HttpClient& httpClient_;
    Options options_;
};

} // namespace aeo_engine::ai
