#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace aeo_engine::common {

// Process-level settings, read once at startup
struct AppConfig {
    std::string userAgent = "AEO-Platform-Bot/1.0";

    // Headless browser service; empty disables rendering
    std::string browserlessUrl = "http://browserless:3000";
    bool renderEnabled = true;

    std::chrono::milliseconds requestTimeout{30000};
    size_t maxConcurrentFetches = 4;
    std::chrono::milliseconds minCrawlDelay{2000};

    std::chrono::seconds robotsCacheTtl{3600};
    std::chrono::seconds aiCacheTtl{604800};

    std::string rubricPath = "config/default-rubric.json";
    std::string eatWeightsPath;

    size_t summaryThresholdTokens = 1000;
    size_t summaryTargetWords = 300;

    size_t llmMaxConcurrency = 2;
    std::chrono::milliseconds llmTimeout{60000};
    std::string openAiApiKey;
    std::string openAiBaseUrl = "https://api.openai.com/v1";
    std::string openAiModel = "gpt-4-turbo";
    int openAiMaxTokens = 2000;

    // Optional JSON-lines mirror of emitted records
    std::string resultsFile;

    // Throws ConfigError on malformed numeric or boolean values
    static AppConfig fromEnvironment();
};

// Environment helpers shared by the config loaders
std::string envString(const char* name, const std::string& defaultValue);
long long envInteger(const char* name, long long defaultValue);
bool envBool(const char* name, bool defaultValue);

} // namespace aeo_engine::common
