#include "../../include/aeo_engine/common/Config.h"
#include "../../include/aeo_engine/common/Errors.h"
#include "../../include/aeo_engine/common/TextUtils.h"
#include "../../include/Logger.h"

#include <cstdlib>

namespace aeo_engine::common {

std::string envString(const char* name, const std::string& defaultValue) {
    const char* value = std::getenv(name);
    if (!value) {
        return defaultValue;
    }
    return std::string(value);
}

long long envInteger(const char* name, long long defaultValue) {
    const char* value = std::getenv(name);
    if (!value || trim(value).empty()) {
        return defaultValue;
    }
    try {
        size_t consumed = 0;
        const std::string text = trim(value);
        long long parsed = std::stoll(text, &consumed);
        if (consumed != text.size() || parsed < 0) {
            throw ConfigError(std::string(name) + " must be a non-negative integer, got '" + value + "'");
        }
        return parsed;
    } catch (const std::invalid_argument&) {
        throw ConfigError(std::string(name) + " must be a non-negative integer, got '" + value + "'");
    } catch (const std::out_of_range&) {
        throw ConfigError(std::string(name) + " is out of range: '" + value + "'");
    }
}

bool envBool(const char* name, bool defaultValue) {
    const char* value = std::getenv(name);
    if (!value) {
        return defaultValue;
    }
    const std::string lowered = toLower(trim(value));
    if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") return true;
    if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") return false;
    throw ConfigError(std::string(name) + " must be a boolean, got '" + value + "'");
}

AppConfig AppConfig::fromEnvironment() {
    AppConfig config;

    config.userAgent = envString("AEO_USER_AGENT", config.userAgent);
    config.browserlessUrl = envString("AEO_BROWSERLESS_URL", config.browserlessUrl);
    config.renderEnabled = envBool("AEO_RENDER_ENABLED", !config.browserlessUrl.empty());
    config.requestTimeout = std::chrono::milliseconds(envInteger("AEO_REQUEST_TIMEOUT_MS", config.requestTimeout.count()));
    config.maxConcurrentFetches = static_cast<size_t>(envInteger("AEO_MAX_CONCURRENT_FETCHES", config.maxConcurrentFetches));
    config.minCrawlDelay = std::chrono::milliseconds(envInteger("AEO_MIN_CRAWL_DELAY_MS", config.minCrawlDelay.count()));
    config.robotsCacheTtl = std::chrono::seconds(envInteger("AEO_ROBOTS_CACHE_TTL_SECONDS", config.robotsCacheTtl.count()));
    config.aiCacheTtl = std::chrono::seconds(envInteger("AEO_AI_CACHE_TTL_SECONDS", config.aiCacheTtl.count()));
    config.rubricPath = envString("AEO_RUBRIC_PATH", config.rubricPath);
    config.eatWeightsPath = envString("AEO_EAT_WEIGHTS_PATH", config.eatWeightsPath);
    config.summaryThresholdTokens = static_cast<size_t>(envInteger("AEO_SUMMARY_THRESHOLD_TOKENS", config.summaryThresholdTokens));
    config.summaryTargetWords = static_cast<size_t>(envInteger("AEO_SUMMARY_TARGET_WORDS", config.summaryTargetWords));
    config.llmMaxConcurrency = static_cast<size_t>(envInteger("AEO_LLM_MAX_CONCURRENCY", config.llmMaxConcurrency));
    config.llmTimeout = std::chrono::milliseconds(envInteger("AEO_LLM_TIMEOUT_MS", config.llmTimeout.count()));
    config.openAiApiKey = envString("OPENAI_API_KEY", "");
    config.openAiBaseUrl = envString("OPENAI_BASE_URL", config.openAiBaseUrl);
    config.openAiModel = envString("OPENAI_MODEL", config.openAiModel);
    config.openAiMaxTokens = static_cast<int>(envInteger("OPENAI_MAX_TOKENS", config.openAiMaxTokens));
    config.resultsFile = envString("AEO_RESULTS_FILE", "");

    if (config.maxConcurrentFetches == 0) {
        throw ConfigError("AEO_MAX_CONCURRENT_FETCHES must be at least 1");
    }
    if (config.llmMaxConcurrency == 0) {
        throw ConfigError("AEO_LLM_MAX_CONCURRENCY must be at least 1");
    }
    if (config.browserlessUrl.empty()) {
        config.renderEnabled = false;
    }

    LOG_DEBUG("Loaded configuration: userAgent=" + config.userAgent +
              ", renderEnabled=" + std::string(config.renderEnabled ? "true" : "false") +
              ", maxConcurrentFetches=" + std::to_string(config.maxConcurrentFetches) +
              ", rubricPath=" + config.rubricPath);
    return config;
}

} // namespace aeo_engine::common
