#pragma once

#include <chrono>
#include <string>
#include <curl/curl.h>
#include "../../include/aeo_engine/crawler/FailureType.h"
#include "../../include/aeo_engine/crawler/FetchConfig.h"

namespace aeo_engine::crawler {

class FailureClassifier {
public:
    /**
     * Classify a failed fetch
     * @param httpCode HTTP status code (0 when no response arrived)
     * @param curlCode transport result
     * @param errorMessage transport error text
     * @param config retry settings
     */
    static FailureType classifyFailure(int httpCode,
                                       CURLcode curlCode,
                                       const std::string& errorMessage,
                                       const FetchConfig& config);

    // Unknown failures get half the retry budget; permanent ones none
    static bool shouldRetry(FailureType failureType, int retryCount, int maxRetries);

    // Exponential backoff: base * multiplier^(retryCount - 1), capped; 429 uses the rate-limit base
    static std::chrono::milliseconds calculateRetryDelay(int retryCount,
                                                         const FetchConfig& config,
                                                         FailureType failureType);

    static std::string getFailureTypeDescription(FailureType failureType);

private:
    static bool isPermanentHttpError(int httpCode);
    static bool isPermanentCurlError(CURLcode curlCode);
};

} // namespace aeo_engine::crawler
