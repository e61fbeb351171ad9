#pragma once

#include <chrono>
#include <set>
#include <string>
#include <curl/curl.h>

namespace aeo_engine::crawler {

// Page fetch, retry and per-domain pacing settings
struct FetchConfig {
    std::chrono::milliseconds requestTimeout{30000};
    bool followRedirects = true;
    size_t maxRedirects = 5;
    size_t maxPageBytes = 10 * 1024 * 1024;

    // Lower bound for the gap between two requests to one domain
    std::chrono::milliseconds minCrawlDelay{2000};

    bool renderEnabled = true;
    std::chrono::milliseconds renderTimeout{60000};
    std::chrono::milliseconds renderWait{5000};

    int maxRetries = 3;
    std::chrono::milliseconds baseRetryDelay{1000};
    float backoffMultiplier = 2.0f;
    std::chrono::milliseconds maxRetryDelay{30000};
    std::chrono::seconds rateLimitDelay{60};

    std::set<int> retryableHttpCodes = {408, 429, 500, 502, 503, 504, 520, 521, 522, 523, 524};
    std::set<CURLcode> retryableCurlCodes = {
        CURLE_OPERATION_TIMEDOUT,
        CURLE_COULDNT_CONNECT,
        CURLE_RECV_ERROR,
        CURLE_SEND_ERROR,
        CURLE_GOT_NOTHING,
        CURLE_PARTIAL_FILE,
        CURLE_SSL_CONNECT_ERROR
    };

    int circuitBreakerFailureThreshold = 5;
    std::chrono::minutes circuitBreakerResetTime{5};
};

} // namespace aeo_engine::crawler
