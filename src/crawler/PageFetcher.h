#pragma once

#include <chrono>
#include <functional>
#include <string>
#include "DomainManager.h"
#include "../../include/aeo_engine/crawler/BrowserRenderer.h"
#include "../../include/aeo_engine/crawler/FetchConfig.h"
#include "../../include/aeo_engine/crawler/PageFetchResult.h"
#include "../../include/aeo_engine/http/HttpClient.h"

namespace aeo_engine::crawler {

/**
 * Fetches one page: headless render first when a browser session is supplied, a static
 * HTTP GET otherwise or when rendering fails. Requests are paced per domain and retried
 * with backoff for retryable failures.
 */
class PageFetcher {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    PageFetcher(http::HttpClient& httpClient, DomainManager& domains, const FetchConfig& config);

    // Throws FetchError once the failure is permanent or retries are exhausted
    PageFetchResult fetch(const std::string& url, const std::string& userAgent, BrowserSession* browser = nullptr);

    // Replace the blocking sleep used for pacing and backoff
    void setSleeper(Sleeper sleeper);

    const FetchConfig& config() const { return config_; }

private:
    http::HttpResponse fetchStatic(const std::string& url, const std::string& userAgent) const;
    static int retryAfterSeconds(const http::HttpResponse& response);

    http::HttpClient& httpClient_;
    DomainManager& domains_;
    FetchConfig config_;
    Sleeper sleeper_;
};

} // namespace aeo_engine::crawler
