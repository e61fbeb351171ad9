#include "PageFetcher.h"
#include "FailureClassifier.h"
#include "../../include/aeo_engine/common/Errors.h"
#include "../../include/aeo_engine/url/UrlCanonicalizer.h"
#include "../../include/Logger.h"
#include "../../include/crawler/CrawlLogger.h"

#include <algorithm>
#include <thread>

namespace aeo_engine::crawler {

PageFetcher::PageFetcher(http::HttpClient& httpClient, DomainManager& domains, const FetchConfig& config)
    : httpClient_(httpClient)
    , domains_(domains)
    , config_(config)
    , sleeper_([](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); }) {
}

void PageFetcher::setSleeper(Sleeper sleeper) {
    sleeper_ = std::move(sleeper);
}

http::HttpResponse PageFetcher::fetchStatic(const std::string& url, const std::string& userAgent) const {
    http::HttpRequest request;
    request.url = url;
    request.userAgent = userAgent;
    request.timeout = config_.requestTimeout;
    request.followRedirects = config_.followRedirects;
    request.maxBodyBytes = config_.maxPageBytes;
    request.headers["Accept"] = "text/html,application/xhtml+xml,application/xml;q=0.9,*/*;q=0.8";
    request.headers["Accept-Language"] = "en-US,en;q=0.9";
    return httpClient_.execute(request);
}

int PageFetcher::retryAfterSeconds(const http::HttpResponse& response) {
    auto it = response.headers.find("retry-after");
    if (it == response.headers.end()) {
        return 0;
    }
    try {
        return std::max(0, std::stoi(it->second));
    } catch (const std::exception&) {
        return 0;  // HTTP-date form is not supported
    }
}

PageFetchResult PageFetcher::fetch(const std::string& url, const std::string& userAgent, BrowserSession* browser) {
    const std::string domain = url::extractHost(url);
    if (domain.empty()) {
        throw common::InvalidUrlError(url, "cannot fetch");
    }

    const bool wantRender = browser != nullptr && config_.renderEnabled;

    for (int attempt = 0;; ++attempt) {
        if (domains_.isCircuitBreakerOpen(domain)) {
            throw common::FetchError(url, "circuit breaker open for " + domain, 0, CURLE_OK, FailureType::TEMPORARY);
        }

        auto wait = domains_.reserveSlot(domain);
        if (wait.count() > 0) {
            LOG_DEBUG("Waiting " + std::to_string(wait.count()) + "ms before fetching " + url);
            sleeper_(wait);
        }

        auto started = std::chrono::steady_clock::now();
        PageFetchResult result;
        result.url = url;
        result.attempts = attempt + 1;

        if (wantRender) {
            if (browser->available()) {
                RenderResult rendered = browser->render(url, userAgent, config_.renderTimeout);
                if (rendered.success) {
                    result.finalUrl = url;
                    result.statusCode = rendered.statusCode > 0 ? rendered.statusCode : 200;
                    result.contentType = "text/html";
                    result.html = std::move(rendered.html);
                    result.renderMethod = RenderMethod::RENDERED;
                    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - started);
                    result.fetchedAt = std::chrono::system_clock::now();
                    domains_.recordSuccess(domain);
                    return result;
                }
                result.renderFallbackReason = rendered.error;
            } else {
                result.renderFallbackReason = browser->initError();
            }
            LOG_INFO("Render fallback for " + url + ": " + *result.renderFallbackReason);
        }

        http::HttpResponse response = fetchStatic(url, userAgent);
        if (response.ok()) {
            result.finalUrl = response.finalUrl.empty() ? url : response.finalUrl;
            result.statusCode = response.statusCode;
            result.headers = std::move(response.headers);
            result.contentType = response.contentType;
            result.html = std::move(response.body);
            result.renderMethod = RenderMethod::STATIC;
            result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started);
            result.fetchedAt = std::chrono::system_clock::now();
            domains_.recordSuccess(domain);
            return result;
        }

        const std::string error = response.transportOk()
            ? "HTTP " + std::to_string(response.statusCode)
            : response.errorMessage;
        FailureType type = FailureClassifier::classifyFailure(response.statusCode, response.curlCode, error, config_);
        if (type == FailureType::RATE_LIMITED) {
            domains_.recordRateLimit(domain, retryAfterSeconds(response));
        }
        domains_.recordFailure(domain, type, error);

        if (!FailureClassifier::shouldRetry(type, attempt, config_.maxRetries)) {
            CrawlLogger::broadcastLog("Failed to fetch " + url + ": " + error, "error");
            throw common::FetchError(url, error, response.statusCode, response.curlCode, type);
        }

        auto delay = FailureClassifier::calculateRetryDelay(attempt + 1, config_, type);
        LOG_WARNING("Fetch of " + url + " failed (" + error + "), retry " + std::to_string(attempt + 1) + " in " +
                    std::to_string(delay.count()) + "ms");
        sleeper_(delay);
    }
}

} // namespace aeo_engine::crawler
