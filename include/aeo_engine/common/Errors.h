#pragma once

#include <stdexcept>
#include <string>
#include <curl/curl.h>
#include "../crawler/FailureType.h"

namespace aeo_engine::common {

class AeoError : public std::runtime_error {
public:
    explicit AeoError(const std::string& message) : std::runtime_error(message) {}
};

// Malformed or non-HTTP(S) URL
class InvalidUrlError : public AeoError {
public:
    explicit InvalidUrlError(const std::string& url, const std::string& reason = "")
        : AeoError("Invalid URL: " + url + (reason.empty() ? "" : " (" + reason + ")")), url_(url) {}

    const std::string& url() const { return url_; }

private:
    std::string url_;
};

// Every known user agent is denied by robots.txt
class RobotsBlockedError : public AeoError {
public:
    RobotsBlockedError(const std::string& domain, const std::string& reason)
        : AeoError("Crawling blocked by robots.txt for " + domain + ": " + reason), domain_(domain) {}

    const std::string& domain() const { return domain_; }

private:
    std::string domain_;
};

class FetchError : public AeoError {
public:
    FetchError(const std::string& url,
               const std::string& reason,
               int statusCode = 0,
               CURLcode curlCode = CURLE_OK,
               crawler::FailureType failureType = crawler::FailureType::UNKNOWN)
        : AeoError("Failed to fetch " + url + ": " + reason)
        , url_(url), statusCode_(statusCode), curlCode_(curlCode), failureType_(failureType) {}

    const std::string& url() const { return url_; }
    int statusCode() const { return statusCode_; }
    CURLcode curlCode() const { return curlCode_; }
    crawler::FailureType failureType() const { return failureType_; }

private:
    std::string url_;
    int statusCode_;
    CURLcode curlCode_;
    crawler::FailureType failureType_;
};

class MalformedSitemapError : public AeoError {
public:
    MalformedSitemapError(const std::string& sitemapUrl, const std::string& reason)
        : AeoError("Malformed sitemap " + sitemapUrl + ": " + reason) {}
};

class AiResponseParseError : public AeoError {
public:
    explicit AiResponseParseError(const std::string& reason)
        : AeoError("Could not parse AI scoring response: " + reason) {}
};

class LlmServiceError : public AeoError {
public:
    explicit LlmServiceError(const std::string& reason, bool timedOut = false)
        : AeoError("LLM service error: " + reason), timedOut_(timedOut) {}

    bool timedOut() const { return timedOut_; }

private:
    bool timedOut_;
};

class RubricValidationError : public AeoError {
public:
    explicit RubricValidationError(const std::string& reason)
        : AeoError("Invalid rubric: " + reason) {}
};

class ConfigError : public AeoError {
public:
    explicit ConfigError(const std::string& reason)
        : AeoError("Configuration error: " + reason) {}
};

} // namespace aeo_engine::common
