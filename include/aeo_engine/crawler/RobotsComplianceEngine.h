#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "../common/Recommendation.h"
#include "../common/TtlCache.h"
#include "../http/HttpClient.h"

namespace aeo_engine::crawler {

class RobotsRules;

// Terminal states of a per-domain robots check
enum class RobotsOutcome {
    ALLOWED_AS_DECLARED,
    ALLOWED_AS_BROWSER,
    BLOCKED,
    ERROR_FALLBACK_PERMISSIVE
};

// Progress of the check for a (domain, agent) pair
enum class RobotsCheckState {
    UNCHECKED,
    FETCHING,
    RESOLVED
};

enum class CrawlStrategy {
    CRAWLER,
    BROWSER,
    BLOCKED
};

std::string toString(RobotsOutcome outcome);
std::string toString(CrawlStrategy strategy);

struct RobotsPolicy {
    std::string domain;
    bool exists = false;
    bool allowedAsDeclaredAgent = true;
    bool allowedAsBrowserAgent = true;
    std::string declaredUserAgent;
    std::string effectiveUserAgent;
    double crawlDelaySeconds = 1.0;
    std::vector<std::string> disallowedPaths;
    std::vector<std::string> sitemapUrls;
    RobotsOutcome outcome = RobotsOutcome::ERROR_FALLBACK_PERMISSIVE;
    std::string reason;
    std::vector<common::Recommendation> recommendations;
    std::chrono::system_clock::time_point checkedAt = std::chrono::system_clock::now();
    // Absent when robots.txt could not be read
    std::shared_ptr<const RobotsRules> rules;

    bool canCrawl() const { return outcome != RobotsOutcome::BLOCKED; }
    CrawlStrategy strategy() const;

    // Path-level check for the effective agent; permissive without rules
    bool isUrlAllowed(const std::string& url) const;

    // max(crawlDelaySeconds, minimum)
    std::chrono::milliseconds effectiveDelay(std::chrono::milliseconds minimum) const;
};

using RobotsPolicyCache = common::TtlCache<std::string, std::shared_ptr<const RobotsPolicy>>;

/**
 * Negotiates crawl access for a domain: the declared agent first, then a fixed list of
 * browser agents. Decisions are cached per (domain, agent) in the injected cache and
 * replaced wholesale when they expire.
 */
class RobotsComplianceEngine {
public:
    static constexpr const char* kDefaultUserAgent = "AEO-Platform-Bot/1.0";

    RobotsComplianceEngine(http::HttpClient& httpClient,
                           RobotsPolicyCache& cache,
                           std::string declaredUserAgent = kDefaultUserAgent,
                           std::chrono::milliseconds fetchTimeout = std::chrono::seconds(10));

    // `domainOrUrl` may be a bare host or any URL on the host; an empty agent means the declared one
    std::shared_ptr<const RobotsPolicy> checkRobots(const std::string& domainOrUrl, const std::string& userAgent = "");

    // Decide from robots.txt content without any I/O
    RobotsPolicy evaluate(const std::string& domain, const std::string& content, const std::string& userAgent) const;

    RobotsCheckState checkState(const std::string& domainOrUrl, const std::string& userAgent = "") const;

    // Drop cached decisions for every agent of the domain
    void invalidate(const std::string& domainOrUrl);

    const std::string& declaredUserAgent() const { return declaredUserAgent_; }

    // (name, user agent string) in fallback priority order
    static const std::vector<std::pair<std::string, std::string>>& browserUserAgents();

    static std::string normalizeDomain(const std::string& domainOrUrl);

private:
    RobotsPolicy fallbackPolicy(const std::string& domain, const std::string& userAgent, const std::string& reason) const;
    static std::string cacheKey(const std::string& domain, const std::string& userAgent);

    http::HttpClient& httpClient_;
    RobotsPolicyCache& cache_;
    std::string declaredUserAgent_;
    std::chrono::milliseconds fetchTimeout_;

    mutable std::mutex inflightMutex_;
    std::unordered_set<std::string> inflight_;
};

} // namespace aeo_engine::crawler
