#include "../../include/aeo_engine/crawler/RobotsComplianceEngine.h"
#include "../../include/aeo_engine/common/Errors.h"
#include "../../include/aeo_engine/common/TextUtils.h"
#include "../../include/aeo_engine/url/UrlCanonicalizer.h"
#include "../../include/crawler/CrawlLogger.h"
#include "../../include/Logger.h"
#include "RobotsTxtParser.h"

#include <algorithm>

namespace aeo_engine::crawler {

namespace {

constexpr double kFallbackCrawlDelaySeconds = 2.0;
constexpr double kDefaultCrawlDelaySeconds = 1.0;

// Marks a (domain, agent) pair as being fetched for the lifetime of the guard
class InflightGuard {
public:
    InflightGuard(std::mutex& mutex, std::unordered_set<std::string>& inflight, std::string key)
        : mutex_(mutex), inflight_(inflight), key_(std::move(key)) {
        std::lock_guard<std::mutex> lock(mutex_);
        inflight_.insert(key_);
    }
    ~InflightGuard() {
        std::lock_guard<std::mutex> lock(mutex_);
        inflight_.erase(key_);
    }
    InflightGuard(const InflightGuard&) = delete;
    InflightGuard& operator=(const InflightGuard&) = delete;

private:
    std::mutex& mutex_;
    std::unordered_set<std::string>& inflight_;
    std::string key_;
};

} // namespace

std::string toString(RobotsOutcome outcome) {
    switch (outcome) {
        case RobotsOutcome::ALLOWED_AS_DECLARED: return "allowed_as_declared";
        case RobotsOutcome::ALLOWED_AS_BROWSER: return "allowed_as_browser";
        case RobotsOutcome::BLOCKED: return "blocked";
        case RobotsOutcome::ERROR_FALLBACK_PERMISSIVE: return "error_fallback_permissive";
    }
    return "unknown";
}

std::string toString(CrawlStrategy strategy) {
    switch (strategy) {
        case CrawlStrategy::CRAWLER: return "crawler";
        case CrawlStrategy::BROWSER: return "browser";
        case CrawlStrategy::BLOCKED: return "blocked";
    }
    return "unknown";
}

CrawlStrategy RobotsPolicy::strategy() const {
    switch (outcome) {
        case RobotsOutcome::ALLOWED_AS_DECLARED:
        case RobotsOutcome::ERROR_FALLBACK_PERMISSIVE:
            return CrawlStrategy::CRAWLER;
        case RobotsOutcome::ALLOWED_AS_BROWSER:
            return CrawlStrategy::BROWSER;
        case RobotsOutcome::BLOCKED:
            return CrawlStrategy::BLOCKED;
    }
    return CrawlStrategy::BLOCKED;
}

bool RobotsPolicy::isUrlAllowed(const std::string& url) const {
    if (!canCrawl()) {
        return false;
    }
    if (!rules) {
        return true;
    }
    return rules->isAllowed(url, effectiveUserAgent);
}

std::chrono::milliseconds RobotsPolicy::effectiveDelay(std::chrono::milliseconds minimum) const {
    auto robotsDelay = std::chrono::milliseconds(static_cast<long long>(crawlDelaySeconds * 1000.0));
    return std::max(robotsDelay, minimum);
}

RobotsComplianceEngine::RobotsComplianceEngine(http::HttpClient& httpClient,
                                               RobotsPolicyCache& cache,
                                               std::string declaredUserAgent,
                                               std::chrono::milliseconds fetchTimeout)
    : httpClient_(httpClient)
    , cache_(cache)
    , declaredUserAgent_(declaredUserAgent.empty() ? kDefaultUserAgent : std::move(declaredUserAgent))
    , fetchTimeout_(fetchTimeout) {
}

const std::vector<std::pair<std::string, std::string>>& RobotsComplianceEngine::browserUserAgents() {
    static const std::vector<std::pair<std::string, std::string>> agents = {
        {"chrome", "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36"},
        {"firefox", "Mozilla/5.0 (Macintosh; Intel Mac OS X 10.15; rv:121.0) Gecko/20100101 Firefox/121.0"},
        {"safari", "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) AppleWebKit/605.1.15 (KHTML, like Gecko) Version/17.2.1 Safari/605.1.15"}
    };
    return agents;
}

std::string RobotsComplianceEngine::normalizeDomain(const std::string& domainOrUrl) {
    const std::string input = common::trim(domainOrUrl);
    if (input.find("://") != std::string::npos) {
        return url::extractHost(input);
    }
    std::string host = input.substr(0, input.find_first_of("/?#"));
    return common::toLower(host);
}

std::string RobotsComplianceEngine::cacheKey(const std::string& domain, const std::string& userAgent) {
    return domain + "_" + userAgent;
}

RobotsCheckState RobotsComplianceEngine::checkState(const std::string& domainOrUrl, const std::string& userAgent) const {
    const std::string domain = normalizeDomain(domainOrUrl);
    const std::string key = cacheKey(domain, userAgent.empty() ? declaredUserAgent_ : userAgent);
    {
        std::lock_guard<std::mutex> lock(inflightMutex_);
        if (inflight_.count(key)) {
            return RobotsCheckState::FETCHING;
        }
    }
    return cache_.contains(key) ? RobotsCheckState::RESOLVED : RobotsCheckState::UNCHECKED;
}

void RobotsComplianceEngine::invalidate(const std::string& domainOrUrl) {
    const std::string prefix = normalizeDomain(domainOrUrl) + "_";
    size_t removed = cache_.invalidateIf([&prefix](const std::string& key) { return common::startsWith(key, prefix); });
    LOG_DEBUG("Invalidated " + std::to_string(removed) + " robots decisions for " + domainOrUrl);
}

std::shared_ptr<const RobotsPolicy> RobotsComplianceEngine::checkRobots(const std::string& domainOrUrl, const std::string& userAgent) {
    const std::string domain = normalizeDomain(domainOrUrl);
    if (domain.empty()) {
        throw common::InvalidUrlError(domainOrUrl, "no host");
    }
    const std::string agent = userAgent.empty() ? declaredUserAgent_ : userAgent;
    const std::string key = cacheKey(domain, agent);

    if (auto cached = cache_.get(key)) {
        LOG_DEBUG("Robots decision cache hit for " + key);
        return *cached;
    }

    InflightGuard guard(inflightMutex_, inflight_, key);
    const std::string robotsUrl = "https://" + domain + "/robots.txt";
    LOG_INFO("Fetching robots.txt: " + robotsUrl);

    http::HttpResponse response = httpClient_.get(robotsUrl, agent, fetchTimeout_);

    RobotsPolicy policy;
    if (!response.transportOk()) {
        policy = fallbackPolicy(domain, agent, "robots.txt unavailable: " + response.errorMessage);
    } else if (response.statusCode >= 500) {
        policy = fallbackPolicy(domain, agent, "robots.txt returned HTTP " + std::to_string(response.statusCode));
    } else if (response.statusCode < 200 || response.statusCode >= 300) {
        policy = fallbackPolicy(domain, agent, "No robots.txt found");
    } else {
        policy = evaluate(domain, response.body, agent);
    }

    auto shared = std::make_shared<const RobotsPolicy>(std::move(policy));
    cache_.put(key, shared);

    LOG_INFO("Robots decision for " + domain + ": " + toString(shared->outcome) +
             " (agent: " + shared->effectiveUserAgent + ", delay: " + std::to_string(shared->crawlDelaySeconds) + "s)");
    if (shared->outcome == RobotsOutcome::BLOCKED) {
        CrawlLogger::broadcastLog("Crawling blocked by robots.txt for " + domain, "warning");
    } else if (shared->outcome == RobotsOutcome::ALLOWED_AS_BROWSER) {
        CrawlLogger::broadcastLog("Declared agent disallowed on " + domain + ", continuing with browser agent", "info");
    }
    return shared;
}

RobotsPolicy RobotsComplianceEngine::fallbackPolicy(const std::string& domain, const std::string& userAgent, const std::string& reason) const {
    RobotsPolicy policy;
    policy.domain = domain;
    policy.exists = false;
    policy.allowedAsDeclaredAgent = true;
    policy.allowedAsBrowserAgent = true;
    policy.declaredUserAgent = userAgent;
    policy.effectiveUserAgent = userAgent;
    policy.crawlDelaySeconds = kFallbackCrawlDelaySeconds;
    policy.outcome = RobotsOutcome::ERROR_FALLBACK_PERMISSIVE;
    policy.reason = reason;
    LOG_WARNING("Robots fallback for " + domain + ": " + reason);
    return policy;
}

RobotsPolicy RobotsComplianceEngine::evaluate(const std::string& domain, const std::string& content, const std::string& userAgent) const {
    auto rules = std::make_shared<const RobotsRules>(RobotsRules::parse(content));

    RobotsPolicy policy;
    policy.domain = domain;
    policy.exists = true;
    policy.declaredUserAgent = userAgent;
    policy.rules = rules;
    policy.sitemapUrls = rules->sitemaps();
    policy.allowedAsDeclaredAgent = rules->isAllowed("/", userAgent);

    std::string allowedBrowserAgent;
    for (const auto& [name, agent] : browserUserAgents()) {
        if (rules->isAllowed("/", agent)) {
            allowedBrowserAgent = agent;
            LOG_DEBUG("Browser agent '" + name + "' allowed on " + domain);
            break;
        }
    }
    policy.allowedAsBrowserAgent = !allowedBrowserAgent.empty();

    if (policy.allowedAsDeclaredAgent) {
        policy.outcome = RobotsOutcome::ALLOWED_AS_DECLARED;
        policy.effectiveUserAgent = userAgent;
        policy.reason = "robots.txt allows " + userAgent;
    } else if (policy.allowedAsBrowserAgent) {
        policy.outcome = RobotsOutcome::ALLOWED_AS_BROWSER;
        policy.effectiveUserAgent = allowedBrowserAgent;
        policy.reason = "robots.txt disallows " + userAgent + " but allows browser user agents";

        common::Recommendation recommendation;
        recommendation.category = "Crawler Access";
        recommendation.priority = common::RecommendationPriority::MEDIUM;
        recommendation.issue = "robots.txt blocks " + userAgent + " while allowing regular browsers";
        recommendation.recommendation = "Add an explicit 'User-agent: " + RobotsRules::productToken(userAgent) +
                                        "' group with 'Allow: /' so AI crawlers can read your content";
        recommendation.impact = "AI answer engines that respect robots.txt cannot index this site";
        policy.recommendations.push_back(std::move(recommendation));
    } else {
        policy.outcome = RobotsOutcome::BLOCKED;
        policy.effectiveUserAgent = userAgent;
        policy.reason = "robots.txt disallows " + userAgent + " and all known browser user agents";

        common::Recommendation recommendation;
        recommendation.category = "Crawler Access";
        recommendation.priority = common::RecommendationPriority::HIGH;
        recommendation.issue = "Comprehensive robots.txt blocking";
        recommendation.recommendation = "This website blocks all automated access including browser user agents. "
                                        "This indicates very strict content protection policies.";
        recommendation.impact = "Cannot provide automated analysis - this shows extremely security-conscious site management.";
        recommendation.implementation = "To analyze this site:\n"
                                        "1. Contact site owner directly for analysis permission\n"
                                        "2. Use manual browser inspection with developer tools\n"
                                        "3. Check if any public API endpoints are available\n"
                                        "4. Review publicly available meta information only";
        policy.recommendations.push_back(std::move(recommendation));
    }

    policy.crawlDelaySeconds = rules->crawlDelay(policy.effectiveUserAgent).value_or(kDefaultCrawlDelaySeconds);

    for (const auto& path : rules->disallowedPaths(policy.effectiveUserAgent)) {
        if (path != "/") {
            policy.disallowedPaths.push_back(path);
        }
    }
    return policy;
}

} // namespace aeo_engine::crawler
