#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include "../../include/aeo_engine/crawler/FailureType.h"
#include "../../include/aeo_engine/crawler/FetchConfig.h"

namespace aeo_engine::crawler {

enum class CircuitBreakerState {
    CLOSED,     // Normal operation
    OPEN,       // Requests to the domain are refused
    HALF_OPEN   // One trial request decides
};

struct DomainState {
    CircuitBreakerState circuitState = CircuitBreakerState::CLOSED;

    int consecutiveFailures = 0;
    int totalRequests = 0;
    int successfulRequests = 0;

    // Politeness delay from robots.txt, never below FetchConfig::minCrawlDelay
    std::chrono::milliseconds crawlDelay{0};
    // Grows with consecutive failures and decays back to crawlDelay on success
    std::chrono::milliseconds dynamicCrawlDelay{0};

    std::chrono::steady_clock::time_point nextSlot{};
    std::chrono::steady_clock::time_point circuitOpenedAt{};
    std::chrono::steady_clock::time_point rateLimitedUntil{};

    std::string lastError;
    FailureType lastFailureType = FailureType::UNKNOWN;

    double getSuccessRate() const {
        return totalRequests > 0 ? static_cast<double>(successfulRequests) / totalRequests : 0.0;
    }
};

/**
 * Per-domain pacing and circuit breaking shared by every fetch worker of a process.
 * Callers reserve a slot before each request and sleep for the returned wait.
 */
class DomainManager {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFunction = std::function<Clock::time_point()>;

    explicit DomainManager(const FetchConfig& config, ClockFunction clock = nullptr);

    // Effective delay becomes max(delay, minCrawlDelay)
    void setCrawlDelay(const std::string& domain, std::chrono::milliseconds delay);

    // Claim the next request slot for the domain; returns how long to wait before sending
    std::chrono::milliseconds reserveSlot(const std::string& domain);

    bool isCircuitBreakerOpen(const std::string& domain);

    void recordSuccess(const std::string& domain);
    void recordFailure(const std::string& domain, FailureType failureType, const std::string& error);

    // 429 handling: honours Retry-After seconds when given, else the configured rate-limit delay
    void recordRateLimit(const std::string& domain, int retryAfterSeconds = 0);

    DomainState getDomainState(const std::string& domain) const;

    void resetCircuitBreaker(const std::string& domain);

private:
    void updateCircuitBreakerState(const std::string& domain, DomainState& state, Clock::time_point now);
    std::chrono::milliseconds calculateDynamicDelay(const DomainState& state) const;
    DomainState& getOrCreateDomainState(const std::string& domain);

    FetchConfig config_;
    ClockFunction clock_;
    std::unordered_map<std::string, DomainState> domainStates_;
    mutable std::mutex domainMutex_;
};

} // namespace aeo_engine::crawler
