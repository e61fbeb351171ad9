#include "DomainManager.h"
#include "FailureClassifier.h"
#include "../../include/Logger.h"
#include "../../include/crawler/CrawlLogger.h"

#include <algorithm>
#include <cmath>

namespace aeo_engine::crawler {

namespace {

std::string circuitName(CircuitBreakerState state) {
    switch (state) {
        case CircuitBreakerState::OPEN: return "OPEN";
        case CircuitBreakerState::HALF_OPEN: return "HALF_OPEN";
        case CircuitBreakerState::CLOSED: return "CLOSED";
    }
    return "CLOSED";
}

} // namespace

DomainManager::DomainManager(const FetchConfig& config, ClockFunction clock)
    : config_(config), clock_(clock ? std::move(clock) : ClockFunction([] { return Clock::now(); })) {
    LOG_DEBUG("DomainManager initialized with circuit breaker threshold: " +
              std::to_string(config_.circuitBreakerFailureThreshold));
}

void DomainManager::setCrawlDelay(const std::string& domain, std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(domainMutex_);
    auto& state = getOrCreateDomainState(domain);
    state.crawlDelay = std::max(delay, config_.minCrawlDelay);
    state.dynamicCrawlDelay = std::max(state.dynamicCrawlDelay, state.crawlDelay);
    LOG_DEBUG("Crawl delay for " + domain + " set to " + std::to_string(state.crawlDelay.count()) + "ms");
}

std::chrono::milliseconds DomainManager::reserveSlot(const std::string& domain) {
    std::lock_guard<std::mutex> lock(domainMutex_);
    auto& state = getOrCreateDomainState(domain);
    const auto now = clock_();

    auto start = std::max({now, state.nextSlot, state.rateLimitedUntil});
    state.nextSlot = start + state.dynamicCrawlDelay;
    return std::chrono::duration_cast<std::chrono::milliseconds>(start - now);
}

bool DomainManager::isCircuitBreakerOpen(const std::string& domain) {
    std::lock_guard<std::mutex> lock(domainMutex_);
    auto& state = getOrCreateDomainState(domain);
    updateCircuitBreakerState(domain, state, clock_());
    return state.circuitState == CircuitBreakerState::OPEN;
}

void DomainManager::recordSuccess(const std::string& domain) {
    std::lock_guard<std::mutex> lock(domainMutex_);
    auto& state = getOrCreateDomainState(domain);

    state.totalRequests++;
    state.successfulRequests++;
    state.consecutiveFailures = 0;
    if (state.circuitState != CircuitBreakerState::CLOSED) {
        state.circuitState = CircuitBreakerState::CLOSED;
        LOG_INFO("Circuit breaker CLOSED for domain: " + domain);
    }

    if (state.dynamicCrawlDelay > state.crawlDelay) {
        state.dynamicCrawlDelay = std::max(
            state.crawlDelay,
            std::chrono::milliseconds(static_cast<long long>(state.dynamicCrawlDelay.count() * 0.8)));
    }
}

void DomainManager::recordFailure(const std::string& domain, FailureType failureType, const std::string& error) {
    std::lock_guard<std::mutex> lock(domainMutex_);
    auto& state = getOrCreateDomainState(domain);
    const auto now = clock_();

    state.totalRequests++;
    state.consecutiveFailures++;
    state.lastError = error;
    state.lastFailureType = failureType;

    if (state.circuitState == CircuitBreakerState::HALF_OPEN) {
        // The trial request failed
        state.circuitState = CircuitBreakerState::OPEN;
        state.circuitOpenedAt = now;
    } else {
        updateCircuitBreakerState(domain, state, now);
    }
    state.dynamicCrawlDelay = calculateDynamicDelay(state);

    LOG_WARNING("Recorded failure for domain: " + domain +
                " (consecutive failures: " + std::to_string(state.consecutiveFailures) +
                ", type: " + FailureClassifier::getFailureTypeDescription(failureType) +
                ", delay: " + std::to_string(state.dynamicCrawlDelay.count()) + "ms" +
                ", circuit: " + circuitName(state.circuitState) + ")");

    if (state.circuitState == CircuitBreakerState::OPEN) {
        CrawlLogger::broadcastLog("Circuit breaker OPENED for domain: " + domain + " after " +
                                  std::to_string(state.consecutiveFailures) + " failures", "warning");
    }
}

void DomainManager::recordRateLimit(const std::string& domain, int retryAfterSeconds) {
    std::lock_guard<std::mutex> lock(domainMutex_);
    auto& state = getOrCreateDomainState(domain);

    auto pause = retryAfterSeconds > 0 ? std::chrono::seconds(retryAfterSeconds) : config_.rateLimitDelay;
    state.rateLimitedUntil = clock_() + pause;

    LOG_WARNING("Rate limit recorded for domain: " + domain + ", pausing " + std::to_string(pause.count()) + "s");
    CrawlLogger::broadcastLog("Rate limited by domain: " + domain + " for " + std::to_string(pause.count()) + " seconds",
                              "warning");
}

DomainState DomainManager::getDomainState(const std::string& domain) const {
    std::lock_guard<std::mutex> lock(domainMutex_);
    auto it = domainStates_.find(domain);
    if (it != domainStates_.end()) {
        return it->second;
    }
    DomainState defaults;
    defaults.crawlDelay = config_.minCrawlDelay;
    defaults.dynamicCrawlDelay = config_.minCrawlDelay;
    return defaults;
}

void DomainManager::resetCircuitBreaker(const std::string& domain) {
    std::lock_guard<std::mutex> lock(domainMutex_);
    auto& state = getOrCreateDomainState(domain);
    state.circuitState = CircuitBreakerState::CLOSED;
    state.consecutiveFailures = 0;
    state.dynamicCrawlDelay = state.crawlDelay;
    LOG_INFO("Circuit breaker manually reset for domain: " + domain);
}

void DomainManager::updateCircuitBreakerState(const std::string& domain, DomainState& state, Clock::time_point now) {
    switch (state.circuitState) {
        case CircuitBreakerState::CLOSED:
            if (state.consecutiveFailures >= config_.circuitBreakerFailureThreshold) {
                state.circuitState = CircuitBreakerState::OPEN;
                state.circuitOpenedAt = now;
                LOG_WARNING("Circuit breaker OPENED for domain: " + domain);
            }
            break;
        case CircuitBreakerState::OPEN:
            if (now >= state.circuitOpenedAt + config_.circuitBreakerResetTime) {
                state.circuitState = CircuitBreakerState::HALF_OPEN;
                LOG_INFO("Circuit breaker HALF_OPEN for domain: " + domain);
            }
            break;
        case CircuitBreakerState::HALF_OPEN:
            // resolved by the next recordSuccess/recordFailure
            break;
    }
}

std::chrono::milliseconds DomainManager::calculateDynamicDelay(const DomainState& state) const {
    double multiplier = std::pow(1.5, std::min(state.consecutiveFailures, 10));
    if (state.lastFailureType == FailureType::RATE_LIMITED) {
        multiplier *= 2.0;
    }
    auto delay = std::chrono::milliseconds(static_cast<long long>(state.crawlDelay.count() * multiplier));
    return std::min(delay, std::chrono::milliseconds(std::chrono::minutes(5)));
}

DomainState& DomainManager::getOrCreateDomainState(const std::string& domain) {
    auto it = domainStates_.find(domain);
    if (it != domainStates_.end()) {
        return it->second;
    }
    DomainState state;
    state.crawlDelay = config_.minCrawlDelay;
    state.dynamicCrawlDelay = config_.minCrawlDelay;
    return domainStates_.emplace(domain, state).first->second;
}

} // namespace aeo_engine::crawler
