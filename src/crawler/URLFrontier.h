#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <unordered_set>
#include <vector>
#include "../../include/aeo_engine/crawler/FailureType.h"
#include "../../include/aeo_engine/url/UrlCanonicalizer.h"

namespace aeo_engine::crawler {

// Where a frontier entry came from
enum class UrlSource {
    BASE,
    SITEMAP,
    LINK,
    MANUAL
};

std::string toString(UrlSource source);

struct QueuedURL {
    url::CanonicalUrl url;
    double priority = 0.5;
    int depth = 0;  // 0 = base URL
    UrlSource source = UrlSource::LINK;
    int retryCount = 0;
    std::string lastError;
    FailureType lastFailureType = FailureType::UNKNOWN;
    std::chrono::steady_clock::time_point readyAt{};
    uint64_t sequence = 0;  // insertion order, breaks priority ties
};

/**
 * Crawl frontier of canonical URLs. Higher priority first, FIFO among equals.
 * A URL is accepted once per frontier: re-adding a queued, in-flight or visited hash is a no-op.
 */
class URLFrontier {
public:
    // Returns false when the canonical hash is already known
    bool addURL(const url::CanonicalUrl& url, double priority, int depth, UrlSource source);

    // Next ready entry, nullopt when nothing is ready now
    std::optional<QueuedURL> getNextURL();

    // Requeue a failed entry after `delay`
    void scheduleRetry(QueuedURL entry, const std::string& error, FailureType failureType, std::chrono::milliseconds delay);

    void markVisited(const std::string& urlHash);
    bool isVisited(const std::string& urlHash) const;
    bool isKnown(const std::string& urlHash) const;

    bool isEmpty() const;
    bool hasReadyURLs() const;
    size_t size() const;
    size_t visitedCount() const;

    // Time until the earliest queued entry becomes ready (zero if one is ready)
    std::chrono::milliseconds timeUntilReady() const;

private:
    struct Ordering {
        bool operator()(const QueuedURL& a, const QueuedURL& b) const {
            if (a.priority != b.priority) {
                return a.priority < b.priority;
            }
            return a.sequence > b.sequence;
        }
    };

    std::priority_queue<QueuedURL, std::vector<QueuedURL>, Ordering> readyQueue_;
    std::vector<QueuedURL> delayed_;
    std::unordered_set<std::string> known_;
    std::unordered_set<std::string> visited_;
    uint64_t nextSequence_ = 0;
    mutable std::mutex mutex_;

    void promoteDelayed(std::chrono::steady_clock::time_point now);
};

} // namespace aeo_engine::crawler
