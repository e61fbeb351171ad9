#include "URLFrontier.h"
#include "../../include/Logger.h"

#include <algorithm>

namespace aeo_engine::crawler {

std::string toString(UrlSource source) {
    switch (source) {
        case UrlSource::BASE: return "base";
        case UrlSource::SITEMAP: return "sitemap";
        case UrlSource::LINK: return "link";
        case UrlSource::MANUAL: return "manual";
    }
    return "link";
}

bool URLFrontier::addURL(const url::CanonicalUrl& url, double priority, int depth, UrlSource source) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!known_.insert(url.hash).second) {
        LOG_TRACE("Frontier already knows " + url.url);
        return false;
    }
    QueuedURL entry;
    entry.url = url;
    entry.priority = priority;
    entry.depth = depth;
    entry.source = source;
    entry.sequence = nextSequence_++;
    readyQueue_.push(std::move(entry));
    LOG_TRACE("Queued " + url.url + " (priority " + std::to_string(priority) + ", depth " + std::to_string(depth) + ")");
    return true;
}

void URLFrontier::promoteDelayed(std::chrono::steady_clock::time_point now) {
    auto it = delayed_.begin();
    while (it != delayed_.end()) {
        if (it->readyAt <= now) {
            readyQueue_.push(std::move(*it));
            it = delayed_.erase(it);
        } else {
            ++it;
        }
    }
}

std::optional<QueuedURL> URLFrontier::getNextURL() {
    std::lock_guard<std::mutex> lock(mutex_);
    promoteDelayed(std::chrono::steady_clock::now());
    if (readyQueue_.empty()) {
        return std::nullopt;
    }
    QueuedURL entry = readyQueue_.top();
    readyQueue_.pop();
    return entry;
}

void URLFrontier::scheduleRetry(QueuedURL entry, const std::string& error, FailureType failureType,
                                std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(mutex_);
    entry.retryCount++;
    entry.lastError = error;
    entry.lastFailureType = failureType;
    entry.readyAt = std::chrono::steady_clock::now() + delay;
    LOG_DEBUG("Retry " + std::to_string(entry.retryCount) + " for " + entry.url.url + " in " +
              std::to_string(delay.count()) + "ms");
    delayed_.push_back(std::move(entry));
}

void URLFrontier::markVisited(const std::string& urlHash) {
    std::lock_guard<std::mutex> lock(mutex_);
    visited_.insert(urlHash);
    known_.insert(urlHash);
}

bool URLFrontier::isVisited(const std::string& urlHash) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return visited_.count(urlHash) > 0;
}

bool URLFrontier::isKnown(const std::string& urlHash) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return known_.count(urlHash) > 0;
}

bool URLFrontier::isEmpty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return readyQueue_.empty() && delayed_.empty();
}

bool URLFrontier::hasReadyURLs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!readyQueue_.empty()) {
        return true;
    }
    const auto now = std::chrono::steady_clock::now();
    return std::any_of(delayed_.begin(), delayed_.end(), [now](const QueuedURL& e) { return e.readyAt <= now; });
}

size_t URLFrontier::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return readyQueue_.size() + delayed_.size();
}

size_t URLFrontier::visitedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return visited_.size();
}

std::chrono::milliseconds URLFrontier::timeUntilReady() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!readyQueue_.empty() || delayed_.empty()) {
        return std::chrono::milliseconds(0);
    }
    const auto now = std::chrono::steady_clock::now();
    auto earliest = std::min_element(delayed_.begin(), delayed_.end(),
                                     [](const QueuedURL& a, const QueuedURL& b) { return a.readyAt < b.readyAt; });
    if (earliest->readyAt <= now) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(earliest->readyAt - now);
}

} // namespace aeo_engine::crawler
