#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace aeo_engine::common {

/**
 * Thread-safe key/value cache whose entries expire after a fixed time-to-live.
 * Readers share a lock; put() replaces an entry wholesale (last writer wins).
 * A zero TTL keeps entries until they are invalidated. Expired entries are swept
 * every kSweepInterval puts so long-lived caches stay bounded by their live set.
 */
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class TtlCache {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFunction = std::function<Clock::time_point()>;

    static constexpr size_t kSweepInterval = 64;

    explicit TtlCache(std::chrono::milliseconds ttl, ClockFunction clock = nullptr)
        : ttl_(ttl), clock_(clock ? std::move(clock) : ClockFunction([] { return Clock::now(); })) {}

    std::optional<Value> get(const Key& key) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end() || isExpired(it->second)) {
            return std::nullopt;
        }
        return it->second.value;
    }

    void put(const Key& key, Value value) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (++putsSinceSweep_ >= kSweepInterval) {
            putsSinceSweep_ = 0;
            purgeExpiredLocked();
        }
        entries_[key] = Entry{std::move(value), clock_()};
    }

    bool contains(const Key& key) const {
        return get(key).has_value();
    }

    // Returns true when an entry was removed
    bool invalidate(const Key& key) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return entries_.erase(key) > 0;
    }

    // Remove all entries whose key satisfies the predicate
    size_t invalidateIf(const std::function<bool(const Key&)>& predicate) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        size_t removed = 0;
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (predicate(it->first)) {
                it = entries_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    void clear() {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        entries_.clear();
    }

    // Drop expired entries, returning how many were removed
    size_t purgeExpired() {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return purgeExpiredLocked();
    }

    // Number of stored entries, expired ones included until purged
    size_t size() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return entries_.size();
    }

    std::chrono::milliseconds ttl() const { return ttl_; }

private:
    struct Entry {
        Value value;
        Clock::time_point storedAt;
    };

    // Caller holds the unique lock
    size_t purgeExpiredLocked() {
        if (ttl_.count() <= 0) {
            return 0;
        }
        size_t removed = 0;
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (isExpired(it->second)) {
                it = entries_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    bool isExpired(const Entry& entry) const {
        if (ttl_.count() <= 0) {
            return false;
        }
        return clock_() - entry.storedAt >= ttl_;
    }

    std::chrono::milliseconds ttl_;
    ClockFunction clock_;
    std::unordered_map<Key, Entry, Hash> entries_;
    size_t putsSinceSweep_ = 0;
    mutable std::shared_mutex mutex_;
};

} // namespace aeo_engine::common
