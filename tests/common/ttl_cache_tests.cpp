#include <catch2/catch_test_macros.hpp>
#include "../../include/aeo_engine/common/TtlCache.h"

#include <thread>
#include <vector>

using aeo_engine::common::TtlCache;

TEST_CASE("TtlCache expires entries", "[TtlCache]") {
    auto now = TtlCache<std::string, int>::Clock::now();
    TtlCache<std::string, int> cache(std::chrono::seconds(10), [&now] { return now; });

    cache.put("a", 1);
    REQUIRE(cache.get("a") == 1);
    REQUIRE_FALSE(cache.get("missing").has_value());

    now += std::chrono::seconds(9);
    REQUIRE(cache.contains("a"));

    now += std::chrono::seconds(1);
    REQUIRE_FALSE(cache.contains("a"));
    REQUIRE(cache.size() == 1);
    REQUIRE(cache.purgeExpired() == 1);
    REQUIRE(cache.size() == 0);

    SECTION("Put refreshes the timestamp and replaces the value") {
        cache.put("b", 1);
        now += std::chrono::seconds(5);
        cache.put("b", 2);
        now += std::chrono::seconds(6);
        REQUIRE(cache.get("b") == 2);
    }
}

TEST_CASE("TtlCache sweeps expired entries as new ones arrive", "[TtlCache]") {
    using Cache = TtlCache<std::string, int>;
    auto now = Cache::Clock::now();
    Cache cache(std::chrono::seconds(10), [&now] { return now; });

    for (size_t i = 1; i < Cache::kSweepInterval; ++i) {
        cache.put("https://example.com/page/" + std::to_string(i), static_cast<int>(i));
    }
    REQUIRE(cache.size() == Cache::kSweepInterval - 1);

    now += std::chrono::seconds(10);
    cache.put("https://example.com/fresh", 0);
    REQUIRE(cache.size() == 1);
    REQUIRE(cache.get("https://example.com/fresh") == 0);

    SECTION("Live entries survive the sweep") {
        for (size_t i = 1; i < Cache::kSweepInterval; ++i) {
            cache.put("https://example.org/" + std::to_string(i), 1);
        }
        now += std::chrono::seconds(5);
        cache.put("https://example.org/last", 1);
        REQUIRE(cache.size() == Cache::kSweepInterval + 1);
    }
}

TEST_CASE("TtlCache with zero TTL holds until invalidated", "[TtlCache]") {
    auto now = TtlCache<std::string, int>::Clock::now();
    TtlCache<std::string, int> cache(std::chrono::milliseconds(0), [&now] { return now; });

    cache.put("robots:example.com", 1);
    cache.put("robots:example.org", 2);
    cache.put("rubric", 3);
    now += std::chrono::hours(24 * 365);
    REQUIRE(cache.get("rubric") == 3);

    REQUIRE(cache.invalidate("rubric"));
    REQUIRE_FALSE(cache.invalidate("rubric"));
    REQUIRE(cache.invalidateIf([](const std::string& key) { return key.rfind("robots:", 0) == 0; }) == 2);
    REQUIRE(cache.size() == 0);

    cache.put("x", 1);
    cache.clear();
    REQUIRE_FALSE(cache.contains("x"));
}

TEST_CASE("TtlCache tolerates concurrent writers", "[TtlCache]") {
    TtlCache<int, int> cache(std::chrono::minutes(1));
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&cache, t] {
            for (int i = 0; i < 200; ++i) {
                cache.put(i, t);
                cache.get(i);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(cache.size() == 200);
    const auto value = cache.get(42);
    REQUIRE(value.has_value());
    REQUIRE(*value >= 0);
    REQUIRE(*value < 4);
}
