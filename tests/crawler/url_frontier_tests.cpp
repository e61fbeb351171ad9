#include <catch2/catch_test_macros.hpp>
#include "URLFrontier.h"
#include <thread>
#include <chrono>

using namespace aeo_engine::crawler;
using aeo_engine::url::UrlCanonicalizer;

TEST_CASE("URLFrontier handles basic URL operations", "[URLFrontier]") {
    URLFrontier frontier;
    UrlCanonicalizer canonicalizer;

    SECTION("Higher priority first, insertion order among equals") {
        frontier.addURL(canonicalizer.normalize("https://example.com/link-a"), 0.3, 1, UrlSource::LINK);
        frontier.addURL(canonicalizer.normalize("https://example.com/"), 1.0, 0, UrlSource::BASE);
        frontier.addURL(canonicalizer.normalize("https://example.com/link-b"), 0.3, 1, UrlSource::LINK);
        frontier.addURL(canonicalizer.normalize("https://example.com/sitemap-entry"), 0.8, 0, UrlSource::SITEMAP);

        REQUIRE(frontier.size() == 4);
        REQUIRE(frontier.getNextURL()->url.url == "https://example.com/");
        REQUIRE(frontier.getNextURL()->url.url == "https://example.com/sitemap-entry");
        REQUIRE(frontier.getNextURL()->url.url == "https://example.com/link-a");
        REQUIRE(frontier.getNextURL()->url.url == "https://example.com/link-b");
        REQUIRE(frontier.isEmpty());
    }

    SECTION("Handles empty frontier") {
        REQUIRE(frontier.isEmpty());
        REQUIRE(frontier.size() == 0);
        REQUIRE_FALSE(frontier.getNextURL().has_value());
    }
}

TEST_CASE("URLFrontier deduplicates by canonical hash", "[URLFrontier]") {
    URLFrontier frontier;
    UrlCanonicalizer canonicalizer;

    REQUIRE(frontier.addURL(canonicalizer.normalize("https://example.com/page1"), 0.5, 0, UrlSource::SITEMAP));
    REQUIRE_FALSE(frontier.addURL(canonicalizer.normalize("https://example.com/page1/"), 0.5, 0, UrlSource::LINK));
    REQUIRE_FALSE(frontier.addURL(canonicalizer.normalize("https://example.com/page1#section"), 0.5, 0, UrlSource::LINK));
    REQUIRE_FALSE(frontier.addURL(canonicalizer.normalize("https://example.com/page1?utm_source=x"), 0.5, 0, UrlSource::LINK));
    REQUIRE(frontier.size() == 1);

    SECTION("Visited URLs are not queued again") {
        auto entry = frontier.getNextURL();
        REQUIRE(entry.has_value());
        frontier.markVisited(entry->url.hash);
        REQUIRE(frontier.isVisited(entry->url.hash));
        REQUIRE_FALSE(frontier.addURL(entry->url, 1.0, 0, UrlSource::MANUAL));
        REQUIRE(frontier.isEmpty());
        REQUIRE(frontier.visitedCount() == 1);
    }
}

TEST_CASE("URLFrontier schedules retries", "[URLFrontier]") {
    URLFrontier frontier;
    UrlCanonicalizer canonicalizer;
    frontier.addURL(canonicalizer.normalize("https://example.com/flaky"), 0.5, 1, UrlSource::LINK);

    auto entry = frontier.getNextURL();
    REQUIRE(entry.has_value());
    frontier.scheduleRetry(*entry, "HTTP 503", FailureType::TEMPORARY, std::chrono::milliseconds(50));

    REQUIRE_FALSE(frontier.isEmpty());
    REQUIRE_FALSE(frontier.hasReadyURLs());
    REQUIRE_FALSE(frontier.getNextURL().has_value());
    REQUIRE(frontier.timeUntilReady().count() > 0);

    std::this_thread::sleep_for(std::chrono::milliseconds(80));

    REQUIRE(frontier.hasReadyURLs());
    auto retried = frontier.getNextURL();
    REQUIRE(retried.has_value());
    REQUIRE(retried->retryCount == 1);
    REQUIRE(retried->lastError == "HTTP 503");
    REQUIRE(retried->depth == 1);
}
