#include <catch2/catch_test_macros.hpp>
#include "PageFetcher.h"
#include "../../include/aeo_engine/common/Errors.h"
#include "../support/FakeBrowserRenderer.h"
#include "../support/FakeHttpClient.h"

#include <vector>
#include <nlohmann/json.hpp>

using namespace aeo_engine::crawler;
using aeo_engine::common::FetchError;
using aeo_engine::testing::FakeBrowserStats;
using aeo_engine::testing::FakeHttpClient;
using aeo_engine::testing::fakeRendererFactory;

namespace {

FetchConfig testConfig() {
    FetchConfig config;
    config.minCrawlDelay = std::chrono::milliseconds(0);
    config.baseRetryDelay = std::chrono::milliseconds(10);
    return config;
}

const std::string kPage = "https://example.com/page";
const std::string kHtml = "<html><head><title>Hi</title></head><body>Hello</body></html>";

} // namespace

TEST_CASE("PageFetcher fetches static pages", "[PageFetcher]") {
    FakeHttpClient http;
    FetchConfig config = testConfig();
    DomainManager domains(config);
    PageFetcher fetcher(http, domains, config);
    std::vector<std::chrono::milliseconds> sleeps;
    fetcher.setSleeper([&sleeps](std::chrono::milliseconds d) { sleeps.push_back(d); });

    SECTION("Successful fetch") {
        http.respond(kPage, 200, kHtml);

        auto result = fetcher.fetch(kPage, "TestBot/1.0");

        REQUIRE(result.statusCode == 200);
        REQUIRE(result.html == kHtml);
        REQUIRE(result.renderMethod == RenderMethod::STATIC);
        REQUIRE_FALSE(result.renderFallbackReason.has_value());
        REQUIRE(result.attempts == 1);
        REQUIRE(http.requests()[0].userAgent == "TestBot/1.0");
    }

    SECTION("Permanent failures are not retried") {
        http.respond(kPage, 404);

        try {
            fetcher.fetch(kPage, "TestBot/1.0");
            FAIL("expected FetchError");
        } catch (const FetchError& e) {
            REQUIRE(e.statusCode() == 404);
            REQUIRE(e.failureType() == FailureType::PERMANENT);
        }
        REQUIRE(http.requestCount(kPage) == 1);
    }

    SECTION("Temporary failures are retried with backoff") {
        int calls = 0;
        http.setHandler([&calls](const aeo_engine::http::HttpRequest& request) {
            aeo_engine::http::HttpResponse response;
            response.finalUrl = request.url;
            response.statusCode = ++calls < 3 ? 503 : 200;
            response.body = calls < 3 ? "" : kHtml;
            return response;
        });

        auto result = fetcher.fetch(kPage, "TestBot/1.0");

        REQUIRE(result.attempts == 3);
        REQUIRE(calls == 3);
        REQUIRE(sleeps.size() >= 2);
        REQUIRE(sleeps[sleeps.size() - 1] > sleeps[sleeps.size() - 2]);
    }

    SECTION("Retries stop at the configured limit") {
        http.fail(kPage, CURLE_OPERATION_TIMEDOUT, "Timeout was reached");

        REQUIRE_THROWS_AS(fetcher.fetch(kPage, "TestBot/1.0"), FetchError);
        REQUIRE(http.requestCount(kPage) == static_cast<size_t>(config.maxRetries) + 1);
    }
}

TEST_CASE("PageFetcher prefers rendering and falls back to static", "[PageFetcher]") {
    FakeHttpClient http;
    FetchConfig config = testConfig();
    DomainManager domains(config);
    PageFetcher fetcher(http, domains, config);
    fetcher.setSleeper([](std::chrono::milliseconds) {});
    http.respond(kPage, 200, kHtml);
    auto stats = std::make_shared<FakeBrowserStats>();

    SECTION("Rendered when the browser works") {
        BrowserSession session(fakeRendererFactory(stats, {{kPage, "<html><body>rendered</body></html>"}}));

        auto result = fetcher.fetch(kPage, "TestBot/1.0", &session);

        REQUIRE(result.renderMethod == RenderMethod::RENDERED);
        REQUIRE(result.html.find("rendered") != std::string::npos);
        REQUIRE(http.requestCount() == 0);
    }

    SECTION("Browser initialization failure downgrades to static") {
        BrowserSession session(fakeRendererFactory(stats, {}, true));

        auto first = fetcher.fetch(kPage, "TestBot/1.0", &session);
        auto second = fetcher.fetch(kPage, "TestBot/1.0", &session);

        REQUIRE(first.renderMethod == RenderMethod::STATIC);
        REQUIRE(first.renderFallbackReason.value() == "browser executable not found");
        REQUIRE(second.renderMethod == RenderMethod::STATIC);
        REQUIRE_FALSE(session.isOpen());
        REQUIRE(stats->opened == 0);
    }

    SECTION("Failed render of one page falls back for that page") {
        BrowserSession session(fakeRendererFactory(stats, {}));

        auto result = fetcher.fetch(kPage, "TestBot/1.0", &session);

        REQUIRE(result.renderMethod == RenderMethod::STATIC);
        REQUIRE(result.renderFallbackReason.value() == "navigation failed");
        REQUIRE(session.isOpen());
        session.close();
        REQUIRE(stats->closed == 1);
    }
}

TEST_CASE("BrowserlessRenderer talks to the content endpoint", "[BrowserlessRenderer]") {
    FakeHttpClient http;
    BrowserlessRenderer renderer(http, "http://browserless:3000/");

    SECTION("Open fails when the health probe fails") {
        http.respond("http://browserless:3000/health", 503);
        auto opened = renderer.open();
        REQUIRE_FALSE(opened.success);
        REQUIRE(opened.message.find("503") != std::string::npos);
    }

    SECTION("Renders through POST /content") {
        http.respond("http://browserless:3000/health", 200, "ok");
        http.respond("http://browserless:3000/content", 200, kHtml, "text/html", aeo_engine::http::HttpMethod::POST);

        REQUIRE(renderer.open().success);
        auto result = renderer.render(kPage, "TestBot/1.0", std::chrono::seconds(30));

        REQUIRE(result.success);
        REQUIRE(result.html == kHtml);
        auto requests = http.requests();
        auto payload = nlohmann::json::parse(requests.back().body);
        REQUIRE(payload["url"] == kPage);
        REQUIRE(payload["rejectResourceTypes"].size() == 3);
        REQUIRE(payload["userAgent"] == "TestBot/1.0");
    }
}
