#include <catch2/catch_test_macros.hpp>
#include "../../include/aeo_engine/common/Errors.h"
#include "../../include/aeo_engine/orchestrator/CrawlOrchestrator.h"
#include "../support/FakeBrowserRenderer.h"
#include "../support/FakeHttpClient.h"
#include "../support/FakeLlmClient.h"

#include <algorithm>
#include <future>
#include <thread>

using namespace aeo_engine::orchestrator;
using aeo_engine::ai::AiRubricScorer;
using aeo_engine::ai::RubricStore;
using aeo_engine::common::AppConfig;
using aeo_engine::extraction::PageType;
using aeo_engine::http::HttpMethod;
using aeo_engine::http::HttpRequest;
using aeo_engine::http::HttpResponse;
using aeo_engine::testing::FakeBrowserStats;
using aeo_engine::testing::FakeHttpClient;
using aeo_engine::testing::FakeLlmClient;
using nlohmann::json;

namespace {

const std::string kSite = "https://shop.example.com";

std::string page(const std::string& title, const std::string& body, const std::vector<std::string>& links = {}) {
    std::string html = "<html><head><title>" + title + "</title>"
                       "<meta name=\"description\" content=\"" + title + " overview\"></head><body>"
                       "<h1>" + title + "</h1><p>" + body + "</p>";
    for (const auto& link : links) {
        html += "<a href=\"" + link + "\">" + link + "</a>";
    }
    return html + "</body></html>";
}

std::string sitemap(const std::vector<std::pair<std::string, std::string>>& entries) {
    std::string xml = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
                      "<urlset xmlns=\"http://www.sitemaps.org/schemas/sitemap/0.9\">";
    for (const auto& [path, extra] : entries) {
        xml += "<url><loc>" + kSite + path + "</loc>" + extra + "</url>";
    }
    return xml + "</urlset>";
}

AppConfig testConfig(size_t workers = 2) {
    AppConfig config;
    config.renderEnabled = false;
    config.browserlessUrl.clear();
    config.minCrawlDelay = std::chrono::milliseconds(0);
    config.maxConcurrentFetches = workers;
    return config;
}

ProjectConfig project(RunType type) {
    ProjectConfig config;
    config.projectId = "proj-1";
    config.baseUrl = kSite;
    config.runType = type;
    return config;
}

void scriptSite(FakeHttpClient& http) {
    http.respond(kSite + "/robots.txt", 200,
                 "User-agent: *\nAllow: /\nSitemap: " + kSite + "/sitemap.xml\n", "text/plain");
    http.respond(kSite + "/sitemap.xml", 200, sitemap({{"/pricing", "<priority>0.8</priority>"}}), "application/xml");
    http.respond(kSite + "/", 200, page("Shop", "Coffee gear for home baristas.",
                                        {"/products/grinder", "/blog/espresso-guide", "/cart", "/missing",
                                         "https://elsewhere.example.org/"}));
    http.respond(kSite + "/pricing", 200, page("Pricing", "Plans start at 10 EUR per month."));
    http.respond(kSite + "/products/grinder", 200,
                 page("Burr Grinder", "A conical burr grinder.", {"/products/grinder/parts"}));
    http.respond(kSite + "/blog/espresso-guide", 200, page("Espresso Guide", "How to pull a balanced shot."));
    http.respond(kSite + "/cart", 200, page("Cart", "Your cart is empty."));
    http.respond(kSite + "/products/grinder/parts", 200, page("Parts", "Replacement burrs."));
}

json rubricDocument() {
    return json::parse(R"({
        "version": "1.0",
        "categories": [{"name": "Content Quality", "criteria": [
            {"name": "direct_answer", "description": "Answers up front", "scoringGuidance": "100 = first sentence answers"},
            {"name": "readability", "description": "Plain language", "scoringGuidance": "100 = easy to read"}
        ]}],
        "pageTypeRubrics": {"blog": {"emphasizedCriteria": ["direct_answer"]}}
    })");
}

std::shared_ptr<AiRubricScorer> makeScorer(std::shared_ptr<FakeLlmClient> llm) {
    return std::make_shared<AiRubricScorer>(llm, RubricStore::fromDocument(rubricDocument()), nullptr);
}

const std::string kScoreReply = R"({
    "criteriaScores": {"direct_answer": 80, "readability": 70},
    "explanations": {"direct_answer": "Opens with a clear answer.", "readability": "Short, plain sentences."},
    "recommendations": []
})";

std::vector<std::string> snapshotUrls(const InMemoryResultStore& store) {
    std::vector<std::string> urls;
    for (const auto& snapshot : store.snapshots()) {
        urls.push_back(snapshot.url);
    }
    std::sort(urls.begin(), urls.end());
    return urls;
}

} // namespace

TEST_CASE("Full crawl follows internal links to the depth limit", "[CrawlOrchestrator]") {
    FakeHttpClient http;
    scriptSite(http);
    InMemoryResultStore store;
    CrawlOrchestrator orchestrator(testConfig(), http, store, store);
    orchestrator.setSleeper([](std::chrono::milliseconds) {});

    auto config = project(RunType::FULL);
    config.depthLimit = 1;
    config.excludedPatterns = {"/cart"};

    const CrawlRunId runId = orchestrator.startCrawl(config);
    REQUIRE(runId.rfind("crawl_", 0) == 0);
    const RunStatus status = orchestrator.waitForRun(runId, std::chrono::seconds(30));

    REQUIRE(status.state == RunState::COMPLETED);
    REQUIRE(status.pagesProcessed == 4);
    REQUIRE(status.snapshotsCreated == 4);
    REQUIRE(status.pagesFailed == 1);
    REQUIRE(status.pagesDiscovered == 5);
    REQUIRE_FALSE(status.finishedAt.empty());

    REQUIRE(snapshotUrls(store) == std::vector<std::string>{
        kSite + "/", kSite + "/blog/espresso-guide", kSite + "/pricing", kSite + "/products/grinder"});
    REQUIRE(http.requestCount(kSite + "/cart") == 0);
    REQUIRE(http.requestCount(kSite + "/products/grinder/parts") == 0);

    const auto outcomes = store.pageOutcomes();
    REQUIRE(outcomes.size() == 1);
    REQUIRE(outcomes[0].url == kSite + "/missing");
    REQUIRE(outcomes[0].status == PageOutcomeStatus::FAILED);
    REQUIRE(outcomes[0].statusCode == 404);

    for (const auto& snapshot : store.snapshots()) {
        REQUIRE(snapshot.runId == runId);
        REQUIRE(snapshot.rawHtml.has_value());
        if (snapshot.url == kSite + "/blog/espresso-guide") {
            REQUIRE(snapshot.pageType == PageType::BLOG);
        }
    }
    REQUIRE(store.scores().size() == 4);
    for (const auto& score : store.scores()) {
        REQUIRE_FALSE(score.aiScore.has_value());
        REQUIRE(score.ruleScore.overall >= 0);
        REQUIRE(score.ruleScore.overall <= 100);
    }

    const auto history = store.runStatusHistory(runId);
    REQUIRE(history.front().state == RunState::QUEUED);
    REQUIRE(history.back().state == RunState::COMPLETED);
    REQUIRE(orchestrator.activeRuns().empty());
}

TEST_CASE("A robots-blocked site fails the run with a reason", "[CrawlOrchestrator]") {
    FakeHttpClient http;
    http.respond(kSite + "/robots.txt", 200, "User-agent: *\nDisallow: /\n", "text/plain");
    InMemoryResultStore store;
    CrawlOrchestrator orchestrator(testConfig(), http, store, store);

    const RunStatus status = orchestrator.waitForRun(orchestrator.startCrawl(project(RunType::FULL)),
                                                     std::chrono::seconds(30));

    REQUIRE(status.state == RunState::FAILED);
    REQUIRE(status.reason.find("Crawling blocked by robots.txt") != std::string::npos);
    REQUIRE(status.pagesBlocked == 1);
    REQUIRE(store.snapshots().empty());
    REQUIRE(store.pageOutcomes().size() == 1);
    REQUIRE(store.pageOutcomes()[0].status == PageOutcomeStatus::BLOCKED);
    REQUIRE(http.requestCount(kSite + "/") == 0);

    SECTION("analyzeDomain reports the block without fetching") {
        const PageAnalysis analysis = orchestrator.analyzeDomain("shop.example.com");
        REQUIRE(analysis.status == AnalysisStatus::BLOCKED);
        REQUIRE(analysis.crawlStrategy == "blocked");
        REQUIRE(analysis.ruleScore.overall == 0);
        REQUIRE_FALSE(analysis.snapshot.has_value());
        REQUIRE(http.requestCount(kSite + "/") == 0);
    }
}

TEST_CASE("Sample runs take the highest-priority sitemap entries", "[CrawlOrchestrator]") {
    FakeHttpClient http;
    http.respond(kSite + "/robots.txt", 200, "User-agent: *\nAllow: /\nSitemap: " + kSite + "/sitemap.xml\n",
                 "text/plain");
    http.respond(kSite + "/sitemap.xml", 200, sitemap({
        {"/a", "<priority>0.9</priority>"},
        {"/b", "<priority>0.2</priority>"},
        {"/c", "<priority>0.7</priority>"},
        {"/d", "<priority>0.4</priority>"}
    }), "application/xml");
    for (const std::string path : {"/", "/a", "/b", "/c", "/d"}) {
        http.respond(kSite + path, 200, page("Page " + path, "Content for " + path + "."));
    }
    InMemoryResultStore store;
    CrawlOrchestrator orchestrator(testConfig(), http, store, store);
    orchestrator.setSleeper([](std::chrono::milliseconds) {});

    auto config = project(RunType::SAMPLE);
    config.sampleSize = 3;
    const RunStatus status = orchestrator.waitForRun(orchestrator.startCrawl(config), std::chrono::seconds(30));

    REQUIRE(status.state == RunState::COMPLETED);
    REQUIRE(status.pagesProcessed == 3);
    REQUIRE(status.reason.find("Sample size") != std::string::npos);
    REQUIRE(snapshotUrls(store) == std::vector<std::string>{kSite + "/", kSite + "/a", kSite + "/c"});
    REQUIRE(http.requestCount(kSite + "/b") == 0);
}

TEST_CASE("Manual runs crawl only the listed URLs", "[CrawlOrchestrator]") {
    FakeHttpClient http;
    scriptSite(http);
    InMemoryResultStore store;
    CrawlOrchestrator orchestrator(testConfig(), http, store, store);
    orchestrator.setSleeper([](std::chrono::milliseconds) {});

    auto config = project(RunType::MANUAL);
    config.urls = {kSite + "/pricing?utm_source=newsletter", kSite + "/cart", "https://other.example.net/page"};
    config.excludedPatterns = {"/cart"};
    const RunStatus status = orchestrator.waitForRun(orchestrator.startCrawl(config), std::chrono::seconds(30));

    REQUIRE(status.state == RunState::COMPLETED);
    REQUIRE(snapshotUrls(store) == std::vector<std::string>{kSite + "/", kSite + "/pricing"});
    REQUIRE(http.requestCount(kSite + "/sitemap.xml") == 0);
    REQUIRE(http.requestCount(kSite + "/products/grinder") == 0);
}

TEST_CASE("Unchanged pages produce no new snapshots outside full runs", "[CrawlOrchestrator]") {
    FakeHttpClient http;
    scriptSite(http);
    InMemoryResultStore store;
    CrawlOrchestrator orchestrator(testConfig(), http, store, store);
    orchestrator.setSleeper([](std::chrono::milliseconds) {});

    const RunStatus first = orchestrator.waitForRun(orchestrator.startCrawl(project(RunType::SITEMAP_ONLY)),
                                                    std::chrono::seconds(30));
    REQUIRE(first.snapshotsCreated == 2);

    SECTION("A second sitemap run skips unchanged content") {
        const RunStatus second = orchestrator.waitForRun(orchestrator.startCrawl(project(RunType::SITEMAP_ONLY)),
                                                         std::chrono::seconds(30));
        REQUIRE(second.state == RunState::COMPLETED);
        REQUIRE(second.pagesProcessed == 2);
        REQUIRE(second.pagesUnchanged == 2);
        REQUIRE(second.snapshotsCreated == 0);
        REQUIRE(store.snapshots().size() == 2);
    }

    SECTION("Changed content is captured again") {
        http.respond(kSite + "/pricing", 200, page("Pricing", "Plans now start at 12 EUR per month."));
        const RunStatus second = orchestrator.waitForRun(orchestrator.startCrawl(project(RunType::SITEMAP_ONLY)),
                                                         std::chrono::seconds(30));
        REQUIRE(second.pagesUnchanged == 1);
        REQUIRE(second.snapshotsCreated == 1);
        REQUIRE(store.snapshots().size() == 3);
    }

    SECTION("Full runs always capture") {
        auto config = project(RunType::FULL);
        config.depthLimit = 0;
        const RunStatus second = orchestrator.waitForRun(orchestrator.startCrawl(config), std::chrono::seconds(30));
        REQUIRE(second.pagesUnchanged == 0);
        REQUIRE(second.snapshotsCreated == 2);
        REQUIRE(store.snapshots().size() == 4);
    }
}

TEST_CASE("Delta runs only queue recently modified sitemap entries", "[CrawlOrchestrator]") {
    FakeHttpClient http;
    http.respond(kSite + "/robots.txt", 200, "User-agent: *\nAllow: /\nSitemap: " + kSite + "/sitemap.xml\n",
                 "text/plain");
    http.respond(kSite + "/sitemap.xml", 200, sitemap({
        {"/old", "<lastmod>2023-01-10</lastmod>"},
        {"/new", "<lastmod>2024-06-02</lastmod>"}
    }), "application/xml");
    for (const std::string path : {"/", "/old", "/new"}) {
        http.respond(kSite + path, 200, page("Page " + path, "Content for " + path + "."));
    }
    InMemoryResultStore store;
    CrawlOrchestrator orchestrator(testConfig(), http, store, store);
    orchestrator.setSleeper([](std::chrono::milliseconds) {});

    auto config = ProjectConfig::fromJson(json{
        {"base_url", kSite}, {"run_type", "delta"}, {"modified_after", "2024-01-01"}});
    const RunStatus status = orchestrator.waitForRun(orchestrator.startCrawl(config), std::chrono::seconds(30));

    REQUIRE(status.state == RunState::COMPLETED);
    REQUIRE(snapshotUrls(store) == std::vector<std::string>{kSite + "/", kSite + "/new"});
    REQUIRE(http.requestCount(kSite + "/old") == 0);
}

TEST_CASE("AI scoring is attached and degrades to rule scores", "[CrawlOrchestrator]") {
    FakeHttpClient http;
    scriptSite(http);
    InMemoryResultStore store;
    auto llm = std::make_shared<FakeLlmClient>();

    SECTION("Scores and token usage are recorded") {
        llm->reply(kScoreReply, 100);
        CrawlOrchestrator orchestrator(testConfig(1), http, store, store, makeScorer(llm));
        orchestrator.setSleeper([](std::chrono::milliseconds) {});

        auto config = project(RunType::SITEMAP_ONLY);
        config.aiScoring = true;
        const RunStatus status = orchestrator.waitForRun(orchestrator.startCrawl(config), std::chrono::seconds(30));

        REQUIRE(status.snapshotsCreated == 2);
        REQUIRE(status.tokensUsed == 200);
        for (const auto& score : store.scores()) {
            REQUIRE(score.aiScore.has_value());
            REQUIRE(score.aiScore->overallScore == 75);
            REQUIRE_FALSE(score.aiScoreUnavailable);
        }
    }

    SECTION("The token limit stops the run") {
        llm->reply(kScoreReply, 100);
        CrawlOrchestrator orchestrator(testConfig(1), http, store, store, makeScorer(llm));
        orchestrator.setSleeper([](std::chrono::milliseconds) {});

        auto config = project(RunType::SITEMAP_ONLY);
        config.aiScoring = true;
        config.tokenLimit = 100;
        const RunStatus status = orchestrator.waitForRun(orchestrator.startCrawl(config), std::chrono::seconds(30));

        REQUIRE(status.state == RunState::COMPLETED);
        REQUIRE(status.snapshotsCreated == 1);
        REQUIRE(status.reason.find("Token limit") != std::string::npos);
    }

    SECTION("LLM failures leave the rule score in place") {
        llm->failWith("upstream timeout");
        CrawlOrchestrator orchestrator(testConfig(1), http, store, store, makeScorer(llm));
        orchestrator.setSleeper([](std::chrono::milliseconds) {});

        auto config = project(RunType::SITEMAP_ONLY);
        config.aiScoring = true;
        const RunStatus status = orchestrator.waitForRun(orchestrator.startCrawl(config), std::chrono::seconds(30));

        REQUIRE(status.state == RunState::COMPLETED);
        REQUIRE(status.snapshotsCreated == 2);
        for (const auto& score : store.scores()) {
            REQUIRE_FALSE(score.aiScore.has_value());
            REQUIRE(score.aiScoreUnavailable);
            REQUIRE(score.aiUnavailableReason.find("upstream timeout") != std::string::npos);
        }
    }
}

TEST_CASE("analyzeDomain and rescorePage", "[CrawlOrchestrator]") {
    FakeHttpClient http;
    scriptSite(http);
    InMemoryResultStore store;
    auto llm = std::make_shared<FakeLlmClient>();
    llm->reply(kScoreReply, 120);
    CrawlOrchestrator orchestrator(testConfig(), http, store, store, makeScorer(llm));
    orchestrator.setSleeper([](std::chrono::milliseconds) {});

    const PageAnalysis analysis = orchestrator.analyzeDomain("shop.example.com", kSite + "/blog/espresso-guide", true);
    REQUIRE(analysis.status == AnalysisStatus::COMPLETED);
    REQUIRE(analysis.pageType == PageType::BLOG);
    REQUIRE(analysis.crawlStrategy == "crawler");
    REQUIRE(analysis.aiScore.has_value());
    REQUIRE(analysis.snapshot.has_value());
    REQUIRE(analysis.snapshot->runId == CrawlOrchestrator::kAdHocRunId);
    REQUIRE(analysis.snapshot->metrics.renderMethod == aeo_engine::crawler::RenderMethod::STATIC);
    REQUIRE(llm->callCount() == 1);

    const json serialized = analysis;
    REQUIRE(serialized["status"] == "completed");
    REQUIRE_FALSE(serialized["snapshot"].contains("rawHtml"));

    const auto rescored = orchestrator.rescorePage(analysis.snapshot->id);
    REQUIRE(rescored.overallScore == 75);
    REQUIRE_FALSE(rescored.fromCache);
    REQUIRE(llm->callCount() == 2);
    REQUIRE(store.scores().size() == 2);
    REQUIRE(store.latestScore(analysis.snapshot->id)->aiScore.has_value());

    REQUIRE_THROWS_AS(orchestrator.rescorePage("snap_unknown_1"), aeo_engine::common::AeoError);
    REQUIRE_THROWS_AS(orchestrator.analyzeDomain("ftp://shop.example.com"), aeo_engine::common::InvalidUrlError);
    REQUIRE_THROWS_AS(orchestrator.analyzeDomain("shop.example.com", "https://elsewhere.example.org/pricing"),
                      aeo_engine::common::InvalidUrlError);
    REQUIRE(http.requestCount("https://elsewhere.example.org/robots.txt") == 0);
    REQUIRE(http.requestCount("https://elsewhere.example.org/pricing") == 0);

    SECTION("Without a scorer") {
        CrawlOrchestrator ruleOnly(testConfig(), http, store, store);
        REQUIRE_THROWS_AS(ruleOnly.rescorePage(analysis.snapshot->id), aeo_engine::common::ConfigError);

        const PageAnalysis home = ruleOnly.analyzeDomain("shop.example.com", std::nullopt, true);
        REQUIRE(home.status == AnalysisStatus::COMPLETED);
        REQUIRE(home.aiScoreUnavailable);
    }

    SECTION("Failed fetches are reported") {
        const PageAnalysis missing = orchestrator.analyzeDomain("shop.example.com", kSite + "/missing");
        REQUIRE(missing.status == AnalysisStatus::FAILED);
        REQUIRE(missing.statusCode == 404);
        REQUIRE_FALSE(missing.error.empty());
    }
}

TEST_CASE("Paused runs finish in-flight pages and resume where they stopped", "[CrawlOrchestrator]") {
    FakeHttpClient scripted;
    scriptSite(scripted);

    std::promise<void> baseRequested;
    std::promise<void> releaseBase;
    std::shared_future<void> release = releaseBase.get_future().share();
    bool signalled = false;

    FakeHttpClient http;
    http.setHandler([&](const HttpRequest& request) -> HttpResponse {
        if (request.url == kSite + "/" && !signalled) {
            signalled = true;
            baseRequested.set_value();
            release.wait();
        }
        return scripted.execute(request);
    });

    InMemoryResultStore store;
    CrawlOrchestrator orchestrator(testConfig(1), http, store, store);
    orchestrator.setSleeper([](std::chrono::milliseconds) {});

    const CrawlRunId runId = orchestrator.startCrawl(project(RunType::SITEMAP_ONLY));
    baseRequested.get_future().wait();

    REQUIRE(orchestrator.pauseRun(runId));
    REQUIRE_FALSE(orchestrator.pauseRun(runId));
    REQUIRE(orchestrator.getRunStatus(runId)->state == RunState::PAUSED);

    releaseBase.set_value();
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    // The in-flight base page completes; nothing new is fetched while paused
    REQUIRE(store.snapshots().size() == 1);
    REQUIRE(scripted.requestCount(kSite + "/pricing") == 0);
    REQUIRE(orchestrator.getRunStatus(runId)->state == RunState::PAUSED);

    REQUIRE(orchestrator.resumeRun(runId));
    REQUIRE_FALSE(orchestrator.resumeRun(runId));
    const RunStatus status = orchestrator.waitForRun(runId, std::chrono::seconds(30));
    REQUIRE(status.state == RunState::COMPLETED);
    REQUIRE(status.snapshotsCreated == 2);
    REQUIRE(scripted.requestCount(kSite + "/") == 1);

    REQUIRE_FALSE(orchestrator.pauseRun(runId));
    REQUIRE_FALSE(orchestrator.pauseRun("crawl_0_0"));
    REQUIRE_FALSE(orchestrator.getRunStatus("crawl_0_0").has_value());
}

TEST_CASE("A run shares one browser across its workers", "[CrawlOrchestrator]") {
    FakeHttpClient http;
    scriptSite(http);
    InMemoryResultStore store;
    auto stats = std::make_shared<FakeBrowserStats>();

    AppConfig config = testConfig(4);
    config.renderEnabled = true;
    CrawlOrchestrator orchestrator(config, http, store, store, nullptr,
                                   aeo_engine::testing::fakeRendererFactory(
                                       stats, {{kSite + "/", page("Shop", "Rendered storefront.", {"/pricing"})}}));
    orchestrator.setSleeper([](std::chrono::milliseconds) {});

    auto crawl = project(RunType::FULL);
    crawl.depthLimit = 1;
    const RunStatus status = orchestrator.waitForRun(orchestrator.startCrawl(crawl), std::chrono::seconds(30));

    REQUIRE(status.state == RunState::COMPLETED);
    REQUIRE(status.pagesProcessed > 1);
    REQUIRE(stats->created == 1);
    REQUIRE(stats->opened == 1);
    REQUIRE(stats->closed == 1);
    REQUIRE(stats->renders >= static_cast<int>(status.pagesProcessed));

    SECTION("A second run gets its own browser, released when it ends") {
        const RunStatus again = orchestrator.waitForRun(orchestrator.startCrawl(crawl), std::chrono::seconds(30));
        REQUIRE(again.state == RunState::COMPLETED);
        REQUIRE(stats->created == 2);
        REQUIRE(stats->closed == 2);
    }
}
