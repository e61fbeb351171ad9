#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "../ai/AiRubricScorer.h"
#include "../common/Config.h"
#include "../crawler/BrowserRenderer.h"
#include "../crawler/FetchConfig.h"
#include "../crawler/RobotsComplianceEngine.h"
#include "../crawler/SitemapParser.h"
#include "../extraction/ContentExtractor.h"
#include "../extraction/PageTypeClassifier.h"
#include "../http/HttpClient.h"
#include "../scoring/RuleScoreCalculator.h"
#include "../url/UrlCanonicalizer.h"
#include "CrawlRecords.h"
#include "ProjectConfig.h"
#include "ResultStore.h"

namespace aeo_engine::crawler {
class DomainManager;
class PageFetcher;
struct QueuedURL;
}

namespace aeo_engine::orchestrator {

class PageAnalyzer;

using CrawlRunId = std::string;

/**
 * Composes the crawl-and-score pipeline.
 *
 * analyzeDomain() and rescorePage() run on the calling thread. startCrawl()
 * returns immediately; the run executes on its own thread with a bounded pool
 * of fetch workers, each owning one browser session for the run.
 */
class CrawlOrchestrator {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    // Run id recorded on ad-hoc analyses and rescores
    static constexpr const char* kAdHocRunId = "adhoc";

    CrawlOrchestrator(const common::AppConfig& config,
                      http::HttpClient& httpClient,
                      ResultSink& sink,
                      SnapshotRepository& snapshots,
                      std::shared_ptr<ai::AiRubricScorer> aiScorer = nullptr,
                      crawler::RendererFactory rendererFactory = nullptr);
    ~CrawlOrchestrator();

    CrawlOrchestrator(const CrawlOrchestrator&) = delete;
    CrawlOrchestrator& operator=(const CrawlOrchestrator&) = delete;

    // `domain` may be a bare host; throws InvalidUrlError for unusable input
    PageAnalysis analyzeDomain(const std::string& domain,
                               const std::optional<std::string>& specificUrl = std::nullopt,
                               bool withAi = false);

    CrawlRunId startCrawl(const ProjectConfig& project);

    // Only queued or running runs can be paused; only paused runs resumed
    bool pauseRun(const CrawlRunId& runId);
    bool resumeRun(const CrawlRunId& runId);

    std::optional<RunStatus> getRunStatus(const CrawlRunId& runId) const;

    // Blocks until the run is terminal or the timeout passes; returns the latest status
    RunStatus waitForRun(const CrawlRunId& runId, std::chrono::milliseconds timeout = std::chrono::minutes(30));

    // Fresh AI score for a stored snapshot; throws AeoError when it is unknown or AI is off
    ai::AiScoreResult rescorePage(const std::string& snapshotId);

    std::vector<CrawlRunId> activeRuns() const;

    // Stops every run and joins its threads
    void shutdown();

    // Replaces the blocking sleep used for politeness delays and retry backoff
    void setSleeper(Sleeper sleeper);

private:
    struct Run;

    void executeRun(Run& run);
    void seedFrontier(Run& run, const crawler::RobotsPolicy& policy);
    void workerLoop(Run& run, const crawler::RobotsPolicy& policy);
    void processEntry(Run& run,
                      const crawler::QueuedURL& entry,
                      const crawler::RobotsPolicy& policy,
                      crawler::BrowserSession* browser);
    void enqueueLinks(Run& run, const crawler::QueuedURL& entry, const PageAnalysis& analysis);
    // Empty while no sample, token or page limit applies
    std::string limitReason(const Run& run) const;
    void emitStatus(Run& run);
    void finishRun(Run& run, RunState state, const std::string& reason);

    std::unique_ptr<crawler::BrowserSession> openBrowserSession() const;
    crawler::FetchConfig fetchConfig() const;
    void applyCrawlDelay(const crawler::RobotsPolicy& policy);
    std::string generateRunId();

    common::AppConfig config_;
    http::HttpClient& httpClient_;
    ResultSink& sink_;
    SnapshotRepository& snapshots_;
    std::shared_ptr<ai::AiRubricScorer> aiScorer_;
    crawler::RendererFactory rendererFactory_;

    url::UrlCanonicalizer canonicalizer_;
    crawler::RobotsPolicyCache robotsCache_;
    crawler::RobotsComplianceEngine robots_;
    crawler::SitemapParser sitemaps_;
    extraction::ContentExtractor extractor_;
    extraction::PageTypeClassifier classifier_;
    scoring::RuleScoreCalculator calculator_;
    std::unique_ptr<crawler::DomainManager> domains_;
    std::unique_ptr<crawler::PageFetcher> fetcher_;
    std::unique_ptr<PageAnalyzer> analyzer_;

    std::map<CrawlRunId, std::unique_ptr<Run>> runs_;
    mutable std::mutex runsMutex_;
    std::atomic<uint64_t> runCounter_{0};
    std::atomic<bool> stopping_{false};
};

} // namespace aeo_engine::orchestrator
