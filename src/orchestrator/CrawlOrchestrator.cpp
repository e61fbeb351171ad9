#include "../../include/aeo_engine/orchestrator/CrawlOrchestrator.h"
#include "../../include/Logger.h"
#include "../../include/aeo_engine/common/Errors.h"
#include "../../include/aeo_engine/common/TextUtils.h"
#include "../../include/crawler/CrawlLogger.h"
#include "../crawler/DomainManager.h"
#include "../crawler/PageFetcher.h"
#include "../crawler/URLFrontier.h"
#include "PageAnalyzer.h"

#include <algorithm>
#include <condition_variable>
#include <thread>
#include <unordered_set>

namespace aeo_engine::orchestrator {

namespace {

constexpr double kBasePriority = 1.0;
constexpr double kDefaultSitemapPriority = 0.5;
constexpr double kLinkPriority = 0.3;
constexpr size_t kStatusEveryPages = 10;
constexpr std::chrono::milliseconds kIdlePoll{50};

scoring::RuleScoreCalculator makeCalculator(const common::AppConfig& config) {
    if (config.eatWeightsPath.empty()) {
        return scoring::RuleScoreCalculator();
    }
    LOG_INFO("Loading EAT weight tables from " + config.eatWeightsPath);
    return scoring::RuleScoreCalculator(scoring::EatWeightTables::loadFromFile(config.eatWeightsPath));
}

std::string withScheme(const std::string& domain) {
    const std::string trimmed = common::trim(domain);
    if (trimmed.find("://") != std::string::npos) {
        return trimmed;
    }
    return "https://" + trimmed;
}

} // namespace

struct CrawlOrchestrator::Run {
    ProjectConfig project;
    RunStatus status;
    url::CanonicalUrl base;
    crawler::URLFrontier frontier;
    // Canonical hashes of pages fetched in this run
    std::unordered_set<std::string> processed;
    // Shared by every worker of the run, closed in finishRun
    std::unique_ptr<crawler::BrowserSession> browser;
    std::thread thread;

    mutable std::mutex mutex;
    std::condition_variable cv;
    bool paused = false;
    size_t inFlight = 0;
    size_t pagesSinceStatus = 0;
};

CrawlOrchestrator::CrawlOrchestrator(const common::AppConfig& config,
                                     http::HttpClient& httpClient,
                                     ResultSink& sink,
                                     SnapshotRepository& snapshots,
                                     std::shared_ptr<ai::AiRubricScorer> aiScorer,
                                     crawler::RendererFactory rendererFactory)
    : config_(config)
    , httpClient_(httpClient)
    , sink_(sink)
    , snapshots_(snapshots)
    , aiScorer_(std::move(aiScorer))
    , rendererFactory_(std::move(rendererFactory))
    , robotsCache_(std::chrono::duration_cast<std::chrono::milliseconds>(config.robotsCacheTtl))
    , robots_(httpClient, robotsCache_, config.userAgent, config.requestTimeout)
    , sitemaps_(httpClient, canonicalizer_, config.userAgent)
    , calculator_(makeCalculator(config)) {
    if (!rendererFactory_ && config_.renderEnabled && !config_.browserlessUrl.empty()) {
        const std::string browserlessUrl = config_.browserlessUrl;
        http::HttpClient* client = &httpClient_;
        rendererFactory_ = [client, browserlessUrl]() -> std::unique_ptr<crawler::BrowserRenderer> {
            return std::make_unique<crawler::BrowserlessRenderer>(*client, browserlessUrl);
        };
    }

    const crawler::FetchConfig fetch = fetchConfig();
    domains_ = std::make_unique<crawler::DomainManager>(fetch);
    fetcher_ = std::make_unique<crawler::PageFetcher>(httpClient_, *domains_, fetch);
    analyzer_ = std::make_unique<PageAnalyzer>(*fetcher_, canonicalizer_, extractor_, classifier_, calculator_,
                                               aiScorer_.get());

    LOG_INFO_STREAM("CrawlOrchestrator ready (workers=" << config_.maxConcurrentFetches
                    << ", rendering=" << (rendererFactory_ ? "on" : "off")
                    << ", ai=" << (aiScorer_ ? "on" : "off") << ")");
}

CrawlOrchestrator::~CrawlOrchestrator() {
    shutdown();
}

crawler::FetchConfig CrawlOrchestrator::fetchConfig() const {
    crawler::FetchConfig fetch;
    fetch.requestTimeout = config_.requestTimeout;
    fetch.minCrawlDelay = config_.minCrawlDelay;
    fetch.renderEnabled = config_.renderEnabled;
    return fetch;
}

void CrawlOrchestrator::setSleeper(Sleeper sleeper) {
    fetcher_->setSleeper(std::move(sleeper));
}

std::unique_ptr<crawler::BrowserSession> CrawlOrchestrator::openBrowserSession() const {
    if (!config_.renderEnabled || !rendererFactory_) {
        return nullptr;
    }
    return std::make_unique<crawler::BrowserSession>(rendererFactory_);
}

void CrawlOrchestrator::applyCrawlDelay(const crawler::RobotsPolicy& policy) {
    domains_->setCrawlDelay(policy.domain, policy.effectiveDelay(config_.minCrawlDelay));
}

std::string CrawlOrchestrator::generateRunId() {
    const auto now = std::chrono::system_clock::now();
    const auto timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    return "crawl_" + std::to_string(timestamp) + "_" + std::to_string(++runCounter_);
}

PageAnalysis CrawlOrchestrator::analyzeDomain(const std::string& domain,
                                              const std::optional<std::string>& specificUrl,
                                              bool withAi) {
    const std::string target = specificUrl ? common::trim(*specificUrl) : withScheme(domain);
    // Reject malformed input before any network traffic
    url::parseUrl(target);
    if (specificUrl && !url::UrlCanonicalizer::isSameDomain(target, withScheme(domain))) {
        throw common::InvalidUrlError(target, "not on domain " + common::trim(domain));
    }

    LOG_INFO("Analyzing " + target);
    const auto policy = robots_.checkRobots(target);
    if (!policy->canCrawl()) {
        PageAnalysis analysis = PageAnalyzer::blocked(target, *policy);
        PageOutcome outcome;
        outcome.runId = kAdHocRunId;
        outcome.url = target;
        outcome.status = PageOutcomeStatus::BLOCKED;
        outcome.reason = analysis.error;
        outcome.recommendations = analysis.recommendations;
        sink_.emitPageOutcome(outcome);
        return analysis;
    }
    applyCrawlDelay(*policy);

    auto browser = openBrowserSession();
    PageAnalysis analysis = analyzer_->analyze(target, *policy, browser.get());
    if (browser) {
        browser->close();
    }

    if (analysis.status != AnalysisStatus::COMPLETED) {
        PageOutcome outcome;
        outcome.runId = kAdHocRunId;
        outcome.url = target;
        outcome.status = analysis.status == AnalysisStatus::BLOCKED ? PageOutcomeStatus::BLOCKED
                                                                    : PageOutcomeStatus::FAILED;
        outcome.reason = analysis.error;
        outcome.statusCode = analysis.statusCode;
        outcome.recommendations = analysis.recommendations;
        sink_.emitPageOutcome(outcome);
        return analysis;
    }

    if (withAi) {
        analyzer_->attachAiScore(analysis);
    }

    PageSnapshot& snapshot = *analysis.snapshot;
    snapshot.id = snapshots_.allocateSnapshotId(snapshot.urlHash);
    snapshot.runId = kAdHocRunId;
    sink_.emitSnapshot(snapshot);
    sink_.emitScore(toScoreRecord(analysis));
    return analysis;
}

ai::AiScoreResult CrawlOrchestrator::rescorePage(const std::string& snapshotId) {
    const auto snapshot = snapshots_.findSnapshot(snapshotId);
    if (!snapshot) {
        throw common::AeoError("Snapshot not found: " + snapshotId);
    }
    if (!aiScorer_) {
        throw common::ConfigError("AI scoring is not configured");
    }

    ai::ScoringInput input{snapshot->extraction, snapshot->cleanedText, snapshot->contentHash,
                           snapshot->metrics.wordCount};
    ai::AiScoreResult result = aiScorer_->rescore(input, snapshot->pageType);

    const std::chrono::milliseconds loadTime(snapshot->metrics.loadTimeMs);
    ScoreRecord record;
    record.snapshotId = snapshot->id;
    record.runId = snapshot->runId;
    record.url = snapshot->url;
    record.pageType = snapshot->pageType;
    record.ruleScore = calculator_.score(snapshot->extraction, snapshot->pageType, loadTime);
    record.recommendations = calculator_.generateRecommendations(snapshot->extraction, record.ruleScore, loadTime);
    record.aiScore = result;
    sink_.emitScore(record);

    LOG_INFO_STREAM("Rescored " << snapshot->url << ": " << result.overallScore);
    return result;
}

CrawlRunId CrawlOrchestrator::startCrawl(const ProjectConfig& project) {
    if (stopping_) {
        throw common::AeoError("Orchestrator is shut down");
    }

    auto run = std::make_unique<Run>();
    run->project = project;
    run->base = canonicalizer_.normalize(project.baseUrl);

    const CrawlRunId runId = generateRunId();
    run->status.runId = runId;
    run->status.projectId = project.projectId;
    run->status.runType = toString(project.runType);
    run->status.state = RunState::QUEUED;
    sink_.emitRunStatus(run->status);

    Run* runPtr = run.get();
    {
        std::lock_guard<std::mutex> lock(runsMutex_);
        runs_[runId] = std::move(run);
        runPtr->thread = std::thread(&CrawlOrchestrator::executeRun, this, std::ref(*runPtr));
    }

    LOG_INFO("Started crawl run " + runId + " for " + project.baseUrl + " (" + toString(project.runType) + ")");
    return runId;
}

void CrawlOrchestrator::executeRun(Run& run) {
    {
        std::lock_guard<std::mutex> lock(run.mutex);
        if (!run.paused) {
            run.status.state = RunState::RUNNING;
        }
        run.status.startedAt = common::nowIso8601();
        emitStatus(run);
    }
    CrawlLogger::broadcastRunLog(run.status.runId, "Crawl started for " + run.base.url);

    std::shared_ptr<const crawler::RobotsPolicy> policy;
    std::vector<std::thread> workers;
    try {
        policy = robots_.checkRobots(run.project.baseUrl, run.project.userAgent);
        if (!policy->canCrawl()) {
            const std::string reason = common::RobotsBlockedError(policy->domain, policy->reason).what();
            PageOutcome outcome;
            outcome.runId = run.status.runId;
            outcome.url = run.base.url;
            outcome.status = PageOutcomeStatus::BLOCKED;
            outcome.reason = reason;
            outcome.recommendations = policy->recommendations;
            sink_.emitPageOutcome(outcome);
            {
                std::lock_guard<std::mutex> lock(run.mutex);
                ++run.status.pagesBlocked;
            }
            finishRun(run, RunState::FAILED, reason);
            return;
        }

        applyCrawlDelay(*policy);
        seedFrontier(run, *policy);
        run.browser = openBrowserSession();

        const size_t workerCount = std::max<size_t>(1, config_.maxConcurrentFetches);
        for (size_t i = 0; i < workerCount; ++i) {
            workers.emplace_back(&CrawlOrchestrator::workerLoop, this, std::ref(run), std::cref(*policy));
        }
        for (auto& worker : workers) {
            worker.join();
        }

        if (stopping_) {
            finishRun(run, RunState::FAILED, "Crawl interrupted by shutdown");
        } else {
            finishRun(run, RunState::COMPLETED, "");
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Crawl run " + run.status.runId + " failed: " + e.what());
        for (auto& worker : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        finishRun(run, RunState::FAILED, e.what());
    }
}

void CrawlOrchestrator::seedFrontier(Run& run, const crawler::RobotsPolicy& policy) {
    const ProjectConfig& project = run.project;
    size_t added = run.frontier.addURL(run.base, kBasePriority, 0, crawler::UrlSource::BASE) ? 1 : 0;

    if (project.runType == RunType::MANUAL) {
        for (const auto& raw : project.urls) {
            if (!url::UrlCanonicalizer::shouldCrawl(raw, {}, project.excludedPatterns)) {
                continue;
            }
            if (!url::UrlCanonicalizer::isSameDomain(raw, run.base.url)) {
                LOG_WARNING("Skipping manual URL on another host: " + raw);
                continue;
            }
            try {
                const url::CanonicalUrl canonical = canonicalizer_.normalize(raw);
                if (run.frontier.addURL(canonical, kDefaultSitemapPriority, 0, crawler::UrlSource::MANUAL)) {
                    ++added;
                }
            } catch (const common::InvalidUrlError& e) {
                LOG_WARNING(std::string("Skipping manual URL: ") + e.what());
            }
        }
    } else {
        const url::ParsedUrl parsedBase = url::parseUrl(run.base.url);
        std::vector<crawler::SitemapEntry> entries = sitemaps_.parseSite(parsedBase.origin(), policy.sitemapUrls);
        const size_t found = entries.size();

        crawler::SitemapFilter filter;
        filter.excludePatterns = project.excludedPatterns;
        if (project.runType == RunType::DELTA) {
            filter.modifiedAfter = project.modifiedAfter;
        }
        if (project.runType == RunType::SAMPLE) {
            filter.minPriority = project.minPriority;
        }
        entries = crawler::SitemapParser::filterUrls(entries, filter);

        if (project.runType == RunType::SAMPLE) {
            std::stable_sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) {
                return a.priority.value_or(kDefaultSitemapPriority) > b.priority.value_or(kDefaultSitemapPriority);
            });
            if (project.sampleSize > 0 && entries.size() > project.sampleSize) {
                entries.resize(project.sampleSize);
            }
        }

        for (const auto& entry : entries) {
            if (!url::UrlCanonicalizer::isSameDomain(entry.url.url, run.base.url)) {
                continue;
            }
            if (run.frontier.addURL(entry.url, entry.priority.value_or(kDefaultSitemapPriority), 0,
                                    crawler::UrlSource::SITEMAP)) {
                ++added;
            }
        }
        LOG_INFO_STREAM("Run " << run.status.runId << ": " << found << " sitemap URLs, "
                        << entries.size() << " after filtering");
    }

    std::lock_guard<std::mutex> lock(run.mutex);
    run.status.pagesDiscovered += added;
    emitStatus(run);
}

// Caller holds run.mutex
std::string CrawlOrchestrator::limitReason(const Run& run) const {
    const RunStatus& status = run.status;
    const size_t started = status.pagesProcessed + run.inFlight;
    if (run.project.sampleSize > 0 && started >= run.project.sampleSize) {
        return "Sample size of " + std::to_string(run.project.sampleSize) + " pages reached";
    }
    if (run.project.tokenLimit > 0 && status.tokensUsed >= run.project.tokenLimit) {
        return "Token limit of " + std::to_string(run.project.tokenLimit) + " reached";
    }
    if (started + status.pagesFailed + status.pagesBlocked >= run.project.maxPages) {
        return "Page limit of " + std::to_string(run.project.maxPages) + " reached";
    }
    return "";
}

void CrawlOrchestrator::workerLoop(Run& run, const crawler::RobotsPolicy& policy) {
    while (true) {
        std::optional<crawler::QueuedURL> entry;
        {
            std::unique_lock<std::mutex> lock(run.mutex);
            while (!entry) {
                if (stopping_) {
                    break;
                }
                if (run.paused) {
                    run.cv.wait(lock);
                    continue;
                }
                const std::string limit = limitReason(run);
                if (!limit.empty()) {
                    if (run.status.reason.empty()) {
                        run.status.reason = limit;
                    }
                    break;
                }
                entry = run.frontier.getNextURL();
                if (entry) {
                    break;
                }
                if (run.frontier.isEmpty() && run.inFlight == 0) {
                    break;
                }
                run.cv.wait_for(lock, kIdlePoll);
            }
            if (!entry) {
                break;
            }
            ++run.inFlight;
        }

        try {
            processEntry(run, *entry, policy, run.browser.get());
        } catch (const std::exception& e) {
            LOG_ERROR("Page " + entry->url.url + " failed: " + e.what());
            PageOutcome outcome;
            outcome.runId = run.status.runId;
            outcome.url = entry->url.url;
            outcome.status = PageOutcomeStatus::FAILED;
            outcome.reason = e.what();
            sink_.emitPageOutcome(outcome);
            std::lock_guard<std::mutex> lock(run.mutex);
            ++run.status.pagesFailed;
        }

        {
            std::lock_guard<std::mutex> lock(run.mutex);
            --run.inFlight;
        }
        run.cv.notify_all();
    }
    run.cv.notify_all();
}

void CrawlOrchestrator::processEntry(Run& run,
                                     const crawler::QueuedURL& entry,
                                     const crawler::RobotsPolicy& policy,
                                     crawler::BrowserSession* browser) {
    PageAnalysis analysis = analyzer_->analyze(entry.url.url, policy, browser);

    if (analysis.status != AnalysisStatus::COMPLETED) {
        const bool blocked = analysis.status == AnalysisStatus::BLOCKED;
        PageOutcome outcome;
        outcome.runId = run.status.runId;
        outcome.url = entry.url.url;
        outcome.status = blocked ? PageOutcomeStatus::BLOCKED : PageOutcomeStatus::FAILED;
        outcome.reason = analysis.error;
        outcome.statusCode = analysis.statusCode;
        outcome.recommendations = analysis.recommendations;
        sink_.emitPageOutcome(outcome);
        CrawlLogger::broadcastRunLog(run.status.runId, toString(outcome.status) + ": " + entry.url.url, "warning");

        std::lock_guard<std::mutex> lock(run.mutex);
        run.frontier.markVisited(entry.url.hash);
        if (blocked) {
            ++run.status.pagesBlocked;
        } else {
            ++run.status.pagesFailed;
        }
        return;
    }

    PageSnapshot& snapshot = *analysis.snapshot;
    bool duplicate = false;
    {
        std::lock_guard<std::mutex> lock(run.mutex);
        run.frontier.markVisited(entry.url.hash);
        run.frontier.markVisited(snapshot.urlHash);
        duplicate = !run.processed.insert(snapshot.urlHash).second;
    }
    if (duplicate) {
        LOG_DEBUG("Skipping " + entry.url.url + ": canonical " + snapshot.url + " already processed");
        return;
    }

    if (run.project.runType != RunType::FULL) {
        const auto previous = snapshots_.latestContentHash(snapshot.urlHash);
        if (previous && *previous == snapshot.contentHash) {
            LOG_DEBUG("Unchanged: " + snapshot.url);
            std::lock_guard<std::mutex> lock(run.mutex);
            ++run.status.pagesProcessed;
            ++run.status.pagesUnchanged;
            return;
        }
    }

    if (run.project.aiScoring) {
        analyzer_->attachAiScore(analysis);
    }

    snapshot.id = snapshots_.allocateSnapshotId(snapshot.urlHash);
    snapshot.runId = run.status.runId;
    sink_.emitSnapshot(snapshot);
    sink_.emitScore(toScoreRecord(analysis));
    CrawlLogger::broadcastRunLog(run.status.runId, "Scored " + snapshot.url + ": " +
                                 std::to_string(analysis.ruleScore.overall));

    std::lock_guard<std::mutex> lock(run.mutex);
    ++run.status.pagesProcessed;
    ++run.status.snapshotsCreated;
    if (analysis.aiScore && !analysis.aiScore->fromCache) {
        run.status.tokensUsed += analysis.aiScore->tokensUsed;
    }
    if (run.project.runType == RunType::FULL && entry.depth < run.project.depthLimit) {
        enqueueLinks(run, entry, analysis);
    }
    if (++run.pagesSinceStatus >= kStatusEveryPages) {
        run.pagesSinceStatus = 0;
        emitStatus(run);
    }
}

// Caller holds run.mutex
void CrawlOrchestrator::enqueueLinks(Run& run, const crawler::QueuedURL& entry, const PageAnalysis& analysis) {
    size_t added = 0;
    for (const auto& link : analysis.snapshot->extraction.internalLinks) {
        if (!url::UrlCanonicalizer::isSameDomain(link.url, run.base.url) ||
            !url::UrlCanonicalizer::shouldCrawl(link.url, {}, run.project.excludedPatterns)) {
            continue;
        }
        try {
            const url::CanonicalUrl canonical = canonicalizer_.normalize(link.url);
            if (run.frontier.addURL(canonical, kLinkPriority, entry.depth + 1, crawler::UrlSource::LINK)) {
                ++added;
            }
        } catch (const common::InvalidUrlError& e) {
            LOG_DEBUG(std::string("Ignoring link: ") + e.what());
        }
    }
    run.status.pagesDiscovered += added;
}

// Caller holds run.mutex
void CrawlOrchestrator::emitStatus(Run& run) {
    sink_.emitRunStatus(run.status);
}

void CrawlOrchestrator::finishRun(Run& run, RunState state, const std::string& reason) {
    if (run.browser) {
        run.browser->close();
    }
    {
        std::lock_guard<std::mutex> lock(run.mutex);
        run.status.state = state;
        if (!reason.empty()) {
            run.status.reason = reason;
        }
        run.status.finishedAt = common::nowIso8601();
        emitStatus(run);
    }
    run.cv.notify_all();

    LOG_INFO_STREAM("Crawl run " << run.status.runId << " " << toString(state)
                    << " (processed=" << run.status.pagesProcessed
                    << ", failed=" << run.status.pagesFailed
                    << ", blocked=" << run.status.pagesBlocked
                    << ", unchanged=" << run.status.pagesUnchanged << ")");
    CrawlLogger::broadcastRunLog(run.status.runId, "Crawl " + toString(state),
                                 state == RunState::FAILED ? "error" : "info");
}

bool CrawlOrchestrator::pauseRun(const CrawlRunId& runId) {
    std::lock_guard<std::mutex> runsLock(runsMutex_);
    auto it = runs_.find(runId);
    if (it == runs_.end()) {
        return false;
    }
    Run& run = *it->second;
    std::lock_guard<std::mutex> lock(run.mutex);
    if (run.status.state != RunState::RUNNING && run.status.state != RunState::QUEUED) {
        return false;
    }
    run.paused = true;
    run.status.state = RunState::PAUSED;
    emitStatus(run);
    LOG_INFO("Paused crawl run " + runId);
    return true;
}

bool CrawlOrchestrator::resumeRun(const CrawlRunId& runId) {
    std::lock_guard<std::mutex> runsLock(runsMutex_);
    auto it = runs_.find(runId);
    if (it == runs_.end()) {
        return false;
    }
    Run& run = *it->second;
    {
        std::lock_guard<std::mutex> lock(run.mutex);
        if (run.status.state != RunState::PAUSED) {
            return false;
        }
        run.paused = false;
        run.status.state = RunState::RUNNING;
        emitStatus(run);
    }
    run.cv.notify_all();
    LOG_INFO("Resumed crawl run " + runId);
    return true;
}

std::optional<RunStatus> CrawlOrchestrator::getRunStatus(const CrawlRunId& runId) const {
    std::lock_guard<std::mutex> runsLock(runsMutex_);
    auto it = runs_.find(runId);
    if (it == runs_.end()) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(it->second->mutex);
    return it->second->status;
}

RunStatus CrawlOrchestrator::waitForRun(const CrawlRunId& runId, std::chrono::milliseconds timeout) {
    Run* run = nullptr;
    {
        std::lock_guard<std::mutex> runsLock(runsMutex_);
        auto it = runs_.find(runId);
        if (it == runs_.end()) {
            throw common::AeoError("Unknown crawl run: " + runId);
        }
        run = it->second.get();
    }
    std::unique_lock<std::mutex> lock(run->mutex);
    run->cv.wait_for(lock, timeout, [run] { return isTerminal(run->status.state); });
    return run->status;
}

std::vector<CrawlRunId> CrawlOrchestrator::activeRuns() const {
    std::vector<CrawlRunId> active;
    std::lock_guard<std::mutex> runsLock(runsMutex_);
    for (const auto& [id, run] : runs_) {
        std::lock_guard<std::mutex> lock(run->mutex);
        if (!isTerminal(run->status.state)) {
            active.push_back(id);
        }
    }
    return active;
}

void CrawlOrchestrator::shutdown() {
    stopping_ = true;

    std::vector<Run*> runs;
    {
        std::lock_guard<std::mutex> runsLock(runsMutex_);
        for (auto& [id, run] : runs_) {
            runs.push_back(run.get());
        }
    }
    for (Run* run : runs) {
        {
            std::lock_guard<std::mutex> lock(run->mutex);
        }
        run->cv.notify_all();
        if (run->thread.joinable()) {
            run->thread.join();
        }
    }
}

} // namespace aeo_engine::orchestrator
