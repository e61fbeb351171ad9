#include "PageAnalyzer.h"
#include "../../include/Logger.h"
#include "../../include/aeo_engine/common/Errors.h"
#include "../../include/aeo_engine/common/Hashing.h"
#include "../../include/aeo_engine/common/TextUtils.h"
#include "../../include/crawler/CrawlLogger.h"

namespace aeo_engine::orchestrator {

PageAnalyzer::PageAnalyzer(crawler::PageFetcher& fetcher,
                           const url::UrlCanonicalizer& canonicalizer,
                           const extraction::ContentExtractor& extractor,
                           const extraction::PageTypeClassifier& classifier,
                           const scoring::RuleScoreCalculator& calculator,
                           ai::AiRubricScorer* aiScorer)
    : fetcher_(fetcher)
    , canonicalizer_(canonicalizer)
    , extractor_(extractor)
    , classifier_(classifier)
    , calculator_(calculator)
    , aiScorer_(aiScorer) {}

PageAnalysis PageAnalyzer::blocked(const std::string& url, const crawler::RobotsPolicy& policy) {
    PageAnalysis analysis;
    analysis.status = AnalysisStatus::BLOCKED;
    analysis.url = url;
    analysis.crawlStrategy = crawler::toString(policy.strategy());
    analysis.recommendations = policy.recommendations;
    if (!policy.canCrawl()) {
        analysis.error = common::RobotsBlockedError(policy.domain, policy.reason).what();
    } else {
        analysis.error = "Disallowed by robots.txt for " + policy.effectiveUserAgent;
    }
    return analysis;
}

PageAnalysis PageAnalyzer::analyze(const std::string& url,
                                   const crawler::RobotsPolicy& policy,
                                   crawler::BrowserSession* browser) const {
    if (!policy.canCrawl() || !policy.isUrlAllowed(url)) {
        LOG_INFO("Skipping " + url + ": blocked by robots.txt");
        return blocked(url, policy);
    }

    PageAnalysis analysis;
    analysis.url = url;
    analysis.crawlStrategy = crawler::toString(policy.strategy());

    crawler::PageFetchResult page;
    try {
        page = fetcher_.fetch(url, policy.effectiveUserAgent, browser);
    } catch (const common::FetchError& e) {
        LOG_WARNING(std::string("Page fetch failed: ") + e.what());
        analysis.status = AnalysisStatus::FAILED;
        analysis.statusCode = e.statusCode();
        analysis.error = e.what();
        return analysis;
    }
    analysis.statusCode = page.statusCode;
    if (page.renderFallbackReason) {
        CrawlLogger::broadcastLog("Render fallback for " + url + ": " + *page.renderFallbackReason, "warning");
    }

    const std::string pageUrl = page.finalUrl.empty() ? url : page.finalUrl;

    PageSnapshot snapshot;
    try {
        snapshot.extraction = extractor_.extract(page.html, pageUrl);
        const url::CanonicalUrl canonical = canonicalizer_.resolveCanonical(pageUrl, page.html);
        snapshot.url = canonical.url;
        snapshot.urlHash = canonical.hash;
    } catch (const common::InvalidUrlError& e) {
        analysis.status = AnalysisStatus::FAILED;
        analysis.error = e.what();
        return analysis;
    }

    snapshot.fetchedUrl = pageUrl;
    snapshot.statusCode = page.statusCode;
    snapshot.rawHtml = page.html;
    snapshot.cleanedText = snapshot.extraction.body;
    snapshot.contentHash = common::contentHash(snapshot.cleanedText);
    snapshot.metrics = extraction::calculateMetrics(page.html, snapshot.extraction, page.elapsed, page.renderMethod);
    snapshot.pageType = classifier_.classify(snapshot.extraction);
    snapshot.capturedAt = common::formatIso8601(page.fetchedAt);

    analysis.pageType = snapshot.pageType;
    analysis.ruleScore = calculator_.score(snapshot.extraction, snapshot.pageType, page.elapsed);
    analysis.recommendations = calculator_.generateRecommendations(snapshot.extraction, analysis.ruleScore, page.elapsed);
    // Browser-agent fallbacks come with their own advice
    analysis.recommendations.insert(analysis.recommendations.end(),
                                    policy.recommendations.begin(), policy.recommendations.end());
    scoring::RuleScoreCalculator::prioritize(analysis.recommendations);

    LOG_DEBUG_STREAM("Analyzed " << snapshot.url << " as " << extraction::toString(snapshot.pageType)
                     << " (overall " << analysis.ruleScore.overall << ", "
                     << crawler::toString(page.renderMethod) << ")");

    analysis.snapshot = std::move(snapshot);
    analysis.status = AnalysisStatus::COMPLETED;
    return analysis;
}

void PageAnalyzer::attachAiScore(PageAnalysis& analysis, bool useCache) const {
    if (analysis.status != AnalysisStatus::COMPLETED || !analysis.snapshot) {
        return;
    }
    if (!aiScorer_) {
        analysis.aiScoreUnavailable = true;
        analysis.aiUnavailableReason = "AI scoring is not configured";
        return;
    }

    const PageSnapshot& snapshot = *analysis.snapshot;
    ai::ScoringInput input{snapshot.extraction, snapshot.cleanedText, snapshot.contentHash, snapshot.metrics.wordCount};
    try {
        analysis.aiScore = aiScorer_->scorePage(input, analysis.pageType, useCache);
        analysis.aiScoreUnavailable = false;
        analysis.aiUnavailableReason.clear();
    } catch (const common::AeoError& e) {
        // Parse, service and rubric failures all degrade to the rule score
        LOG_WARNING("AI score unavailable for " + snapshot.url + ": " + e.what());
        analysis.aiScoreUnavailable = true;
        analysis.aiUnavailableReason = e.what();
    }
}

} // namespace aeo_engine::orchestrator
