#pragma once

#include <string>
#include "../../include/aeo_engine/ai/AiRubricScorer.h"
#include "../../include/aeo_engine/crawler/BrowserRenderer.h"
#include "../../include/aeo_engine/crawler/RobotsComplianceEngine.h"
#include "../../include/aeo_engine/extraction/ContentExtractor.h"
#include "../../include/aeo_engine/extraction/PageTypeClassifier.h"
#include "../../include/aeo_engine/orchestrator/CrawlRecords.h"
#include "../../include/aeo_engine/scoring/RuleScoreCalculator.h"
#include "../../include/aeo_engine/url/UrlCanonicalizer.h"
#include "../crawler/PageFetcher.h"

namespace aeo_engine::orchestrator {

/**
 * Single-page pipeline: fetch, extract, classify and rule-score.
 *
 * The returned snapshot has no id or run id yet; the caller decides whether it
 * is emitted. AI scoring is a separate step so callers can skip it for pages
 * whose content did not change.
 */
class PageAnalyzer {
public:
    PageAnalyzer(crawler::PageFetcher& fetcher,
                 const url::UrlCanonicalizer& canonicalizer,
                 const extraction::ContentExtractor& extractor,
                 const extraction::PageTypeClassifier& classifier,
                 const scoring::RuleScoreCalculator& calculator,
                 ai::AiRubricScorer* aiScorer = nullptr);

    PageAnalysis analyze(const std::string& url,
                         const crawler::RobotsPolicy& policy,
                         crawler::BrowserSession* browser = nullptr) const;

    // Fills aiScore, or flags the analysis as AI-score-unavailable
    void attachAiScore(PageAnalysis& analysis, bool useCache = true) const;

    // Zero-score record for a URL robots does not let us fetch
    static PageAnalysis blocked(const std::string& url, const crawler::RobotsPolicy& policy);

    bool aiEnabled() const { return aiScorer_ != nullptr; }

private:
    crawler::PageFetcher& fetcher_;
    const url::UrlCanonicalizer& canonicalizer_;
    const extraction::ContentExtractor& extractor_;
    const extraction::PageTypeClassifier& classifier_;
    const scoring::RuleScoreCalculator& calculator_;
    ai::AiRubricScorer* aiScorer_;
};

} // namespace aeo_engine::orchestrator
