#pragma once

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "ContentPreparer.h"
#include "LlmClient.h"
#include "RubricStore.h"
#include "../common/TtlCache.h"
#include "../extraction/ContentExtraction.h"
#include "../extraction/PageTypeClassifier.h"

namespace aeo_engine::ai {

struct AiRecommendation {
    std::string category;
    std::string text;
    std::vector<std::string> references;
    // Ready-to-use content ({type, content}); absent for structural advice
    std::optional<nlohmann::json> example;
};

struct AiScoreResult {
    extraction::PageType pageType = extraction::PageType::RESOURCE;
    int overallScore = 0;
    std::map<std::string, int> criteriaScores;
    std::map<std::string, std::string> explanations;
    std::vector<AiRecommendation> recommendations;
    std::string cacheKey;
    long long tokensUsed = 0;
    std::string rubricVersion;
    PreparationMethod preparationMethod = PreparationMethod::STRUCTURED_ONLY;
    int tokensSavedPercent = 0;
    bool fromCache = false;
};

// Page content handed to the scorer
struct ScoringInput {
    extraction::ContentExtraction extraction;
    std::string cleanedText;
    std::string contentHash;     // computed from cleanedText when empty
    size_t wordCount = 0;
};

// Parsed model reply, before overall scoring
struct ParsedScoringResponse {
    std::map<std::string, int> criteriaScores;
    std::map<std::string, std::string> explanations;
    std::vector<AiRecommendation> recommendations;
};

struct ScoreValidation {
    bool valid = true;
    std::vector<std::string> warnings;
};

// Counting semaphore bounding in-flight LLM work
class ConcurrencyLimiter {
public:
    explicit ConcurrencyLimiter(size_t permits);

    void acquire();
    void release();

    class Permit {
    public:
        explicit Permit(ConcurrencyLimiter& limiter) : limiter_(limiter) { limiter_.acquire(); }
        ~Permit() { limiter_.release(); }
        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;

    private:
        ConcurrencyLimiter& limiter_;
    };

private:
    size_t available_;
    std::mutex mutex_;
    std::condition_variable cv_;
};

/**
 * Rubric-driven LLM scorer.
 *
 * Results are cached under aiScoreCacheKey(contentHash, rubricVersion); a cache
 * hit returns without any LLM traffic. rescore() always calls the model and
 * overwrites the cached entry.
 *
 * Throws AiResponseParseError when the reply cannot be parsed after one
 * corrective retry and LlmServiceError when the service fails.
 */
class AiRubricScorer {
public:
    struct Options {
        int maxTokens = 2000;
        double temperature = 0.3;
        size_t maxConcurrency = 2;
        std::chrono::milliseconds timeout{60000};
        std::chrono::milliseconds cacheTtl{std::chrono::hours(24 * 7)};
    };

    AiRubricScorer(std::shared_ptr<LlmClient> llmClient,
                   std::shared_ptr<RubricStore> rubricStore,
                   std::shared_ptr<ContentPreparer> preparer);
    AiRubricScorer(std::shared_ptr<LlmClient> llmClient,
                   std::shared_ptr<RubricStore> rubricStore,
                   std::shared_ptr<ContentPreparer> preparer,
                   Options options);

    AiScoreResult scorePage(const ScoringInput& input, extraction::PageType pageType, bool useCache = true);
    AiScoreResult rescore(const ScoringInput& input, extraction::PageType pageType);

    std::optional<AiScoreResult> cachedResult(const std::string& cacheKey) const;
    void clearCache();
    size_t cacheSize() const;

    const RubricStore& rubricStore() const { return *rubricStore_; }

    // Rounded arithmetic mean; 0 for an empty set
    static int calculateOverallScore(const std::map<std::string, int>& criteriaScores);
    static ScoreValidation validateScoreResult(const AiScoreResult& result);

    static std::string buildScoringPrompt(const std::string& content,
                                          extraction::PageType pageType,
                                          const std::vector<RubricCriterion>& criteria);
    static std::string buildScoringSystemPrompt(extraction::PageType pageType,
                                                const std::string& rubricVersion,
                                                const std::vector<RubricCriterion>& criteria);

    // Scores for criteria outside knownCriteria are dropped
    static ParsedScoringResponse parseScoringResponse(const std::string& content,
                                                      const std::vector<std::string>& knownCriteria);

private:
    std::shared_ptr<LlmClient> llmClient_;
    std::shared_ptr<RubricStore> rubricStore_;
    std::shared_ptr<ContentPreparer> preparer_;
    Options options_;
    ConcurrencyLimiter limiter_;
    common::TtlCache<std::string, AiScoreResult> cache_;
};

void to_json(nlohmann::json& j, const AiRecommendation& recommendation);
void to_json(nlohmann::json& j, const AiScoreResult& result);

} // namespace aeo_engine::ai
