#pragma once

#include <chrono>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "EatWeightTables.h"
#include "../common/Recommendation.h"
#include "../extraction/ContentExtraction.h"
#include "../extraction/PageTypeClassifier.h"

namespace aeo_engine::scoring {

// Component scores are each in [0, 100]; overall is their weighted sum
struct RuleScore {
    int content = 0;
    int eat = 0;
    int technical = 0;
    int structuredData = 0;
    int overall = 0;
    std::string eatProfile;
};

struct ComponentWeights {
    double content = 0.25;
    double eat = 0.25;
    double technical = 0.25;
    double structuredData = 0.25;
};

/**
 * Rule-based answer-engine readiness scoring.
 *
 * Stateless apart from its configuration: the same extraction, page type and
 * load time always give the same RuleScore.
 */
class RuleScoreCalculator {
public:
    static constexpr int kRecommendationThreshold = 70;

    RuleScoreCalculator();
    explicit RuleScoreCalculator(EatWeightTables tables, ComponentWeights weights = ComponentWeights());

    RuleScore score(const extraction::ContentExtraction& extraction,
                    extraction::PageType pageType,
                    std::chrono::milliseconds loadTime = std::chrono::milliseconds(0)) const;

    // Items for every component below the threshold, highest priority and category importance first
    std::vector<common::Recommendation> generateRecommendations(
        const extraction::ContentExtraction& extraction,
        const RuleScore& score,
        std::chrono::milliseconds loadTime = std::chrono::milliseconds(0)) const;

    double contentScore(const extraction::PageSignals& signals) const;
    double eatScore(const extraction::PageSignals& signals, const EatProfile& profile) const;
    double technicalScore(const extraction::PageSignals& signals, std::chrono::milliseconds loadTime) const;
    double structuredDataScore(const extraction::PageSignals& signals) const;

    // Raw page-specific trust points before the profile weight is applied
    static double pageFactorPoints(const extraction::PageSignals& signals, const EatProfile& profile);

    static int categoryImportance(const std::string& category);
    static void prioritize(std::vector<common::Recommendation>& recommendations);

    const EatWeightTables& weightTables() const { return tables_; }

private:
    void addContentRecommendations(const extraction::PageSignals& signals,
                                   std::vector<common::Recommendation>& out) const;
    void addEatRecommendations(const extraction::PageSignals& signals,
                               std::vector<common::Recommendation>& out) const;
    void addTechnicalRecommendations(const extraction::PageSignals& signals,
                                     std::chrono::milliseconds loadTime,
                                     std::vector<common::Recommendation>& out) const;
    void addStructuredDataRecommendations(const extraction::PageSignals& signals,
                                          std::vector<common::Recommendation>& out) const;

    EatWeightTables tables_;
    ComponentWeights weights_;
};

void to_json(nlohmann::json& j, const RuleScore& score);

} // namespace aeo_engine::scoring
