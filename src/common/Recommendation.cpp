#include "../../include/aeo_engine/common/Recommendation.h"
#include "../../include/aeo_engine/common/TextUtils.h"

namespace aeo_engine::common {

std::string toString(RecommendationPriority priority) {
    switch (priority) {
        case RecommendationPriority::HIGH: return "high";
        case RecommendationPriority::MEDIUM: return "medium";
        case RecommendationPriority::LOW: return "low";
    }
    return "medium";
}

RecommendationPriority recommendationPriorityFromString(const std::string& value) {
    const std::string lowered = toLower(value);
    if (lowered == "high") return RecommendationPriority::HIGH;
    if (lowered == "low") return RecommendationPriority::LOW;
    return RecommendationPriority::MEDIUM;
}

void to_json(nlohmann::json& j, const Recommendation& recommendation) {
    j = nlohmann::json{
        {"category", recommendation.category},
        {"priority", toString(recommendation.priority)},
        {"issue", recommendation.issue},
        {"recommendation", recommendation.recommendation},
        {"impact", recommendation.impact}
    };
    if (recommendation.example) {
        j["example"] = *recommendation.example;
    }
    if (recommendation.implementation) {
        j["implementation"] = *recommendation.implementation;
    }
}

void from_json(const nlohmann::json& j, Recommendation& recommendation) {
    recommendation.category = j.value("category", "");
    recommendation.priority = recommendationPriorityFromString(j.value("priority", "medium"));
    recommendation.issue = j.value("issue", "");
    recommendation.recommendation = j.value("recommendation", "");
    recommendation.impact = j.value("impact", "");
    if (j.contains("example") && j["example"].is_string()) {
        recommendation.example = j["example"].get<std::string>();
    }
    if (j.contains("implementation") && j["implementation"].is_string()) {
        recommendation.implementation = j["implementation"].get<std::string>();
    }
}

} // namespace aeo_engine::common
