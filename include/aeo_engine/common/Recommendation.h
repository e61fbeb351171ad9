#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace aeo_engine::common {

enum class RecommendationPriority {
    LOW = 1,
    MEDIUM = 2,
    HIGH = 3
};

std::string toString(RecommendationPriority priority);
RecommendationPriority recommendationPriorityFromString(const std::string& value);

// Improvement item attached to rule scores and robots decisions
struct Recommendation {
    std::string category;
    RecommendationPriority priority = RecommendationPriority::MEDIUM;
    std::string issue;
    std::string recommendation;
    std::string impact;
    std::optional<std::string> example;
    std::optional<std::string> implementation;
};

void to_json(nlohmann::json& j, const Recommendation& recommendation);
void from_json(const nlohmann::json& j, Recommendation& recommendation);

} // namespace aeo_engine::common
