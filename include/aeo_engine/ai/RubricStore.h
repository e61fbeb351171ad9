#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../common/TtlCache.h"
#include "../extraction/PageTypeClassifier.h"

namespace aeo_engine::ai {

struct RubricCriterion {
    std::string name;
    std::string category;
    std::string description;
    std::string scoringGuidance;
    std::vector<std::string> bestPractices;
    bool emphasized = false;
};

// Parsed, validated rubric document
struct Rubric {
    std::string version = "1.0";
    std::string documentType;
    nlohmann::json document;
};

struct RubricStats {
    std::string version;
    std::string documentType;
    size_t categoryCount = 0;
    size_t totalCriteria = 0;
    std::map<std::string, size_t> criteriaByCategory;
    std::vector<std::string> pageTypes;
};

/**
 * Versioned scoring rubric, loaded once and cached until invalidated.
 *
 * Document shape:
 *   {version, documentType,
 *    categories: [{name, criteria: [{name, description, scoringGuidance, bestPractices}]}],
 *    pageTypeRubrics: {<pageType>: {emphasizedCriteria: [...]}}}
 */
class RubricStore {
public:
    // Rubric read from a JSON file on first use
    explicit RubricStore(std::string path, std::chrono::milliseconds ttl = std::chrono::milliseconds(0));

    // Rubric held in memory
    static std::shared_ptr<RubricStore> fromDocument(nlohmann::json document);

    // Throws ConfigError when the file cannot be read, RubricValidationError when it is invalid
    std::shared_ptr<const Rubric> active() const;
    std::string version() const;

    // Every criterion in document order, flagged when the page type emphasizes it
    std::vector<RubricCriterion> criteriaForPageType(extraction::PageType pageType) const;
    std::vector<std::string> allCriteriaNames() const;
    RubricStats stats() const;

    void invalidate();

    // Empty when the document is usable
    static std::vector<std::string> validateRubric(const nlohmann::json& document);

private:
    RubricStore(std::optional<nlohmann::json> document, std::string path, std::chrono::milliseconds ttl);

    std::shared_ptr<const Rubric> load() const;

    std::optional<nlohmann::json> inlineDocument_;
    std::string path_;
    mutable common::TtlCache<std::string, std::shared_ptr<const Rubric>> cache_;
};

void to_json(nlohmann::json& j, const RubricCriterion& criterion);
void to_json(nlohmann::json& j, const RubricStats& stats);

} // namespace aeo_engine::ai
