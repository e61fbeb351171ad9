#include "../../include/aeo_engine/ai/RubricStore.h"
#include "../../include/aeo_engine/common/Errors.h"
#include "../../include/Logger.h"

#include <fstream>
#include <set>

namespace aeo_engine::ai {

using nlohmann::json;

namespace {

const char* kActiveKey = "active";

std::string stringField(const json& object, const char* key) {
    if (object.is_object() && object.contains(key) && object[key].is_string()) {
        return object[key].get<std::string>();
    }
    return "";
}

} // namespace

RubricStore::RubricStore(std::string path, std::chrono::milliseconds ttl)
    : RubricStore(std::nullopt, std::move(path), ttl) {
}

RubricStore::RubricStore(std::optional<json> document, std::string path, std::chrono::milliseconds ttl)
    : inlineDocument_(std::move(document)), path_(std::move(path)), cache_(ttl) {
}

std::shared_ptr<RubricStore> RubricStore::fromDocument(json document) {
    return std::shared_ptr<RubricStore>(new RubricStore(std::move(document), "", std::chrono::milliseconds(0)));
}

std::vector<std::string> RubricStore::validateRubric(const json& document) {
    std::vector<std::string> errors;

    if (!document.is_object() || !document.contains("categories") || !document["categories"].is_array()) {
        errors.push_back("Rubric must have categories array");
        return errors;
    }

    size_t index = 0;
    for (const auto& category : document["categories"]) {
        const std::string categoryName = stringField(category, "name");
        if (categoryName.empty()) {
            errors.push_back("Category at index " + std::to_string(index) + " missing name");
        }
        const std::string label = categoryName.empty() ? std::to_string(index) : categoryName;

        if (!category.is_object() || !category.contains("criteria") || !category["criteria"].is_array()) {
            errors.push_back("Category " + label + " missing criteria array");
        } else {
            size_t criterionIndex = 0;
            for (const auto& criterion : category["criteria"]) {
                const std::string name = stringField(criterion, "name");
                if (name.empty()) {
                    errors.push_back("Criterion at category " + label + ", index " +
                                     std::to_string(criterionIndex) + " missing name");
                }
                if (stringField(criterion, "description").empty()) {
                    errors.push_back("Criterion " + name + " missing description");
                }
                if (stringField(criterion, "scoringGuidance").empty()) {
                    errors.push_back("Criterion " + name + " missing scoringGuidance");
                }
                ++criterionIndex;
            }
        }
        ++index;
    }

    if (!document.contains("pageTypeRubrics") || !document["pageTypeRubrics"].is_object()) {
        errors.push_back("Rubric should have pageTypeRubrics for page-type-aware scoring");
    }
    return errors;
}

std::shared_ptr<const Rubric> RubricStore::load() const {
    json document;
    if (inlineDocument_) {
        document = *inlineDocument_;
    } else {
        std::ifstream file(path_);
        if (!file.is_open()) {
            throw common::ConfigError("Failed to load rubric from " + path_);
        }
        document = json::parse(file, nullptr, false);
        if (document.is_discarded()) {
            throw common::RubricValidationError(path_ + " is not valid JSON");
        }
    }

    const auto errors = validateRubric(document);
    if (!errors.empty()) {
        std::string message = errors.front();
        if (errors.size() > 1) {
            message += " (and " + std::to_string(errors.size() - 1) + " more)";
        }
        for (const auto& error : errors) {
            LOG_WARNING("Rubric validation: " + error);
        }
        throw common::RubricValidationError(message);
    }

    auto rubric = std::make_shared<Rubric>();
    rubric->version = stringField(document, "version");
    if (rubric->version.empty()) {
        rubric->version = "1.0";
    }
    rubric->documentType = stringField(document, "documentType");
    rubric->document = std::move(document);

    LOG_INFO("Loaded rubric version " + rubric->version +
             (inlineDocument_ ? std::string(" (in memory)") : " from " + path_));
    return rubric;
}

std::shared_ptr<const Rubric> RubricStore::active() const {
    if (auto cached = cache_.get(kActiveKey)) {
        return *cached;
    }
    auto rubric = load();
    cache_.put(kActiveKey, rubric);
    return rubric;
}

std::string RubricStore::version() const {
    return active()->version;
}

std::vector<RubricCriterion> RubricStore::criteriaForPageType(extraction::PageType pageType) const {
    const auto rubric = active();
    const json& document = rubric->document;

    std::set<std::string> emphasized;
    const std::string typeName = extraction::toString(pageType);
    if (document["pageTypeRubrics"].contains(typeName)) {
        const json& typeRubric = document["pageTypeRubrics"][typeName];
        if (typeRubric.contains("emphasizedCriteria") && typeRubric["emphasizedCriteria"].is_array()) {
            for (const auto& name : typeRubric["emphasizedCriteria"]) {
                if (name.is_string()) {
                    emphasized.insert(name.get<std::string>());
                }
            }
        }
    }

    std::vector<RubricCriterion> criteria;
    for (const auto& category : document["categories"]) {
        const std::string categoryName = stringField(category, "name");
        for (const auto& item : category["criteria"]) {
            RubricCriterion criterion;
            criterion.name = stringField(item, "name");
            criterion.category = categoryName;
            criterion.description = stringField(item, "description");
            criterion.scoringGuidance = stringField(item, "scoringGuidance");
            if (item.contains("bestPractices") && item["bestPractices"].is_array()) {
                for (const auto& practice : item["bestPractices"]) {
                    if (practice.is_string()) {
                        criterion.bestPractices.push_back(practice.get<std::string>());
                    }
                }
            }
            criterion.emphasized = emphasized.count(criterion.name) > 0;
            criteria.push_back(std::move(criterion));
        }
    }
    return criteria;
}

std::vector<std::string> RubricStore::allCriteriaNames() const {
    std::vector<std::string> names;
    for (const auto& category : active()->document["categories"]) {
        for (const auto& criterion : category["criteria"]) {
            names.push_back(stringField(criterion, "name"));
        }
    }
    return names;
}

RubricStats RubricStore::stats() const {
    const auto rubric = active();
    RubricStats stats;
    stats.version = rubric->version;
    stats.documentType = rubric->documentType;
    for (const auto& category : rubric->document["categories"]) {
        const size_t count = category["criteria"].size();
        ++stats.categoryCount;
        stats.totalCriteria += count;
        stats.criteriaByCategory[stringField(category, "name")] = count;
    }
    for (const auto& [type, unused] : rubric->document["pageTypeRubrics"].items()) {
        stats.pageTypes.push_back(type);
    }
    return stats;
}

void RubricStore::invalidate() {
    cache_.clear();
    LOG_DEBUG("Rubric cache cleared");
}

void to_json(json& j, const RubricCriterion& criterion) {
    j = json{
        {"name", criterion.name},
        {"category", criterion.category},
        {"description", criterion.description},
        {"scoringGuidance", criterion.scoringGuidance},
        {"bestPractices", criterion.bestPractices},
        {"emphasized", criterion.emphasized}
    };
}

void to_json(json& j, const RubricStats& stats) {
    j = json{
        {"version", stats.version},
        {"documentType", stats.documentType},
        {"categoryCount", stats.categoryCount},
        {"totalCriteria", stats.totalCriteria},
        {"criteriaByCategory", stats.criteriaByCategory},
        {"pageTypes", stats.pageTypes}
    };
}

} // namespace aeo_engine::ai
