#include <catch2/catch_test_macros.hpp>
#include "../../include/aeo_engine/ai/RubricStore.h"
#include "../../include/aeo_engine/common/Errors.h"

#include <cstdio>
#include <fstream>

using namespace aeo_engine::ai;
using aeo_engine::common::ConfigError;
using aeo_engine::common::RubricValidationError;
using aeo_engine::extraction::PageType;
using nlohmann::json;

namespace {

json minimalRubric() {
    return json::parse(R"({
        "version": "3.0",
        "documentType": "unit",
        "categories": [
            {"name": "Content Quality", "criteria": [
                {"name": "direct_answer", "description": "d1", "scoringGuidance": "g1", "bestPractices": ["lead with the answer"]},
                {"name": "readability", "description": "d2", "scoringGuidance": "g2"}
            ]},
            {"name": "Structured Data", "criteria": [
                {"name": "schema_markup", "description": "d3", "scoringGuidance": "g3"}
            ]}
        ],
        "pageTypeRubrics": {"product": {"emphasizedCriteria": ["schema_markup"]}, "blog": {}}
    })");
}

} // namespace

TEST_CASE("RubricStore exposes criteria per page type", "[RubricStore]") {
    auto store = RubricStore::fromDocument(minimalRubric());

    REQUIRE(store->version() == "3.0");
    REQUIRE(store->allCriteriaNames() == std::vector<std::string>{"direct_answer", "readability", "schema_markup"});

    const auto productCriteria = store->criteriaForPageType(PageType::PRODUCT);
    REQUIRE(productCriteria.size() == 3);
    REQUIRE(productCriteria[0].category == "Content Quality");
    REQUIRE(productCriteria[0].bestPractices == std::vector<std::string>{"lead with the answer"});
    REQUIRE_FALSE(productCriteria[0].emphasized);
    REQUIRE(productCriteria[2].emphasized);

    for (const auto& criterion : store->criteriaForPageType(PageType::HOMEPAGE)) {
        REQUIRE_FALSE(criterion.emphasized);
    }

    const auto stats = store->stats();
    REQUIRE(stats.version == "3.0");
    REQUIRE(stats.documentType == "unit");
    REQUIRE(stats.categoryCount == 2);
    REQUIRE(stats.totalCriteria == 3);
    REQUIRE(stats.criteriaByCategory.at("Content Quality") == 2);
    REQUIRE(stats.pageTypes == std::vector<std::string>{"blog", "product"});
}

TEST_CASE("RubricStore validates rubric documents", "[RubricStore]") {
    REQUIRE(RubricStore::validateRubric(minimalRubric()).empty());

    REQUIRE(RubricStore::validateRubric(json::object()) ==
            std::vector<std::string>{"Rubric must have categories array"});

    auto broken = minimalRubric();
    broken["categories"][0].erase("name");
    broken["categories"][1]["criteria"][0].erase("scoringGuidance");
    broken.erase("pageTypeRubrics");
    REQUIRE(RubricStore::validateRubric(broken) == std::vector<std::string>{
        "Category at index 0 missing name",
        "Criterion schema_markup missing scoringGuidance",
        "Rubric should have pageTypeRubrics for page-type-aware scoring"
    });

    REQUIRE_THROWS_AS(RubricStore::fromDocument(broken)->active(), RubricValidationError);

    auto noVersion = minimalRubric();
    noVersion.erase("version");
    REQUIRE(RubricStore::fromDocument(noVersion)->version() == "1.0");
}

TEST_CASE("RubricStore loads from disk and caches until invalidated", "[RubricStore]") {
    const std::string path = "rubric_store_test.json";
    {
        std::ofstream out(path);
        out << minimalRubric().dump();
    }

    RubricStore store(path);
    REQUIRE(store.version() == "3.0");

    auto updated = minimalRubric();
    updated["version"] = "3.1";
    {
        std::ofstream out(path);
        out << updated.dump();
    }
    REQUIRE(store.version() == "3.0");

    store.invalidate();
    REQUIRE(store.version() == "3.1");

    {
        std::ofstream out(path);
        out << "{ not json";
    }
    store.invalidate();
    REQUIRE_THROWS_AS(store.active(), RubricValidationError);

    std::remove(path.c_str());
    REQUIRE_THROWS_AS(RubricStore("missing_rubric.json").active(), ConfigError);
}

TEST_CASE("Shipped default rubric is valid", "[RubricStore]") {
    std::ifstream file(AEO_ENGINE_SOURCE_DIR "/config/default-rubric.json");
    REQUIRE(file.is_open());
    const json document = json::parse(file);
    REQUIRE(RubricStore::validateRubric(document).empty());

    auto store = RubricStore::fromDocument(document);
    REQUIRE(store->stats().totalCriteria == 10);
    REQUIRE(store->stats().pageTypes.size() == 6);

    size_t emphasized = 0;
    for (const auto& criterion : store->criteriaForPageType(PageType::BLOG)) {
        if (criterion.emphasized) {
            ++emphasized;
        }
    }
    REQUIRE(emphasized == 4);
}
