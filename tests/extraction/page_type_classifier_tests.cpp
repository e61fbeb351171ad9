#include <catch2/catch_test_macros.hpp>
#include "../../include/aeo_engine/extraction/PageTypeClassifier.h"
#include "../../include/aeo_engine/extraction/ContentExtractor.h"

#include <stdexcept>

using namespace aeo_engine::extraction;

namespace {

ContentExtraction pageAt(const std::string& url, std::vector<std::string> indicators = {}) {
    ContentExtraction extraction;
    extraction.url = url;
    extraction.signals.indicators = std::move(indicators);
    return extraction;
}

} // namespace

TEST_CASE("PageTypeClassifier rule order", "[PageTypeClassifier]") {
    PageTypeClassifier classifier;

    SECTION("Root and very short paths are homepages") {
        REQUIRE(classifier.classify(pageAt("https://example.com/")) == PageType::HOMEPAGE);
        REQUIRE(classifier.classify(pageAt("https://example.com/en")) == PageType::HOMEPAGE);
        REQUIRE(classifier.classifyWithTrace(pageAt("https://example.com/")).rule == "root-path");
    }

    SECTION("URL structure wins over content") {
        auto trace = classifier.classifyWithTrace(
            pageAt("https://example.com/blog/new-grinder", {"product_language", "price_markup", "product_markup"}));
        REQUIRE(trace.type == PageType::BLOG);
        REQUIRE(trace.rule == "url:blog");
        REQUIRE(trace.votes.empty());
    }

    SECTION("Each URL family") {
        REQUIRE(classifier.classify(pageAt("https://example.com/shop/mug")) == PageType::PRODUCT);
        REQUIRE(classifier.classify(pageAt("https://example.com/service/consulting")) == PageType::SOLUTION);
        REQUIRE(classifier.classify(pageAt("https://example.com/docs/setup")) == PageType::RESOURCE);
        REQUIRE(classifier.classify(pageAt("https://example.com/contact/sales")) == PageType::CONVERSION);
    }

    SECTION("Content votes are checked blog first, then conversion") {
        auto trace = classifier.classifyWithTrace(
            pageAt("https://example.com/catalog/grinder-x",
                   {"cta_language", "purchase_language", "product_language", "price_markup"}));
        REQUIRE(trace.type == PageType::CONVERSION);
        REQUIRE(trace.rule == "content:conversion");
        REQUIRE(trace.votes.at("content:blog") == 0);
        REQUIRE(trace.votes.at("content:conversion") == 2);
    }

    SECTION("A single indicator is not enough") {
        auto trace = classifier.classifyWithTrace(pageAt("https://example.com/misc/page", {"article_element"}));
        REQUIRE(trace.type == PageType::RESOURCE);
        REQUIRE(trace.rule == "fallback");
    }

    SECTION("Homepage content needs three indicators") {
        REQUIRE(classifier.classify(pageAt("https://example.com/start-here",
                                           {"welcome_language", "navigation"})) == PageType::RESOURCE);
        REQUIRE(classifier.classify(pageAt("https://example.com/start-here",
                                           {"welcome_language", "navigation", "hero_markup"})) == PageType::HOMEPAGE);
    }
}

TEST_CASE("PageTypeClassifier on extracted product page", "[PageTypeClassifier]") {
    const char* html = R"(<html><head><title>Grinder X</title></head><body><main>
<div class="product-card">
  <h1>Grinder X</h1>
  <p>Specifications and dimensions for the Grinder X burr grinder.</p>
  <span class="price">199</span>
</div>
</main></body></html>)";

    ContentExtractor extractor(2024);
    const auto extraction = extractor.extract(html, "https://example.com/catalog/grinder-x");

    REQUIRE(extraction.signals.hasIndicator("product_markup"));
    REQUIRE(extraction.signals.hasIndicator("price_markup"));
    REQUIRE(PageTypeClassifier().classify(extraction) == PageType::PRODUCT);
}

TEST_CASE("PageTypeClassifier with a custom table", "[PageTypeClassifier]") {
    std::vector<ClassificationRule> rules = {
        {RuleKind::URL_PATTERN, PageType::RESOURCE, {"/kb/"}, 0, "url:kb"},
        {RuleKind::CONTENT_VOTE, PageType::SOLUTION, {"solution_language"}, 1, "content:any-solution"},
        {RuleKind::FALLBACK, PageType::BLOG, {}, 0, "fallback"}
    };
    PageTypeClassifier classifier(rules);

    REQUIRE(classifier.rules().size() == 3);
    // No root rule in this table
    REQUIRE(classifier.classify(pageAt("https://example.com/")) == PageType::BLOG);
    REQUIRE(classifier.classify(pageAt("https://example.com/kb/article")) == PageType::RESOURCE);
    REQUIRE(classifier.classify(pageAt("https://example.com/x", {"solution_language"})) == PageType::SOLUTION);
}

TEST_CASE("Page type names", "[PageTypeClassifier]") {
    REQUIRE(allPageTypes().size() == 6);
    for (PageType type : allPageTypes()) {
        REQUIRE(pageTypeFromString(toString(type)) == type);
    }
    REQUIRE(pageTypeFromString(" Blog ") == PageType::BLOG);
    REQUIRE_THROWS_AS(pageTypeFromString("landing"), std::invalid_argument);
}
