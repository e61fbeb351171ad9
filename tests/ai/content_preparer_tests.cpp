#include <catch2/catch_test_macros.hpp>
#include "../../include/aeo_engine/ai/ContentPreparer.h"
#include "../../include/aeo_engine/ai/TokenCounter.h"
#include "../../include/aeo_engine/common/Errors.h"
#include "../support/FakeLlmClient.h"

using namespace aeo_engine::ai;
using aeo_engine::extraction::ContentExtraction;
using aeo_engine::extraction::PageType;
using aeo_engine::testing::FakeLlmClient;

namespace {

ContentExtraction sampleExtraction() {
    ContentExtraction extraction;
    extraction.url = "https://example.com/guides/espresso";
    extraction.title = "Espresso Guide";
    extraction.metaDescription = "Pull better shots at home.";
    extraction.headings = {{1, "Espresso Guide"}, {2, "What grind size works?"}};
    extraction.faq = {{"How hot should the water be?", "About 93C."}};
    extraction.internalLinks = {{"https://example.com/guides/grinders", "Grinders"}};
    extraction.schemaTypes = {"Article", "FAQPage"};
    return extraction;
}

} // namespace

TEST_CASE("Token estimation", "[TokenCounter]") {
    REQUIRE(estimateTokens("") == 0);
    REQUIRE(estimateTokens("abc") == 1);
    REQUIRE(estimateTokens("abcd") == 1);
    REQUIRE(estimateTokens("abcde") == 2);
    // Code points, not bytes
    REQUIRE(estimateTokens("\xC3\xA6\xC3\xB8\xC3\xA5\xC3\xA6") == 1);

    REQUIRE(needsSummarization(std::string(4004, 'x'), 1000));
    REQUIRE_FALSE(needsSummarization(std::string(4000, 'x'), 1000));

    SECTION("Chunking keeps paragraphs together") {
        const std::string content = std::string(40, 'a') + "\n\n" + std::string(40, 'b') + "\n\n\n" + std::string(40, 'c');
        const auto chunks = chunkContent(content, 20);
        REQUIRE(chunks.size() == 2);
        REQUIRE(chunks[0] == std::string(40, 'a') + "\n\n" + std::string(40, 'b'));
        REQUIRE(chunks[1] == std::string(40, 'c'));
        REQUIRE(chunkContent("", 20).empty());
    }
}

TEST_CASE("ContentPreparer builds the structured context", "[ContentPreparer]") {
    const auto info = ContentPreparer::extractStructuredInfo(sampleExtraction(), 812);
    REQUIRE(info.faqCount == 1);
    REQUIRE(info.internalLinksCount == 1);
    REQUIRE(info.wordCount == 812);
    REQUIRE_FALSE(info.hasCanonical);

    REQUIRE(ContentPreparer::buildContextString(info) ==
            "Title: Espresso Guide\n"
            "Meta: Pull better shots at home.\n"
            "Headings: Espresso Guide (H1), What grind size works? (H2)\n"
            "FAQs: How hot should the water be?\n"
            "Schema: Article, FAQPage\n"
            "Links: 1 internal, 0 external\n"
            "Words: 812");

    REQUIRE(ContentPreparer::buildContextString(StructuredInfo{}) == "Links: 0 internal, 0 external\nWords: 0");
}

TEST_CASE("ContentPreparer reduces content before scoring", "[ContentPreparer]") {
    auto llm = std::make_shared<FakeLlmClient>();
    ContentPreparer::Options options;
    options.thresholdTokens = 50;
    options.targetWords = 120;
    options.maxSummaryInputChars = 1000;
    ContentPreparer preparer(llm, options);

    SECTION("Short content passes through without an LLM call") {
        const auto prepared = preparer.prepare(sampleExtraction(), "Grind fine and tamp evenly.", 5, PageType::RESOURCE);

        REQUIRE(prepared.method == PreparationMethod::STRUCTURED_ONLY);
        REQUIRE(prepared.content.find("Main Content:\nGrind fine and tamp evenly.") != std::string::npos);
        REQUIRE(prepared.content.rfind("Title: Espresso Guide", 0) == 0);
        REQUIRE(prepared.tokensUsed == 0);
        REQUIRE(prepared.reductionPercent == 0);
        REQUIRE(llm->callCount() == 0);
    }

    SECTION("Long content is summarized") {
        llm->reply("Espresso needs fine grind and 93C water!", 75);
        const std::string body(800, 'e');

        const auto prepared = preparer.prepare(sampleExtraction(), body, 1, PageType::RESOURCE);

        REQUIRE(prepared.method == PreparationMethod::AI_SUMMARIZED);
        REQUIRE(prepared.originalTokens == 200);
        REQUIRE(prepared.content.find("Content Summary:\nEspresso needs fine grind and 93C water!") != std::string::npos);
        REQUIRE(prepared.tokensUsed == 75);
        // 200 tokens down to 10
        REQUIRE(prepared.reductionPercent == 95);
        REQUIRE_FALSE(prepared.summaryInputTruncated);

        const auto request = llm->requests().at(0);
        REQUIRE(request.maxTokens == 240);
        REQUIRE(request.temperature == 0.3);
        REQUIRE(request.messages[0].content.find("Target length: ~120 words") != std::string::npos);
        REQUIRE(request.messages[1].content.rfind("Page Type: resource\n\nStructured Context:\nTitle: Espresso Guide", 0) == 0);
    }

    SECTION("Oversized summarizer input is capped and flagged") {
        llm->reply("Summary.");
        const std::string body(3000, 'x');

        const auto prepared = preparer.prepare(sampleExtraction(), body, 1, PageType::RESOURCE);

        REQUIRE(prepared.summaryInputTruncated);
        const std::string userPrompt = llm->requests().at(0).messages[1].content;
        REQUIRE(userPrompt.find(std::string(1000, 'x')) != std::string::npos);
        REQUIRE(userPrompt.find(std::string(1001, 'x')) == std::string::npos);
    }

    SECTION("Forced summarization of short content") {
        llm->reply("Tiny.");
        const auto prepared = preparer.prepare(sampleExtraction(), "Short.", 1, PageType::BLOG, true);
        REQUIRE(prepared.method == PreparationMethod::AI_SUMMARIZED);
    }

    SECTION("An empty summary is an error") {
        llm->reply("");
        REQUIRE_THROWS_AS(preparer.prepare(sampleExtraction(), std::string(800, 'e'), 1, PageType::BLOG),
                          aeo_engine::common::LlmServiceError);
    }

    SECTION("Summarization without a client is an error") {
        ContentPreparer offline(nullptr, options);
        REQUIRE_THROWS_AS(offline.prepare(sampleExtraction(), std::string(800, 'e'), 1, PageType::BLOG),
                          aeo_engine::common::LlmServiceError);
    }
}
