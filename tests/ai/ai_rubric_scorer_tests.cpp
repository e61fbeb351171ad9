#include <catch2/catch_test_macros.hpp>
#include "../../include/aeo_engine/ai/AiRubricScorer.h"
#include "../../include/aeo_engine/common/Errors.h"
#include "../../include/aeo_engine/common/Hashing.h"
#include "../support/FakeLlmClient.h"

using namespace aeo_engine::ai;
using aeo_engine::extraction::PageType;
using aeo_engine::testing::FakeLlmClient;
using nlohmann::json;

namespace {

json testRubric() {
    return json::parse(R"({
        "version": "2.1",
        "documentType": "test-rubric",
        "categories": [
            {"name": "Content Quality", "criteria": [
                {"name": "direct_answer", "description": "Answers up front", "scoringGuidance": "High when answered early"},
                {"name": "question_coverage", "description": "Covers questions", "scoringGuidance": "High with many questions"}
            ]},
            {"name": "Structured Data", "criteria": [
                {"name": "schema_markup", "description": "Has JSON-LD", "scoringGuidance": "High with page-type schema"},
                {"name": "eeat_signals", "description": "Shows authorship", "scoringGuidance": "High with author and dates"}
            ]}
        ],
        "pageTypeRubrics": {
            "blog": {"emphasizedCriteria": ["direct_answer", "question_coverage"]},
            "product": {"emphasizedCriteria": ["schema_markup"]}
        }
    })");
}

const std::string kValidReply = R"({
    "criteriaScores": {"direct_answer": 80, "question_coverage": 70, "schema_markup": 90, "eeat_signals": 60},
    "criteriaExplanations": {"direct_answer": "Opens with a clear two sentence answer."},
    "recommendations": [
        {"category": "question_coverage",
         "text": "The brewing guide never says how long the grounds should steep.",
         "references": ["How to Brew Coffee"],
         "example": {"type": "faq", "content": [{"q": "How long should coffee steep?", "a": "Four minutes."}]}},
        {"category": "internal_linking", "text": "Link the grinder guide.", "references": []}
    ]
})";

ScoringInput makeInput(const std::string& hash = "hash-one") {
    ScoringInput input;
    input.extraction.url = "https://example.com/blog/brew-coffee";
    input.extraction.title = "How to Brew Coffee";
    input.cleanedText = "Use fresh beans and water just off the boil.";
    input.contentHash = hash;
    input.wordCount = 9;
    return input;
}

struct ScorerFixture {
    std::shared_ptr<FakeLlmClient> llm = std::make_shared<FakeLlmClient>();
    std::shared_ptr<RubricStore> rubric = RubricStore::fromDocument(testRubric());
    AiRubricScorer scorer{llm, rubric, std::make_shared<ContentPreparer>(llm)};
};

} // namespace

TEST_CASE("AiRubricScorer overall score is the rounded mean", "[AiRubricScorer]") {
    REQUIRE(AiRubricScorer::calculateOverallScore({{"a", 80}, {"b", 70}, {"c", 90}, {"d", 60}}) == 75);
    REQUIRE(AiRubricScorer::calculateOverallScore({{"d", 60}, {"c", 90}, {"a", 80}, {"b", 70}}) == 75);
    REQUIRE(AiRubricScorer::calculateOverallScore({{"a", 1}, {"b", 2}}) == 2);
    REQUIRE(AiRubricScorer::calculateOverallScore({}) == 0);
}

TEST_CASE("AiRubricScorer scores a page from the model reply", "[AiRubricScorer]") {
    ScorerFixture fixture;
    fixture.llm->reply(kValidReply, 420);

    const AiScoreResult result = fixture.scorer.scorePage(makeInput(), PageType::BLOG);

    REQUIRE(result.pageType == PageType::BLOG);
    REQUIRE(result.criteriaScores.size() == 4);
    REQUIRE(result.overallScore == 75);
    REQUIRE(result.explanations.at("direct_answer") == "Opens with a clear two sentence answer.");
    REQUIRE(result.recommendations.size() == 2);
    REQUIRE(result.recommendations[0].references == std::vector<std::string>{"How to Brew Coffee"});
    REQUIRE(result.recommendations[0].example.has_value());
    REQUIRE((*result.recommendations[0].example)["type"] == "faq");
    REQUIRE_FALSE(result.recommendations[1].example.has_value());
    REQUIRE(result.rubricVersion == "2.1");
    REQUIRE(result.cacheKey == aeo_engine::common::aiScoreCacheKey("hash-one", "2.1"));
    REQUIRE(result.tokensUsed == 420);
    REQUIRE(result.preparationMethod == PreparationMethod::STRUCTURED_ONLY);
    REQUIRE_FALSE(result.fromCache);

    SECTION("Request uses low temperature and structured output") {
        const auto requests = fixture.llm->requests();
        REQUIRE(requests.size() == 1);
        const CompletionRequest& request = requests[0];
        REQUIRE(request.temperature == 0.3);
        REQUIRE(request.maxTokens == 2000);
        REQUIRE(request.structuredOutput);
        REQUIRE(request.messages.size() == 2);
        REQUIRE(request.messages[0].role == "system");
        REQUIRE(request.messages[0].content.find("Rubric Version: 2.1") != std::string::npos);
        REQUIRE(request.messages[1].content.find("Analyze and score this blog page") != std::string::npos);
        REQUIRE(request.messages[1].content.find("- direct_answer [EMPHASIZED]: Answers up front") != std::string::npos);
        REQUIRE(request.messages[1].content.find("- schema_markup: Has JSON-LD") != std::string::npos);
        REQUIRE(request.messages[1].content.find("Main Content:\nUse fresh beans") != std::string::npos);
    }
}

TEST_CASE("AiRubricScorer normalizes scores", "[AiRubricScorer]") {
    const std::vector<std::string> known{"direct_answer", "question_coverage", "schema_markup", "eeat_signals"};

    SECTION("Clamps, rounds, accepts numeric strings and drops unknown criteria") {
        const auto parsed = AiRubricScorer::parseScoringResponse(R"({"criteriaScores": {
            "direct_answer": 140, "question_coverage": "70", "schema_markup": -5,
            "eeat_signals": 66.6, "made_up": 50}})", known);

        REQUIRE(parsed.criteriaScores.size() == 4);
        REQUIRE(parsed.criteriaScores.at("direct_answer") == 100);
        REQUIRE(parsed.criteriaScores.at("question_coverage") == 70);
        REQUIRE(parsed.criteriaScores.at("schema_markup") == 0);
        REQUIRE(parsed.criteriaScores.at("eeat_signals") == 67);
        REQUIRE(parsed.criteriaScores.count("made_up") == 0);
    }

    SECTION("Strips a markdown code fence") {
        const auto parsed = AiRubricScorer::parseScoringResponse(
            "```json\n{\"criteriaScores\": {\"direct_answer\": 55}}\n```", known);
        REQUIRE(parsed.criteriaScores.at("direct_answer") == 55);
    }

    SECTION("Accepts the short explanations key") {
        const auto parsed = AiRubricScorer::parseScoringResponse(
            R"({"criteriaScores": {"direct_answer": 55}, "explanations": {"direct_answer": "Answer is buried."}})", known);
        REQUIRE(parsed.explanations.at("direct_answer") == "Answer is buried.");
    }

    SECTION("Unusable replies are parse errors") {
        REQUIRE_THROWS_AS(AiRubricScorer::parseScoringResponse("I think the page is great", known),
                          aeo_engine::common::AiResponseParseError);
        REQUIRE_THROWS_AS(AiRubricScorer::parseScoringResponse(R"({"scores": {}})", known),
                          aeo_engine::common::AiResponseParseError);
        REQUIRE_THROWS_AS(AiRubricScorer::parseScoringResponse(R"({"criteriaScores": {"made_up": 50}})", known),
                          aeo_engine::common::AiResponseParseError);
        REQUIRE_THROWS_AS(AiRubricScorer::parseScoringResponse(R"({"criteriaScores": {"direct_answer": "high"}})", known),
                          aeo_engine::common::AiResponseParseError);
    }
}

TEST_CASE("AiRubricScorer caches by content hash and rubric version", "[AiRubricScorer]") {
    ScorerFixture fixture;
    fixture.llm->reply(kValidReply);

    const auto first = fixture.scorer.scorePage(makeInput(), PageType::BLOG);
    const auto second = fixture.scorer.scorePage(makeInput(), PageType::BLOG);

    REQUIRE(fixture.llm->callCount() == 1);
    REQUIRE(second.fromCache);
    REQUIRE(second.overallScore == first.overallScore);
    REQUIRE(second.cacheKey == first.cacheKey);
    REQUIRE(fixture.scorer.cacheSize() == 1);

    SECTION("Different content is scored again") {
        fixture.scorer.scorePage(makeInput("hash-two"), PageType::BLOG);
        REQUIRE(fixture.llm->callCount() == 2);
    }

    SECTION("Caching disabled always calls the model") {
        fixture.scorer.scorePage(makeInput(), PageType::BLOG, false);
        REQUIRE(fixture.llm->callCount() == 2);
    }

    SECTION("Empty content hash is derived from the cleaned text") {
        auto input = makeInput("");
        const auto result = fixture.scorer.scorePage(input, PageType::BLOG);
        REQUIRE(result.cacheKey ==
                aeo_engine::common::aiScoreCacheKey(aeo_engine::common::contentHash(input.cleanedText), "2.1"));
    }
}

TEST_CASE("AiRubricScorer rescore bypasses and refreshes the cache", "[AiRubricScorer]") {
    ScorerFixture fixture;
    fixture.llm->reply(kValidReply);
    fixture.llm->reply(R"({"criteriaScores": {"direct_answer": 40, "question_coverage": 40,
                                              "schema_markup": 40, "eeat_signals": 40}})");

    const auto original = fixture.scorer.scorePage(makeInput(), PageType::BLOG);
    const auto rescored = fixture.scorer.rescore(makeInput(), PageType::BLOG);

    REQUIRE(fixture.llm->callCount() == 2);
    REQUIRE(original.overallScore == 75);
    REQUIRE(rescored.overallScore == 40);
    REQUIRE_FALSE(rescored.fromCache);

    const auto cached = fixture.scorer.cachedResult(original.cacheKey);
    REQUIRE(cached.has_value());
    REQUIRE(cached->overallScore == 40);
}

TEST_CASE("AiRubricScorer retries an unparseable reply once", "[AiRubricScorer]") {
    ScorerFixture fixture;

    SECTION("Corrective retry succeeds") {
        fixture.llm->reply("Sure! Here are the scores you asked for.", 80);
        fixture.llm->reply(kValidReply, 120);

        const auto result = fixture.scorer.scorePage(makeInput(), PageType::BLOG);

        REQUIRE(result.overallScore == 75);
        REQUIRE(result.tokensUsed == 200);
        const auto requests = fixture.llm->requests();
        REQUIRE(requests.size() == 2);
        REQUIRE(requests[1].messages.size() == 4);
        REQUIRE(requests[1].messages[2].role == "assistant");
        REQUIRE(requests[1].messages[3].role == "user");
        REQUIRE(requests[1].messages[3].content.find("direct_answer, question_coverage") != std::string::npos);
    }

    SECTION("Second failure is reported") {
        fixture.llm->reply("still not json");

        REQUIRE_THROWS_AS(fixture.scorer.scorePage(makeInput(), PageType::BLOG),
                          aeo_engine::common::AiResponseParseError);
        REQUIRE(fixture.llm->callCount() == 2);
        REQUIRE(fixture.scorer.cacheSize() == 0);
    }

    SECTION("Service errors propagate without retry") {
        fixture.llm->failWith("timeout");

        REQUIRE_THROWS_AS(fixture.scorer.scorePage(makeInput(), PageType::BLOG),
                          aeo_engine::common::LlmServiceError);
        REQUIRE(fixture.llm->callCount() == 1);
    }
}

TEST_CASE("AiRubricScorer summarizes long pages before scoring", "[AiRubricScorer]") {
    auto llm = std::make_shared<FakeLlmClient>();
    llm->setHandler([](const CompletionRequest& request) {
        CompletionResponse response;
        if (request.structuredOutput) {
            response.content = kValidReply;
            response.usage.totalTokens = 300;
        } else {
            response.content = "Coffee brewing summary.";
            response.usage.totalTokens = 50;
        }
        return response;
    });
    ContentPreparer::Options preparerOptions;
    preparerOptions.thresholdTokens = 10;
    AiRubricScorer scorer(llm, RubricStore::fromDocument(testRubric()),
                          std::make_shared<ContentPreparer>(llm, preparerOptions));

    auto input = makeInput();
    input.cleanedText = std::string(400, 'a');

    const auto result = scorer.scorePage(input, PageType::PRODUCT);

    REQUIRE(llm->callCount() == 2);
    REQUIRE(result.preparationMethod == PreparationMethod::AI_SUMMARIZED);
    REQUIRE(result.tokensUsed == 350);
    REQUIRE(result.tokensSavedPercent > 90);
    const auto requests = llm->requests();
    REQUIRE(requests[1].messages[1].content.find("Content Summary:\nCoffee brewing summary.") != std::string::npos);
    REQUIRE(requests[1].messages[1].content.find("- schema_markup [EMPHASIZED]") != std::string::npos);
}

TEST_CASE("AiRubricScorer validates score results", "[AiRubricScorer]") {
    AiScoreResult result;
    result.criteriaScores = {{"direct_answer", 80}};
    result.explanations = {{"direct_answer", "Clear answer in the first paragraph."}};
    result.overallScore = 80;
    result.recommendations.push_back({"direct_answer", "Move the steeping time into the opening paragraph.",
                                      {"Opening paragraph"}, std::nullopt});

    REQUIRE(AiRubricScorer::validateScoreResult(result).valid);

    result.overallScore = 120;
    result.criteriaScores["question_coverage"] = -3;
    result.recommendations.push_back({"authority", "Cite more.", {}, std::nullopt});

    const auto validation = AiRubricScorer::validateScoreResult(result);
    REQUIRE_FALSE(validation.valid);
    REQUIRE(validation.warnings == std::vector<std::string>{
        "Overall score out of range",
        "Criterion question_coverage score out of range",
        "Criterion question_coverage explanation too short",
        "Recommendation 1 too short",
        "Recommendation 1 missing references"
    });
}

TEST_CASE("AiScoreResult serializes for score records", "[AiRubricScorer]") {
    ScorerFixture fixture;
    fixture.llm->reply(kValidReply);

    const json record = fixture.scorer.scorePage(makeInput(), PageType::BLOG);

    REQUIRE(record["pageType"] == "blog");
    REQUIRE(record["overallScore"] == 75);
    REQUIRE(record["criteriaScores"]["schema_markup"] == 90);
    REQUIRE(record["preparationMethod"] == "structured-only");
    REQUIRE(record["recommendations"][0].contains("example"));
    REQUIRE_FALSE(record["recommendations"][1].contains("example"));
}
