#include "../../include/aeo_engine/ai/AiRubricScorer.h"
#include "../../include/aeo_engine/common/Errors.h"
#include "../../include/aeo_engine/common/Hashing.h"
#include "../../include/aeo_engine/common/TextUtils.h"
#include "../../include/Logger.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <set>

namespace aeo_engine::ai {

using nlohmann::json;

namespace {

// Remove a surrounding ``` fence (with or without a language tag)
std::string stripCodeFence(const std::string& content) {
    std::string text = common::trim(content);
    if (!common::startsWith(text, "```")) {
        return text;
    }
    const size_t firstNewline = text.find('\n');
    if (firstNewline == std::string::npos) {
        return text;
    }
    text = text.substr(firstNewline + 1);
    const size_t closing = text.rfind("```");
    if (closing != std::string::npos) {
        text = text.substr(0, closing);
    }
    return common::trim(text);
}

std::optional<double> numericScore(const json& value) {
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        const std::string text = common::trim(value.get<std::string>());
        if (text.empty()) {
            return std::nullopt;
        }
        char* end = nullptr;
        const double parsed = std::strtod(text.c_str(), &end);
        if (end == text.c_str()) {
            return std::nullopt;
        }
        return parsed;
    }
    return std::nullopt;
}

std::string joinNames(const std::vector<std::string>& names) {
    std::string joined;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) joined += ", ";
        joined += names[i];
    }
    return joined;
}

} // namespace

ConcurrencyLimiter::ConcurrencyLimiter(size_t permits)
    : available_(std::max<size_t>(1, permits)) {
}

void ConcurrencyLimiter::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return available_ > 0; });
    --available_;
}

void ConcurrencyLimiter::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++available_;
    }
    cv_.notify_one();
}

AiRubricScorer::AiRubricScorer(std::shared_ptr<LlmClient> llmClient,
                               std::shared_ptr<RubricStore> rubricStore,
                               std::shared_ptr<ContentPreparer> preparer)
    : AiRubricScorer(std::move(llmClient), std::move(rubricStore), std::move(preparer), Options()) {
}

AiRubricScorer::AiRubricScorer(std::shared_ptr<LlmClient> llmClient,
                               std::shared_ptr<RubricStore> rubricStore,
                               std::shared_ptr<ContentPreparer> preparer,
                               Options options)
    : llmClient_(std::move(llmClient))
    , rubricStore_(std::move(rubricStore))
    , preparer_(std::move(preparer))
    , options_(options)
    , limiter_(options.maxConcurrency)
    , cache_(options.cacheTtl) {
    if (!llmClient_) {
        throw common::ConfigError("AI scorer requires an LLM client");
    }
    if (!rubricStore_) {
        throw common::ConfigError("AI scorer requires a rubric store");
    }
    if (!preparer_) {
        preparer_ = std::make_shared<ContentPreparer>(llmClient_);
    }
}

std::string AiRubricScorer::buildScoringPrompt(const std::string& content,
                                               extraction::PageType pageType,
                                               const std::vector<RubricCriterion>& criteria) {
    std::string criteriaList;
    for (size_t i = 0; i < criteria.size(); ++i) {
        if (i > 0) criteriaList += "\n";
        criteriaList += "- " + criteria[i].name + (criteria[i].emphasized ? " [EMPHASIZED]" : "") +
                        ": " + criteria[i].description;
    }

    return "Analyze and score this " + extraction::toString(pageType) +
           " page for Answer Engine Optimization (AEO).\n"
           "\n"
           "Criteria to Evaluate:\n" + criteriaList + "\n"
           "\n"
           "Page Content:\n" + content + "\n"
           "\n"
           "Provide your analysis as JSON with this structure:\n"
           "{\n"
           "  \"criteriaScores\": {\n"
           "    \"direct_answer\": 75,\n"
           "    \"question_coverage\": 80,\n"
           "    ...\n"
           "  },\n"
           "  \"criteriaExplanations\": {\n"
           "    \"direct_answer\": \"Brief explanation of this score\",\n"
           "    ...\n"
           "  },\n"
           "  \"recommendations\": [\n"
           "    {\n"
           "      \"category\": \"question_coverage\",\n"
           "      \"text\": \"Human-sounding recommendation that references specific page content\",\n"
           "      \"references\": [\"Specific element from page\"],\n"
           "      \"example\": {\n"
           "        \"type\": \"faq\",\n"
           "        \"content\": [\n"
           "          {\"q\": \"What is X?\", \"a\": \"X is...\"},\n"
           "          {\"q\": \"How does Y work?\", \"a\": \"Y works by...\"}\n"
           "        ]\n"
           "      }\n"
           "    }\n"
           "  ]\n"
           "}\n"
           "\n"
           "Scoring Guidelines:\n"
           "- Score each criterion 0-100\n"
           "- 0-40: Poor (major improvements needed)\n"
           "- 41-60: Fair (significant improvements recommended)\n"
           "- 61-80: Good (minor improvements suggested)\n"
           "- 81-100: Excellent (well optimized)\n"
           "- Emphasize page-type-appropriate criteria\n"
           "- Recommendations must be concise (2-4 sentences), human-sounding, and reference actual page content\n"
           "- Avoid formulaic patterns like \"Consider adding...\" or \"It would be beneficial to...\"\n"
           "- Be specific and actionable\n"
           "\n"
           "Content Examples:\n"
           "- Include an \"example\" object with each recommendation containing ready-to-use content\n"
           "- Example types available:\n"
           "  * \"faq\": Array of 3-5 Q&A pairs - [{q: \"question\", a: \"answer\"}]\n"
           "  * \"tldr\": 2-3 sentence summary capturing key points\n"
           "  * \"executive_summary\": Professional 1-paragraph overview (3-4 sentences)\n"
           "  * \"table\": {headers: [...], rows: [[...], [...]]} - 3-5 data rows\n"
           "  * \"text\": Improved content snippet showing the enhancement\n"
           "- Omit the example for technical, multimedia and internal linking advice\n"
           "- Examples should be specific to the actual page content and topic";
}

std::string AiRubricScorer::buildScoringSystemPrompt(extraction::PageType pageType,
                                                     const std::string& rubricVersion,
                                                     const std::vector<RubricCriterion>& criteria) {
    return "You are an Answer Engine Optimization (AEO) expert evaluating web pages for their readiness "
           "to appear in AI-powered search results like Google AI Overviews.\n"
           "\n"
           "Page Type: " + extraction::toString(pageType) + "\n"
           "Rubric Version: " + rubricVersion + "\n"
           "\n"
           "Your task is to:\n"
           "1. Analyze the page content against the provided rubric criteria\n"
           "2. Score each criterion from 0-100\n"
           "3. Provide brief, specific explanations for each score\n"
           "4. Generate actionable, human-sounding recommendations that reference actual page content\n"
           "\n"
           "Scoring Guidelines:\n"
           "- 0-40: Poor - Major improvements needed\n"
           "- 41-60: Fair - Significant room for improvement\n"
           "- 61-80: Good - Minor improvements recommended\n"
           "- 81-100: Excellent - Well optimized\n"
           "\n"
           "Rubric Criteria:\n" + json(criteria).dump(2) + "\n"
           "\n"
           "Respond in valid JSON format matching the expected schema.";
}

ParsedScoringResponse AiRubricScorer::parseScoringResponse(const std::string& content,
                                                           const std::vector<std::string>& knownCriteria) {
    const json document = json::parse(stripCodeFence(content), nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        throw common::AiResponseParseError("response is not a JSON object");
    }
    if (!document.contains("criteriaScores") || !document["criteriaScores"].is_object()) {
        throw common::AiResponseParseError("missing criteriaScores object");
    }

    const std::set<std::string> known(knownCriteria.begin(), knownCriteria.end());
    ParsedScoringResponse parsed;

    for (const auto& [criterion, value] : document["criteriaScores"].items()) {
        if (known.count(criterion) == 0) {
            LOG_DEBUG("Dropping score for unknown criterion " + criterion);
            continue;
        }
        const auto score = numericScore(value);
        if (!score || !std::isfinite(*score)) {
            LOG_WARNING("Ignoring non-numeric score for criterion " + criterion + ": " + value.dump());
            continue;
        }
        const double clamped = std::clamp(*score, 0.0, 100.0);
        if (clamped != *score) {
            LOG_WARNING("Clamped score for criterion " + criterion + " from " + value.dump());
        }
        parsed.criteriaScores[criterion] = static_cast<int>(std::lround(clamped));
    }
    if (parsed.criteriaScores.empty()) {
        throw common::AiResponseParseError("no scores for known criteria");
    }

    const char* explanationKey = document.contains("criteriaExplanations") ? "criteriaExplanations" : "explanations";
    if (document.contains(explanationKey) && document[explanationKey].is_object()) {
        for (const auto& [criterion, value] : document[explanationKey].items()) {
            if (value.is_string() && parsed.criteriaScores.count(criterion) > 0) {
                parsed.explanations[criterion] = value.get<std::string>();
            }
        }
    }

    if (document.contains("recommendations") && document["recommendations"].is_array()) {
        for (const auto& item : document["recommendations"]) {
            if (!item.is_object() || !item.contains("text") || !item["text"].is_string()) {
                continue;
            }
            AiRecommendation recommendation;
            recommendation.text = item["text"].get<std::string>();
            if (item.contains("category") && item["category"].is_string()) {
                recommendation.category = item["category"].get<std::string>();
            }
            if (item.contains("references") && item["references"].is_array()) {
                for (const auto& reference : item["references"]) {
                    if (reference.is_string()) {
                        recommendation.references.push_back(reference.get<std::string>());
                    }
                }
            }
            if (item.contains("example") && item["example"].is_object()) {
                recommendation.example = item["example"];
            }
            parsed.recommendations.push_back(std::move(recommendation));
        }
    }
    return parsed;
}

int AiRubricScorer::calculateOverallScore(const std::map<std::string, int>& criteriaScores) {
    if (criteriaScores.empty()) {
        return 0;
    }
    double sum = 0.0;
    for (const auto& [criterion, score] : criteriaScores) {
        sum += score;
    }
    return static_cast<int>(std::lround(sum / static_cast<double>(criteriaScores.size())));
}

ScoreValidation AiRubricScorer::validateScoreResult(const AiScoreResult& result) {
    ScoreValidation validation;

    if (result.overallScore < 0 || result.overallScore > 100) {
        validation.warnings.push_back("Overall score out of range");
    }
    for (const auto& [criterion, score] : result.criteriaScores) {
        if (score < 0 || score > 100) {
            validation.warnings.push_back("Criterion " + criterion + " score out of range");
        }
        auto explanation = result.explanations.find(criterion);
        if (explanation == result.explanations.end() || common::trim(explanation->second).size() < 10) {
            validation.warnings.push_back("Criterion " + criterion + " explanation too short");
        }
    }
    for (size_t i = 0; i < result.recommendations.size(); ++i) {
        const auto& recommendation = result.recommendations[i];
        if (recommendation.text.size() < 20) {
            validation.warnings.push_back("Recommendation " + std::to_string(i) + " too short");
        }
        if (recommendation.references.empty()) {
            validation.warnings.push_back("Recommendation " + std::to_string(i) + " missing references");
        }
    }

    validation.valid = validation.warnings.empty();
    return validation;
}

AiScoreResult AiRubricScorer::scorePage(const ScoringInput& input, extraction::PageType pageType, bool useCache) {
    const std::string rubricVersion = rubricStore_->version();
    const std::string contentHash = input.contentHash.empty() ? common::contentHash(input.cleanedText)
                                                              : input.contentHash;
    const std::string cacheKey = common::aiScoreCacheKey(contentHash, rubricVersion);

    if (useCache) {
        if (auto cached = cache_.get(cacheKey)) {
            LOG_DEBUG("AI score cache hit for " + input.extraction.url);
            AiScoreResult result = *cached;
            result.fromCache = true;
            return result;
        }
    }

    const auto criteria = rubricStore_->criteriaForPageType(pageType);
    std::vector<std::string> criteriaNames;
    for (const auto& criterion : criteria) {
        criteriaNames.push_back(criterion.name);
    }

    ConcurrencyLimiter::Permit permit(limiter_);

    const PreparedContent prepared = preparer_->prepare(input.extraction, input.cleanedText,
                                                        input.wordCount, pageType);

    CompletionRequest request;
    request.messages = {
        {"system", buildScoringSystemPrompt(pageType, rubricVersion, criteria)},
        {"user", buildScoringPrompt(prepared.content, pageType, criteria)}
    };
    request.maxTokens = options_.maxTokens;
    request.temperature = options_.temperature;
    request.structuredOutput = true;
    request.timeout = options_.timeout;

    long long tokensUsed = prepared.tokensUsed;
    CompletionResponse response = llmClient_->complete(request);
    tokensUsed += response.usage.totalTokens;

    ParsedScoringResponse parsed;
    try {
        parsed = parseScoringResponse(response.content, criteriaNames);
    } catch (const common::AiResponseParseError& e) {
        LOG_WARNING("Retrying AI scoring for " + input.extraction.url + ": " + e.what());
        request.messages.push_back({"assistant", response.content});
        request.messages.push_back({"user",
            std::string("Your previous reply could not be used (") + e.what() + "). "
            "Reply again with only a JSON object containing criteriaScores, criteriaExplanations and "
            "recommendations. Score these criteria with integers from 0 to 100: " + joinNames(criteriaNames) + "."});

        response = llmClient_->complete(request);
        tokensUsed += response.usage.totalTokens;
        parsed = parseScoringResponse(response.content, criteriaNames);
    }

    AiScoreResult result;
    result.pageType = pageType;
    result.criteriaScores = std::move(parsed.criteriaScores);
    result.explanations = std::move(parsed.explanations);
    result.recommendations = std::move(parsed.recommendations);
    result.overallScore = calculateOverallScore(result.criteriaScores);
    result.cacheKey = cacheKey;
    result.tokensUsed = tokensUsed;
    result.rubricVersion = rubricVersion;
    result.preparationMethod = prepared.method;
    result.tokensSavedPercent = prepared.reductionPercent;

    const auto validation = validateScoreResult(result);
    for (const auto& warning : validation.warnings) {
        LOG_DEBUG("AI score for " + input.extraction.url + ": " + warning);
    }

    cache_.put(cacheKey, result);
    LOG_INFO("AI scored " + input.extraction.url + " as " + extraction::toString(pageType) + ": " +
             std::to_string(result.overallScore) + " (" + std::to_string(tokensUsed) + " tokens)");
    return result;
}

AiScoreResult AiRubricScorer::rescore(const ScoringInput& input, extraction::PageType pageType) {
    return scorePage(input, pageType, false);
}

std::optional<AiScoreResult> AiRubricScorer::cachedResult(const std::string& cacheKey) const {
    return cache_.get(cacheKey);
}

void AiRubricScorer::clearCache() {
    cache_.clear();
}

size_t AiRubricScorer::cacheSize() const {
    return cache_.size();
}

void to_json(json& j, const AiRecommendation& recommendation) {
    j = json{
        {"category", recommendation.category},
        {"text", recommendation.text},
        {"references", recommendation.references}
    };
    if (recommendation.example) {
        j["example"] = *recommendation.example;
    }
}

void to_json(json& j, const AiScoreResult& result) {
    j = json{
        {"pageType", extraction::toString(result.pageType)},
        {"overallScore", result.overallScore},
        {"criteriaScores", result.criteriaScores},
        {"explanations", result.explanations},
        {"recommendations", result.recommendations},
        {"cacheKey", result.cacheKey},
        {"tokensUsed", result.tokensUsed},
        {"rubricVersion", result.rubricVersion},
        {"preparationMethod", toString(result.preparationMethod)},
        {"tokensSavedPercent", result.tokensSavedPercent},
        {"fromCache", result.fromCache}
    };
}

} // namespace aeo_engine::ai
