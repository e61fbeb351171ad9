#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "LlmClient.h"
#include "../extraction/ContentExtraction.h"
#include "../extraction/PageTypeClassifier.h"

namespace aeo_engine::ai {

enum class PreparationMethod {
    STRUCTURED_ONLY,   // context plus the unmodified body
    AI_SUMMARIZED      // context plus an LLM summary of the body
};

std::string toString(PreparationMethod method);

// Page facts that survive summarization; never costs tokens
struct StructuredInfo {
    std::string title;
    std::string metaDescription;
    std::vector<extraction::Heading> headings;       // first 10
    size_t faqCount = 0;
    std::vector<extraction::FaqPair> faqSample;      // first 3
    size_t internalLinksCount = 0;
    size_t outboundLinksCount = 0;
    std::vector<std::string> schemaTypes;
    std::optional<std::string> author;
    std::optional<std::string> datePublished;
    size_t wordCount = 0;
    bool hasCanonical = false;
};

struct PreparedContent {
    std::string content;
    PreparationMethod method = PreparationMethod::STRUCTURED_ONLY;
    std::string structuredContext;
    size_t originalTokens = 0;
    size_t preparedTokens = 0;
    int reductionPercent = 0;
    long long tokensUsed = 0;                // LLM tokens spent on summarization
    bool summaryInputTruncated = false;      // body was longer than the summarizer input cap
};

/**
 * Reduces page content before AI scoring.
 *
 * Bodies at or under the token threshold pass through whole behind the
 * structured context. Larger bodies are replaced by an LLM summary; the
 * reduction is reported and a capped summarizer input is flagged and logged.
 */
class ContentPreparer {
public:
    struct Options {
        size_t thresholdTokens = 1000;
        size_t targetWords = 300;
        size_t maxSummaryInputChars = 10000;
        std::chrono::milliseconds timeout{60000};
    };

    explicit ContentPreparer(std::shared_ptr<LlmClient> llmClient);
    ContentPreparer(std::shared_ptr<LlmClient> llmClient, Options options);

    // Throws LlmServiceError when a needed summary cannot be produced
    PreparedContent prepare(const extraction::ContentExtraction& extraction,
                            const std::string& cleanedText,
                            size_t wordCount,
                            extraction::PageType pageType,
                            bool forceSummarize = false) const;

    static StructuredInfo extractStructuredInfo(const extraction::ContentExtraction& extraction, size_t wordCount);
    static std::string buildContextString(const StructuredInfo& info);
    static std::string buildSummarizationSystemPrompt(size_t targetWords);

    const Options& options() const { return options_; }

private:
    std::shared_ptr<LlmClient> llmClient_;
    Options options_;
};

void to_json(nlohmann::json& j, const PreparedContent& prepared);

} // namespace aeo_engine::ai
