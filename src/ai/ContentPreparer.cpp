#include "../../include/aeo_engine/ai/ContentPreparer.h"
#include "../../include/aeo_engine/ai/TokenCounter.h"
#include "../../include/aeo_engine/common/Errors.h"
#include "../../include/Logger.h"

#include <algorithm>
#include <cmath>

namespace aeo_engine::ai {

namespace {

// Largest prefix of at most maxBytes that does not split a UTF-8 sequence
std::string utf8Prefix(const std::string& text, size_t maxBytes) {
    if (text.size() <= maxBytes) {
        return text;
    }
    size_t cut = maxBytes;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return text.substr(0, cut);
}

} // namespace

std::string toString(PreparationMethod method) {
    return method == PreparationMethod::AI_SUMMARIZED ? "ai-summarized" : "structured-only";
}

ContentPreparer::ContentPreparer(std::shared_ptr<LlmClient> llmClient)
    : ContentPreparer(std::move(llmClient), Options()) {
}

ContentPreparer::ContentPreparer(std::shared_ptr<LlmClient> llmClient, Options options)
    : llmClient_(std::move(llmClient)), options_(options) {
}

StructuredInfo ContentPreparer::extractStructuredInfo(const extraction::ContentExtraction& extraction, size_t wordCount) {
    StructuredInfo info;
    info.title = extraction.title;
    info.metaDescription = extraction.metaDescription;
    info.headings.assign(extraction.headings.begin(),
                         extraction.headings.begin() + std::min<size_t>(10, extraction.headings.size()));
    info.faqCount = extraction.faq.size();
    info.faqSample.assign(extraction.faq.begin(), extraction.faq.begin() + std::min<size_t>(3, extraction.faq.size()));
    info.internalLinksCount = extraction.internalLinks.size();
    info.outboundLinksCount = extraction.outboundLinks.size();
    info.schemaTypes = extraction.schemaTypes;
    info.author = extraction.author;
    info.datePublished = extraction.datePublished;
    info.wordCount = wordCount;
    info.hasCanonical = !extraction.canonicalUrl.empty();
    return info;
}

std::string ContentPreparer::buildContextString(const StructuredInfo& info) {
    std::vector<std::string> parts;

    if (!info.title.empty()) {
        parts.push_back("Title: " + info.title);
    }
    if (!info.metaDescription.empty()) {
        parts.push_back("Meta: " + info.metaDescription);
    }
    if (!info.headings.empty()) {
        std::string line = "Headings: ";
        for (size_t i = 0; i < info.headings.size(); ++i) {
            if (i > 0) line += ", ";
            line += info.headings[i].text + " (H" + std::to_string(info.headings[i].level) + ")";
        }
        parts.push_back(line);
    }
    if (!info.faqSample.empty()) {
        std::string line = "FAQs: ";
        for (size_t i = 0; i < info.faqSample.size(); ++i) {
            if (i > 0) line += "; ";
            line += info.faqSample[i].question;
        }
        parts.push_back(line);
    }
    if (!info.schemaTypes.empty()) {
        std::string line = "Schema: ";
        for (size_t i = 0; i < info.schemaTypes.size(); ++i) {
            if (i > 0) line += ", ";
            line += info.schemaTypes[i];
        }
        parts.push_back(line);
    }
    parts.push_back("Links: " + std::to_string(info.internalLinksCount) + " internal, " +
                    std::to_string(info.outboundLinksCount) + " external");
    parts.push_back("Words: " + std::to_string(info.wordCount));

    std::string context;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) context += "\n";
        context += parts[i];
    }
    return context;
}

std::string ContentPreparer::buildSummarizationSystemPrompt(size_t targetWords) {
    return "You are a content summarization expert. Your task is to create concise, accurate summaries of web page content.\n"
           "\n"
           "Guidelines:\n"
           "- Preserve key facts, entities, and concepts\n"
           "- Maintain technical accuracy\n"
           "- Focus on main topics and themes\n"
           "- Remove boilerplate, navigation, ads\n"
           "- Target length: ~" + std::to_string(targetWords) + " words\n"
           "- Use clear, professional language\n"
           "\n"
           "Output only the summary text, no additional commentary.";
}

PreparedContent ContentPreparer::prepare(const extraction::ContentExtraction& extraction,
                                         const std::string& cleanedText,
                                         size_t wordCount,
                                         extraction::PageType pageType,
                                         bool forceSummarize) const {
    PreparedContent prepared;
    const StructuredInfo info = extractStructuredInfo(extraction, wordCount);
    prepared.structuredContext = buildContextString(info);
    prepared.originalTokens = estimateTokens(cleanedText);

    if (!forceSummarize && prepared.originalTokens <= options_.thresholdTokens) {
        prepared.method = PreparationMethod::STRUCTURED_ONLY;
        prepared.content = prepared.structuredContext + "\n\nMain Content:\n" + cleanedText;
        prepared.preparedTokens = estimateTokens(prepared.content);
        LOG_DEBUG("Prepared " + extraction.url + " without summarization (" +
                  std::to_string(prepared.originalTokens) + " tokens)");
        return prepared;
    }

    if (!llmClient_) {
        throw common::LlmServiceError("Content summarization failed: no LLM client configured");
    }

    std::string summaryInput = utf8Prefix(cleanedText, options_.maxSummaryInputChars);
    if (summaryInput.size() < cleanedText.size()) {
        prepared.summaryInputTruncated = true;
        LOG_WARNING("Summarizer input for " + extraction.url + " capped at " + std::to_string(summaryInput.size()) +
                    " of " + std::to_string(cleanedText.size()) + " bytes");
    }

    CompletionRequest request;
    request.messages = {
        {"system", buildSummarizationSystemPrompt(options_.targetWords)},
        {"user", "Page Type: " + extraction::toString(pageType) + "\n\n" +
                 "Structured Context:\n" + prepared.structuredContext + "\n\n" +
                 "Full Content to Summarize:\n" + summaryInput}
    };
    request.maxTokens = static_cast<int>(std::min<size_t>(800, options_.targetWords * 2));
    request.temperature = 0.3;
    request.timeout = options_.timeout;

    const CompletionResponse response = llmClient_->complete(request);
    if (response.content.empty()) {
        throw common::LlmServiceError("Content summarization failed: empty summary");
    }

    const size_t summaryTokens = estimateTokens(response.content);
    prepared.method = PreparationMethod::AI_SUMMARIZED;
    prepared.content = prepared.structuredContext + "\n\nContent Summary:\n" + response.content;
    prepared.preparedTokens = estimateTokens(prepared.content);
    prepared.tokensUsed = response.usage.totalTokens;
    if (prepared.originalTokens > 0) {
        const double reduction = (static_cast<double>(prepared.originalTokens) - static_cast<double>(summaryTokens)) /
                                 static_cast<double>(prepared.originalTokens) * 100.0;
        prepared.reductionPercent = static_cast<int>(std::lround(reduction));
    }

    LOG_INFO("Summarized " + extraction.url + ": " + std::to_string(prepared.originalTokens) + " -> " +
             std::to_string(summaryTokens) + " tokens (" + std::to_string(prepared.reductionPercent) + "% reduction)");
    return prepared;
}

void to_json(nlohmann::json& j, const PreparedContent& prepared) {
    j = nlohmann::json{
        {"method", toString(prepared.method)},
        {"originalTokens", prepared.originalTokens},
        {"preparedTokens", prepared.preparedTokens},
        {"reductionPercent", prepared.reductionPercent},
        {"tokensUsed", prepared.tokensUsed},
        {"summaryInputTruncated", prepared.summaryInputTruncated}
    };
}

} // namespace aeo_engine::ai
