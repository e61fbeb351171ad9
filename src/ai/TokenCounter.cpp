#include "../../include/aeo_engine/ai/TokenCounter.h"
#include "../../include/aeo_engine/common/TextUtils.h"

#include <regex>

namespace aeo_engine::ai {

size_t estimateTokens(const std::string& text) {
    const size_t characters = common::utf8Length(text);
    return (characters + 3) / 4;
}

bool needsSummarization(const std::string& text, size_t thresholdTokens) {
    return estimateTokens(text) > thresholdTokens;
}

std::vector<std::string> chunkContent(const std::string& content, size_t maxTokensPerChunk) {
    static const std::regex paragraphBreak("\n\n+");

    std::vector<std::string> chunks;
    std::string current;
    size_t currentTokens = 0;

    std::sregex_token_iterator it(content.begin(), content.end(), paragraphBreak, -1);
    for (std::sregex_token_iterator end; it != end; ++it) {
        const std::string paragraph = it->str();
        if (paragraph.empty()) {
            continue;
        }
        const size_t paragraphTokens = estimateTokens(paragraph);
        if (!current.empty() && currentTokens + paragraphTokens > maxTokensPerChunk) {
            chunks.push_back(std::move(current));
            current = paragraph;
            currentTokens = paragraphTokens;
        } else {
            if (!current.empty()) {
                current += "\n\n";
            }
            current += paragraph;
            currentTokens += paragraphTokens;
        }
    }
    if (!current.empty()) {
        chunks.push_back(std::move(current));
    }
    return chunks;
}

} // namespace aeo_engine::ai
