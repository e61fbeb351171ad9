#pragma once

#include <string>
#include <vector>

namespace aeo_engine::ai {

// Rough token estimate: one token per four characters, rounded up
size_t estimateTokens(const std::string& text);

bool needsSummarization(const std::string& text, size_t thresholdTokens);

// Splits on blank lines into chunks of at most maxTokensPerChunk estimated tokens.
// A single paragraph larger than the limit becomes its own chunk.
std::vector<std::string> chunkContent(const std::string& content, size_t maxTokensPerChunk = 2000);

} // namespace aeo_engine::ai
