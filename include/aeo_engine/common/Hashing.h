#pragma once

#include <string>
#include <vector>

namespace aeo_engine::common {

// Lower-case hex SHA-256 of the input (64 characters)
std::string sha256Hex(const std::string& data);

// Digest of several parts joined with "||"
std::string hashMultiple(const std::vector<std::string>& parts);

// First 16 characters of sha256Hex
std::string shortHash(const std::string& data);

// Digest of the cleaned body text
std::string contentHash(const std::string& cleanedText);

// Cache key for AI scores: "ai_score:" + hashMultiple({contentHash, rubricVersion})
std::string aiScoreCacheKey(const std::string& contentHash, const std::string& rubricVersion);

} // namespace aeo_engine::common
