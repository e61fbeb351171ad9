#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace aeo_engine::common {

std::string toLower(const std::string& input);

std::string trim(const std::string& input);

// Collapse runs of whitespace into single spaces and trim the ends
std::string collapseWhitespace(const std::string& input);

bool startsWith(const std::string& value, const std::string& prefix);
bool endsWith(const std::string& value, const std::string& suffix);

bool containsIgnoreCase(const std::string& haystack, const std::string& needle);
bool equalsIgnoreCase(const std::string& a, const std::string& b);

std::vector<std::string> split(const std::string& input, char delimiter);

// Whitespace-separated word count
size_t countWords(const std::string& text);

// Number of UTF-8 code points
size_t utf8Length(const std::string& text);

// Escape a literal for use inside std::regex
std::string escapeRegex(const std::string& literal);

// Current UTC time as ISO-8601 with milliseconds
std::string nowIso8601();

std::string formatIso8601(std::chrono::system_clock::time_point timePoint);

// W3C datetime (sitemap lastmod, schema dates); nullopt when not parseable
std::optional<std::chrono::system_clock::time_point> parseIsoDate(const std::string& value);

} // namespace aeo_engine::common
