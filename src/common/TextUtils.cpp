#include "../../include/aeo_engine/common/TextUtils.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <regex>
#include <sstream>

namespace aeo_engine::common {

std::string toLower(const std::string& input) {
    std::string out = input;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::tolower(c); });
    return out;
}

std::string trim(const std::string& input) {
    const char* whitespace = " \t\r\n\f\v";
    size_t start = input.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = input.find_last_not_of(whitespace);
    return input.substr(start, end - start + 1);
}

std::string collapseWhitespace(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    bool pendingSpace = false;
    for (unsigned char c : input) {
        if (std::isspace(c)) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(static_cast<char>(c));
    }
    return out;
}

bool startsWith(const std::string& value, const std::string& prefix) {
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool containsIgnoreCase(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) {
        return true;
    }
    return toLower(haystack).find(toLower(needle)) != std::string::npos;
}

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::vector<std::string> split(const std::string& input, char delimiter) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream stream(input);
    while (std::getline(stream, current, delimiter)) {
        parts.push_back(current);
    }
    if (!input.empty() && input.back() == delimiter) {
        parts.emplace_back();
    }
    return parts;
}

size_t countWords(const std::string& text) {
    std::istringstream stream(text);
    std::string word;
    size_t count = 0;
    while (stream >> word) {
        ++count;
    }
    return count;
}

size_t utf8Length(const std::string& text) {
    size_t length = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) {
            ++length;
        }
    }
    return length;
}

std::string escapeRegex(const std::string& literal) {
    static const std::string special = R"(\^$.|?*+()[]{})";
    std::string out;
    out.reserve(literal.size() * 2);
    for (char c : literal) {
        if (special.find(c) != std::string::npos) {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

std::string nowIso8601() {
    auto now = std::chrono::system_clock::now();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return ss.str();
}

std::string formatIso8601(std::chrono::system_clock::time_point timePoint) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(timePoint);
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

std::optional<std::chrono::system_clock::time_point> parseIsoDate(const std::string& value) {
    // yyyy-mm-dd[Thh:mm[:ss[.fff]]][Z|+hh:mm]
    static const std::regex pattern(
        R"(^(\d{4})-(\d{2})-(\d{2})(?:[T ](\d{2}):(\d{2})(?::(\d{2})(?:\.\d+)?)?)?\s*(Z|[+-]\d{2}:?\d{2})?$)",
        std::regex::icase);
    std::smatch match;
    const std::string input = trim(value);
    if (!std::regex_match(input, match, pattern)) {
        return std::nullopt;
    }

    std::tm parts{};
    parts.tm_year = std::stoi(match[1].str()) - 1900;
    parts.tm_mon = std::stoi(match[2].str()) - 1;
    parts.tm_mday = std::stoi(match[3].str());
    parts.tm_hour = match[4].matched ? std::stoi(match[4].str()) : 0;
    parts.tm_min = match[5].matched ? std::stoi(match[5].str()) : 0;
    parts.tm_sec = match[6].matched ? std::stoi(match[6].str()) : 0;
    if (parts.tm_mon < 0 || parts.tm_mon > 11 || parts.tm_mday < 1 || parts.tm_mday > 31 ||
        parts.tm_hour > 23 || parts.tm_min > 59 || parts.tm_sec > 60) {
        return std::nullopt;
    }

    long offsetSeconds = 0;
    if (match[7].matched && match[7].str() != "Z" && match[7].str() != "z") {
        std::string zone = match[7].str();
        const int sign = zone[0] == '-' ? -1 : 1;
        zone.erase(std::remove(zone.begin(), zone.end(), ':'), zone.end());
        offsetSeconds = sign * (std::stol(zone.substr(1, 2)) * 3600 + std::stol(zone.substr(3, 2)) * 60);
    }

    std::time_t utcSeconds = timegm(&parts) - offsetSeconds;
    return std::chrono::system_clock::from_time_t(utcSeconds);
}

} // namespace aeo_engine::common
