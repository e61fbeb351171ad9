#pragma once

#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace aeo_engine::crawler {

// Parsed robots.txt. Immutable after parse(), so it can be shared between threads.
class RobotsRules {
public:
    static RobotsRules parse(const std::string& content);

    // `pathAndQuery` is the URL path (with query) or a full URL
    bool isAllowed(const std::string& pathAndQuery, const std::string& userAgent) const;

    // Crawl-delay of the agent's group, else of the wildcard group
    std::optional<double> crawlDelay(const std::string& userAgent) const;

    // Disallow patterns that apply to the agent, in file order
    std::vector<std::string> disallowedPaths(const std::string& userAgent) const;

    const std::vector<std::string>& sitemaps() const { return sitemaps_; }

    // Lower-cased product token: "AEO-Platform-Bot/1.0" -> "aeo-platform-bot"
    static std::string productToken(const std::string& userAgent);

private:
    struct Rule {
        std::string pattern;
        bool allow = false;
        std::regex regex;
    };

    struct Group {
        std::vector<std::string> agents;  // product tokens, "*" for wildcard
        std::vector<Rule> rules;
        std::optional<double> crawlDelay;
    };

    // Groups naming the agent explicitly, else the wildcard groups
    std::vector<const Group*> groupsFor(const std::string& userAgent) const;

    static std::regex compilePattern(const std::string& pattern);

    std::vector<Group> groups_;
    std::vector<std::string> sitemaps_;
};

} // namespace aeo_engine::crawler
