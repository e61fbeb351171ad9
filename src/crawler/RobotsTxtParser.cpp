#include "RobotsTxtParser.h"
#include "../../include/aeo_engine/common/TextUtils.h"
#include "../../include/Logger.h"

#include <sstream>

namespace aeo_engine::crawler {

using common::toLower;
using common::trim;

namespace {

std::string pathOf(const std::string& target) {
    size_t schemeEnd = target.find("://");
    if (schemeEnd == std::string::npos) {
        return target.empty() ? "/" : target;
    }
    size_t pathStart = target.find('/', schemeEnd + 3);
    if (pathStart == std::string::npos) {
        size_t queryStart = target.find('?', schemeEnd + 3);
        return queryStart == std::string::npos ? "/" : "/" + target.substr(queryStart);
    }
    std::string path = target.substr(pathStart);
    size_t fragment = path.find('#');
    return fragment == std::string::npos ? path : path.substr(0, fragment);
}

} // namespace

std::string RobotsRules::productToken(const std::string& userAgent) {
    std::string token = toLower(trim(userAgent));
    size_t slash = token.find('/');
    if (slash != std::string::npos) {
        token = token.substr(0, slash);
    }
    return trim(token);
}

std::regex RobotsRules::compilePattern(const std::string& pattern) {
    std::string expression = "^";
    bool anchored = !pattern.empty() && pattern.back() == '$';
    const std::string body = anchored ? pattern.substr(0, pattern.size() - 1) : pattern;
    for (char c : body) {
        if (c == '*') {
            expression += ".*";
        } else {
            expression += common::escapeRegex(std::string(1, c));
        }
    }
    if (anchored) {
        expression += "$";
    }
    return std::regex(expression, std::regex::ECMAScript);
}

RobotsRules RobotsRules::parse(const std::string& content) {
    RobotsRules rules;
    std::istringstream stream(content);
    std::string line;
    Group* current = nullptr;
    bool lastWasAgent = false;

    while (std::getline(stream, line)) {
        size_t comment = line.find('#');
        if (comment != std::string::npos) {
            line = line.substr(0, comment);
        }
        line = trim(line);
        if (line.empty()) {
            continue;
        }

        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            LOG_TRACE("Ignoring robots.txt line without directive: " + line);
            continue;
        }
        // Only the directive is case-insensitive; paths keep their case
        const std::string directive = toLower(trim(line.substr(0, colon)));
        const std::string value = trim(line.substr(colon + 1));

        if (directive == "user-agent") {
            // Consecutive User-agent lines share one group
            if (!lastWasAgent || !current) {
                rules.groups_.emplace_back();
                current = &rules.groups_.back();
            }
            current->agents.push_back(value == "*" ? "*" : productToken(value));
            lastWasAgent = true;
            continue;
        }
        lastWasAgent = false;

        if (directive == "sitemap") {
            // The value may itself contain "://", so take everything after the first colon
            if (!value.empty()) {
                rules.sitemaps_.push_back(value);
            }
            continue;
        }

        if (!current) {
            continue;  // rules before any User-agent line
        }

        if (directive == "allow" || directive == "disallow") {
            if (value.empty()) {
                continue;  // empty Disallow allows everything
            }
            try {
                Rule rule;
                rule.pattern = value;
                rule.allow = directive == "allow";
                rule.regex = compilePattern(value);
                current->rules.push_back(std::move(rule));
            } catch (const std::regex_error& e) {
                LOG_WARNING("Skipping robots.txt pattern '" + value + "': " + e.what());
            }
        } else if (directive == "crawl-delay") {
            try {
                double delay = std::stod(value);
                if (delay >= 0) {
                    current->crawlDelay = delay;
                }
            } catch (const std::exception&) {
                LOG_DEBUG("Invalid Crawl-delay value: " + value);
            }
        }
    }

    LOG_DEBUG("Parsed robots.txt: " + std::to_string(rules.groups_.size()) + " groups, " +
              std::to_string(rules.sitemaps_.size()) + " sitemaps");
    return rules;
}

std::vector<const RobotsRules::Group*> RobotsRules::groupsFor(const std::string& userAgent) const {
    const std::string token = productToken(userAgent);
    std::vector<const Group*> specific;
    std::vector<const Group*> wildcard;
    for (const auto& group : groups_) {
        for (const auto& agent : group.agents) {
            if (agent == "*") {
                wildcard.push_back(&group);
                break;
            }
            if (!token.empty() && agent == token) {
                specific.push_back(&group);
                break;
            }
        }
    }
    return specific.empty() ? wildcard : specific;
}

bool RobotsRules::isAllowed(const std::string& pathAndQuery, const std::string& userAgent) const {
    const std::string path = pathOf(pathAndQuery);
    const Rule* best = nullptr;

    for (const Group* group : groupsFor(userAgent)) {
        for (const auto& rule : group->rules) {
            if (!std::regex_search(path, rule.regex)) {
                continue;
            }
            // Longest pattern wins; Allow wins ties
            if (!best || rule.pattern.size() > best->pattern.size() ||
                (rule.pattern.size() == best->pattern.size() && rule.allow && !best->allow)) {
                best = &rule;
            }
        }
    }
    return !best || best->allow;
}

std::optional<double> RobotsRules::crawlDelay(const std::string& userAgent) const {
    for (const Group* group : groupsFor(userAgent)) {
        if (group->crawlDelay) {
            return group->crawlDelay;
        }
    }
    // Agent group without a delay inherits the wildcard one
    for (const auto& group : groups_) {
        for (const auto& agent : group.agents) {
            if (agent == "*" && group.crawlDelay) {
                return group.crawlDelay;
            }
        }
    }
    return std::nullopt;
}

std::vector<std::string> RobotsRules::disallowedPaths(const std::string& userAgent) const {
    std::vector<std::string> paths;
    for (const Group* group : groupsFor(userAgent)) {
        for (const auto& rule : group->rules) {
            if (!rule.allow) {
                paths.push_back(rule.pattern);
            }
        }
    }
    return paths;
}

} // namespace aeo_engine::crawler
