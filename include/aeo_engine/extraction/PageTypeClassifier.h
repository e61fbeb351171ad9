#pragma once

#include <map>
#include <string>
#include <vector>
#include "ContentExtraction.h"

namespace aeo_engine::extraction {

enum class PageType {
    HOMEPAGE,
    PRODUCT,
    SOLUTION,
    BLOG,
    RESOURCE,
    CONVERSION
};

std::string toString(PageType type);
// Throws std::invalid_argument for names outside the closed set
PageType pageTypeFromString(const std::string& name);
const std::vector<PageType>& allPageTypes();

enum class RuleKind {
    ROOT_PATH,      // "/" or a path of at most three characters
    URL_PATTERN,    // any pattern is a substring of the URL
    CONTENT_VOTE,   // at least `threshold` named indicators are present
    FALLBACK
};

struct ClassificationRule {
    RuleKind kind = RuleKind::FALLBACK;
    PageType type = PageType::RESOURCE;
    std::vector<std::string> patterns;    // URL_PATTERN: substrings, CONTENT_VOTE: indicator names
    size_t threshold = 0;
    std::string name;
};

struct ClassificationTrace {
    PageType type = PageType::RESOURCE;
    std::string rule;
    // Indicator votes per content rule that was evaluated
    std::map<std::string, size_t> votes;
};

/**
 * Rule-based page type detection.
 *
 * Rules are evaluated in table order and the first that fires wins: the root
 * path rule, then URL patterns (blog, product, solution, resource, conversion),
 * then content votes (blog, conversion, product, solution, resource, homepage),
 * then the resource fallback.
 */
class PageTypeClassifier {
public:
    PageTypeClassifier();
    explicit PageTypeClassifier(std::vector<ClassificationRule> rules);

    PageType classify(const ContentExtraction& extraction) const;
    ClassificationTrace classifyWithTrace(const ContentExtraction& extraction) const;

    const std::vector<ClassificationRule>& rules() const { return rules_; }

    static std::vector<ClassificationRule> defaultRules();

private:
    std::vector<ClassificationRule> rules_;
};

} // namespace aeo_engine::extraction
