#include "../../include/aeo_engine/extraction/PageTypeClassifier.h"
#include "../../include/aeo_engine/url/UrlCanonicalizer.h"
#include "../../include/aeo_engine/common/Errors.h"
#include "../../include/aeo_engine/common/TextUtils.h"
#include "../../include/Logger.h"

#include <stdexcept>

namespace aeo_engine::extraction {

std::string toString(PageType type) {
    switch (type) {
        case PageType::HOMEPAGE: return "homepage";
        case PageType::PRODUCT: return "product";
        case PageType::SOLUTION: return "solution";
        case PageType::BLOG: return "blog";
        case PageType::RESOURCE: return "resource";
        case PageType::CONVERSION: return "conversion";
    }
    return "resource";
}

PageType pageTypeFromString(const std::string& name) {
    const std::string lowered = common::toLower(common::trim(name));
    for (PageType type : allPageTypes()) {
        if (toString(type) == lowered) {
            return type;
        }
    }
    throw std::invalid_argument("Unknown page type: " + name);
}

const std::vector<PageType>& allPageTypes() {
    static const std::vector<PageType> types = {
        PageType::HOMEPAGE, PageType::PRODUCT, PageType::SOLUTION,
        PageType::BLOG, PageType::RESOURCE, PageType::CONVERSION
    };
    return types;
}

PageTypeClassifier::PageTypeClassifier() : rules_(defaultRules()) {
}

PageTypeClassifier::PageTypeClassifier(std::vector<ClassificationRule> rules) : rules_(std::move(rules)) {
}

std::vector<ClassificationRule> PageTypeClassifier::defaultRules() {
    return {
        {RuleKind::ROOT_PATH, PageType::HOMEPAGE, {}, 0, "root-path"},

        // URL structure is checked before any content heuristic
        {RuleKind::URL_PATTERN, PageType::BLOG,
         {"/blog/", "/blogg/", "/article/", "/post/", "/news/"}, 0, "url:blog"},
        {RuleKind::URL_PATTERN, PageType::PRODUCT,
         {"/product/", "/produkt/", "/shop/", "/buy/", "/item/"}, 0, "url:product"},
        {RuleKind::URL_PATTERN, PageType::SOLUTION,
         {"/solution/", "/løsning/", "/service/", "/tjeneste/", "/feature/"}, 0, "url:solution"},
        {RuleKind::URL_PATTERN, PageType::RESOURCE,
         {"/resource/", "/guide/", "/tutorial/", "/documentation/", "/docs/", "/help/", "/support/", "/faq/"}, 0,
         "url:resource"},
        {RuleKind::URL_PATTERN, PageType::CONVERSION,
         {"/pricing/", "/price/", "/contact/", "/kontakt/", "/signup/", "/register/", "/demo/", "/trial/",
          "/get-started/"}, 0, "url:conversion"},

        {RuleKind::CONTENT_VOTE, PageType::BLOG,
         {"author_present", "publish_date", "byline_language", "byline_markup", "article_element"}, 2,
         "content:blog"},
        {RuleKind::CONTENT_VOTE, PageType::CONVERSION,
         {"conversion_form", "cta_language", "pricing_markup", "cta_markup", "purchase_language"}, 2,
         "content:conversion"},
        {RuleKind::CONTENT_VOTE, PageType::PRODUCT,
         {"product_language", "price_markup", "product_markup", "feature_language", "buy_button"}, 2,
         "content:product"},
        {RuleKind::CONTENT_VOTE, PageType::SOLUTION,
         {"solution_language", "problem_language", "benefit_language", "solution_title"}, 2,
         "content:solution"},
        {RuleKind::CONTENT_VOTE, PageType::RESOURCE,
         {"guide_language", "instruction_language", "faq_style_headings", "faq_section", "download_language"}, 2,
         "content:resource"},
        {RuleKind::CONTENT_VOTE, PageType::HOMEPAGE,
         {"welcome_language", "navigation", "hero_markup", "header_and_footer", "multiple_sections"}, 3,
         "content:homepage"},

        {RuleKind::FALLBACK, PageType::RESOURCE, {}, 0, "fallback"}
    };
}

PageType PageTypeClassifier::classify(const ContentExtraction& extraction) const {
    return classifyWithTrace(extraction).type;
}

ClassificationTrace PageTypeClassifier::classifyWithTrace(const ContentExtraction& extraction) const {
    ClassificationTrace trace;

    std::string path = "/";
    try {
        path = url::parseUrl(extraction.url).path;
    } catch (const common::InvalidUrlError& e) {
        LOG_DEBUG(std::string("Classifying without a URL path: ") + e.what());
        path.clear();
    }

    for (const auto& rule : rules_) {
        bool fired = false;
        switch (rule.kind) {
            case RuleKind::ROOT_PATH:
                fired = !path.empty() && (path == "/" || path.size() <= 3);
                break;
            case RuleKind::URL_PATTERN:
                for (const auto& pattern : rule.patterns) {
                    if (extraction.url.find(pattern) != std::string::npos) {
                        fired = true;
                        break;
                    }
                }
                break;
            case RuleKind::CONTENT_VOTE: {
                size_t votes = 0;
                for (const auto& indicator : rule.patterns) {
                    if (extraction.signals.hasIndicator(indicator)) {
                        ++votes;
                    }
                }
                trace.votes[rule.name] = votes;
                fired = votes >= rule.threshold;
                break;
            }
            case RuleKind::FALLBACK:
                fired = true;
                break;
        }

        if (fired) {
            trace.type = rule.type;
            trace.rule = rule.name;
            LOG_DEBUG("Classified " + extraction.url + " as " + toString(rule.type) + " by rule " + rule.name);
            return trace;
        }
    }

    trace.type = PageType::RESOURCE;
    trace.rule = "fallback";
    return trace;
}

} // namespace aeo_engine::extraction
