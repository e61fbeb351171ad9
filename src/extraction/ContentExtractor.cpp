#include "../../include/aeo_engine/extraction/ContentExtractor.h"
#include "../../include/aeo_engine/extraction/HtmlDocument.h"
#include "../../include/aeo_engine/url/UrlCanonicalizer.h"
#include "../../include/aeo_engine/common/TextUtils.h"
#include "../../include/Logger.h"
#include "JsonLd.h"
#include "PageSignalDetector.h"

#include <algorithm>
#include <ctime>
#include <regex>
#include <set>

namespace aeo_engine::extraction {

using common::collapseWhitespace;
using common::trim;

namespace {

const char* kMainContentSelectors[] = {
    "main",
    "article",
    "[role=\"main\"]",
    "#content",
    "#main-content",
    ".content",
    ".main-content",
    "body"
};

const char* kAuthorSelectors[] = {
    "meta[name=\"author\"]",
    "meta[property=\"article:author\"]",
    "[rel=\"author\"]",
    ".author",
    "[class*=\"author\"]",
    "[itemprop=\"author\"]"
};

const char* kPublishDateMetaSelectors[] = {
    "meta[property=\"article:published_time\"]",
    "meta[name=\"publication_date\"]",
    "meta[name=\"date\"]",
    "time[datetime]",
    "[itemprop=\"datePublished\"]"
};

int currentYear() {
    std::time_t now = std::time(nullptr);
    std::tm utc{};
    gmtime_r(&now, &utc);
    return utc.tm_year + 1900;
}

bool hasMatchingAncestor(const GumboNode* node, const Selector& selector) {
    for (const GumboNode* parent = node->parent; parent; parent = parent->parent) {
        if (HtmlDocument::isElement(parent) && selector.matches(parent)) {
            return true;
        }
    }
    return false;
}

std::optional<std::string> firstMatch(const std::string& text, const std::vector<std::regex>& patterns) {
    for (const auto& pattern : patterns) {
        std::smatch match;
        if (std::regex_search(text, match, pattern)) {
            return match.str(0);
        }
    }
    return std::nullopt;
}

} // namespace

ContentExtractor::ContentExtractor(int referenceYear)
    : referenceYear_(referenceYear > 0 ? referenceYear : currentYear()) {
}

ContentExtraction ContentExtractor::extract(const std::string& html, const std::string& pageUrl) const {
    // Validates the URL up front; link resolution and isHttps depend on it
    url::parseUrl(pageUrl);

    HtmlDocument document(html);
    JsonLdDocument jsonLd(document);

    ContentExtraction extraction;
    extraction.url = pageUrl;
    extraction.title = extractTitle(document);
    extraction.metaDescription = extractMetaDescription(document);
    extraction.canonicalUrl = extractCanonicalUrl(document, pageUrl);
    extraction.headings = extractHeadings(document);
    extraction.body = extractBodyText(document);

    // Structured data first, then DOM patterns
    extraction.faq = jsonLd.faqPairs();
    std::set<std::pair<std::string, std::string>> seenPairs;
    for (const auto& pair : extraction.faq) {
        seenPairs.insert({pair.question, pair.answer});
    }
    for (auto& pair : extractDomFaq(document)) {
        if (seenPairs.insert({pair.question, pair.answer}).second) {
            extraction.faq.push_back(std::move(pair));
        }
    }

    extractLinks(document, pageUrl, extraction);
    extraction.schemaTypes = jsonLd.allTypes();

    extraction.author = extractAuthor(document);
    if (!extraction.author) {
        extraction.author = jsonLd.author();
    }

    PageSignalDetector detector(document, jsonLd, referenceYear_);
    extraction.signals = detector.detect(extraction);

    extraction.datePublished = extractMetaPublishDate(document);
    if (!extraction.datePublished) {
        extraction.datePublished = jsonLd.firstString("datePublished");
    }
    if (!extraction.datePublished) {
        extraction.datePublished = extraction.signals.publishDate;
    }

    LOG_DEBUG("Extracted " + pageUrl + ": " + std::to_string(extraction.headings.size()) + " headings, " +
              std::to_string(extraction.faq.size()) + " FAQ pairs, " +
              std::to_string(extraction.internalLinks.size()) + " internal / " +
              std::to_string(extraction.outboundLinks.size()) + " outbound links, " +
              std::to_string(extraction.schemaTypes.size()) + " schema types");
    return extraction;
}

std::string ContentExtractor::extractTitle(const HtmlDocument& document) const {
    const GumboNode* ogTitle = document.selectFirst("meta[property=\"og:title\"]");
    std::string title = ogTitle ? trim(HtmlDocument::attribute(ogTitle, "content")) : "";
    if (title.empty()) {
        title = document.title();
    }
    return title;
}

std::string ContentExtractor::extractMetaDescription(const HtmlDocument& document) const {
    const GumboNode* ogDescription = document.selectFirst("meta[property=\"og:description\"]");
    std::string description = ogDescription ? trim(HtmlDocument::attribute(ogDescription, "content")) : "";
    if (description.empty()) {
        const GumboNode* meta = document.selectFirst("meta[name=\"description\"]");
        description = meta ? trim(HtmlDocument::attribute(meta, "content")) : "";
    }
    return description;
}

std::string ContentExtractor::extractCanonicalUrl(const HtmlDocument& document, const std::string& pageUrl) const {
    std::string hint;
    if (const GumboNode* link = document.selectFirst("link[rel=\"canonical\"]")) {
        hint = trim(HtmlDocument::attribute(link, "href"));
    }
    if (hint.empty()) {
        if (const GumboNode* ogUrl = document.selectFirst("meta[property=\"og:url\"]")) {
            hint = trim(HtmlDocument::attribute(ogUrl, "content"));
        }
    }
    if (hint.empty()) {
        return pageUrl;
    }
    return url::resolveReference(pageUrl, hint).value_or(hint);
}

std::vector<Heading> ContentExtractor::extractHeadings(const HtmlDocument& document) const {
    std::vector<Heading> headings;
    for (const GumboNode* node : document.select("h1, h2, h3, h4, h5, h6")) {
        std::string text = HtmlDocument::text(node);
        if (text.empty()) {
            continue;
        }
        Heading heading;
        heading.level = HtmlDocument::tagName(node)[1] - '0';
        heading.text = std::move(text);
        headings.push_back(std::move(heading));
    }
    return headings;
}

std::string ContentExtractor::extractBodyText(const HtmlDocument& document) const {
    static const Selector boilerplate =
        Selector::parse("nav, footer, header, aside, [role=\"navigation\"]");

    for (const char* selectorText : kMainContentSelectors) {
        const Selector selector = Selector::parse(selectorText);
        auto matches = document.select(selector);
        if (matches.empty()) {
            continue;
        }
        std::string text;
        for (const GumboNode* node : matches) {
            // Nested matches are covered by their outermost ancestor
            if (hasMatchingAncestor(node, selector) || hasMatchingAncestor(node, boilerplate) ||
                boilerplate.matches(node)) {
                continue;
            }
            text += HtmlDocument::text(node, boilerplate);
            text.push_back(' ');
        }
        text = collapseWhitespace(text);
        if (!text.empty() || std::string(selectorText) == "body") {
            return text;
        }
    }
    return "";
}

std::vector<FaqPair> ContentExtractor::extractDomFaq(const HtmlDocument& document) const {
    static const Selector answerSelector = Selector::parse("[class*=\"answer\"]");
    std::vector<FaqPair> pairs;

    for (const GumboNode* section : document.select(".faq, [class*=\"faq\"], [id*=\"faq\"]")) {
        // dt/dd pairs
        for (const GumboNode* term : document.selectWithin(section, "dt")) {
            const GumboNode* next = HtmlDocument::nextElementSibling(term);
            if (!next || HtmlDocument::tagName(next) != "dd") {
                continue;
            }
            std::string question = HtmlDocument::text(term);
            std::string answer = HtmlDocument::text(next);
            if (!question.empty() && !answer.empty()) {
                pairs.push_back({std::move(question), std::move(answer)});
            }
        }

        // question/answer blocks
        for (const GumboNode* questionNode : document.selectWithin(section, "[class*=\"question\"]")) {
            const GumboNode* next = HtmlDocument::nextElementSibling(questionNode);
            if (!next || !answerSelector.matches(next)) {
                continue;
            }
            std::string question = HtmlDocument::text(questionNode);
            std::string answer = HtmlDocument::text(next);
            if (!question.empty() && !answer.empty()) {
                pairs.push_back({std::move(question), std::move(answer)});
            }
        }
    }
    return pairs;
}

void ContentExtractor::extractLinks(const HtmlDocument& document,
                                    const std::string& pageUrl,
                                    ContentExtraction& extraction) const {
    std::set<std::string> seenInternal;
    std::set<std::string> seenOutbound;

    for (const GumboNode* anchor : document.select("a[href]")) {
        const std::string href = trim(HtmlDocument::attribute(anchor, "href"));
        if (href.empty() || href[0] == '#' || common::startsWith(common::toLower(href), "javascript:")) {
            continue;
        }
        auto resolved = url::resolveReference(pageUrl, href);
        if (!resolved) {
            continue;
        }

        Link link{*resolved, HtmlDocument::text(anchor)};
        if (url::UrlCanonicalizer::isSameDomain(*resolved, pageUrl)) {
            if (seenInternal.insert(link.url).second) {
                extraction.internalLinks.push_back(std::move(link));
            }
        } else if (seenOutbound.insert(link.url).second) {
            extraction.outboundLinks.push_back(std::move(link));
        }
    }
}

std::optional<std::string> ContentExtractor::extractAuthor(const HtmlDocument& document) const {
    for (const char* selector : kAuthorSelectors) {
        const GumboNode* node = document.selectFirst(selector);
        if (!node) {
            continue;
        }
        std::string author = trim(HtmlDocument::attribute(node, "content"));
        if (author.empty()) {
            author = trim(HtmlDocument::attribute(node, "href"));
        }
        if (author.empty()) {
            author = HtmlDocument::text(node);
        }
        if (!author.empty()) {
            return author;
        }
    }
    return std::nullopt;
}

std::optional<std::string> ContentExtractor::extractMetaPublishDate(const HtmlDocument& document) const {
    for (const char* selector : kPublishDateMetaSelectors) {
        const GumboNode* node = document.selectFirst(selector);
        if (!node) {
            continue;
        }
        std::string date = trim(HtmlDocument::attribute(node, "content"));
        if (date.empty()) {
            date = trim(HtmlDocument::attribute(node, "datetime"));
        }
        if (!date.empty()) {
            return date;
        }
    }
    return std::nullopt;
}

std::optional<std::string> ContentExtractor::findDateInText(const std::string& text) {
    static const std::vector<std::regex> patterns = {
        std::regex("(\\d{1,2})\\.\\s?(januar|februar|mars|april|mai|juni|juli|august|september|oktober|november|desember)\\s?(\\d{4})",
                   std::regex::icase),
        std::regex("(\\d{1,2})\\.(\\d{1,2})\\.(\\d{4})"),
        std::regex("(january|february|march|april|may|june|july|august|september|october|november|december)\\s+\\d{1,2},?\\s+\\d{4}",
                   std::regex::icase),
        std::regex("\\d{4}-\\d{2}-\\d{2}"),
        std::regex("\\d{1,2}/\\d{1,2}/\\d{4}")
    };
    return firstMatch(text, patterns);
}

std::optional<std::string> ContentExtractor::findUpdateDateInText(const std::string& text) {
    static const std::vector<std::regex> patterns = {
        std::regex("oppdatert[:\\s]*(\\d{1,2})\\.\\s?(januar|februar|mars|april|mai|juni|juli|august|september|oktober|november|desember)\\s?(\\d{4})",
                   std::regex::icase),
        std::regex("sist endret[:\\s]*(\\d{1,2})\\.\\s?(januar|februar|mars|april|mai|juni|juli|august|september|oktober|november|desember)\\s?(\\d{4})",
                   std::regex::icase),
        std::regex("updated[:\\s]*(january|february|march|april|may|june|july|august|september|october|november|december)\\s+\\d{1,2},?\\s+\\d{4}",
                   std::regex::icase),
        std::regex("last modified[:\\s]*(january|february|march|april|may|june|july|august|september|october|november|december)\\s+\\d{1,2},?\\s+\\d{4}",
                   std::regex::icase)
    };
    return firstMatch(text, patterns);
}

bool ContentExtractor::hasDirectAnswer(const std::string& firstParagraph) {
    static const std::regex openers("^(To|In order to|The best way to)", std::regex::icase);
    static const std::regex definition("^([A-Z][^.!?]*\\s+(is|are|means|refers to))");
    static const std::regex phrases("^(Here's how|Follow these steps|The answer is)", std::regex::icase);

    return std::regex_search(firstParagraph, openers) ||
           std::regex_search(firstParagraph, definition) ||
           std::regex_search(firstParagraph, phrases) ||
           (firstParagraph.size() > 50 && firstParagraph.find("answer") != std::string::npos);
}

int ContentExtractor::readabilityScore(const std::string& text) {
    if (text.empty()) {
        return 0;
    }

    size_t sentences = 0;
    std::string current;
    for (char c : text) {
        if (c == '.' || c == '!' || c == '?') {
            if (!trim(current).empty()) {
                ++sentences;
            }
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    if (!trim(current).empty()) {
        ++sentences;
    }

    const double words = static_cast<double>(common::countWords(text));
    const double average = words / static_cast<double>(std::max<size_t>(sentences, 1));
    if (average < 15) return 85;
    if (average < 20) return 75;
    if (average < 25) return 65;
    return 45;
}

} // namespace aeo_engine::extraction
