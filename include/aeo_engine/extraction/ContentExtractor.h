#pragma once

#include <optional>
#include <string>
#include "ContentExtraction.h"

namespace aeo_engine::extraction {

class HtmlDocument;

/**
 * Pulls structured page facts out of raw HTML.
 *
 * Extraction is pure: the same HTML, URL and reference year always produce the
 * same ContentExtraction. The reference year only feeds the "mentions current
 * year" freshness signal; 0 uses the system clock.
 */
class ContentExtractor {
public:
    explicit ContentExtractor(int referenceYear = 0);

    // Throws InvalidUrlError when pageUrl is not an absolute http(s) URL
    ContentExtraction extract(const std::string& html, const std::string& pageUrl) const;

    // First date-looking substring (Norwegian, dotted, English, ISO, slashed forms in that order)
    static std::optional<std::string> findDateInText(const std::string& text);

    // "Updated ..." / "Sist endret ..." style phrases
    static std::optional<std::string> findUpdateDateInText(const std::string& text);

    static bool hasDirectAnswer(const std::string& firstParagraph);

    // Banded average-words-per-sentence proxy: 85, 75, 65 or 45; 0 for empty text
    static int readabilityScore(const std::string& text);

private:
    std::string extractTitle(const HtmlDocument& document) const;
    std::string extractMetaDescription(const HtmlDocument& document) const;
    std::string extractCanonicalUrl(const HtmlDocument& document, const std::string& pageUrl) const;
    std::vector<Heading> extractHeadings(const HtmlDocument& document) const;
    std::string extractBodyText(const HtmlDocument& document) const;
    std::vector<FaqPair> extractDomFaq(const HtmlDocument& document) const;
    void extractLinks(const HtmlDocument& document, const std::string& pageUrl, ContentExtraction& extraction) const;
    std::optional<std::string> extractAuthor(const HtmlDocument& document) const;
    std::optional<std::string> extractMetaPublishDate(const HtmlDocument& document) const;

    int referenceYear_;
};

} // namespace aeo_engine::extraction
