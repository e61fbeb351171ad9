#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../crawler/PageFetchResult.h"

namespace aeo_engine::extraction {

struct Heading {
    int level = 1;
    std::string text;
};

struct FaqPair {
    std::string question;
    std::string answer;
};

struct Link {
    std::string url;
    std::string anchor;
};

// What the page declares through JSON-LD
struct StructuredDataSummary {
    // Top-level objects, @graph members included
    size_t objectCount = 0;
    std::vector<std::string> topLevelTypes;

    bool hasFaqSchema = false;
    size_t faqQuestionCount = 0;
    bool hasHowToSchema = false;
    size_t howToStepCount = 0;
    bool hasArticleSchema = false;
    bool articleHasAuthor = false;
    bool articleHasDatePublished = false;
    bool hasBreadcrumbSchema = false;
    size_t breadcrumbItemCount = 0;
};

/**
 * DOM facts consumed by the classifier and the rule scorer.
 *
 * Text-based signals are evaluated against the whole body text (navigation
 * and footer included), the cleaned main text is kept in ContentExtraction::body.
 */
struct PageSignals {
    // Content
    size_t wordCount = 0;
    size_t orderedListItems = 0;
    size_t unorderedListItems = 0;
    size_t paragraphCount = 0;
    bool hasDirectAnswer = false;
    std::string contentFormat = "article";
    bool hasDataBackup = false;
    size_t h1Count = 0;
    size_t h2Count = 0;
    size_t h3Count = 0;
    size_t questionHeadings = 0;     // h1-h3 phrased as questions
    bool hasFaqSection = false;
    size_t faqQuestionCount = 0;     // h2-h4 phrased as questions
    size_t faqElementCount = 0;
    int readabilityScore = 0;
    double questionAnsweringScore = 0.0;
    std::vector<std::string> aiOverviewKeywords;
    double aiOverviewScore = 0.0;
    bool isListicle = false;
    bool hasComparisons = false;
    bool mentionsCurrentYear = false;

    // Expertise, authority, trust
    bool hasAuthor = false;
    bool hasAuthorBio = false;
    bool authorFromText = false;
    bool hasContact = false;
    bool hasContactPage = false;
    size_t externalLinkCount = 0;
    size_t authorityCitations = 0;
    bool hasReferences = false;
    std::optional<std::string> publishDate;
    std::optional<std::string> updateDate;
    std::vector<std::string> expertiseIndicators;
    std::vector<std::string> trustSignals;
    // Page-specific trust facts keyed by name (counts; 0/1 for presence)
    std::map<std::string, int> pageFacts;

    // Technical
    bool isHttps = false;
    bool hasViewportMeta = false;
    double responsiveImageRatio = 0.0;
    bool hasMobileCss = false;
    size_t imageCount = 0;
    size_t imagesWithAlt = 0;
    bool hasMetaDescription = false;
    size_t metaDescriptionLength = 0;
    bool hasOgTitle = false;
    size_t titleLength = 0;
    size_t internalLinkCount = 0;
    bool hasRobotsMeta = false;
    bool hasCanonical = false;

    StructuredDataSummary structuredData;

    // Named boolean indicators used by content-vote classification rules
    std::vector<std::string> indicators;

    bool hasIndicator(const std::string& name) const;

    // Percentage of images carrying alt text; 100 when the page has no images
    double imageAltCoverage() const;
};

// Structured page facts, derived deterministically from HTML + URL
struct ContentExtraction {
    std::string url;
    std::string title;
    std::string metaDescription;
    std::string canonicalUrl;
    std::vector<Heading> headings;
    std::string body;
    std::vector<FaqPair> faq;
    std::vector<Link> internalLinks;
    std::vector<Link> outboundLinks;
    std::vector<std::string> schemaTypes;
    std::optional<std::string> author;
    std::optional<std::string> datePublished;
    PageSignals signals;
};

struct PageMetrics {
    long long loadTimeMs = 0;
    size_t contentLength = 0;
    size_t wordCount = 0;
    crawler::RenderMethod renderMethod = crawler::RenderMethod::STATIC;
};

PageMetrics calculateMetrics(const std::string& html,
                             const ContentExtraction& extraction,
                             std::chrono::milliseconds loadTime,
                             crawler::RenderMethod renderMethod);

void to_json(nlohmann::json& j, const Heading& heading);
void to_json(nlohmann::json& j, const FaqPair& pair);
void to_json(nlohmann::json& j, const Link& link);
void to_json(nlohmann::json& j, const StructuredDataSummary& summary);
void to_json(nlohmann::json& j, const PageSignals& signals);
void to_json(nlohmann::json& j, const ContentExtraction& extraction);
void to_json(nlohmann::json& j, const PageMetrics& metrics);

} // namespace aeo_engine::extraction
