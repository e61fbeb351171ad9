#include "../../include/aeo_engine/extraction/ContentExtraction.h"
#include "../../include/aeo_engine/common/TextUtils.h"

#include <algorithm>

namespace aeo_engine::extraction {

namespace {

nlohmann::json optionalString(const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

} // namespace

bool PageSignals::hasIndicator(const std::string& name) const {
    return std::find(indicators.begin(), indicators.end(), name) != indicators.end();
}

double PageSignals::imageAltCoverage() const {
    if (imageCount == 0) {
        return 100.0;
    }
    return static_cast<double>(imagesWithAlt) / static_cast<double>(imageCount) * 100.0;
}

PageMetrics calculateMetrics(const std::string& html,
                             const ContentExtraction& extraction,
                             std::chrono::milliseconds loadTime,
                             crawler::RenderMethod renderMethod) {
    PageMetrics metrics;
    metrics.loadTimeMs = loadTime.count();
    metrics.contentLength = html.size();
    metrics.wordCount = common::countWords(extraction.body);
    metrics.renderMethod = renderMethod;
    return metrics;
}

void to_json(nlohmann::json& j, const Heading& heading) {
    j = nlohmann::json{{"level", heading.level}, {"text", heading.text}};
}

void to_json(nlohmann::json& j, const FaqPair& pair) {
    j = nlohmann::json{{"question", pair.question}, {"answer", pair.answer}};
}

void to_json(nlohmann::json& j, const Link& link) {
    j = nlohmann::json{{"url", link.url}, {"anchor", link.anchor}};
}

void to_json(nlohmann::json& j, const StructuredDataSummary& summary) {
    j = nlohmann::json{
        {"objectCount", summary.objectCount},
        {"topLevelTypes", summary.topLevelTypes},
        {"faqSchema", {{"present", summary.hasFaqSchema}, {"questionCount", summary.faqQuestionCount}}},
        {"howToSchema", {{"present", summary.hasHowToSchema}, {"stepCount", summary.howToStepCount}}},
        {"articleSchema", {
            {"present", summary.hasArticleSchema},
            {"hasAuthor", summary.articleHasAuthor},
            {"hasDatePublished", summary.articleHasDatePublished}
        }},
        {"breadcrumbSchema", {{"present", summary.hasBreadcrumbSchema}, {"itemCount", summary.breadcrumbItemCount}}}
    };
}

void to_json(nlohmann::json& j, const PageSignals& signals) {
    j = nlohmann::json{
        {"content", {
            {"wordCount", signals.wordCount},
            {"hasDirectAnswer", signals.hasDirectAnswer},
            {"contentFormat", signals.contentFormat},
            {"hasDataBackup", signals.hasDataBackup},
            {"headings", {
                {"h1", signals.h1Count},
                {"h2", signals.h2Count},
                {"h3", signals.h3Count},
                {"questionHeadings", signals.questionHeadings}
            }},
            {"faq", {
                {"hasFaqSection", signals.hasFaqSection},
                {"questionCount", signals.faqQuestionCount},
                {"elementCount", signals.faqElementCount}
            }},
            {"readabilityScore", signals.readabilityScore},
            {"questionAnsweringScore", signals.questionAnsweringScore},
            {"aiOverview", {{"keywords", signals.aiOverviewKeywords}, {"score", signals.aiOverviewScore}}},
            {"listItems", {{"ordered", signals.orderedListItems}, {"unordered", signals.unorderedListItems}}},
            {"isListicle", signals.isListicle},
            {"hasComparisons", signals.hasComparisons},
            {"mentionsCurrentYear", signals.mentionsCurrentYear}
        }},
        {"eat", {
            {"hasAuthor", signals.hasAuthor},
            {"hasAuthorBio", signals.hasAuthorBio},
            {"authorFromText", signals.authorFromText},
            {"hasContact", signals.hasContact},
            {"hasContactPage", signals.hasContactPage},
            {"externalLinkCount", signals.externalLinkCount},
            {"authorityCitations", signals.authorityCitations},
            {"hasReferences", signals.hasReferences},
            {"publishDate", optionalString(signals.publishDate)},
            {"updateDate", optionalString(signals.updateDate)},
            {"expertiseIndicators", signals.expertiseIndicators},
            {"trustSignals", signals.trustSignals},
            {"pageFacts", signals.pageFacts}
        }},
        {"technical", {
            {"isHttps", signals.isHttps},
            {"hasViewportMeta", signals.hasViewportMeta},
            {"responsiveImageRatio", signals.responsiveImageRatio},
            {"hasMobileCss", signals.hasMobileCss},
            {"imageCount", signals.imageCount},
            {"imageAltCoverage", signals.imageAltCoverage()},
            {"metaDescriptionLength", signals.metaDescriptionLength},
            {"hasOgTitle", signals.hasOgTitle},
            {"titleLength", signals.titleLength},
            {"internalLinkCount", signals.internalLinkCount},
            {"hasRobotsMeta", signals.hasRobotsMeta},
            {"hasCanonical", signals.hasCanonical}
        }},
        {"structuredData", signals.structuredData},
        {"indicators", signals.indicators}
    };
}

void to_json(nlohmann::json& j, const ContentExtraction& extraction) {
    j = nlohmann::json{
        {"url", extraction.url},
        {"title", extraction.title},
        {"metaDescription", extraction.metaDescription},
        {"canonicalUrl", extraction.canonicalUrl},
        {"headings", extraction.headings},
        {"body", extraction.body},
        {"faq", extraction.faq},
        {"internalLinks", extraction.internalLinks},
        {"outboundLinks", extraction.outboundLinks},
        {"schemaTypes", extraction.schemaTypes},
        {"author", optionalString(extraction.author)},
        {"datePublished", optionalString(extraction.datePublished)},
        {"signals", extraction.signals}
    };
}

void to_json(nlohmann::json& j, const PageMetrics& metrics) {
    j = nlohmann::json{
        {"loadTimeMs", metrics.loadTimeMs},
        {"contentLength", metrics.contentLength},
        {"wordCount", metrics.wordCount},
        {"renderMethod", crawler::toString(metrics.renderMethod)}
    };
}

} // namespace aeo_engine::extraction
