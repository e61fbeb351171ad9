#include "../../include/aeo_engine/scoring/RuleScoreCalculator.h"
#include "../../include/Logger.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <map>

namespace aeo_engine::scoring {

using common::Recommendation;
using common::RecommendationPriority;
using extraction::PageSignals;

namespace {

double clampScore(double value) {
    return std::max(0.0, std::min(100.0, value));
}

int roundScore(double value) {
    return static_cast<int>(std::lround(clampScore(value)));
}

double capped(double cap, double value) {
    return std::min(cap, value);
}

Recommendation makeRecommendation(const char* category,
                                  RecommendationPriority priority,
                                  const char* issue,
                                  const char* recommendation,
                                  const std::string& impact) {
    Recommendation item;
    item.category = category;
    item.priority = priority;
    item.issue = issue;
    item.recommendation = recommendation;
    item.impact = impact;
    return item;
}

const char* kFaqSchemaExample = R"({
  "@context": "https://schema.org",
  "@type": "FAQPage",
  "mainEntity": [
    {
      "@type": "Question",
      "name": "Your question here?",
      "acceptedAnswer": {
        "@type": "Answer",
        "text": "Your answer here."
      }
    }
  ]
})";

} // namespace

RuleScoreCalculator::RuleScoreCalculator() : tables_(EatWeightTables::createDefault()) {
}

RuleScoreCalculator::RuleScoreCalculator(EatWeightTables tables, ComponentWeights weights)
    : tables_(std::move(tables)), weights_(weights) {
}

RuleScore RuleScoreCalculator::score(const extraction::ContentExtraction& extraction,
                                     extraction::PageType pageType,
                                     std::chrono::milliseconds loadTime) const {
    const PageSignals& signals = extraction.signals;
    const EatProfile& profile = tables_.profileFor(pageType);

    const double content = clampScore(contentScore(signals));
    const double eat = clampScore(eatScore(signals, profile));
    const double technical = clampScore(technicalScore(signals, loadTime));
    const double structured = clampScore(structuredDataScore(signals));

    RuleScore result;
    result.content = roundScore(content);
    result.eat = roundScore(eat);
    result.technical = roundScore(technical);
    result.structuredData = roundScore(structured);
    result.overall = roundScore(content * weights_.content + eat * weights_.eat +
                                technical * weights_.technical + structured * weights_.structuredData);
    result.eatProfile = profile.name;

    LOG_DEBUG("Rule score for " + extraction.url + " (" + extraction::toString(pageType) + "/" + profile.name +
              "): overall=" + std::to_string(result.overall) + " content=" + std::to_string(result.content) +
              " eat=" + std::to_string(result.eat) + " technical=" + std::to_string(result.technical) +
              " structured=" + std::to_string(result.structuredData));
    return result;
}

double RuleScoreCalculator::contentScore(const PageSignals& signals) const {
    double score = 0.0;

    // Word count (10 points)
    if (signals.wordCount > 1000) score += 10;
    else if (signals.wordCount > 500) score += 7;
    else if (signals.wordCount > 300) score += 4;

    // Direct answer opening (15 points)
    if (signals.hasDirectAnswer) score += 15;

    // Content format (10 points)
    static const std::map<std::string, double> formatScores = {
        {"listicle", 10}, {"step-by-step guide", 9}, {"comparison", 8}, {"review", 7}, {"article", 5}
    };
    auto format = formatScores.find(signals.contentFormat);
    score += format != formatScores.end() ? format->second : 3;

    // Factual backup (10 points)
    if (signals.hasDataBackup) score += 10;

    // Heading structure (10 points)
    const bool hasH1 = signals.h1Count > 0;
    const bool properHierarchy = signals.h1Count == 1 && signals.h2Count > 0;
    if (hasH1 && properHierarchy) {
        score += 8;
    } else if (hasH1) {
        score += 5;
    }
    score += capped(2, static_cast<double>(signals.questionHeadings));

    // FAQ (10 points)
    if (signals.hasFaqSection) score += 5;
    score += capped(5, static_cast<double>(signals.faqQuestionCount));

    score += capped(10, signals.readabilityScore / 10.0);
    score += capped(10, signals.questionAnsweringScore / 10.0);

    // AI overview readiness (15 points)
    score += capped(10, signals.aiOverviewScore / 10.0);
    if (signals.isListicle) score += 3;
    if (signals.hasComparisons) score += 2;

    return capped(100, score);
}

double RuleScoreCalculator::pageFactorPoints(const PageSignals& signals, const EatProfile& profile) {
    double points = profile.pageFactors.base;
    for (const auto& rule : profile.pageFactors.rules) {
        auto fact = signals.pageFacts.find(rule.fact);
        const int value = fact != signals.pageFacts.end() ? fact->second : 0;
        if (value > 0 && value >= rule.minimum) {
            points += capped(rule.cap, rule.points * value);
        }
    }
    return points;
}

double RuleScoreCalculator::eatScore(const PageSignals& signals, const EatProfile& profile) const {
    double score = 0.0;

    if (signals.hasAuthor) score += profile.author;
    if (signals.hasAuthorBio) score += profile.authorBio;
    if (signals.hasContact || signals.hasContactPage) score += profile.contact;

    if (signals.authorityCitations > 0) {
        score += profile.citationFlat;
        score += capped(profile.citationCap, profile.citationPerItem * static_cast<double>(signals.authorityCitations));
    }
    if (signals.hasReferences) score += profile.references;

    if (signals.publishDate) score += profile.publishDate;
    if (signals.updateDate) score += profile.updateDate;

    score += capped(profile.expertiseCap, profile.expertisePerItem * static_cast<double>(signals.expertiseIndicators.size()));
    score += capped(profile.trustCap, profile.trustPerItem * static_cast<double>(signals.trustSignals.size()));

    if (profile.pageFactors.weight > 0) {
        score += capped(profile.pageFactors.cap, pageFactorPoints(signals, profile) * profile.pageFactors.weight);
    }

    return capped(100, score);
}

double RuleScoreCalculator::technicalScore(const PageSignals& signals, std::chrono::milliseconds loadTime) const {
    double score = 0.0;

    // HTTPS (15 points)
    if (signals.isHttps) score += 15;

    // Mobile (25 points)
    if (signals.hasViewportMeta) score += 10;
    score += capped(10, signals.responsiveImageRatio * 10);
    if (signals.hasMobileCss) score += 5;

    // Load time (20 points)
    const auto ms = loadTime.count();
    if (ms < 2000) score += 20;
    else if (ms < 3000) score += 15;
    else if (ms < 5000) score += 10;
    else score += 5;

    // Meta tags (15 points)
    if (signals.hasMetaDescription) {
        const size_t length = signals.metaDescriptionLength;
        if (length >= 120 && length <= 160) score += 8;
        else if (length >= 100 && length <= 180) score += 5;
        else if (length > 0) score += 3;
    }
    if (signals.titleLength >= 30 && signals.titleLength <= 60) score += 7;
    else if (signals.titleLength > 0) score += 4;

    // Internal linking (10 points)
    if (signals.internalLinkCount > 5) score += 5;
    score += capped(5, static_cast<double>(signals.internalLinkCount) / 5.0);

    // Images (10 points); a page without images beats one with unlabelled images
    if (signals.imageCount == 0) {
        score += 5;
    } else {
        score += capped(10, signals.imageAltCoverage() / 10.0);
    }

    if (signals.hasCanonical) score += 3;
    if (signals.hasRobotsMeta) score += 2;

    return capped(100, score);
}

double RuleScoreCalculator::structuredDataScore(const PageSignals& signals) const {
    const auto& data = signals.structuredData;
    double score = 0.0;

    if (data.objectCount > 0) score += 20;

    if (data.hasFaqSchema) {
        score += 15;
        score += capped(10, static_cast<double>(data.faqQuestionCount) * 2);
    }
    if (data.hasHowToSchema) {
        score += 10;
        score += capped(10, static_cast<double>(data.howToStepCount) * 2);
    }
    if (data.hasArticleSchema) {
        score += 10;
        if (data.articleHasAuthor) score += 5;
        if (data.articleHasDatePublished) score += 5;
    }
    if (data.hasBreadcrumbSchema) {
        score += 5;
        score += capped(5, static_cast<double>(data.breadcrumbItemCount));
    }

    const size_t typeCount = data.topLevelTypes.size();
    if (typeCount >= 3) score += 5;
    else if (typeCount >= 2) score += 3;

    return capped(100, score);
}

std::vector<Recommendation> RuleScoreCalculator::generateRecommendations(
    const extraction::ContentExtraction& extraction,
    const RuleScore& score,
    std::chrono::milliseconds loadTime) const {
    std::vector<Recommendation> recommendations;
    const PageSignals& signals = extraction.signals;

    if (score.content < kRecommendationThreshold) {
        addContentRecommendations(signals, recommendations);
    }
    if (score.eat < kRecommendationThreshold) {
        addEatRecommendations(signals, recommendations);
    }
    if (score.technical < kRecommendationThreshold) {
        addTechnicalRecommendations(signals, loadTime, recommendations);
    }
    if (score.structuredData < kRecommendationThreshold) {
        addStructuredDataRecommendations(signals, recommendations);
    }

    prioritize(recommendations);
    return recommendations;
}

void RuleScoreCalculator::addContentRecommendations(const PageSignals& signals, std::vector<Recommendation>& out) const {
    if (signals.wordCount < 300) {
        out.push_back(makeRecommendation(
            "Content Quality", RecommendationPriority::HIGH, "Content too short",
            "Expand your content to at least 500-1000 words. AI search engines prefer comprehensive content that thoroughly answers questions.",
            "High - Longer content is 52% more likely to appear in AI overviews"));
    }

    if (!signals.hasDirectAnswer) {
        auto item = makeRecommendation(
            "AI Optimization", RecommendationPriority::HIGH, "No direct answer in opening",
            "Start your content with a direct answer to the main question in the first 2-3 sentences. This dramatically improves AI overview visibility.",
            "High - Direct answers are crucial for AI search results");
        item.example = "Instead of: \"Many people wonder about...\" Try: \"To optimize for AI search, start with a clear answer: [Your direct answer here].\"";
        out.push_back(std::move(item));
    }

    const std::string& format = signals.contentFormat;
    if (format != "listicle" && format != "step-by-step guide" && format != "comparison") {
        out.push_back(makeRecommendation(
            "Content Structure", RecommendationPriority::MEDIUM, "Content format not optimized for AI",
            "Convert your content into a list format, comparison, or step-by-step guide. These formats perform 32.5% better in AI overviews.",
            "Medium - Format optimization improves AI visibility"));
    }

    if (!signals.hasDataBackup) {
        auto item = makeRecommendation(
            "Content Authority", RecommendationPriority::MEDIUM, "Lacks factual backing",
            "Add statistics, research citations, or data to support your claims. AI systems favor content with factual backup.",
            "Medium - Factual content builds authority");
        item.example = "Include phrases like \"According to [source],\" \"Research shows,\" or specific percentages and statistics.";
        out.push_back(std::move(item));
    }

    if (!(signals.h1Count == 1 && signals.h2Count > 0)) {
        out.push_back(makeRecommendation(
            "Content Structure", RecommendationPriority::MEDIUM, "Poor heading hierarchy",
            "Use proper H1-H6 hierarchy with one H1 tag and multiple H2 tags for main sections.",
            "Medium - Proper structure helps AI understand content"));
    }

    if (signals.faqQuestionCount < 3) {
        auto item = makeRecommendation(
            "AI Optimization", RecommendationPriority::HIGH, "Insufficient question-answer pairs",
            "Add more question-answer pairs throughout your content. Use H2 or H3 tags for questions.",
            "High - Question-answer format is ideal for AI overviews");
        item.example = "Use headings like \"How to [do something]?\" or \"What is [concept]?\" followed by clear answers.";
        out.push_back(std::move(item));
    }
}

void RuleScoreCalculator::addEatRecommendations(const PageSignals& signals, std::vector<Recommendation>& out) const {
    if (!signals.hasAuthor) {
        auto item = makeRecommendation(
            "E-A-T (Expertise)", RecommendationPriority::HIGH, "Missing author information",
            "Add clear author bylines and author bio sections. AI systems heavily favor content with identifiable experts.",
            "High - Author credibility is crucial for AI search trust");
        item.implementation = "Add author schema markup and visible author information on each page.";
        out.push_back(std::move(item));
    }

    if (!signals.hasContact && !signals.hasContactPage) {
        out.push_back(makeRecommendation(
            "E-A-T (Trust)", RecommendationPriority::MEDIUM, "No contact information",
            "Add contact information or a contact page to build trust with AI systems.",
            "Medium - Contact info improves trustworthiness"));
    }

    if (signals.authorityCitations == 0) {
        auto item = makeRecommendation(
            "E-A-T (Authority)", RecommendationPriority::MEDIUM, "No authoritative citations",
            "Link to authoritative sources like .edu, .gov, or reputable industry sources to back up your claims.",
            "Medium - External authority links improve credibility");
        item.example = "Link to studies, government data, or industry research to support your points.";
        out.push_back(std::move(item));
    }

    if (!signals.publishDate && !signals.updateDate) {
        auto item = makeRecommendation(
            "Content Freshness", RecommendationPriority::MEDIUM, "No publication or update dates",
            "Add publication dates and last updated timestamps. Keep content current.",
            "Medium - Fresh content performs better in AI search");
        item.implementation = "Use schema markup for article dates and display visible timestamps.";
        out.push_back(std::move(item));
    }
}

void RuleScoreCalculator::addTechnicalRecommendations(const PageSignals& signals,
                                                      std::chrono::milliseconds loadTime,
                                                      std::vector<Recommendation>& out) const {
    if (!signals.isHttps) {
        out.push_back(makeRecommendation(
            "Technical SEO", RecommendationPriority::HIGH, "Site not using HTTPS",
            "Implement SSL certificate. HTTPS is required for AI search trust and ranking.",
            "High - HTTPS is a baseline requirement"));
    }

    if (!signals.hasViewportMeta) {
        auto item = makeRecommendation(
            "Mobile Optimization", RecommendationPriority::HIGH, "Missing viewport meta tag",
            "Add viewport meta tag: <meta name=\"viewport\" content=\"width=device-width, initial-scale=1\">",
            "High - Mobile-first indexing requires proper viewport");
        item.implementation = "Add the viewport meta tag to your HTML head section.";
        out.push_back(std::move(item));
    }

    if (loadTime.count() > 3000) {
        char seconds[32];
        std::snprintf(seconds, sizeof(seconds), "%.2f", static_cast<double>(loadTime.count()) / 1000.0);
        out.push_back(makeRecommendation(
            "Page Speed", RecommendationPriority::HIGH, "Slow page loading",
            "Optimize page speed to under 2 seconds. Compress images, minify CSS/JS, and use a CDN.",
            std::string("High - Page speed affects AI search rankings (current load time: ") + seconds + "s)"));
    }

    if (!signals.hasMetaDescription) {
        auto item = makeRecommendation(
            "Meta Optimization", RecommendationPriority::MEDIUM, "Missing meta description",
            "Add compelling meta descriptions (120-160 characters) that answer the main question.",
            "Medium - Meta descriptions help AI understand page content");
        item.example = "Write descriptions that directly answer what users are searching for.";
        out.push_back(std::move(item));
    }

    if (signals.imageCount > 0 && signals.imageAltCoverage() < 80) {
        out.push_back(makeRecommendation(
            "Image SEO", RecommendationPriority::MEDIUM, "Images missing alt text",
            "Add descriptive alt text to all images. This helps AI systems understand your content.",
            "Medium - Alt text improves accessibility and AI understanding (" +
                std::to_string(std::lround(signals.imageAltCoverage())) + "% of images have alt text)"));
    }
}

void RuleScoreCalculator::addStructuredDataRecommendations(const PageSignals& signals,
                                                           std::vector<Recommendation>& out) const {
    const auto& data = signals.structuredData;

    if (data.objectCount == 0) {
        auto item = makeRecommendation(
            "Structured Data", RecommendationPriority::HIGH, "No structured data markup",
            "Implement JSON-LD structured data, starting with Article or BlogPosting schema.",
            "High - Structured data is crucial for AI search visibility");
        item.implementation = "Add Article schema with author, datePublished, and headline properties.";
        out.push_back(std::move(item));
    }

    if (!data.hasFaqSchema && data.faqQuestionCount < 3) {
        auto item = makeRecommendation(
            "FAQ Schema", RecommendationPriority::HIGH, "Missing FAQ structured data",
            "Add FAQ schema markup for question-answer pairs. This dramatically improves AI overview chances.",
            "High - FAQ schema is highly favored by AI search");
        item.example = "Use FAQPage schema for pages with 3+ question-answer pairs.";
        item.implementation = kFaqSchemaExample;
        out.push_back(std::move(item));
    }

    if (!data.hasHowToSchema) {
        out.push_back(makeRecommendation(
            "HowTo Schema", RecommendationPriority::MEDIUM, "Missing HowTo structured data",
            "For step-by-step content, add HowTo schema markup to improve AI search visibility.",
            "Medium - HowTo schema helps AI understand procedural content"));
    }

    if (!data.hasArticleSchema) {
        auto item = makeRecommendation(
            "Article Schema", RecommendationPriority::MEDIUM, "Missing Article structured data",
            "Add Article or BlogPosting schema with author, datePublished, and headline.",
            "Medium - Article schema helps AI understand content type");
        item.implementation = "Include author, publisher, datePublished, and headline properties.";
        out.push_back(std::move(item));
    }
}

int RuleScoreCalculator::categoryImportance(const std::string& category) {
    static const std::map<std::string, int> importance = {
        {"AI Optimization", 5},
        {"Content Quality", 4},
        {"FAQ Schema", 4},
        {"Technical SEO", 3},
        {"E-A-T (Expertise)", 3},
        {"Structured Data", 2},
        {"Mobile Optimization", 2}
    };
    auto it = importance.find(category);
    return it != importance.end() ? it->second : 0;
}

void RuleScoreCalculator::prioritize(std::vector<Recommendation>& recommendations) {
    std::stable_sort(recommendations.begin(), recommendations.end(),
                     [](const Recommendation& a, const Recommendation& b) {
                         if (a.priority != b.priority) {
                             return static_cast<int>(a.priority) > static_cast<int>(b.priority);
                         }
                         return categoryImportance(a.category) > categoryImportance(b.category);
                     });
}

void to_json(nlohmann::json& j, const RuleScore& score) {
    j = nlohmann::json{
        {"overall", score.overall},
        {"content", score.content},
        {"eat", score.eat},
        {"technical", score.technical},
        {"structuredData", score.structuredData},
        {"eatProfile", score.eatProfile}
    };
}

} // namespace aeo_engine::scoring
