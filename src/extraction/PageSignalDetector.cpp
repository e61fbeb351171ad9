#include "PageSignalDetector.h"
#include "../../include/aeo_engine/extraction/ContentExtractor.h"
#include "../../include/aeo_engine/url/UrlCanonicalizer.h"
#include "../../include/aeo_engine/common/TextUtils.h"

#include <algorithm>
#include <regex>

namespace aeo_engine::extraction {

using common::toLower;
using common::trim;

namespace {

const std::vector<std::string> kAiOverviewKeywords = {
    "how to", "what is", "best way", "steps to", "guide", "tutorial",
    "comparison", "vs", "versus", "benefits", "advantages", "pros and cons",
    "top", "best", "worst", "list", "review", "rating"
};

const std::vector<std::string> kComparisonWords = {
    "vs", "versus", "compared to", "difference between", "better than"
};

const std::vector<std::string> kExpertiseKeywords = {
    "certified", "expert", "specialist", "professional",
    "years of experience", "degree", "qualification"
};

const std::vector<std::string> kAuthorityDomains = {
    "wikipedia.org", "gov", "edu", "nih.gov", "cdc.gov",
    "who.int", "nature.com", "science.org"
};

const char* const kAuthorSelectors[] = {
    "[rel=\"author\"]", ".author", ".byline", "[class*=\"author\"]", "[id*=\"author\"]",
    ".post-author", ".article-author", ".writer", "[class*=\"writer\"]", ".posted-by", ".written-by"
};

const char* const kPublishDateSelectors[] = {
    "time[datetime]",
    "[datetime]",
    "[property=\"article:published_time\"]",
    "[name=\"article:published_time\"]",
    "[property=\"datePublished\"]",
    ".published", ".date", ".post-date", ".entry-date", ".publish-date",
    "[class*=\"publish\"]", "[class*=\"date\"]", "[id*=\"date\"]",
    ".dato", ".publisert", ".opprettet", ".blogg-dato", ".artikkel-dato",
    "[class*=\"dato\"]", "[class*=\"publiser\"]", "[id*=\"dato\"]",
    ".byline .date", ".meta .date", ".post-meta .date", ".article-meta .date",
    "header .date", ".entry-meta time", ".post-info .date"
};

const char* const kUpdateDateSelectors[] = {
    "[property=\"article:modified_time\"]",
    "[name=\"article:modified_time\"]",
    "[property=\"dateModified\"]",
    "time[datetime][class*=\"updated\"]",
    "time[datetime][class*=\"modified\"]",
    "[class*=\"updated\"]", "[class*=\"modified\"]", "[class*=\"last-modified\"]",
    ".last-updated", ".modified-date", ".update-date",
    "[class*=\"oppdatert\"]", "[class*=\"endret\"]", "[class*=\"sist-endret\"]",
    ".oppdatert", ".endret", ".sist-endret", ".sist-oppdatert",
    ".meta .updated", ".post-meta .updated", ".article-meta .updated"
};

bool looksLikeQuestion(const std::string& text) {
    static const std::regex questionWord("^(how|what|why|when|where|who|which)", std::regex::icase);
    return text.find('?') != std::string::npos || std::regex_search(trim(text), questionWord);
}

bool containsAny(const std::string& lowerText, const std::vector<std::string>& needles,
                 std::vector<std::string>* matched = nullptr) {
    bool any = false;
    for (const auto& needle : needles) {
        if (lowerText.find(needle) != std::string::npos) {
            any = true;
            if (matched) {
                matched->push_back(needle);
            }
        }
    }
    return any;
}

bool matches(const std::string& text, const char* pattern, bool ignoreCase = true) {
    const std::regex regex(pattern, ignoreCase ? std::regex::ECMAScript | std::regex::icase : std::regex::ECMAScript);
    return std::regex_search(text, regex);
}

bool isAuthorityHost(const std::string& link) {
    const std::string host = url::extractHost(link);
    for (const auto& domain : kAuthorityDomains) {
        if (domain.find('.') == std::string::npos) {
            // Bare TLDs: .gov, .edu and their second-level forms (.gov.uk, .edu.au)
            if (common::endsWith(host, "." + domain) || host.find("." + domain + ".") != std::string::npos) {
                return true;
            }
        } else if (host == domain || common::endsWith(host, "." + domain)) {
            return true;
        }
    }
    return false;
}

} // namespace

PageSignalDetector::PageSignalDetector(const HtmlDocument& document, const JsonLdDocument& jsonLd, int referenceYear)
    : document_(document)
    , jsonLd_(jsonLd)
    , referenceYear_(referenceYear)
    , bodyText_(document.bodyText())
    , lowerText_(toLower(bodyText_)) {
}

PageSignals PageSignalDetector::detect(const ContentExtraction& extraction) const {
    PageSignals signals;
    detectContent(extraction, signals);
    detectAuthority(extraction, signals);
    detectPageFacts(signals);
    detectTechnical(extraction, signals);
    detectIndicators(signals);
    return signals;
}

void PageSignalDetector::detectContent(const ContentExtraction& extraction, PageSignals& signals) const {
    signals.wordCount = common::countWords(bodyText_);
    signals.orderedListItems = document_.count("ol li");
    signals.unorderedListItems = document_.count("ul li");
    signals.paragraphCount = document_.count("p");

    const GumboNode* firstParagraph = document_.selectFirst("p");
    signals.hasDirectAnswer = ContentExtractor::hasDirectAnswer(firstParagraph ? HtmlDocument::text(firstParagraph) : "");

    const size_t listItems = signals.orderedListItems + signals.unorderedListItems;
    const bool hasSteps = matches(bodyText_, "step \\d+|first,|second,|third,|next,|finally,");
    if (hasSteps && listItems > 3) {
        signals.contentFormat = "step-by-step guide";
    } else if (listItems > 5) {
        signals.contentFormat = "listicle";
    } else if (matches(bodyText_, "vs\\.|versus|compared to|comparison")) {
        signals.contentFormat = "comparison";
    } else if (matches(bodyText_, "review|rating|score|pros and cons")) {
        signals.contentFormat = "review";
    } else {
        signals.contentFormat = "article";
    }

    signals.hasDataBackup = matches(bodyText_, "according to|study shows|research indicates|data from|statistics|\\d+%|survey");

    for (const auto& heading : extraction.headings) {
        if (heading.level > 3) {
            continue;
        }
        if (heading.level == 1) ++signals.h1Count;
        if (heading.level == 2) ++signals.h2Count;
        if (heading.level == 3) ++signals.h3Count;
        if (looksLikeQuestion(heading.text)) {
            ++signals.questionHeadings;
        }
    }

    signals.faqElementCount = document_.count("[class*=\"faq\"], [id*=\"faq\"], [class*=\"question\"], [id*=\"question\"]");
    signals.hasFaqSection = signals.faqElementCount > 0;
    signals.faqQuestionCount = questionHeadingCount("h2, h3, h4", false);

    signals.mentionsCurrentYear = bodyText_.find(std::to_string(referenceYear_)) != std::string::npos;
    signals.readabilityScore = ContentExtractor::readabilityScore(bodyText_);

    const size_t questions = static_cast<size_t>(std::count(bodyText_.begin(), bodyText_.end(), '?'));
    if (questions == 0) {
        signals.questionAnsweringScore = bodyText_.size() > 500 ? 70.0 : 40.0;
    } else {
        signals.questionAnsweringScore =
            std::min(100.0, static_cast<double>(signals.paragraphCount) / static_cast<double>(questions) * 80.0);
    }

    containsAny(lowerText_, kAiOverviewKeywords, &signals.aiOverviewKeywords);
    signals.aiOverviewScore = std::min(100.0, static_cast<double>(signals.aiOverviewKeywords.size()) /
                                                  static_cast<double>(kAiOverviewKeywords.size()) * 100.0);

    signals.isListicle = signals.orderedListItems > 3 || signals.unorderedListItems > 5;
    signals.hasComparisons = containsAny(lowerText_, kComparisonWords);
}

void PageSignalDetector::detectAuthority(const ContentExtraction& extraction, PageSignals& signals) const {
    // Names must be capitalised; the lead-in words may be any case
    static const std::vector<std::regex> bylinePatterns = {
        std::regex("\\b[Bb][Yy]\\s+[A-Z][a-z]+(?:\\s+[A-Z][a-z]+)*"),
        std::regex("\\b[Aa][Vv]\\s+[A-Z][a-z]+(?:\\s+[A-Z][a-z]+)*"),
        std::regex("\\b[Ff]orfatter:?\\s*[A-Z][a-z]+(?:\\s+[A-Z][a-z]+)*"),
        std::regex("\\b[Ss]krevet\\s+av\\s+[A-Z][a-z]+(?:\\s+[A-Z][a-z]+)*"),
        std::regex("\\b[Aa]uthor:?\\s*[A-Z][a-z]+(?:\\s+[A-Z][a-z]+)*"),
        std::regex("\\b[Ww]ritten\\s+by\\s+[A-Z][a-z]+(?:\\s+[A-Z][a-z]+)*")
    };

    bool authorMarkup = false;
    for (const char* selector : kAuthorSelectors) {
        if (document_.exists(selector)) {
            authorMarkup = true;
            break;
        }
    }
    signals.authorFromText = std::any_of(bylinePatterns.begin(), bylinePatterns.end(), [this](const std::regex& pattern) {
        return std::regex_search(bodyText_, pattern);
    });
    signals.hasAuthor = authorMarkup || signals.authorFromText || extraction.author.has_value();
    signals.hasAuthorBio = document_.exists(".author-bio, .author-description, [class*=\"author-bio\"]");

    signals.hasContact = matches(bodyText_, "contact|email|phone|address") ||
                         matches(bodyText_, "@[\\w.-]+\\.\\w+", false) ||
                         matches(bodyText_, "\\+?\\d{1,4}[\\s-]?\\(?\\d{3}\\)?[\\s-]?\\d{3}[\\s-]?\\d{4}", false);
    signals.hasContactPage = document_.exists("a[href*=\"contact\"]");

    signals.externalLinkCount = extraction.outboundLinks.size();
    signals.authorityCitations = static_cast<size_t>(std::count_if(
        extraction.outboundLinks.begin(), extraction.outboundLinks.end(),
        [](const Link& link) { return isAuthorityHost(link.url); }));
    signals.hasReferences = document_.exists("[class*=\"reference\"], [class*=\"citation\"]");

    signals.publishDate = findPublishDate();
    signals.updateDate = findUpdateDate();

    containsAny(lowerText_, kExpertiseKeywords, &signals.expertiseIndicators);

    if (document_.exists("[src*=\"ssl\"], [href*=\"https\"]")) {
        signals.trustSignals.push_back("SSL certificate");
    }
    if (document_.exists(".testimonial, [class*=\"review\"]")) {
        signals.trustSignals.push_back("testimonials");
    }
    if (document_.exists("[class*=\"award\"], [class*=\"certification\"]")) {
        signals.trustSignals.push_back("certifications");
    }
    std::string footerText;
    for (const GumboNode* footer : document_.select("footer")) {
        footerText += HtmlDocument::text(footer);
    }
    if (toLower(footerText).find("privacy") != std::string::npos) {
        signals.trustSignals.push_back("privacy policy");
    }
}

void PageSignalDetector::detectPageFacts(PageSignals& signals) const {
    auto& facts = signals.pageFacts;

    std::string footerText;
    for (const GumboNode* footer : document_.select("footer")) {
        footerText += HtmlDocument::text(footer);
    }

    facts["clear_navigation"] = document_.exists("nav, [role=\"navigation\"]") ? 1 : 0;
    facts["value_proposition"] = document_.exists(".hero, [class*=\"hero\"], [class*=\"value\"]") ? 1 : 0;
    facts["comprehensive_footer"] = footerText.size() > 100 ? 1 : 0;

    facts["company_background"] = matches(lowerText_, "\\b(team|ansatte|grunnlagt|founded|historie|history)\\b", false) ? 1 : 0;
    facts["mission_vision"] = matches(lowerText_, "\\b(mission|visjon|vision|values|verdier)\\b", false) ? 1 : 0;
    facts["team_photos"] = document_.exists("img[alt*=\"team\"], img[alt*=\"person\"], .team") ? 1 : 0;

    facts["phone_number"] = matches(bodyText_, "\\+?\\d{2,4}[\\s-]?\\d{2,4}[\\s-]?\\d{2,4}", false) ? 1 : 0;
    facts["email_address"] = matches(bodyText_, "@[\\w.-]+\\.\\w+", false) ? 1 : 0;
    facts["contact_form"] = document_.exists("form") ? 1 : 0;
    facts["physical_address"] = matches(bodyText_, "\\b(addresse|address|location|lokasjon)\\b") ? 1 : 0;

    facts["pricing_information"] = document_.exists(".price, .pricing, [class*=\"price\"]") ? 1 : 0;
    facts["customer_testimonials"] = document_.exists(".testimonial, [class*=\"review\"], [class*=\"testimonial\"]") ? 1 : 0;
    facts["guarantee_policy"] = matches(bodyText_, "\\b(garantie|guarantee|refund|pengene tilbake)\\b") ? 1 : 0;

    facts["question_headings"] = static_cast<int>(questionHeadingCount("h2, h3, h4", true));
    facts["search_functionality"] = document_.exists("[type=\"search\"], .search") ? 1 : 0;
}

void PageSignalDetector::detectTechnical(const ContentExtraction& extraction, PageSignals& signals) const {
    signals.isHttps = common::startsWith(toLower(extraction.url), "https://");

    const GumboNode* viewport = document_.selectFirst("meta[name=\"viewport\"]");
    signals.hasViewportMeta = viewport &&
        HtmlDocument::attribute(viewport, "content").find("width=device-width") != std::string::npos;

    const auto images = document_.select("img");
    signals.imageCount = images.size();
    size_t responsive = 0;
    for (const GumboNode* image : images) {
        if (HtmlDocument::hasAttribute(image, "srcset")) {
            ++responsive;
        }
        if (!trim(HtmlDocument::attribute(image, "alt")).empty()) {
            ++signals.imagesWithAlt;
        }
    }
    signals.responsiveImageRatio = images.empty() ? 0.0 : static_cast<double>(responsive) / static_cast<double>(images.size());
    signals.hasMobileCss = document_.exists("link[media*=\"screen\"]");

    const GumboNode* description = document_.selectFirst("meta[name=\"description\"]");
    const std::string descriptionText = description ? trim(HtmlDocument::attribute(description, "content")) : "";
    signals.hasMetaDescription = !descriptionText.empty();
    signals.metaDescriptionLength = common::utf8Length(descriptionText);

    const GumboNode* ogTitle = document_.selectFirst("meta[property=\"og:title\"]");
    signals.hasOgTitle = ogTitle && !trim(HtmlDocument::attribute(ogTitle, "content")).empty();
    signals.titleLength = common::utf8Length(document_.title());

    signals.internalLinkCount = extraction.internalLinks.size();
    signals.hasRobotsMeta = document_.exists("meta[name=\"robots\"]");
    const GumboNode* canonical = document_.selectFirst("link[rel=\"canonical\"]");
    signals.hasCanonical = canonical && !trim(HtmlDocument::attribute(canonical, "href")).empty();

    signals.structuredData = jsonLd_.summarize();
}

void PageSignalDetector::detectIndicators(PageSignals& signals) const {
    auto add = [&signals](const char* name, bool present) {
        if (present) {
            signals.indicators.push_back(name);
        }
    };
    const std::string lowerTitle = toLower(document_.title());

    // Blog / article
    add("author_present", signals.hasAuthor);
    add("publish_date", signals.publishDate.has_value());
    add("byline_language", matches(lowerText_, "\\b(publisert|published|forfatter|author|av\\s+[a-z]|written by|posted by)"));
    add("byline_markup", document_.exists("[class*=\"author\"], [class*=\"byline\"], [class*=\"date\"], [class*=\"publish\"]"));
    add("article_element", document_.exists("article"));

    // Conversion
    add("conversion_form", document_.exists("form[class*=\"contact\"], form[class*=\"signup\"], form[class*=\"register\"]"));
    add("cta_language", matches(lowerText_, "\\b(get started|sign up|free trial|request demo|contact us|book a demo|start free|subscribe)\\b"));
    add("pricing_markup", document_.exists(".price, .pricing, [class*=\"price\"], [class*=\"plan\"]"));
    add("cta_markup", document_.exists("[class*=\"cta\"], [class*=\"call-to-action\"]"));
    add("purchase_language", matches(lowerText_, "\\b(kontakt oss|få tilbud|bestill|order now|buy now|purchase)\\b"));

    // Product
    add("product_language", matches(lowerText_, "\\b(produkt|product|buy|kjøp|price|pris|add to cart|legg i handlekurv|specifications|specs)\\b"));
    add("price_markup", document_.exists(".price, .pricing, [class*=\"price\"]"));
    add("product_markup", document_.exists("[class*=\"product\"], [class*=\"item\"]"));
    add("feature_language", matches(lowerText_, "\\b(features|benefits|fordeler|technical details|dimensions)\\b"));
    add("buy_button", document_.exists("button[class*=\"buy\"], button[class*=\"cart\"], button[class*=\"purchase\"]"));

    // Solution
    add("solution_language", matches(lowerText_, "\\b(solution|løsning|service|tjeneste|how we|hvordan vi|our approach|vår tilnærming)\\b"));
    add("problem_language", matches(lowerText_, "\\b(problem|utfordring|challenge|need|behov|pain point)\\b"));
    add("benefit_language", matches(lowerText_, "\\b(benefit|fordel|advantage|result|resultat|outcome)\\b"));
    add("solution_title", lowerTitle.find("solution") != std::string::npos ||
                          lowerTitle.find("løsning") != std::string::npos ||
                          lowerTitle.find("service") != std::string::npos);

    // Resource
    add("guide_language", matches(lowerText_, "\\b(guide|veiledning|tutorial|how to|hvordan|documentation|docs|learn|lær|reference)\\b"));
    add("instruction_language", matches(lowerText_, "\\b(step|steg|instruction|tips|best practices|examples|eksempler)\\b"));
    add("faq_style_headings", signals.pageFacts["question_headings"] >= 3);
    add("faq_section", signals.hasFaqSection);
    add("download_language", matches(lowerText_, "\\b(download|last ned|pdf|template|mal|worksheet|checklist)\\b"));

    // Homepage
    add("welcome_language", matches(lowerText_, "\\b(velkommen|welcome|hjem|home|hovedside)\\b"));
    add("navigation", signals.pageFacts["clear_navigation"] > 0);
    add("hero_markup", document_.exists(".hero, [class*=\"hero\"], [class*=\"banner\"]"));
    add("header_and_footer", document_.exists("header") && document_.exists("footer"));
    add("multiple_sections", document_.count("section") >= 3);
}

std::optional<std::string> PageSignalDetector::findPublishDate() const {
    auto value = firstDateValue(kPublishDateSelectors, sizeof(kPublishDateSelectors) / sizeof(kPublishDateSelectors[0]));
    if (!value) {
        value = jsonLd_.firstString("datePublished");
    }
    if (!value) {
        value = ContentExtractor::findDateInText(bodyText_);
    }
    return value;
}

std::optional<std::string> PageSignalDetector::findUpdateDate() const {
    auto value = firstDateValue(kUpdateDateSelectors, sizeof(kUpdateDateSelectors) / sizeof(kUpdateDateSelectors[0]));
    if (!value) {
        value = jsonLd_.firstString("dateModified");
    }
    if (!value) {
        value = ContentExtractor::findUpdateDateInText(bodyText_);
    }
    return value;
}

std::optional<std::string> PageSignalDetector::firstDateValue(const char* const* selectors, size_t count) const {
    for (size_t i = 0; i < count; ++i) {
        const GumboNode* node = document_.selectFirst(selectors[i]);
        if (!node) {
            continue;
        }
        std::string value = trim(HtmlDocument::attribute(node, "datetime"));
        if (value.empty()) {
            value = trim(HtmlDocument::attribute(node, "content"));
        }
        if (value.empty()) {
            value = HtmlDocument::text(node);
        }
        if (value.size() > 4) {
            return value;
        }
    }
    return std::nullopt;
}

size_t PageSignalDetector::questionHeadingCount(const char* selector, bool questionMarkOnly) const {
    size_t count = 0;
    for (const GumboNode* node : document_.select(selector)) {
        const std::string text = HtmlDocument::text(node);
        if (questionMarkOnly ? text.find('?') != std::string::npos : looksLikeQuestion(text)) {
            ++count;
        }
    }
    return count;
}

} // namespace aeo_engine::extraction
