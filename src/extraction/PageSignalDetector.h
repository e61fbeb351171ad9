#pragma once

#include <string>
#include "../../include/aeo_engine/extraction/ContentExtraction.h"
#include "../../include/aeo_engine/extraction/HtmlDocument.h"
#include "JsonLd.h"

namespace aeo_engine::extraction {

// Computes PageSignals for one parsed page
class PageSignalDetector {
public:
    PageSignalDetector(const HtmlDocument& document, const JsonLdDocument& jsonLd, int referenceYear);

    // `extraction` must already carry headings, links and title
    PageSignals detect(const ContentExtraction& extraction) const;

private:
    void detectContent(const ContentExtraction& extraction, PageSignals& signals) const;
    void detectAuthority(const ContentExtraction& extraction, PageSignals& signals) const;
    void detectPageFacts(PageSignals& signals) const;
    void detectTechnical(const ContentExtraction& extraction, PageSignals& signals) const;
    void detectIndicators(PageSignals& signals) const;

    std::optional<std::string> findPublishDate() const;
    std::optional<std::string> findUpdateDate() const;

    // First non-trivial datetime/content/text value among the selectors
    std::optional<std::string> firstDateValue(const char* const* selectors, size_t count) const;

    size_t questionHeadingCount(const char* selector, bool questionMarkOnly) const;

    const HtmlDocument& document_;
    const JsonLdDocument& jsonLd_;
    int referenceYear_;
    std::string bodyText_;
    std::string lowerText_;
};

} // namespace aeo_engine::extraction
