#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../../include/aeo_engine/extraction/ContentExtraction.h"
#include "../../include/aeo_engine/extraction/HtmlDocument.h"

namespace aeo_engine::extraction {

// The JSON-LD blocks of one page. Blocks that fail to parse are skipped.
class JsonLdDocument {
public:
    explicit JsonLdDocument(const HtmlDocument& document);

    // Top-level objects; @graph members replace their wrapper
    const std::vector<nlohmann::json>& objects() const { return objects_; }

    bool empty() const { return objects_.empty(); }

    // Every @type found at any depth, first-seen order
    std::vector<std::string> allTypes() const;

    // First string value of `key` on a top-level object
    std::optional<std::string> firstString(const std::string& key) const;

    std::optional<std::string> author() const;
    std::vector<FaqPair> faqPairs() const;
    StructuredDataSummary summarize() const;

    static std::vector<std::string> typesOf(const nlohmann::json& object);
    static bool hasType(const nlohmann::json& object, const std::string& type);

private:
    void addBlock(const nlohmann::json& block);

    std::vector<nlohmann::json> objects_;
};

} // namespace aeo_engine::extraction
