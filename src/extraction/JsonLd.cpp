#include "JsonLd.h"
#include "../../include/aeo_engine/common/TextUtils.h"
#include "../../include/Logger.h"

#include <algorithm>
#include <functional>

namespace aeo_engine::extraction {

namespace {

size_t arraySize(const nlohmann::json& object, const std::string& key) {
    auto it = object.find(key);
    if (it == object.end()) {
        return 0;
    }
    return it->is_array() ? it->size() : 1;
}

std::optional<std::string> nameOf(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_object()) {
        auto name = value.find("name");
        if (name != value.end() && name->is_string()) {
            return name->get<std::string>();
        }
    }
    if (value.is_array() && !value.empty()) {
        return nameOf(value.front());
    }
    return std::nullopt;
}

std::string answerText(const nlohmann::json& question) {
    auto accepted = question.find("acceptedAnswer");
    if (accepted == question.end()) {
        return "";
    }
    const nlohmann::json& answer = accepted->is_array() && !accepted->empty() ? accepted->front() : *accepted;
    if (answer.is_object()) {
        auto text = answer.find("text");
        if (text != answer.end() && text->is_string()) {
            return common::collapseWhitespace(text->get<std::string>());
        }
    }
    return "";
}

} // namespace

JsonLdDocument::JsonLdDocument(const HtmlDocument& document) {
    for (const GumboNode* script : document.select("script[type=\"application/ld+json\"]")) {
        const std::string raw = HtmlDocument::rawText(script);
        nlohmann::json block = nlohmann::json::parse(raw, nullptr, false);
        if (block.is_discarded()) {
            LOG_DEBUG("Skipping malformed JSON-LD block (" + std::to_string(raw.size()) + " bytes)");
            continue;
        }
        addBlock(block);
    }
}

void JsonLdDocument::addBlock(const nlohmann::json& block) {
    if (block.is_array()) {
        for (const auto& item : block) {
            addBlock(item);
        }
        return;
    }
    if (!block.is_object()) {
        return;
    }
    auto graph = block.find("@graph");
    if (graph != block.end() && graph->is_array()) {
        for (const auto& member : *graph) {
            if (member.is_object()) {
                objects_.push_back(member);
            }
        }
        return;
    }
    objects_.push_back(block);
}

std::vector<std::string> JsonLdDocument::typesOf(const nlohmann::json& object) {
    std::vector<std::string> types;
    if (!object.is_object()) {
        return types;
    }
    auto type = object.find("@type");
    if (type == object.end()) {
        return types;
    }
    if (type->is_string()) {
        types.push_back(type->get<std::string>());
    } else if (type->is_array()) {
        for (const auto& entry : *type) {
            if (entry.is_string()) {
                types.push_back(entry.get<std::string>());
            }
        }
    }
    return types;
}

bool JsonLdDocument::hasType(const nlohmann::json& object, const std::string& type) {
    auto types = typesOf(object);
    return std::find(types.begin(), types.end(), type) != types.end();
}

std::vector<std::string> JsonLdDocument::allTypes() const {
    std::vector<std::string> types;
    std::function<void(const nlohmann::json&)> visit = [&](const nlohmann::json& value) {
        if (value.is_object()) {
            for (const auto& type : typesOf(value)) {
                if (std::find(types.begin(), types.end(), type) == types.end()) {
                    types.push_back(type);
                }
            }
            for (const auto& item : value.items()) {
                if (item.value().is_structured()) {
                    visit(item.value());
                }
            }
        } else if (value.is_array()) {
            for (const auto& item : value) {
                visit(item);
            }
        }
    };
    for (const auto& object : objects_) {
        visit(object);
    }
    return types;
}

std::optional<std::string> JsonLdDocument::firstString(const std::string& key) const {
    for (const auto& object : objects_) {
        auto it = object.find(key);
        if (it != object.end() && it->is_string() && !it->get<std::string>().empty()) {
            return it->get<std::string>();
        }
    }
    return std::nullopt;
}

std::optional<std::string> JsonLdDocument::author() const {
    for (const auto& object : objects_) {
        auto it = object.find("author");
        if (it == object.end()) {
            continue;
        }
        auto name = nameOf(*it);
        if (name && !name->empty()) {
            return name;
        }
    }
    return std::nullopt;
}

std::vector<FaqPair> JsonLdDocument::faqPairs() const {
    std::vector<FaqPair> pairs;
    for (const auto& object : objects_) {
        if (!hasType(object, "FAQPage")) {
            continue;
        }
        auto mainEntity = object.find("mainEntity");
        if (mainEntity == object.end() || !mainEntity->is_array()) {
            continue;
        }
        for (const auto& item : *mainEntity) {
            if (!hasType(item, "Question")) {
                continue;
            }
            FaqPair pair;
            auto name = item.find("name");
            if (name != item.end() && name->is_string()) {
                pair.question = common::collapseWhitespace(name->get<std::string>());
            }
            pair.answer = answerText(item);
            pairs.push_back(std::move(pair));
        }
    }
    return pairs;
}

StructuredDataSummary JsonLdDocument::summarize() const {
    StructuredDataSummary summary;
    summary.objectCount = objects_.size();

    for (const auto& object : objects_) {
        for (const auto& type : typesOf(object)) {
            if (std::find(summary.topLevelTypes.begin(), summary.topLevelTypes.end(), type) == summary.topLevelTypes.end()) {
                summary.topLevelTypes.push_back(type);
            }
        }

        if (!summary.hasFaqSchema && hasType(object, "FAQPage")) {
            summary.hasFaqSchema = true;
            summary.faqQuestionCount = arraySize(object, "mainEntity");
        }
        if (!summary.hasHowToSchema && hasType(object, "HowTo")) {
            summary.hasHowToSchema = true;
            summary.howToStepCount = arraySize(object, "step");
        }
        if (!summary.hasArticleSchema &&
            (hasType(object, "Article") || hasType(object, "BlogPosting") || hasType(object, "NewsArticle"))) {
            summary.hasArticleSchema = true;
            summary.articleHasAuthor = object.contains("author") && !object["author"].is_null();
            summary.articleHasDatePublished = object.contains("datePublished") && !object["datePublished"].is_null();
        }
        if (!summary.hasBreadcrumbSchema && hasType(object, "BreadcrumbList")) {
            summary.hasBreadcrumbSchema = true;
            summary.breadcrumbItemCount = arraySize(object, "itemListElement");
        }
    }
    return summary;
}

} // namespace aeo_engine::extraction
