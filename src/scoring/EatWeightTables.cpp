#include "../../include/aeo_engine/scoring/EatWeightTables.h"
#include "../../include/aeo_engine/common/Errors.h"
#include "../../include/Logger.h"

#include <fstream>
#include <stdexcept>

namespace aeo_engine::scoring {

using nlohmann::json;

namespace {

PageFactorRule flag(const char* fact, double points, const char* label) {
    PageFactorRule rule;
    rule.fact = fact;
    rule.points = points;
    rule.cap = points;
    rule.label = label;
    return rule;
}

EatProfile blogProfile() {
    EatProfile p;
    p.name = "blog";
    p.author = 20;
    p.authorBio = 10;
    p.contact = 10;
    p.citationPerItem = 4;
    p.citationCap = 20;
    p.references = 5;
    p.publishDate = 10;
    p.updateDate = 10;
    p.expertisePerItem = 2;
    p.expertiseCap = 10;
    p.trustPerItem = 1;
    p.trustCap = 5;
    // Editorial factors are covered by the author and freshness points above
    p.pageFactors.base = 100;
    return p;
}

EatProfile homepageProfile() {
    EatProfile p;
    p.name = "homepage";
    p.contact = 25;
    p.citationFlat = 10;
    p.updateDate = 5;
    p.expertisePerItem = 3;
    p.expertiseCap = 15;
    p.trustPerItem = 4;
    p.trustCap = 20;
    p.pageFactors.rules = {
        flag("clear_navigation", 20, "clear navigation"),
        flag("value_proposition", 15, "value proposition"),
        flag("comprehensive_footer", 10, "comprehensive footer")
    };
    p.pageFactors.weight = 0.25;
    p.pageFactors.cap = 25;
    return p;
}

EatProfile aboutProfile() {
    EatProfile p;
    p.name = "about";
    p.author = 5;
    p.contact = 20;
    p.citationFlat = 10;
    p.updateDate = 5;
    p.expertisePerItem = 4;
    p.expertiseCap = 20;
    p.trustPerItem = 3;
    p.trustCap = 15;
    p.pageFactors.rules = {
        flag("company_background", 25, "company background"),
        flag("mission_vision", 20, "mission/vision"),
        flag("team_photos", 15, "team photos")
    };
    p.pageFactors.weight = 0.25;
    p.pageFactors.cap = 25;
    return p;
}

EatProfile contactProfile() {
    EatProfile p;
    p.name = "contact";
    p.contact = 40;
    p.updateDate = 5;
    p.expertisePerItem = 2;
    p.expertiseCap = 10;
    p.trustPerItem = 3;
    p.trustCap = 15;
    p.pageFactors.rules = {
        flag("phone_number", 20, "phone number"),
        flag("email_address", 15, "email address"),
        flag("contact_form", 20, "contact form"),
        flag("physical_address", 15, "physical address")
    };
    p.pageFactors.weight = 0.3;
    p.pageFactors.cap = 30;
    return p;
}

EatProfile serviceProfile() {
    EatProfile p;
    p.name = "service";
    p.author = 5;
    p.contact = 20;
    p.citationFlat = 15;
    p.updateDate = 10;
    p.expertisePerItem = 4;
    p.expertiseCap = 20;
    p.trustPerItem = 3;
    p.trustCap = 15;
    p.pageFactors.rules = {
        flag("pricing_information", 20, "pricing information"),
        flag("customer_testimonials", 25, "customer testimonials"),
        flag("guarantee_policy", 15, "guarantee/refund policy")
    };
    p.pageFactors.weight = 0.15;
    p.pageFactors.cap = 15;
    return p;
}

EatProfile faqProfile() {
    EatProfile p;
    p.name = "faq";
    p.contact = 15;
    p.citationFlat = 15;
    p.updateDate = 10;
    p.expertisePerItem = 5;
    p.expertiseCap = 25;
    p.trustPerItem = 3;
    p.trustCap = 15;

    PageFactorRule questions;
    questions.fact = "question_headings";
    questions.points = 5;
    questions.cap = 40;
    questions.minimum = 5;
    questions.label = "questions answered";
    p.pageFactors.rules = {questions, flag("search_functionality", 20, "search functionality")};
    p.pageFactors.weight = 0.2;
    p.pageFactors.cap = 20;
    return p;
}

EatProfile genericProfile() {
    EatProfile p;
    p.name = "generic";
    p.author = 10;
    p.authorBio = 5;
    p.contact = 15;
    p.citationFlat = 10;
    p.publishDate = 5;
    p.updateDate = 5;
    p.expertisePerItem = 3;
    p.expertiseCap = 15;
    p.trustPerItem = 3;
    p.trustCap = 15;
    // Standard page
    p.pageFactors.base = 50;
    p.pageFactors.weight = 0.2;
    p.pageFactors.cap = 20;
    return p;
}

} // namespace

EatWeightTables EatWeightTables::createDefault() {
    EatWeightTables tables;
    for (EatProfile profile : {blogProfile(), homepageProfile(), aboutProfile(), contactProfile(),
                               serviceProfile(), faqProfile(), genericProfile()}) {
        tables.profiles_[profile.name] = profile;
    }

    using extraction::PageType;
    tables.pageTypeProfiles_ = {
        {PageType::BLOG, "blog"},
        {PageType::HOMEPAGE, "homepage"},
        {PageType::CONVERSION, "contact"},
        {PageType::SOLUTION, "service"},
        {PageType::PRODUCT, "generic"},
        {PageType::RESOURCE, "generic"}
    };
    tables.fallbackProfile_ = "generic";
    return tables;
}

EatWeightTables EatWeightTables::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw common::ConfigError("Cannot open EAT weight tables at " + path);
    }
    const json document = json::parse(file, nullptr, false);
    if (document.is_discarded()) {
        throw common::ConfigError("EAT weight tables at " + path + " are not valid JSON");
    }
    EatWeightTables tables = fromJson(document);
    LOG_INFO("Loaded EAT weight tables from " + path + " (" + std::to_string(tables.profiles_.size()) + " profiles)");
    return tables;
}

EatWeightTables EatWeightTables::fromJson(const json& document) {
    if (!document.is_object() || !document.contains("profiles") || !document["profiles"].is_object()) {
        throw common::ConfigError("EAT weight tables need a 'profiles' object");
    }

    EatWeightTables tables;
    try {
        for (const auto& [name, value] : document["profiles"].items()) {
            EatProfile profile = value.get<EatProfile>();
            profile.name = name;
            tables.profiles_[name] = std::move(profile);
        }
    } catch (const json::exception& e) {
        throw common::ConfigError(std::string("Invalid EAT profile: ") + e.what());
    }

    tables.fallbackProfile_ = document.value("fallbackProfile", std::string("generic"));
    if (!tables.hasProfile(tables.fallbackProfile_)) {
        throw common::ConfigError("Fallback EAT profile '" + tables.fallbackProfile_ + "' is not defined");
    }

    if (document.contains("pageTypeProfiles")) {
        for (const auto& [typeName, profileName] : document["pageTypeProfiles"].items()) {
            extraction::PageType type;
            try {
                type = extraction::pageTypeFromString(typeName);
            } catch (const std::invalid_argument& e) {
                throw common::ConfigError(e.what());
            }
            if (!profileName.is_string() || !tables.hasProfile(profileName.get<std::string>())) {
                throw common::ConfigError("Page type '" + typeName + "' maps to an undefined EAT profile");
            }
            tables.pageTypeProfiles_[type] = profileName.get<std::string>();
        }
    }
    return tables;
}

json EatWeightTables::toJson() const {
    json document;
    document["profiles"] = json::object();
    for (const auto& [name, profile] : profiles_) {
        document["profiles"][name] = profile;
    }
    document["pageTypeProfiles"] = json::object();
    for (const auto& [type, profileName] : pageTypeProfiles_) {
        document["pageTypeProfiles"][extraction::toString(type)] = profileName;
    }
    document["fallbackProfile"] = fallbackProfile_;
    return document;
}

const EatProfile& EatWeightTables::profileFor(extraction::PageType type) const {
    auto it = pageTypeProfiles_.find(type);
    if (it != pageTypeProfiles_.end() && hasProfile(it->second)) {
        return profiles_.at(it->second);
    }
    return profiles_.at(fallbackProfile_);
}

const EatProfile& EatWeightTables::profile(const std::string& name) const {
    auto it = profiles_.find(name);
    if (it == profiles_.end()) {
        return profiles_.at(fallbackProfile_);
    }
    return it->second;
}

bool EatWeightTables::hasProfile(const std::string& name) const {
    return profiles_.count(name) > 0;
}

void to_json(json& j, const PageFactorRule& rule) {
    j = json{
        {"fact", rule.fact},
        {"points", rule.points},
        {"cap", rule.cap},
        {"minimum", rule.minimum},
        {"label", rule.label}
    };
}

void from_json(const json& j, PageFactorRule& rule) {
    rule.fact = j.at("fact").get<std::string>();
    rule.points = j.value("points", 0.0);
    rule.cap = j.value("cap", rule.points);
    rule.minimum = j.value("minimum", 1);
    rule.label = j.value("label", rule.fact);
}

void to_json(json& j, const EatProfile& profile) {
    j = json{
        {"author", profile.author},
        {"authorBio", profile.authorBio},
        {"contact", profile.contact},
        {"citationFlat", profile.citationFlat},
        {"citationPerItem", profile.citationPerItem},
        {"citationCap", profile.citationCap},
        {"references", profile.references},
        {"publishDate", profile.publishDate},
        {"updateDate", profile.updateDate},
        {"expertisePerItem", profile.expertisePerItem},
        {"expertiseCap", profile.expertiseCap},
        {"trustPerItem", profile.trustPerItem},
        {"trustCap", profile.trustCap},
        {"pageFactors", {
            {"base", profile.pageFactors.base},
            {"rules", profile.pageFactors.rules},
            {"weight", profile.pageFactors.weight},
            {"cap", profile.pageFactors.cap}
        }}
    };
}

void from_json(const json& j, EatProfile& profile) {
    profile.author = j.value("author", 0.0);
    profile.authorBio = j.value("authorBio", 0.0);
    profile.contact = j.value("contact", 0.0);
    profile.citationFlat = j.value("citationFlat", 0.0);
    profile.citationPerItem = j.value("citationPerItem", 0.0);
    profile.citationCap = j.value("citationCap", 0.0);
    profile.references = j.value("references", 0.0);
    profile.publishDate = j.value("publishDate", 0.0);
    profile.updateDate = j.value("updateDate", 0.0);
    profile.expertisePerItem = j.value("expertisePerItem", 0.0);
    profile.expertiseCap = j.value("expertiseCap", 0.0);
    profile.trustPerItem = j.value("trustPerItem", 0.0);
    profile.trustCap = j.value("trustCap", 0.0);

    if (j.contains("pageFactors")) {
        const json& factors = j["pageFactors"];
        profile.pageFactors.base = factors.value("base", 0.0);
        profile.pageFactors.weight = factors.value("weight", 0.0);
        profile.pageFactors.cap = factors.value("cap", 0.0);
        if (factors.contains("rules")) {
            profile.pageFactors.rules = factors["rules"].get<std::vector<PageFactorRule>>();
        }
    }
}

} // namespace aeo_engine::scoring
