#pragma once

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../extraction/PageTypeClassifier.h"

namespace aeo_engine::scoring {

// One page-specific trust fact and what it is worth
struct PageFactorRule {
    std::string fact;         // key into PageSignals::pageFacts
    double points = 0.0;      // per unit of the fact's value
    double cap = 0.0;         // upper bound for this rule
    int minimum = 1;          // fact values below this contribute nothing
    std::string label;
};

// Point allocation for the expertise/authority/trust sub-score of one profile
struct EatProfile {
    std::string name;

    // Authorship
    double author = 0.0;
    double authorBio = 0.0;

    // Contact details or a contact page
    double contact = 0.0;

    // Citations: flat bonus once any authority citation exists, plus per-citation points up to a cap
    double citationFlat = 0.0;
    double citationPerItem = 0.0;
    double citationCap = 0.0;
    double references = 0.0;

    // Freshness
    double publishDate = 0.0;
    double updateDate = 0.0;

    double expertisePerItem = 0.0;
    double expertiseCap = 0.0;
    double trustPerItem = 0.0;
    double trustCap = 0.0;

    // Page-specific trust: (base + sum of rules) * weight, capped
    struct PageFactors {
        double base = 0.0;
        std::vector<PageFactorRule> rules;
        double weight = 0.0;
        double cap = 0.0;
    } pageFactors;
};

/**
 * EAT weight tables kept as data.
 *
 * Each profile is a point allocation; page types are mapped onto profiles and
 * anything unmapped uses the fallback profile. Defaults reproduce the product's
 * hand-tuned values and can be overridden from a JSON file.
 */
class EatWeightTables {
public:
    static EatWeightTables createDefault();

    // Throws ConfigError on unreadable files or invalid documents
    static EatWeightTables loadFromFile(const std::string& path);
    static EatWeightTables fromJson(const nlohmann::json& document);
    nlohmann::json toJson() const;

    const EatProfile& profileFor(extraction::PageType type) const;
    const EatProfile& profile(const std::string& name) const;
    bool hasProfile(const std::string& name) const;

    const std::map<std::string, EatProfile>& profiles() const { return profiles_; }
    const std::map<extraction::PageType, std::string>& pageTypeProfiles() const { return pageTypeProfiles_; }
    const std::string& fallbackProfile() const { return fallbackProfile_; }

private:
    std::map<std::string, EatProfile> profiles_;
    std::map<extraction::PageType, std::string> pageTypeProfiles_;
    std::string fallbackProfile_ = "generic";
};

void to_json(nlohmann::json& j, const PageFactorRule& rule);
void from_json(const nlohmann::json& j, PageFactorRule& rule);
void to_json(nlohmann::json& j, const EatProfile& profile);
void from_json(const nlohmann::json& j, EatProfile& profile);

} // namespace aeo_engine::scoring
