#include "../../include/aeo_engine/orchestrator/ProjectConfig.h"
#include "../../include/aeo_engine/common/Errors.h"
#include "../../include/aeo_engine/common/TextUtils.h"
#include "../../include/aeo_engine/url/UrlCanonicalizer.h"

#include <fstream>

namespace aeo_engine::orchestrator {

using nlohmann::json;

namespace {

long long nonNegativeInteger(const json& document, const char* key, long long defaultValue) {
    if (!document.contains(key) || document[key].is_null()) {
        return defaultValue;
    }
    const json& value = document[key];
    if (!value.is_number_integer() || value.get<long long>() < 0) {
        throw common::ConfigError(std::string(key) + " must be a non-negative integer");
    }
    return value.get<long long>();
}

std::vector<std::string> stringList(const json& document, const char* key) {
    std::vector<std::string> values;
    if (!document.contains(key) || document[key].is_null()) {
        return values;
    }
    if (!document[key].is_array()) {
        throw common::ConfigError(std::string(key) + " must be an array of strings");
    }
    for (const auto& item : document[key]) {
        if (!item.is_string()) {
            throw common::ConfigError(std::string(key) + " must be an array of strings");
        }
        values.push_back(item.get<std::string>());
    }
    return values;
}

} // namespace

std::string toString(RunType type) {
    switch (type) {
        case RunType::FULL: return "full";
        case RunType::SITEMAP_ONLY: return "sitemap_only";
        case RunType::SAMPLE: return "sample";
        case RunType::DELTA: return "delta";
        case RunType::MANUAL: return "manual";
    }
    return "full";
}

RunType runTypeFromString(const std::string& name) {
    const std::string lowered = common::toLower(common::trim(name));
    if (lowered == "full") return RunType::FULL;
    if (lowered == "sitemap_only") return RunType::SITEMAP_ONLY;
    if (lowered == "sample") return RunType::SAMPLE;
    if (lowered == "delta") return RunType::DELTA;
    if (lowered == "manual") return RunType::MANUAL;
    throw common::ConfigError("run_type must be one of: full, sitemap_only, sample, delta, manual (got '" + name + "')");
}

ProjectConfig ProjectConfig::fromJson(const json& document) {
    if (!document.is_object()) {
        throw common::ConfigError("project config must be a JSON object");
    }
    if (!document.contains("base_url") || !document["base_url"].is_string()) {
        throw common::ConfigError("base_url is required");
    }

    ProjectConfig config;
    config.baseUrl = common::trim(document["base_url"].get<std::string>());
    url::parseUrl(config.baseUrl);

    if (document.contains("project_id") && document["project_id"].is_string()) {
        config.projectId = document["project_id"].get<std::string>();
    }
    if (document.contains("run_type") && !document["run_type"].is_null()) {
        if (!document["run_type"].is_string()) {
            throw common::ConfigError("run_type must be a string");
        }
        config.runType = runTypeFromString(document["run_type"].get<std::string>());
    }

    config.depthLimit = static_cast<int>(nonNegativeInteger(document, "depth_limit", config.depthLimit));
    config.sampleSize = static_cast<size_t>(nonNegativeInteger(document, "sample_size", 0));
    config.tokenLimit = nonNegativeInteger(document, "token_limit", 0);
    config.maxPages = static_cast<size_t>(nonNegativeInteger(document, "max_pages", static_cast<long long>(config.maxPages)));
    if (config.maxPages == 0) {
        throw common::ConfigError("max_pages must be at least 1");
    }
    config.excludedPatterns = stringList(document, "excluded_patterns");
    config.urls = stringList(document, "urls");

    if (document.contains("user_agent") && document["user_agent"].is_string()) {
        config.userAgent = document["user_agent"].get<std::string>();
    }
    if (document.contains("ai_scoring")) {
        if (!document["ai_scoring"].is_boolean()) {
            throw common::ConfigError("ai_scoring must be a boolean");
        }
        config.aiScoring = document["ai_scoring"].get<bool>();
    }
    if (document.contains("min_priority") && !document["min_priority"].is_null()) {
        if (!document["min_priority"].is_number()) {
            throw common::ConfigError("min_priority must be a number");
        }
        config.minPriority = document["min_priority"].get<double>();
    }
    if (document.contains("modified_after") && !document["modified_after"].is_null()) {
        const auto parsed = document["modified_after"].is_string()
            ? common::parseIsoDate(document["modified_after"].get<std::string>())
            : std::nullopt;
        if (!parsed) {
            throw common::ConfigError("modified_after must be an ISO-8601 date");
        }
        config.modifiedAfter = parsed;
    }

    if (config.runType == RunType::MANUAL) {
        for (const auto& target : config.urls) {
            url::parseUrl(target);
        }
    }
    return config;
}

ProjectConfig ProjectConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw common::ConfigError("cannot read project config " + path);
    }
    const json document = json::parse(file, nullptr, false);
    if (document.is_discarded()) {
        throw common::ConfigError(path + " is not valid JSON");
    }
    return fromJson(document);
}

void to_json(json& j, const ProjectConfig& config) {
    j = json{
        {"project_id", config.projectId},
        {"base_url", config.baseUrl},
        {"run_type", toString(config.runType)},
        {"depth_limit", config.depthLimit},
        {"sample_size", config.sampleSize},
        {"token_limit", config.tokenLimit},
        {"max_pages", config.maxPages},
        {"excluded_patterns", config.excludedPatterns},
        {"user_agent", config.userAgent},
        {"ai_scoring", config.aiScoring},
        {"urls", config.urls}
    };
    if (config.minPriority) {
        j["min_priority"] = *config.minPriority;
    }
    if (config.modifiedAfter) {
        j["modified_after"] = common::formatIso8601(*config.modifiedAfter);
    }
}

} // namespace aeo_engine::orchestrator
