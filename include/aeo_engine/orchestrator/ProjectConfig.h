#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace aeo_engine::orchestrator {

enum class RunType {
    FULL,           // base + sitemap + link following up to depthLimit
    SITEMAP_ONLY,   // base + sitemap entries
    SAMPLE,         // base + highest-priority sitemap entries
    DELTA,          // base + sitemap entries modified after modifiedAfter
    MANUAL          // base + explicit urls
};

std::string toString(RunType type);
// Throws ConfigError for unknown names
RunType runTypeFromString(const std::string& name);

// One crawl request from the orchestration layer
struct ProjectConfig {
    std::string projectId;
    std::string baseUrl;
    RunType runType = RunType::FULL;
    int depthLimit = 3;
    size_t sampleSize = 0;     // 0 = no limit
    long long tokenLimit = 0;  // 0 = no limit
    size_t maxPages = 500;
    std::vector<std::string> excludedPatterns;
    std::string userAgent;     // empty uses the process default
    bool aiScoring = false;
    std::optional<double> minPriority;
    std::optional<std::chrono::system_clock::time_point> modifiedAfter;
    std::vector<std::string> urls;

    /**
     * Keys: project_id, base_url (required), run_type, depth_limit, sample_size,
     * token_limit, max_pages, excluded_patterns, user_agent, ai_scoring,
     * min_priority, modified_after, urls.
     *
     * Throws InvalidUrlError for a bad base_url and ConfigError for anything else.
     */
    static ProjectConfig fromJson(const nlohmann::json& document);
    static ProjectConfig loadFromFile(const std::string& path);
};

void to_json(nlohmann::json& j, const ProjectConfig& config);

} // namespace aeo_engine::orchestrator
