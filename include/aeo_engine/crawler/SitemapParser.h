#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>
#include <nlohmann/json.hpp>

#include "../http/HttpClient.h"
#include "../url/UrlCanonicalizer.h"

namespace aeo_engine::crawler {

struct SitemapEntry {
    url::CanonicalUrl url;
    std::optional<std::string> lastModified;
    std::optional<std::string> changeFrequency;
    std::optional<double> priority;
};

enum class SitemapType {
    URLSET,       // <urlset> with <url> entries
    SITEMAPINDEX, // <sitemapindex> pointing to child sitemaps
    UNKNOWN
};

struct SitemapParseResult {
    SitemapType type = SitemapType::UNKNOWN;
    std::vector<SitemapEntry> entries;   // URLSET
    std::vector<std::string> sitemaps;   // SITEMAPINDEX
    std::string error;
    bool success = false;
};

struct SitemapFilter {
    std::optional<std::chrono::system_clock::time_point> modifiedAfter;
    std::optional<double> minPriority;
    std::vector<std::string> excludePatterns;
};

struct SitemapStats {
    size_t total = 0;
    size_t withPriority = 0;
    size_t withLastModified = 0;
    size_t withChangeFrequency = 0;
    size_t highPriority = 0;    // >= 0.8
    size_t mediumPriority = 0;  // >= 0.5
    size_t lowPriority = 0;
    std::map<std::string, size_t> changeFrequencyDistribution;
};

void to_json(nlohmann::json& j, const SitemapEntry& entry);
void to_json(nlohmann::json& j, const SitemapStats& stats);

class SitemapParser {
public:
    static constexpr size_t kDefaultMaxDepth = 5;
    static constexpr size_t kMaxSitemapBytes = 50 * 1024 * 1024;

    SitemapParser(http::HttpClient& httpClient,
                  const url::UrlCanonicalizer& canonicalizer,
                  std::string userAgent = "AEO-Platform-Bot/1.0");

    /**
     * Sitemap URLs for a site: the robots-declared ones first, then every conventional
     * location that answers a HEAD probe with 2xx. Duplicates are removed.
     */
    std::vector<std::string> discover(const std::string& baseUrl,
                                      const std::vector<std::string>& robotsSitemaps = {}) const;

    // Fetch and parse a single sitemap node; failures yield success == false and an error text
    SitemapParseResult parse(const std::string& sitemapUrl) const;

    // Parse XML that is already in memory; `sitemapUrl` resolves relative <loc> values
    SitemapParseResult parseDocument(const std::string& xml, const std::string& sitemapUrl) const;

    // Depth-first over indexes with a visited set; entries deduplicated by canonical hash
    std::vector<SitemapEntry> parseAll(const std::vector<std::string>& sitemapUrls,
                                       size_t maxDepth = kDefaultMaxDepth) const;

    // discover() followed by parseAll()
    std::vector<SitemapEntry> parseSite(const std::string& baseUrl,
                                        const std::vector<std::string>& robotsSitemaps = {},
                                        size_t maxDepth = kDefaultMaxDepth) const;

    // Entries lacking the filtered field are kept
    static std::vector<SitemapEntry> filterUrls(const std::vector<SitemapEntry>& entries, const SitemapFilter& filter);

    static SitemapStats getStats(const std::vector<SitemapEntry>& entries);

    static const std::vector<std::string>& conventionalPaths();

private:
    void parseRecursive(const std::string& sitemapUrl,
                        size_t depth,
                        size_t maxDepth,
                        std::unordered_set<std::string>& visited,
                        std::unordered_set<std::string>& seenHashes,
                        std::vector<SitemapEntry>& out) const;

    http::HttpClient& httpClient_;
    const url::UrlCanonicalizer& canonicalizer_;
    std::string userAgent_;
};

} // namespace aeo_engine::crawler
