#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace aeo_engine::url {

// Components of an absolute http(s) URL
struct ParsedUrl {
    std::string scheme;
    std::string userInfo;
    std::string host;
    int port = -1;          // -1 when absent
    std::string path = "/";
    std::string query;      // without '?'
    std::string fragment;   // without '#'
    bool hasQuery = false;
    bool hasFragment = false;

    std::string authority() const;
    std::string origin() const;
    std::string toString() const;
};

// Throws InvalidUrlError for anything that is not an absolute http(s) URL
ParsedUrl parseUrl(const std::string& url);

// Resolve an href found on `baseUrl`; nullopt for non-http(s) targets (mailto:, javascript:, ...)
std::optional<std::string> resolveReference(const std::string& baseUrl, const std::string& href);

// Lower-cased host, or empty when the URL does not parse
std::string extractHost(const std::string& url);

struct NormalizeOptions {
    bool lowercaseHost = true;
    bool removeTrailingSlash = true;
    bool sortParams = true;
    bool removeFragment = true;
    bool removeDefaultPort = true;
    // Case-insensitive parameter names; '*' matches any run of characters
    std::vector<std::string> ignoreParams = defaultIgnoreParams();

    static std::vector<std::string> defaultIgnoreParams();
};

struct CanonicalUrl {
    std::string url;
    std::string hash;  // SHA-256 hex of url

    bool operator==(const CanonicalUrl& other) const { return hash == other.hash; }
    bool operator!=(const CanonicalUrl& other) const { return !(*this == other); }
};

class UrlCanonicalizer {
public:
    explicit UrlCanonicalizer(NormalizeOptions options = NormalizeOptions());

    CanonicalUrl normalize(const std::string& url) const;
    CanonicalUrl normalize(const std::string& url, const NormalizeOptions& options) const;

    static std::string hash(const std::string& canonicalUrl);

    /**
     * Prefer the page's declared canonical (<link rel="canonical">, then og:url) over the
     * fetched URL. Relative hints are resolved against the fetched URL; hints that are not
     * valid http(s) URLs are ignored.
     */
    CanonicalUrl resolveCanonical(const std::string& fetchedUrl, const std::string& html) const;

    // One entry per distinct hash in first-seen order; invalid URLs are skipped
    std::vector<CanonicalUrl> deduplicate(const std::vector<std::string>& urls) const;

    // canonical url -> original variants, invalid URLs skipped
    std::map<std::string, std::vector<std::string>> groupByCanonical(const std::vector<std::string>& urls) const;

    // Same host, ignoring case and a leading "www."
    static bool isSameDomain(const std::string& a, const std::string& b);

    // Query contains page, p, offset, start or pg
    static bool hasPaginationParams(const std::string& url);

    // Substring filters: empty include list admits everything, any exclude hit rejects
    static bool shouldCrawl(const std::string& url,
                            const std::vector<std::string>& includePatterns,
                            const std::vector<std::string>& excludePatterns);

    const NormalizeOptions& options() const { return options_; }

private:
    NormalizeOptions options_;
};

// Glob match with '*' wildcards, case-insensitive
bool matchesWildcard(const std::string& pattern, const std::string& value);

} // namespace aeo_engine::url
