#include "../../include/aeo_engine/crawler/SitemapParser.h"
#include "../../include/aeo_engine/common/Errors.h"
#include "../../include/aeo_engine/common/TextUtils.h"
#include "../../include/Logger.h"

#include <algorithm>
#include <mutex>
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xpath.h>
#include <libxml/xpathInternals.h>

namespace aeo_engine::crawler {

namespace {

void initializeLibXml() {
    static std::once_flag once;
    std::call_once(once, [] { xmlInitParser(); });
}

// Owns a libxml2 document and its XPath context
class XmlDocument {
public:
    explicit XmlDocument(const std::string& content) {
        initializeLibXml();
        doc_ = xmlReadMemory(content.data(), static_cast<int>(content.size()), nullptr, nullptr,
                             XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING | XML_PARSE_NOBLANKS);
        if (doc_) {
            xpathContext_ = xmlXPathNewContext(doc_);
        }
    }

    ~XmlDocument() {
        if (xpathContext_) {
            xmlXPathFreeContext(xpathContext_);
        }
        if (doc_) {
            xmlFreeDoc(doc_);
        }
    }

    XmlDocument(const XmlDocument&) = delete;
    XmlDocument& operator=(const XmlDocument&) = delete;

    bool isValid() const { return doc_ != nullptr && xpathContext_ != nullptr; }

    std::string rootName() const {
        xmlNodePtr root = xmlDocGetRootElement(doc_);
        return root && root->name ? reinterpret_cast<const char*>(root->name) : "";
    }

    // Element nodes selected by `expression`
    std::vector<xmlNodePtr> select(const std::string& expression) const {
        std::vector<xmlNodePtr> nodes;
        xmlXPathObjectPtr result = xmlXPathEvalExpression(BAD_CAST expression.c_str(), xpathContext_);
        if (!result) {
            return nodes;
        }
        if (result->nodesetval) {
            for (int i = 0; i < result->nodesetval->nodeNr; ++i) {
                nodes.push_back(result->nodesetval->nodeTab[i]);
            }
        }
        xmlXPathFreeObject(result);
        return nodes;
    }

private:
    xmlDocPtr doc_ = nullptr;
    xmlXPathContextPtr xpathContext_ = nullptr;
};

// Trimmed text of the first child element with the given local name
std::optional<std::string> childText(xmlNodePtr parent, const char* localName) {
    for (xmlNodePtr child = parent->children; child; child = child->next) {
        if (child->type != XML_ELEMENT_NODE || xmlStrcmp(child->name, BAD_CAST localName) != 0) {
            continue;
        }
        xmlChar* content = xmlNodeGetContent(child);
        if (!content) {
            return std::nullopt;
        }
        std::string text = common::trim(reinterpret_cast<const char*>(content));
        xmlFree(content);
        if (text.empty()) {
            return std::nullopt;
        }
        return text;
    }
    return std::nullopt;
}

std::string originOf(const std::string& baseUrl) {
    return url::parseUrl(baseUrl).origin();
}

} // namespace

void to_json(nlohmann::json& j, const SitemapEntry& entry) {
    j = nlohmann::json{{"url", entry.url.url}, {"urlHash", entry.url.hash}};
    j["lastmod"] = entry.lastModified ? nlohmann::json(*entry.lastModified) : nlohmann::json(nullptr);
    j["changefreq"] = entry.changeFrequency ? nlohmann::json(*entry.changeFrequency) : nlohmann::json(nullptr);
    j["priority"] = entry.priority ? nlohmann::json(*entry.priority) : nlohmann::json(nullptr);
}

void to_json(nlohmann::json& j, const SitemapStats& stats) {
    j = nlohmann::json{
        {"total", stats.total},
        {"with_priority", stats.withPriority},
        {"with_lastmod", stats.withLastModified},
        {"with_changefreq", stats.withChangeFrequency},
        {"priority_distribution", {
            {"high", stats.highPriority},
            {"medium", stats.mediumPriority},
            {"low", stats.lowPriority}
        }},
        {"changefreq_distribution", stats.changeFrequencyDistribution}
    };
}

SitemapParser::SitemapParser(http::HttpClient& httpClient,
                             const url::UrlCanonicalizer& canonicalizer,
                             std::string userAgent)
    : httpClient_(httpClient), canonicalizer_(canonicalizer), userAgent_(std::move(userAgent)) {
}

const std::vector<std::string>& SitemapParser::conventionalPaths() {
    static const std::vector<std::string> paths = {
        "/sitemap.xml",
        "/sitemap_index.xml",
        "/sitemap-index.xml",
        "/sitemaps.xml",
        "/sitemap1.xml"
    };
    return paths;
}

std::vector<std::string> SitemapParser::discover(const std::string& baseUrl,
                                                 const std::vector<std::string>& robotsSitemaps) const {
    std::vector<std::string> discovered;
    auto addUnique = [&discovered](const std::string& sitemapUrl) {
        if (std::find(discovered.begin(), discovered.end(), sitemapUrl) == discovered.end()) {
            discovered.push_back(sitemapUrl);
        }
    };

    for (const auto& declared : robotsSitemaps) {
        if (auto resolved = url::resolveReference(baseUrl, declared)) {
            addUnique(*resolved);
        }
    }

    const std::string origin = originOf(baseUrl);
    for (const auto& path : conventionalPaths()) {
        const std::string candidate = origin + path;
        http::HttpResponse response = httpClient_.head(candidate, userAgent_, std::chrono::seconds(5));
        if (response.ok()) {
            addUnique(candidate);
        } else {
            LOG_TRACE("No sitemap at " + candidate + " (status " + std::to_string(response.statusCode) + ")");
        }
    }

    LOG_INFO("Discovered " + std::to_string(discovered.size()) + " sitemaps for " + baseUrl);
    return discovered;
}

SitemapParseResult SitemapParser::parse(const std::string& sitemapUrl) const {
    http::HttpRequest request;
    request.url = sitemapUrl;
    request.userAgent = userAgent_;
    request.timeout = std::chrono::seconds(30);
    request.maxBodyBytes = kMaxSitemapBytes;
    http::HttpResponse response = httpClient_.execute(request);

    if (!response.ok()) {
        SitemapParseResult failed;
        failed.error = response.transportOk()
            ? "HTTP " + std::to_string(response.statusCode)
            : response.errorMessage;
        LOG_WARNING("Error fetching sitemap " + sitemapUrl + ": " + failed.error);
        return failed;
    }

    return parseDocument(response.body, sitemapUrl);
}

SitemapParseResult SitemapParser::parseDocument(const std::string& xml, const std::string& sitemapUrl) const {
    SitemapParseResult result;
    try {
        XmlDocument document(xml);
        if (!document.isValid()) {
            throw common::MalformedSitemapError(sitemapUrl, "XML could not be parsed");
        }

        const std::string root = document.rootName();
        if (root == "sitemapindex") {
            result.type = SitemapType::SITEMAPINDEX;
            for (xmlNodePtr node : document.select("/*[local-name()='sitemapindex']/*[local-name()='sitemap']")) {
                auto loc = childText(node, "loc");
                if (!loc) {
                    continue;
                }
                if (auto resolved = url::resolveReference(sitemapUrl, *loc)) {
                    result.sitemaps.push_back(*resolved);
                }
            }
        } else if (root == "urlset") {
            result.type = SitemapType::URLSET;
            for (xmlNodePtr node : document.select("/*[local-name()='urlset']/*[local-name()='url']")) {
                auto loc = childText(node, "loc");
                if (!loc) {
                    continue;
                }
                auto resolved = url::resolveReference(sitemapUrl, *loc);
                if (!resolved) {
                    LOG_DEBUG("Skipping non-http sitemap location: " + *loc);
                    continue;
                }

                SitemapEntry entry;
                try {
                    entry.url = canonicalizer_.normalize(*resolved);
                } catch (const common::InvalidUrlError& e) {
                    LOG_DEBUG(std::string("Skipping sitemap entry: ") + e.what());
                    continue;
                }
                entry.lastModified = childText(node, "lastmod");
                entry.changeFrequency = childText(node, "changefreq");
                if (auto priority = childText(node, "priority")) {
                    try {
                        double value = std::stod(*priority);
                        if (value >= 0.0 && value <= 1.0) {
                            entry.priority = value;
                        }
                    } catch (const std::exception&) {
                        LOG_DEBUG("Invalid sitemap priority '" + *priority + "' for " + entry.url.url);
                    }
                }
                result.entries.push_back(std::move(entry));
            }
        } else {
            throw common::MalformedSitemapError(sitemapUrl, "unexpected root element '" + root + "'");
        }
        result.success = true;
    } catch (const common::MalformedSitemapError& e) {
        LOG_WARNING(e.what());
        result.error = e.what();
        result.entries.clear();
        result.sitemaps.clear();
    }

    LOG_DEBUG("Parsed sitemap " + sitemapUrl + ": " + std::to_string(result.entries.size()) + " urls, " +
              std::to_string(result.sitemaps.size()) + " child sitemaps");
    return result;
}

void SitemapParser::parseRecursive(const std::string& sitemapUrl,
                                   size_t depth,
                                   size_t maxDepth,
                                   std::unordered_set<std::string>& visited,
                                   std::unordered_set<std::string>& seenHashes,
                                   std::vector<SitemapEntry>& out) const {
    if (depth > maxDepth) {
        LOG_DEBUG("Sitemap depth limit reached at " + sitemapUrl);
        return;
    }
    if (!visited.insert(sitemapUrl).second) {
        return;
    }

    SitemapParseResult result = parse(sitemapUrl);
    for (auto& entry : result.entries) {
        if (seenHashes.insert(entry.url.hash).second) {
            out.push_back(std::move(entry));
        }
    }
    for (const auto& child : result.sitemaps) {
        parseRecursive(child, depth + 1, maxDepth, visited, seenHashes, out);
    }
}

std::vector<SitemapEntry> SitemapParser::parseAll(const std::vector<std::string>& sitemapUrls, size_t maxDepth) const {
    std::vector<SitemapEntry> entries;
    std::unordered_set<std::string> visited;
    std::unordered_set<std::string> seenHashes;
    for (const auto& sitemapUrl : sitemapUrls) {
        parseRecursive(sitemapUrl, 0, maxDepth, visited, seenHashes, entries);
    }
    LOG_INFO("Collected " + std::to_string(entries.size()) + " sitemap entries from " +
             std::to_string(visited.size()) + " sitemap files");
    return entries;
}

std::vector<SitemapEntry> SitemapParser::parseSite(const std::string& baseUrl,
                                                   const std::vector<std::string>& robotsSitemaps,
                                                   size_t maxDepth) const {
    return parseAll(discover(baseUrl, robotsSitemaps), maxDepth);
}

std::vector<SitemapEntry> SitemapParser::filterUrls(const std::vector<SitemapEntry>& entries, const SitemapFilter& filter) {
    std::vector<SitemapEntry> filtered;
    for (const auto& entry : entries) {
        if (filter.modifiedAfter && entry.lastModified) {
            auto modified = common::parseIsoDate(*entry.lastModified);
            if (modified && *modified < *filter.modifiedAfter) {
                continue;
            }
        }
        if (filter.minPriority && entry.priority && *entry.priority < *filter.minPriority) {
            continue;
        }
        bool excluded = std::any_of(filter.excludePatterns.begin(), filter.excludePatterns.end(),
                                    [&entry](const std::string& pattern) {
                                        return entry.url.url.find(pattern) != std::string::npos;
                                    });
        if (excluded) {
            continue;
        }
        filtered.push_back(entry);
    }
    return filtered;
}

SitemapStats SitemapParser::getStats(const std::vector<SitemapEntry>& entries) {
    SitemapStats stats;
    stats.total = entries.size();
    for (const auto& entry : entries) {
        if (entry.priority) {
            ++stats.withPriority;
            if (*entry.priority >= 0.8) {
                ++stats.highPriority;
            } else if (*entry.priority >= 0.5) {
                ++stats.mediumPriority;
            } else {
                ++stats.lowPriority;
            }
        }
        if (entry.lastModified) {
            ++stats.withLastModified;
        }
        if (entry.changeFrequency) {
            ++stats.withChangeFrequency;
            ++stats.changeFrequencyDistribution[*entry.changeFrequency];
        }
    }
    return stats;
}

} // namespace aeo_engine::crawler
