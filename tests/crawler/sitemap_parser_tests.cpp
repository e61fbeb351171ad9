#include <catch2/catch_test_macros.hpp>
#include "../../include/aeo_engine/crawler/SitemapParser.h"
#include "../../include/aeo_engine/common/TextUtils.h"
#include "../support/FakeHttpClient.h"

using namespace aeo_engine::crawler;
using aeo_engine::testing::FakeHttpClient;
using aeo_engine::url::UrlCanonicalizer;

namespace {

const std::string kUrlSet = R"(<?xml version="1.0" encoding="UTF-8"?>
<urlset xmlns="http://www.sitemaps.org/schemas/sitemap/0.9">
  <url>
    <loc>https://example.com/</loc>
    <lastmod>2024-03-01</lastmod>
    <changefreq>daily</changefreq>
    <priority>1.0</priority>
  </url>
  <url>
    <loc>https://example.com/blog/post?utm_source=feed</loc>
    <lastmod>2023-06-15T08:30:00+02:00</lastmod>
    <changefreq>weekly</changefreq>
    <priority>0.6</priority>
  </url>
  <url>
    <loc>/about</loc>
  </url>
  <url>
    <loc>https://example.com/blog/post</loc>
    <priority>0.2</priority>
  </url>
</urlset>)";

const std::string kIndex = R"(<?xml version="1.0" encoding="UTF-8"?>
<sitemapindex xmlns="http://www.sitemaps.org/schemas/sitemap/0.9">
  <sitemap><loc>https://example.com/sitemap-pages.xml</loc></sitemap>
  <sitemap><loc>https://example.com/sitemap-broken.xml</loc></sitemap>
  <sitemap><loc>https://example.com/sitemap-missing.xml</loc></sitemap>
</sitemapindex>)";

} // namespace

TEST_CASE("SitemapParser distinguishes urlsets and indexes", "[SitemapParser]") {
    FakeHttpClient http;
    UrlCanonicalizer canonicalizer;
    SitemapParser parser(http, canonicalizer);

    SECTION("Parses urlset entries with optional fields") {
        auto result = parser.parseDocument(kUrlSet, "https://example.com/sitemap.xml");

        REQUIRE(result.success);
        REQUIRE(result.type == SitemapType::URLSET);
        REQUIRE(result.entries.size() == 4);
        REQUIRE(result.entries[0].url.url == "https://example.com/");
        REQUIRE(result.entries[0].lastModified.value() == "2024-03-01");
        REQUIRE(result.entries[0].changeFrequency.value() == "daily");
        REQUIRE(result.entries[0].priority.value() == 1.0);
        // Tracking parameters never reach the frontier
        REQUIRE(result.entries[1].url.url == "https://example.com/blog/post");
        // Relative locations resolve against the sitemap URL
        REQUIRE(result.entries[2].url.url == "https://example.com/about");
        REQUIRE_FALSE(result.entries[2].lastModified.has_value());
        REQUIRE_FALSE(result.entries[2].priority.has_value());
    }

    SECTION("Parses sitemap indexes") {
        auto result = parser.parseDocument(kIndex, "https://example.com/sitemap_index.xml");

        REQUIRE(result.success);
        REQUIRE(result.type == SitemapType::SITEMAPINDEX);
        REQUIRE(result.entries.empty());
        REQUIRE(result.sitemaps.size() == 3);
        REQUIRE(result.sitemaps[0] == "https://example.com/sitemap-pages.xml");
    }

    SECTION("Malformed XML yields an empty result with an error") {
        auto result = parser.parseDocument("<urlset><url><loc>https://example.com/</loc>", "https://example.com/s.xml");
        REQUIRE_FALSE(result.success);
        REQUIRE(result.entries.empty());
        REQUIRE_FALSE(result.error.empty());
    }

    SECTION("Unknown root element is rejected") {
        auto result = parser.parseDocument("<rss><channel/></rss>", "https://example.com/feed.xml");
        REQUIRE_FALSE(result.success);
        REQUIRE(result.type == SitemapType::UNKNOWN);
    }
}

TEST_CASE("SitemapParser parses nested sitemaps", "[SitemapParser]") {
    FakeHttpClient http;
    UrlCanonicalizer canonicalizer;
    SitemapParser parser(http, canonicalizer);

    SECTION("Broken children do not abort their siblings") {
        http.respond("https://example.com/sitemap_index.xml", 200, kIndex, "application/xml");
        http.respond("https://example.com/sitemap-pages.xml", 200, kUrlSet, "application/xml");
        http.respond("https://example.com/sitemap-broken.xml", 200, "<urlset><url>", "application/xml");

        auto entries = parser.parseAll({"https://example.com/sitemap_index.xml"});

        // Four <url> nodes, two of which canonicalize to the same page
        REQUIRE(entries.size() == 3);
        REQUIRE(http.requestCount("https://example.com/sitemap-missing.xml") == 1);
    }

    SECTION("A self-referencing index terminates") {
        const std::string selfIndex = R"(<sitemapindex xmlns="http://www.sitemaps.org/schemas/sitemap/0.9">
            <sitemap><loc>https://example.com/loop.xml</loc></sitemap>
        </sitemapindex>)";
        http.respond("https://example.com/loop.xml", 200, selfIndex, "application/xml");

        auto entries = parser.parseAll({"https://example.com/loop.xml"});

        REQUIRE(entries.empty());
        REQUIRE(http.requestCount("https://example.com/loop.xml") == 1);
    }

    SECTION("Depth is bounded") {
        // level0 -> level1 -> ... each index points one level deeper
        http.setHandler([](const aeo_engine::http::HttpRequest& request) {
            aeo_engine::http::HttpResponse response;
            response.statusCode = 200;
            const std::string prefix = "https://example.com/level";
            int level = std::stoi(request.url.substr(prefix.size()));
            response.body = "<sitemapindex xmlns=\"http://www.sitemaps.org/schemas/sitemap/0.9\"><sitemap><loc>" +
                            prefix + std::to_string(level + 1) + ".xml</loc></sitemap></sitemapindex>";
            return response;
        });

        parser.parseAll({"https://example.com/level0.xml"}, 2);

        REQUIRE(http.requestCount() == 3);
    }
}

TEST_CASE("SitemapParser discovers sitemaps", "[SitemapParser]") {
    FakeHttpClient http;
    UrlCanonicalizer canonicalizer;
    SitemapParser parser(http, canonicalizer);

    http.respondHead("https://example.com/sitemap.xml", 200);
    http.respondHead("https://example.com/sitemaps.xml", 200);

    auto discovered = parser.discover("https://example.com/some/page",
                                      {"https://example.com/news.xml", "https://example.com/sitemap.xml"});

    REQUIRE(discovered.size() == 3);
    REQUIRE(discovered[0] == "https://example.com/news.xml");
    REQUIRE(discovered[1] == "https://example.com/sitemap.xml");
    REQUIRE(discovered[2] == "https://example.com/sitemaps.xml");
    // Every conventional location is probed with HEAD
    REQUIRE(http.requests().size() == SitemapParser::conventionalPaths().size());
}

TEST_CASE("SitemapParser filters and summarizes entries", "[SitemapParser]") {
    FakeHttpClient http;
    UrlCanonicalizer canonicalizer;
    SitemapParser parser(http, canonicalizer);
    auto entries = parser.parseDocument(kUrlSet, "https://example.com/sitemap.xml").entries;

    SECTION("Modified-after keeps entries without lastmod") {
        SitemapFilter filter;
        filter.modifiedAfter = aeo_engine::common::parseIsoDate("2024-01-01");
        auto filtered = SitemapParser::filterUrls(entries, filter);
        REQUIRE(filtered.size() == 3);
        REQUIRE(filtered[0].url.url == "https://example.com/");
    }

    SECTION("Minimum priority keeps entries without priority") {
        SitemapFilter filter;
        filter.minPriority = 0.5;
        auto filtered = SitemapParser::filterUrls(entries, filter);
        REQUIRE(filtered.size() == 3);
    }

    SECTION("Exclude patterns use substring matching") {
        SitemapFilter filter;
        filter.excludePatterns = {"/blog/"};
        auto filtered = SitemapParser::filterUrls(entries, filter);
        REQUIRE(filtered.size() == 2);
    }

    SECTION("Stats report priority bands and change frequencies") {
        auto stats = SitemapParser::getStats(entries);
        REQUIRE(stats.total == 4);
        REQUIRE(stats.withPriority == 3);
        REQUIRE(stats.highPriority == 1);
        REQUIRE(stats.mediumPriority == 1);
        REQUIRE(stats.lowPriority == 1);
        REQUIRE(stats.withLastModified == 2);
        REQUIRE(stats.changeFrequencyDistribution.at("weekly") == 1);
    }
}
