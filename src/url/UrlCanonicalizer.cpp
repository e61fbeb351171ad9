#include "../../include/aeo_engine/url/UrlCanonicalizer.h"
#include "../../include/aeo_engine/common/Errors.h"
#include "../../include/aeo_engine/common/Hashing.h"
#include "../../include/aeo_engine/common/TextUtils.h"
#include "../../include/aeo_engine/extraction/HtmlDocument.h"
#include "../../include/Logger.h"

#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace aeo_engine::url {

using common::InvalidUrlError;
using common::toLower;
using common::trim;

namespace {

const std::vector<std::string> kPaginationParams = {"page", "p", "offset", "start", "pg"};

// Drop ASCII control characters and the zero-width code points that survive copy/paste
std::string stripInvisible(const std::string& input) {
    static const std::vector<std::string> invisible = {
        "\xE2\x80\x8B", "\xE2\x80\x8C", "\xE2\x80\x8D", "\xE2\x81\xA0", "\xEF\xBB\xBF",
        "\xE2\x80\x8E", "\xE2\x80\x8F"
    };
    std::string out;
    out.reserve(input.size());
    for (size_t i = 0; i < input.size();) {
        unsigned char c = static_cast<unsigned char>(input[i]);
        if (c < 0x20 || c == 0x7F) {
            ++i;
            continue;
        }
        bool skipped = false;
        if (c >= 0x80) {
            for (const auto& seq : invisible) {
                if (input.compare(i, seq.size(), seq) == 0) {
                    i += seq.size();
                    skipped = true;
                    break;
                }
            }
        }
        if (!skipped) {
            out.push_back(input[i]);
            ++i;
        }
    }
    return out;
}

std::string encodeSpaces(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == ' ') {
            out += "%20";
        } else {
            out.push_back(c);
        }
    }
    return out;
}

bool isValidHostChar(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c >= 0x80;
}

// RFC 3986 section 5.2.4
std::string removeDotSegments(const std::string& path) {
    if (path.find('.') == std::string::npos) {
        return path;
    }
    std::vector<std::string> output;
    std::vector<std::string> segments = common::split(path, '/');
    for (size_t i = 0; i < segments.size(); ++i) {
        const std::string& segment = segments[i];
        if (i == 0 && segment.empty()) {
            continue;  // leading slash
        }
        if (segment == ".") {
            if (i == segments.size() - 1) output.emplace_back();
            continue;
        }
        if (segment == "..") {
            if (!output.empty()) output.pop_back();
            if (i == segments.size() - 1) output.emplace_back();
            continue;
        }
        output.push_back(segment);
    }
    std::string result;
    for (const auto& segment : output) {
        result += "/" + segment;
    }
    return result.empty() ? "/" : result;
}

std::string queryKey(const std::string& param) {
    size_t eq = param.find('=');
    return eq == std::string::npos ? param : param.substr(0, eq);
}

std::string stripWww(const std::string& host) {
    return common::startsWith(host, "www.") ? host.substr(4) : host;
}

} // namespace

std::string ParsedUrl::authority() const {
    std::string out;
    if (!userInfo.empty()) {
        out += userInfo + "@";
    }
    out += host;
    if (port >= 0) {
        out += ":" + std::to_string(port);
    }
    return out;
}

std::string ParsedUrl::origin() const {
    return scheme + "://" + authority();
}

std::string ParsedUrl::toString() const {
    std::string out = origin() + path;
    if (hasQuery) {
        out += "?" + query;
    }
    if (hasFragment) {
        out += "#" + fragment;
    }
    return out;
}

ParsedUrl parseUrl(const std::string& url) {
    const std::string input = trim(stripInvisible(url));
    if (input.empty()) {
        throw InvalidUrlError(url, "empty");
    }

    const size_t schemeEnd = input.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0) {
        throw InvalidUrlError(url, "missing scheme");
    }

    ParsedUrl parsed;
    parsed.scheme = toLower(input.substr(0, schemeEnd));
    if (parsed.scheme != "http" && parsed.scheme != "https") {
        throw InvalidUrlError(url, "unsupported scheme '" + parsed.scheme + "'");
    }

    const std::string rest = input.substr(schemeEnd + 3);
    const size_t authorityEnd = rest.find_first_of("/?#");
    std::string authority = rest.substr(0, authorityEnd);
    std::string remainder = authorityEnd == std::string::npos ? "" : rest.substr(authorityEnd);

    const size_t at = authority.rfind('@');
    if (at != std::string::npos) {
        parsed.userInfo = authority.substr(0, at);
        authority = authority.substr(at + 1);
    }

    std::string portText;
    if (!authority.empty() && authority.front() == '[') {
        const size_t close = authority.find(']');
        if (close == std::string::npos) {
            throw InvalidUrlError(url, "unterminated IPv6 literal");
        }
        parsed.host = authority.substr(0, close + 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                throw InvalidUrlError(url, "unexpected characters after host");
            }
            portText = authority.substr(close + 2);
        }
    } else {
        const size_t colon = authority.rfind(':');
        if (colon != std::string::npos) {
            portText = authority.substr(colon + 1);
            parsed.host = authority.substr(0, colon);
        } else {
            parsed.host = authority;
        }
        if (parsed.host.empty()) {
            throw InvalidUrlError(url, "missing host");
        }
        for (char c : parsed.host) {
            if (!isValidHostChar(static_cast<unsigned char>(c))) {
                throw InvalidUrlError(url, "invalid host character");
            }
        }
        if (parsed.host.front() == '.' || parsed.host.find("..") != std::string::npos) {
            throw InvalidUrlError(url, "invalid host");
        }
    }

    if (!portText.empty()) {
        if (portText.size() > 5 || !std::all_of(portText.begin(), portText.end(),
                                                        [](unsigned char c) { return std::isdigit(c) != 0; })) {
            throw InvalidUrlError(url, "invalid port");
        }
        parsed.port = std::stoi(portText);
        if (parsed.port == 0 || parsed.port > 65535) {
            throw InvalidUrlError(url, "port out of range");
        }
    }

    const size_t hash = remainder.find('#');
    if (hash != std::string::npos) {
        parsed.fragment = remainder.substr(hash + 1);
        parsed.hasFragment = true;
        remainder = remainder.substr(0, hash);
    }
    const size_t question = remainder.find('?');
    if (question != std::string::npos) {
        parsed.query = encodeSpaces(remainder.substr(question + 1));
        parsed.hasQuery = true;
        remainder = remainder.substr(0, question);
    }
    parsed.path = remainder.empty() ? "/" : removeDotSegments(encodeSpaces(remainder));
    return parsed;
}

std::optional<std::string> resolveReference(const std::string& baseUrl, const std::string& href) {
    const std::string target = trim(stripInvisible(href));
    const std::string lowered = toLower(target);
    if (common::startsWith(lowered, "javascript:") || common::startsWith(lowered, "mailto:") ||
        common::startsWith(lowered, "tel:") || common::startsWith(lowered, "data:")) {
        return std::nullopt;
    }

    ParsedUrl base;
    try {
        base = parseUrl(baseUrl);
    } catch (const InvalidUrlError& e) {
        LOG_DEBUG("resolveReference: unusable base URL " + baseUrl + ": " + e.what());
        return std::nullopt;
    }

    if (target.empty()) {
        base.hasFragment = false;
        base.fragment.clear();
        return base.toString();
    }

    // Absolute reference with its own scheme
    size_t colon = target.find(':');
    size_t firstDelimiter = target.find_first_of("/?#");
    if (colon != std::string::npos && (firstDelimiter == std::string::npos || colon < firstDelimiter) &&
        std::isalpha(static_cast<unsigned char>(target[0]))) {
        try {
            return parseUrl(target).toString();
        } catch (const InvalidUrlError&) {
            return std::nullopt;
        }
    }

    std::string candidate;
    if (common::startsWith(target, "//")) {
        candidate = base.scheme + ":" + target;
    } else if (target[0] == '/') {
        candidate = base.origin() + target;
    } else if (target[0] == '?') {
        candidate = base.origin() + base.path + target;
    } else if (target[0] == '#') {
        candidate = base.origin() + base.path + (base.hasQuery ? "?" + base.query : "") + target;
    } else {
        const size_t lastSlash = base.path.rfind('/');
        const std::string directory = lastSlash == std::string::npos ? "/" : base.path.substr(0, lastSlash + 1);
        candidate = base.origin() + directory + target;
    }

    try {
        return parseUrl(candidate).toString();
    } catch (const InvalidUrlError&) {
        return std::nullopt;
    }
}

std::string extractHost(const std::string& url) {
    try {
        return toLower(parseUrl(url).host);
    } catch (const InvalidUrlError&) {
        return "";
    }
}

std::vector<std::string> NormalizeOptions::defaultIgnoreParams() {
    return {
        "utm_*", "fbclid", "fb_action_ids", "fb_action_types", "fb_source", "fb_ref",
        "gclid", "gclsrc", "dclid", "msclkid", "_ga", "_gl", "mc_*", "igshid",
        "twclid", "li_fat_id", "mbid", "mkt_tok", "trk_*", "ref", "referrer", "source"
    };
}

bool matchesWildcard(const std::string& pattern, const std::string& value) {
    const std::string p = toLower(pattern);
    const std::string v = toLower(value);
    size_t pi = 0, vi = 0;
    size_t starPos = std::string::npos, matchPos = 0;
    while (vi < v.size()) {
        if (pi < p.size() && p[pi] == v[vi]) {
            ++pi;
            ++vi;
        } else if (pi < p.size() && p[pi] == '*') {
            starPos = pi++;
            matchPos = vi;
        } else if (starPos != std::string::npos) {
            pi = starPos + 1;
            vi = ++matchPos;
        } else {
            return false;
        }
    }
    while (pi < p.size() && p[pi] == '*') {
        ++pi;
    }
    return pi == p.size();
}

UrlCanonicalizer::UrlCanonicalizer(NormalizeOptions options) : options_(std::move(options)) {
}

CanonicalUrl UrlCanonicalizer::normalize(const std::string& url) const {
    return normalize(url, options_);
}

CanonicalUrl UrlCanonicalizer::normalize(const std::string& url, const NormalizeOptions& options) const {
    ParsedUrl parsed = parseUrl(url);

    if (options.lowercaseHost) {
        parsed.host = toLower(parsed.host);
    }

    if (options.removeDefaultPort &&
        ((parsed.scheme == "http" && parsed.port == 80) || (parsed.scheme == "https" && parsed.port == 443))) {
        parsed.port = -1;
    }

    if (options.removeFragment) {
        parsed.fragment.clear();
        parsed.hasFragment = false;
    }

    if (parsed.hasQuery) {
        std::vector<std::string> kept;
        for (const auto& param : common::split(parsed.query, '&')) {
            if (param.empty()) {
                continue;
            }
            const std::string key = queryKey(param);
            bool ignored = std::any_of(options.ignoreParams.begin(), options.ignoreParams.end(),
                                       [&key](const std::string& pattern) { return matchesWildcard(pattern, key); });
            if (!ignored) {
                kept.push_back(param);
            }
        }
        if (options.sortParams) {
            std::stable_sort(kept.begin(), kept.end(), [](const std::string& a, const std::string& b) {
                return queryKey(a) < queryKey(b);
            });
        }
        parsed.query.clear();
        for (size_t i = 0; i < kept.size(); ++i) {
            if (i > 0) parsed.query += "&";
            parsed.query += kept[i];
        }
        parsed.hasQuery = !parsed.query.empty();
    }

    if (options.removeTrailingSlash) {
        while (parsed.path.size() > 1 && parsed.path.back() == '/') {
            parsed.path.pop_back();
        }
    }

    CanonicalUrl canonical;
    canonical.url = parsed.toString();
    canonical.hash = hash(canonical.url);
    return canonical;
}

std::string UrlCanonicalizer::hash(const std::string& canonicalUrl) {
    return common::sha256Hex(canonicalUrl);
}

CanonicalUrl UrlCanonicalizer::resolveCanonical(const std::string& fetchedUrl, const std::string& html) const {
    if (!html.empty()) {
        extraction::HtmlDocument document(html);
        std::vector<std::string> hints;
        for (const auto* link : document.select("link[rel]")) {
            if (toLower(trim(extraction::HtmlDocument::attribute(link, "rel"))) == "canonical") {
                hints.push_back(extraction::HtmlDocument::attribute(link, "href"));
                break;
            }
        }
        if (const auto* ogUrl = document.selectFirst("meta[property=og:url]")) {
            hints.push_back(extraction::HtmlDocument::attribute(ogUrl, "content"));
        }

        for (const auto& hint : hints) {
            if (trim(hint).empty()) {
                continue;
            }
            auto resolved = resolveReference(fetchedUrl, hint);
            if (!resolved) {
                continue;
            }
            try {
                return normalize(*resolved);
            } catch (const InvalidUrlError& e) {
                LOG_DEBUG("Ignoring canonical hint '" + hint + "': " + e.what());
            }
        }
    }
    return normalize(fetchedUrl);
}

std::vector<CanonicalUrl> UrlCanonicalizer::deduplicate(const std::vector<std::string>& urls) const {
    std::vector<CanonicalUrl> unique;
    std::unordered_set<std::string> seen;
    for (const auto& url : urls) {
        try {
            CanonicalUrl canonical = normalize(url);
            if (seen.insert(canonical.hash).second) {
                unique.push_back(std::move(canonical));
            }
        } catch (const InvalidUrlError& e) {
            LOG_DEBUG(std::string("deduplicate: skipping ") + e.what());
        }
    }
    return unique;
}

std::map<std::string, std::vector<std::string>> UrlCanonicalizer::groupByCanonical(const std::vector<std::string>& urls) const {
    std::map<std::string, std::vector<std::string>> groups;
    for (const auto& url : urls) {
        try {
            groups[normalize(url).url].push_back(url);
        } catch (const InvalidUrlError& e) {
            LOG_DEBUG(std::string("groupByCanonical: skipping ") + e.what());
        }
    }
    return groups;
}

bool UrlCanonicalizer::isSameDomain(const std::string& a, const std::string& b) {
    const std::string hostA = extractHost(a);
    const std::string hostB = extractHost(b);
    return !hostA.empty() && stripWww(hostA) == stripWww(hostB);
}

bool UrlCanonicalizer::hasPaginationParams(const std::string& url) {
    ParsedUrl parsed;
    try {
        parsed = parseUrl(url);
    } catch (const InvalidUrlError&) {
        return false;
    }
    for (const auto& param : common::split(parsed.query, '&')) {
        const std::string key = toLower(queryKey(param));
        if (std::find(kPaginationParams.begin(), kPaginationParams.end(), key) != kPaginationParams.end()) {
            return true;
        }
    }
    return false;
}

bool UrlCanonicalizer::shouldCrawl(const std::string& url,
                                   const std::vector<std::string>& includePatterns,
                                   const std::vector<std::string>& excludePatterns) {
    for (const auto& pattern : excludePatterns) {
        if (!pattern.empty() && url.find(pattern) != std::string::npos) {
            return false;
        }
    }
    if (includePatterns.empty()) {
        return true;
    }
    return std::any_of(includePatterns.begin(), includePatterns.end(), [&url](const std::string& pattern) {
        return url.find(pattern) != std::string::npos;
    });
}

} // namespace aeo_engine::url
