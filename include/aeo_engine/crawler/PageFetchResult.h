#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace aeo_engine::crawler {

enum class RenderMethod {
    STATIC,    // plain HTTP fetch + HTML parse
    RENDERED   // headless browser execution
};

std::string toString(RenderMethod method);

// One page fetch; immutable once produced
struct PageFetchResult {
    std::string url;
    std::string finalUrl;
    int statusCode = 0;
    std::map<std::string, std::string> headers;
    std::string contentType;
    std::string html;
    RenderMethod renderMethod = RenderMethod::STATIC;
    std::chrono::milliseconds elapsed{0};
    std::chrono::system_clock::time_point fetchedAt = std::chrono::system_clock::now();
    // Set when a render was wanted but the static path was used
    std::optional<std::string> renderFallbackReason;
    int attempts = 0;
};

} // namespace aeo_engine::crawler
