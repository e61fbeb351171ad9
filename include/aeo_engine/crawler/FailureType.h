#pragma once

namespace aeo_engine::crawler {

// How a failed fetch should be handled
enum class FailureType {
    TEMPORARY,    // Retry with exponential backoff
    RATE_LIMITED, // Retry with the longer rate-limit delay
    PERMANENT,    // Don't retry (404, 403, unresolvable host, ...)
    UNKNOWN       // Retry with caution (limited attempts)
};

} // namespace aeo_engine::crawler
