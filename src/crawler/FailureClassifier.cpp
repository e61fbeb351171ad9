#include "FailureClassifier.h"
#include "../../include/aeo_engine/common/TextUtils.h"
#include "../../include/Logger.h"

#include <algorithm>
#include <cmath>
#include <set>

namespace aeo_engine::crawler {

FailureType FailureClassifier::classifyFailure(int httpCode,
                                               CURLcode curlCode,
                                               const std::string& errorMessage,
                                               const FetchConfig& config) {
    FailureType type = FailureType::UNKNOWN;

    if (httpCode == 429) {
        type = FailureType::RATE_LIMITED;
    } else if (httpCode > 0 && isPermanentHttpError(httpCode)) {
        type = FailureType::PERMANENT;
    } else if (httpCode > 0 && (config.retryableHttpCodes.count(httpCode) || (httpCode >= 500 && httpCode < 600))) {
        type = FailureType::TEMPORARY;
    } else if (curlCode != CURLE_OK && isPermanentCurlError(curlCode)) {
        type = FailureType::PERMANENT;
    } else if (curlCode != CURLE_OK && config.retryableCurlCodes.count(curlCode)) {
        type = FailureType::TEMPORARY;
    } else {
        const std::string lowered = common::toLower(errorMessage);
        if (lowered.find("name or service not known") != std::string::npos ||
            lowered.find("could not resolve") != std::string::npos ||
            lowered.find("exceeds") != std::string::npos) {
            type = FailureType::PERMANENT;
        } else if (lowered.find("timeout") != std::string::npos ||
                   lowered.find("timed out") != std::string::npos ||
                   lowered.find("connection") != std::string::npos) {
            type = FailureType::TEMPORARY;
        }
    }

    LOG_DEBUG("Classified failure (HTTP " + std::to_string(httpCode) + ", curl " +
              std::to_string(static_cast<int>(curlCode)) + ") as " + getFailureTypeDescription(type));
    return type;
}

bool FailureClassifier::shouldRetry(FailureType failureType, int retryCount, int maxRetries) {
    if (failureType == FailureType::PERMANENT || retryCount >= maxRetries) {
        return false;
    }
    if (failureType == FailureType::UNKNOWN) {
        return retryCount < maxRetries / 2;
    }
    return true;
}

std::chrono::milliseconds FailureClassifier::calculateRetryDelay(int retryCount,
                                                                 const FetchConfig& config,
                                                                 FailureType failureType) {
    std::chrono::milliseconds base = failureType == FailureType::RATE_LIMITED
        ? std::chrono::duration_cast<std::chrono::milliseconds>(config.rateLimitDelay)
        : config.baseRetryDelay;

    double factor = std::pow(config.backoffMultiplier, std::max(retryCount - 1, 0));
    auto delay = std::chrono::milliseconds(static_cast<long long>(base.count() * factor));
    return std::min(delay, config.maxRetryDelay);
}

std::string FailureClassifier::getFailureTypeDescription(FailureType failureType) {
    switch (failureType) {
        case FailureType::TEMPORARY: return "TEMPORARY";
        case FailureType::RATE_LIMITED: return "RATE_LIMITED";
        case FailureType::PERMANENT: return "PERMANENT";
        case FailureType::UNKNOWN: return "UNKNOWN";
    }
    return "INVALID";
}

bool FailureClassifier::isPermanentHttpError(int httpCode) {
    static const std::set<int> permanent = {
        400, 401, 403, 404, 405, 406, 407, 409, 410, 411, 412, 413, 414, 415,
        416, 417, 418, 421, 422, 423, 424, 426, 428, 431, 451
    };
    return permanent.count(httpCode) > 0;
}

bool FailureClassifier::isPermanentCurlError(CURLcode curlCode) {
    switch (curlCode) {
        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_FAILED_INIT:
        case CURLE_URL_MALFORMAT:
        case CURLE_NOT_BUILT_IN:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_FUNCTION_NOT_FOUND:
        case CURLE_BAD_FUNCTION_ARGUMENT:
        case CURLE_INTERFACE_FAILED:
        case CURLE_TOO_MANY_REDIRECTS:
        case CURLE_UNKNOWN_OPTION:
        case CURLE_FILESIZE_EXCEEDED:
            return true;
        default:
            return false;
    }
}

} // namespace aeo_engine::crawler
