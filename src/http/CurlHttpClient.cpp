#include "../../include/aeo_engine/http/HttpClient.h"
#include "../../include/aeo_engine/common/TextUtils.h"
#include "../../include/Logger.h"

#include <algorithm>
#include <mutex>

namespace aeo_engine::http {

namespace {

struct BodySink {
    std::string* data;
    size_t limit;
    bool overflowed = false;
};

std::once_flag curlGlobalInitFlag;

} // namespace

HttpResponse HttpClient::get(const std::string& url, const std::string& userAgent, std::chrono::milliseconds timeout) {
    HttpRequest request;
    request.url = url;
    request.userAgent = userAgent;
    request.timeout = timeout;
    return execute(request);
}

HttpResponse HttpClient::head(const std::string& url, const std::string& userAgent, std::chrono::milliseconds timeout) {
    HttpRequest request;
    request.url = url;
    request.method = HttpMethod::HEAD;
    request.userAgent = userAgent;
    request.timeout = timeout;
    return execute(request);
}

CurlHttpClient::CurlHttpClient(size_t maxRedirects, bool verifySSL)
    : maxRedirects_(maxRedirects), verifySSL_(verifySSL) {
    std::call_once(curlGlobalInitFlag, [] { curl_global_init(CURL_GLOBAL_ALL); });
}

void CurlHttpClient::setProxy(const std::string& proxy) {
    LOG_DEBUG("CurlHttpClient::setProxy called with: " + proxy);
    proxy_ = proxy;
}

HttpResponse CurlHttpClient::execute(const HttpRequest& request) {
    HttpResponse response;
    auto started = std::chrono::steady_clock::now();

    // Local handle per request so workers never share curl state
    CURL* curl = curl_easy_init();
    if (!curl) {
        response.curlCode = CURLE_FAILED_INIT;
        response.errorMessage = "Failed to create CURL handle";
        LOG_ERROR("Error: " + response.errorMessage);
        return response;
    }

    char errbuf[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, std::min(10000L, static_cast<long>(request.timeout.count())));
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, request.followRedirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(maxRedirects_));
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, verifySSL_ ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, verifySSL_ ? 2L : 0L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");

    if (!request.userAgent.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, request.userAgent.c_str());
    }
    if (!proxy_.empty()) {
        curl_easy_setopt(curl, CURLOPT_PROXY, proxy_.c_str());
    }

    switch (request.method) {
        case HttpMethod::HEAD:
            curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
            break;
        case HttpMethod::POST:
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
            break;
        case HttpMethod::GET:
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
            break;
    }

    struct curl_slist* headers = nullptr;
    for (const auto& header : request.headers) {
        const std::string line = header.first + ": " + header.second;
        headers = curl_slist_append(headers, line.c_str());
    }
    if (headers) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    }

    BodySink sink{&response.body, request.maxBodyBytes};
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &sink);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

    LOG_DEBUG("Performing " + std::string(request.method == HttpMethod::HEAD ? "HEAD" :
                                          request.method == HttpMethod::POST ? "POST" : "GET") +
              " request: " + request.url);
    CURLcode res = curl_easy_perform(curl);

    if (headers) {
        curl_slist_free_all(headers);
    }

    long statusCode = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &statusCode);
    response.statusCode = static_cast<int>(statusCode);

    char* contentType = nullptr;
    curl_easy_getinfo(curl, CURLINFO_CONTENT_TYPE, &contentType);
    if (contentType) {
        response.contentType = contentType;
    }

    char* effectiveUrl = nullptr;
    curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effectiveUrl);
    response.finalUrl = effectiveUrl ? effectiveUrl : request.url;

    curl_easy_cleanup(curl);

    response.curlCode = res;
    if (sink.overflowed) {
        response.errorMessage = "Response body exceeds " + std::to_string(request.maxBodyBytes) + " bytes";
        LOG_WARNING(response.errorMessage + ": " + request.url);
    } else if (res != CURLE_OK) {
        response.errorMessage = std::string(curl_easy_strerror(res)) + (errbuf[0] ? std::string(" | ") + errbuf : "");
        LOG_WARNING("CURL error for " + request.url + ": " + response.errorMessage);
    } else if (response.statusCode >= 400) {
        LOG_DEBUG("HTTP " + std::to_string(response.statusCode) + " for " + request.url);
    }

    response.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    return response;
}

size_t CurlHttpClient::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* sink = static_cast<BodySink*>(userp);
    size_t totalSize = size * nmemb;
    if (sink->limit > 0 && sink->data->size() + totalSize > sink->limit) {
        sink->overflowed = true;
        return 0;  // aborts with CURLE_WRITE_ERROR
    }
    sink->data->append(static_cast<char*>(contents), totalSize);
    return totalSize;
}

size_t CurlHttpClient::headerCallback(char* buffer, size_t size, size_t nitems, void* userp) {
    auto* headers = static_cast<std::map<std::string, std::string>*>(userp);
    size_t totalSize = size * nitems;
    std::string line(buffer, totalSize);
    // A new status line starts a new header block after redirects
    if (common::startsWith(line, "HTTP/")) {
        headers->clear();
        return totalSize;
    }
    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        (*headers)[common::toLower(common::trim(line.substr(0, colon)))] = common::trim(line.substr(colon + 1));
    }
    return totalSize;
}

} // namespace aeo_engine::http
