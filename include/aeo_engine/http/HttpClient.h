#pragma once

#include <chrono>
#include <map>
#include <string>
#include <curl/curl.h>

namespace aeo_engine::http {

enum class HttpMethod {
    GET,
    HEAD,
    POST
};

struct HttpRequest {
    std::string url;
    HttpMethod method = HttpMethod::GET;
    std::string userAgent;
    std::chrono::milliseconds timeout{30000};
    std::map<std::string, std::string> headers;
    std::string body;
    // 0 means unlimited; larger bodies abort the transfer
    size_t maxBodyBytes = 0;
    bool followRedirects = true;
};

struct HttpResponse {
    int statusCode = 0;
    // Header names lower-cased; repeated headers keep the last value
    std::map<std::string, std::string> headers;
    std::string body;
    std::string finalUrl;
    std::string contentType;
    CURLcode curlCode = CURLE_OK;
    std::string errorMessage;
    std::chrono::milliseconds elapsed{0};

    // The transfer completed, whatever the status code
    bool transportOk() const { return curlCode == CURLE_OK && errorMessage.empty(); }
    bool ok() const { return transportOk() && statusCode >= 200 && statusCode < 300; }
};

// Blocking HTTP transport. Implementations must be safe to call from several threads.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Never throws for transport or HTTP errors; they are reported in the response
    virtual HttpResponse execute(const HttpRequest& request) = 0;

    HttpResponse get(const std::string& url, const std::string& userAgent, std::chrono::milliseconds timeout);
    HttpResponse head(const std::string& url, const std::string& userAgent, std::chrono::milliseconds timeout);
};

class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(size_t maxRedirects = 5, bool verifySSL = true);
    ~CurlHttpClient() override = default;

    HttpResponse execute(const HttpRequest& request) override;

    void setProxy(const std::string& proxy);

private:
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userp);

    size_t maxRedirects_;
    bool verifySSL_;
    std::string proxy_;
};

} // namespace aeo_engine::http
