#pragma once

#include "../../include/aeo_engine/http/HttpClient.h"

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace aeo_engine::testing {

// Scripted HttpClient: responses keyed by "METHOD url", 404 for anything unknown
class FakeHttpClient : public http::HttpClient {
public:
    using Handler = std::function<http::HttpResponse(const http::HttpRequest&)>;

    void respond(const std::string& url, int status, const std::string& body = "",
                 const std::string& contentType = "text/html", http::HttpMethod method = http::HttpMethod::GET) {
        http::HttpResponse response;
        response.statusCode = status;
        response.body = body;
        response.finalUrl = url;
        response.contentType = contentType;
        if (!contentType.empty()) {
            response.headers["content-type"] = contentType;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        responses_[key(method, url)] = response;
    }

    void respondHead(const std::string& url, int status) {
        respond(url, status, "", "", http::HttpMethod::HEAD);
    }

    // Simulate a transport failure (DNS, timeout, ...)
    void fail(const std::string& url, CURLcode code, const std::string& message,
              http::HttpMethod method = http::HttpMethod::GET) {
        http::HttpResponse response;
        response.curlCode = code;
        response.errorMessage = message;
        response.finalUrl = url;
        std::lock_guard<std::mutex> lock(mutex_);
        responses_[key(method, url)] = response;
    }

    // Handler consulted before the scripted responses when set
    void setHandler(Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = std::move(handler);
    }

    http::HttpResponse execute(const http::HttpRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(request);
        if (handler_) {
            return handler_(request);
        }
        auto it = responses_.find(key(request.method, request.url));
        if (it != responses_.end()) {
            return it->second;
        }
        http::HttpResponse notFound;
        notFound.statusCode = 404;
        notFound.finalUrl = request.url;
        return notFound;
    }

    size_t requestCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

    size_t requestCount(const std::string& url) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t count = 0;
        for (const auto& request : requests_) {
            if (request.url == url) {
                ++count;
            }
        }
        return count;
    }

    std::vector<http::HttpRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    static std::string key(http::HttpMethod method, const std::string& url) {
        switch (method) {
            case http::HttpMethod::HEAD: return "HEAD " + url;
            case http::HttpMethod::POST: return "POST " + url;
            default: return "GET " + url;
        }
    }

    mutable std::mutex mutex_;
    std::map<std::string, http::HttpResponse> responses_;
    std::vector<http::HttpRequest> requests_;
    Handler handler_;
};

} // namespace aeo_engine::testing
