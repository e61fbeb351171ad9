#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "../common/Result.h"
#include "../http/HttpClient.h"

namespace aeo_engine::crawler {

struct RenderResult {
    bool success = false;
    std::string html;
    int statusCode = 0;
    std::string error;
    std::chrono::milliseconds renderTime{0};
};

// Headless browser capable of returning the post-JavaScript DOM of a page
class BrowserRenderer {
public:
    virtual ~BrowserRenderer() = default;

    // Prepare the browser; a failure makes rendering unavailable for the owning session
    virtual common::Result<bool> open() = 0;

    virtual RenderResult render(const std::string& url,
                                const std::string& userAgent,
                                std::chrono::milliseconds timeout) = 0;

    virtual void close() = 0;
};

// Renders through a Browserless service: POST {url, waitFor, rejectResourceTypes} to <base>/content
class BrowserlessRenderer : public BrowserRenderer {
public:
    BrowserlessRenderer(http::HttpClient& httpClient,
                        std::string browserlessUrl,
                        std::chrono::milliseconds waitFor = std::chrono::milliseconds(5000));

    common::Result<bool> open() override;
    RenderResult render(const std::string& url,
                        const std::string& userAgent,
                        std::chrono::milliseconds timeout) override;
    void close() override;

private:
    http::HttpClient& httpClient_;
    std::string browserlessUrl_;
    std::chrono::milliseconds waitFor_;
    bool open_ = false;
};

using RendererFactory = std::function<std::unique_ptr<BrowserRenderer>()>;

/**
 * The single browser of a run, shared by all of its workers. Opened on first use; an
 * initialization failure is remembered so later pages go straight to static fetches.
 * Renders are serialized on the session mutex.
 */
class BrowserSession {
public:
    explicit BrowserSession(RendererFactory factory);
    ~BrowserSession();

    BrowserSession(const BrowserSession&) = delete;
    BrowserSession& operator=(const BrowserSession&) = delete;

    // Opens the browser if needed; false when rendering is unavailable
    bool available();

    RenderResult render(const std::string& url, const std::string& userAgent, std::chrono::milliseconds timeout);

    void close();

    bool isOpen() const;
    std::string initError() const;
    size_t renderCount() const;

private:
    // Caller holds mutex_
    bool openLocked();

    mutable std::mutex mutex_;
    RendererFactory factory_;
    std::unique_ptr<BrowserRenderer> renderer_;
    bool initFailed_ = false;
    std::string initError_;
    size_t renderCount_ = 0;
};

} // namespace aeo_engine::crawler
