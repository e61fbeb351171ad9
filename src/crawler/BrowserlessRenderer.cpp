#include "../../include/aeo_engine/crawler/BrowserRenderer.h"
#include "../../include/aeo_engine/crawler/PageFetchResult.h"
#include "../../include/Logger.h"
#include "../../include/crawler/CrawlLogger.h"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace aeo_engine::crawler {

std::string toString(RenderMethod method) {
    return method == RenderMethod::RENDERED ? "rendered" : "static";
}

BrowserlessRenderer::BrowserlessRenderer(http::HttpClient& httpClient,
                                         std::string browserlessUrl,
                                         std::chrono::milliseconds waitFor)
    : httpClient_(httpClient), browserlessUrl_(std::move(browserlessUrl)), waitFor_(waitFor) {
    while (!browserlessUrl_.empty() && browserlessUrl_.back() == '/') {
        browserlessUrl_.pop_back();
    }
}

common::Result<bool> BrowserlessRenderer::open() {
    if (browserlessUrl_.empty()) {
        return common::Result<bool>::Failure("No browserless URL configured");
    }
    // Health probe before the first render
    http::HttpResponse response = httpClient_.get(browserlessUrl_ + "/health", "", std::chrono::seconds(5));
    if (!response.ok()) {
        std::string reason = response.transportOk()
            ? "Browserless health check returned HTTP " + std::to_string(response.statusCode)
            : "Browserless unavailable: " + response.errorMessage;
        LOG_WARNING(reason);
        return common::Result<bool>::Failure(reason);
    }
    open_ = true;
    LOG_INFO("Browserless session opened at " + browserlessUrl_);
    return common::Result<bool>::Success(true);
}

RenderResult BrowserlessRenderer::render(const std::string& url,
                                         const std::string& userAgent,
                                         std::chrono::milliseconds timeout) {
    RenderResult result;
    if (!open_) {
        result.error = "Browserless session is not open";
        return result;
    }

    json payload = {
        {"url", url},
        {"waitFor", waitFor_.count()},
        {"rejectResourceTypes", json::array({"image", "media", "font"})},
        {"viewport", {{"width", 375}, {"height", 667}}}
    };
    if (!userAgent.empty()) {
        payload["userAgent"] = userAgent;
    }

    http::HttpRequest request;
    request.url = browserlessUrl_ + "/content";
    request.method = http::HttpMethod::POST;
    request.timeout = timeout;
    request.headers["Content-Type"] = "application/json";
    request.body = payload.dump();

    LOG_INFO("Starting headless browser rendering for: " + url);
    http::HttpResponse response = httpClient_.execute(request);
    result.renderTime = response.elapsed;
    result.statusCode = response.statusCode;

    if (!response.transportOk()) {
        result.error = "Browserless request failed: " + response.errorMessage;
        LOG_WARNING(result.error + " (" + url + ")");
        CrawlLogger::broadcastLog("Browserless unavailable for: " + url + " - falling back to static HTML", "warning");
        return result;
    }
    if (response.statusCode != 200) {
        result.error = "Browserless returned HTTP " + std::to_string(response.statusCode);
        LOG_ERROR("Browserless error for " + url + ": " + result.error);
        return result;
    }

    result.html = std::move(response.body);
    result.success = true;
    LOG_INFO("Rendered " + url + " via browserless (" + std::to_string(result.html.size()) + " bytes, " +
             std::to_string(result.renderTime.count()) + "ms)");
    return result;
}

void BrowserlessRenderer::close() {
    if (open_) {
        LOG_DEBUG("Browserless session closed");
    }
    open_ = false;
}

BrowserSession::BrowserSession(RendererFactory factory) : factory_(std::move(factory)) {
}

BrowserSession::~BrowserSession() {
    close();
}

bool BrowserSession::available() {
    std::lock_guard<std::mutex> lock(mutex_);
    return openLocked();
}

bool BrowserSession::openLocked() {
    if (renderer_) {
        return true;
    }
    if (initFailed_) {
        return false;
    }
    if (!factory_) {
        initFailed_ = true;
        initError_ = "Rendering disabled";
        return false;
    }

    std::unique_ptr<BrowserRenderer> renderer = factory_();
    if (!renderer) {
        initFailed_ = true;
        initError_ = "No renderer available";
        return false;
    }
    auto opened = renderer->open();
    if (!opened.success) {
        initFailed_ = true;
        initError_ = opened.message;
        LOG_WARNING("Browser initialization failed, using static fetches: " + initError_);
        CrawlLogger::broadcastLog("Browser initialization failed, falling back to static fetch: " + initError_, "warning");
        return false;
    }
    renderer_ = std::move(renderer);
    return true;
}

RenderResult BrowserSession::render(const std::string& url, const std::string& userAgent, std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!openLocked()) {
        RenderResult unavailable;
        unavailable.error = initError_;
        return unavailable;
    }
    ++renderCount_;
    return renderer_->render(url, userAgent, timeout);
}

void BrowserSession::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (renderer_) {
        renderer_->close();
        renderer_.reset();
        LOG_DEBUG("Browser session released after " + std::to_string(renderCount_) + " renders");
    }
}

bool BrowserSession::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return renderer_ != nullptr;
}

std::string BrowserSession::initError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initError_;
}

size_t BrowserSession::renderCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return renderCount_;
}

} // namespace aeo_engine::crawler
