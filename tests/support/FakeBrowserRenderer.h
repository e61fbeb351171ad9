#pragma once

#include "../../include/aeo_engine/crawler/BrowserRenderer.h"

#include <atomic>
#include <map>
#include <memory>
#include <string>

namespace aeo_engine::testing {

// Shared counters so tests can observe renderers created by a factory
struct FakeBrowserStats {
    std::atomic<int> created{0};
    std::atomic<int> opened{0};
    std::atomic<int> closed{0};
    std::atomic<int> renders{0};
};

class FakeBrowserRenderer : public crawler::BrowserRenderer {
public:
    FakeBrowserRenderer(std::shared_ptr<FakeBrowserStats> stats,
                        std::map<std::string, std::string> pages,
                        bool failOpen = false)
        : stats_(std::move(stats)), pages_(std::move(pages)), failOpen_(failOpen) {}

    common::Result<bool> open() override {
        if (failOpen_) {
            return common::Result<bool>::Failure("browser executable not found");
        }
        ++stats_->opened;
        return common::Result<bool>::Success(true);
    }

    crawler::RenderResult render(const std::string& url, const std::string&, std::chrono::milliseconds) override {
        ++stats_->renders;
        crawler::RenderResult result;
        auto it = pages_.find(url);
        if (it == pages_.end()) {
            result.error = "navigation failed";
            return result;
        }
        result.success = true;
        result.statusCode = 200;
        result.html = it->second;
        return result;
    }

    void close() override { ++stats_->closed; }

private:
    std::shared_ptr<FakeBrowserStats> stats_;
    std::map<std::string, std::string> pages_;
    bool failOpen_;
};

inline crawler::RendererFactory fakeRendererFactory(std::shared_ptr<FakeBrowserStats> stats,
                                                    std::map<std::string, std::string> pages,
                                                    bool failOpen = false) {
    return [stats, pages, failOpen]() -> std::unique_ptr<crawler::BrowserRenderer> {
        ++stats->created;
        return std::make_unique<FakeBrowserRenderer>(stats, pages, failOpen);
    };
}

} // namespace aeo_engine::testing
