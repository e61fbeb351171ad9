#pragma once
#include <string>
#include <functional>
#include <mutex>

// Crawl progress broadcast. The embedding layer installs the hooks; without them every call is a no-op.
class CrawlLogger {
public:
    // (message, level)
    using LogBroadcastFunction = std::function<void(const std::string&, const std::string&)>;
    // (runId, message, level)
    using RunLogBroadcastFunction = std::function<void(const std::string&, const std::string&, const std::string&)>;

    static void setLogBroadcastFunction(LogBroadcastFunction func);
    static void setRunLogBroadcastFunction(RunLogBroadcastFunction func);

    // Remove both hooks
    static void reset();

    static void broadcastLog(const std::string& message, const std::string& level = "info");

    // Run-scoped message; falls back to the general hook when no run hook is set
    static void broadcastRunLog(const std::string& runId, const std::string& message, const std::string& level = "info");

private:
    static LogBroadcastFunction logBroadcastFunction_;
    static RunLogBroadcastFunction runLogBroadcastFunction_;
    static std::mutex hooksMutex_;
};
