#include "../../include/crawler/CrawlLogger.h"
#include "../../include/Logger.h"

CrawlLogger::LogBroadcastFunction CrawlLogger::logBroadcastFunction_ = nullptr;
CrawlLogger::RunLogBroadcastFunction CrawlLogger::runLogBroadcastFunction_ = nullptr;
std::mutex CrawlLogger::hooksMutex_;

void CrawlLogger::setLogBroadcastFunction(LogBroadcastFunction func) {
    std::lock_guard<std::mutex> lock(hooksMutex_);
    logBroadcastFunction_ = std::move(func);
}

void CrawlLogger::setRunLogBroadcastFunction(RunLogBroadcastFunction func) {
    std::lock_guard<std::mutex> lock(hooksMutex_);
    runLogBroadcastFunction_ = std::move(func);
}

void CrawlLogger::reset() {
    std::lock_guard<std::mutex> lock(hooksMutex_);
    logBroadcastFunction_ = nullptr;
    runLogBroadcastFunction_ = nullptr;
}

void CrawlLogger::broadcastLog(const std::string& message, const std::string& level) {
    LogBroadcastFunction hook;
    {
        std::lock_guard<std::mutex> lock(hooksMutex_);
        hook = logBroadcastFunction_;
    }
    LOG_TRACE("CrawlLogger::broadcastLog [" + level + "] " + message);
    if (hook) {
        hook(message, level);
    }
}

void CrawlLogger::broadcastRunLog(const std::string& runId, const std::string& message, const std::string& level) {
    RunLogBroadcastFunction hook;
    {
        std::lock_guard<std::mutex> lock(hooksMutex_);
        hook = runLogBroadcastFunction_;
    }
    if (hook) {
        hook(runId, message, level);
    } else {
        broadcastLog(message + " (Run: " + runId + ")", level);
    }
}
