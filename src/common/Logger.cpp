#include "../../include/Logger.h"
#include <iostream>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <ctime>
#include <thread>
#include <cstdlib>
#include <algorithm>
#include <cctype>

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : logLevel(LogLevel::INFO), logToConsole(true), logToFile(false) {
}

Logger::~Logger() {
    close();
}

void Logger::init(LogLevel level, bool enableConsoleLogging, const std::string& logFilePath) {
    std::lock_guard<std::mutex> lock(mutex);
    logLevel = level;
    logToConsole = enableConsoleLogging;

    if (logFile.is_open()) {
        logFile.close();
    }

    if (!logFilePath.empty()) {
        logFile.open(logFilePath, std::ios::out | std::ios::app);
        logToFile = logFile.is_open();
        if (!logToFile) {
            std::cerr << "[WARN] Could not open log file: " << logFilePath << std::endl;
        }
    } else {
        logToFile = false;
    }
}

void Logger::initFromEnvironment() {
    LogLevel level = LogLevel::INFO;
    if (const char* envLevel = std::getenv("AEO_LOG_LEVEL")) {
        level = parseLogLevel(envLevel);
    }
    std::string filePath;
    if (const char* envFile = std::getenv("AEO_LOG_FILE")) {
        filePath = envFile;
    }
    init(level, true, filePath);
}

LogLevel Logger::parseLogLevel(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "trace") return LogLevel::TRACE;
    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "info") return LogLevel::INFO;
    if (lowered == "warning" || lowered == "warn") return LogLevel::WARNING;
    if (lowered == "error" || lowered == "err") return LogLevel::ERR;
    if (lowered == "none" || lowered == "off") return LogLevel::NONE;
    return LogLevel::INFO;
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex);
    logLevel = level;
}

bool Logger::isEnabled(LogLevel level) const {
    return level != LogLevel::NONE && level >= logLevel;
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!isEnabled(level)) {
        return;
    }

    std::ostringstream line;
    line << currentTimestamp() << " [" << levelToString(level) << "] [" << std::this_thread::get_id() << "] " << message;
    const std::string output = line.str();

    std::lock_guard<std::mutex> lock(mutex);
    if (logToConsole) {
        std::cerr << output << std::endl;
    }

    if (logToFile && logFile.is_open()) {
        logFile << output << std::endl;
        logFile.flush();
    }
}

void Logger::trace(const std::string& message) {
    log(LogLevel::TRACE, message);
}

void Logger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::warning(const std::string& message) {
    log(LogLevel::WARNING, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::ERR, message);
}

void Logger::close() {
    std::lock_guard<std::mutex> lock(mutex);
    if (logFile.is_open()) {
        logFile.close();
    }
    logToFile = false;
}

std::string Logger::levelToString(LogLevel level) const {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERR: return "ERROR";
        default: return "UNKNOWN";
    }
}

std::string Logger::currentTimestamp() const {
    auto now = std::chrono::system_clock::now();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return ss.str();
}
