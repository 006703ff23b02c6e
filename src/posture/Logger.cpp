#include "posture/Logger.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace posture {

namespace {

std::mutex g_outputMutex;
std::atomic<LogLevel> g_minLevel{LogLevel::INFO};

const char* colorTag(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[36m[DEBUG]\033[0m "; // Cyan
        case LogLevel::INFO:  return "\033[32m[INFO] \033[0m "; // Green
        case LogLevel::WARN:  return "\033[33m[WARN] \033[0m "; // Yellow
        case LogLevel::ERROR: return "\033[31m[ERROR]\033[0m "; // Red
    }
    return "";
}

} // namespace

void Logger::log(LogLevel level, const std::string& message) {
    if (!enabled(level)) return;

    const auto now = std::chrono::system_clock::now();
    const std::time_t time = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&time, &local);

    std::ostream& out = level >= LogLevel::WARN ? std::cerr : std::cout;

    std::lock_guard<std::mutex> lock(g_outputMutex);
    out << "[" << std::put_time(&local, "%H:%M:%S")
        << "." << std::setfill('0') << std::setw(3) << ms.count() << "] "
        << colorTag(level) << message << std::endl;
}

void Logger::setLevel(LogLevel level) {
    g_minLevel.store(level, std::memory_order_relaxed);
}

LogLevel Logger::level() {
    return g_minLevel.load(std::memory_order_relaxed);
}

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO:  return "info";
        case LogLevel::WARN:  return "warn";
        case LogLevel::ERROR: return "error";
    }
    return "unknown";
}

std::optional<LogLevel> parseLogLevel(const std::string& name) {
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (key == "debug") return LogLevel::DEBUG;
    if (key == "info") return LogLevel::INFO;
    if (key == "warn" || key == "warning") return LogLevel::WARN;
    if (key == "error") return LogLevel::ERROR;
    return std::nullopt;
}

} // namespace posture
