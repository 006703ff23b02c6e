#pragma once

#include <optional>
#include <sstream>
#include <string>

namespace posture {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

/**
 * Process-wide console logger, safe to call from every pipeline thread.
 *
 * Messages below the configured level are dropped before they are formatted.
 * WARN and ERROR go to stderr, everything else to stdout.
 * Note: Keep per-frame logging rate-limited, console I/O can stall the
 * processing thread.
 */
class Logger {
public:
    static void log(LogLevel level, const std::string& message);

    static void setLevel(LogLevel level);
    [[nodiscard]] static LogLevel level();
    [[nodiscard]] static bool enabled(LogLevel level) { return level >= Logger::level(); }

    template<typename... Args>
    static void debug(const Args&... args) { emit(LogLevel::DEBUG, args...); }

    template<typename... Args>
    static void info(const Args&... args) { emit(LogLevel::INFO, args...); }

    template<typename... Args>
    static void warn(const Args&... args) { emit(LogLevel::WARN, args...); }

    template<typename... Args>
    static void error(const Args&... args) { emit(LogLevel::ERROR, args...); }

private:
    template<typename... Args>
    static void emit(LogLevel level, const Args&... args) {
        if (!enabled(level)) return;
        std::ostringstream ss;
        (ss << ... << args);
        log(level, ss.str());
    }
};

[[nodiscard]] const char* logLevelName(LogLevel level);

/**
 * Accepts "debug", "info", "warn"/"warning" and "error", case-insensitive.
 */
[[nodiscard]] std::optional<LogLevel> parseLogLevel(const std::string& name);

} // namespace posture
