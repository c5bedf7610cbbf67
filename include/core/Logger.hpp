#pragma once

#include <atomic>
#include <iostream>
#include <string>
#include <mutex>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <optional>

namespace core {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

/**
 * Thread-safe Logger utility.
 * Messages below the configured level are dropped before formatting.
 * Avoid logging per frame above DEBUG level, console I/O can block the stream.
 */
class Logger {
public:
    static void setLevel(LogLevel level) { level_ = level; }
    static LogLevel level() { return level_; }

    static bool enabled(LogLevel level) {
        return static_cast<int>(level) >= static_cast<int>(level_.load());
    }

    /**
     * Parses "debug", "info", "warn" or "error".
     */
    static std::optional<LogLevel> parseLevel(const std::string& name) {
        if (name == "debug") return LogLevel::DEBUG;
        if (name == "info") return LogLevel::INFO;
        if (name == "warn" || name == "warning") return LogLevel::WARN;
        if (name == "error") return LogLevel::ERROR;
        return std::nullopt;
    }

    static void log(LogLevel level, const std::string& message) {
        if (!enabled(level)) return;

        std::lock_guard<std::mutex> lock(mutex_);

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

        std::ostream& out = (level == LogLevel::ERROR) ? std::cerr : std::cout;

        out << "[" << std::put_time(std::localtime(&time), "%H:%M:%S")
            << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";

        switch (level) {
            case LogLevel::DEBUG: out << "\033[36m[DEBUG]\033[0m "; break; // Cyan
            case LogLevel::INFO:  out << "\033[32m[INFO] \033[0m "; break; // Green
            case LogLevel::WARN:  out << "\033[33m[WARN] \033[0m "; break; // Yellow
            case LogLevel::ERROR: out << "\033[31m[ERROR]\033[0m "; break; // Red
        }

        out << message << std::endl;
    }

    template<typename... Args>
    static void debug(Args... args) {
        if (!enabled(LogLevel::DEBUG)) return;
        log(LogLevel::DEBUG, format(args...));
    }

    template<typename... Args>
    static void info(Args... args) {
        if (!enabled(LogLevel::INFO)) return;
        log(LogLevel::INFO, format(args...));
    }

    template<typename... Args>
    static void warn(Args... args) {
        if (!enabled(LogLevel::WARN)) return;
        log(LogLevel::WARN, format(args...));
    }

    template<typename... Args>
    static void error(Args... args) {
        log(LogLevel::ERROR, format(args...));
    }

private:
    template<typename... Args>
    static std::string format(Args... args) {
        std::stringstream ss;
        (ss << ... << args);
        return ss.str();
    }

    inline static std::mutex mutex_;
    inline static std::atomic<LogLevel> level_{LogLevel::INFO};
};

} // namespace core
