#pragma once

#include <iostream>
#include <mutex>
#include <string>
#include <sstream>
#include <chrono>
#include <iomanip>
#include <functional>
#include <ctime>

namespace aiexec {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

inline const char* LogLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
    }
    return "INFO";
}

class Logger {
public:
    // Receives every line at or above the minimum level instead of stdout/stderr.
    using Sink = std::function<void(LogLevel level, const std::string& message)>;

    static void Log(LogLevel level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < min_level_) return;

        if (sink_) {
            sink_(level, message);
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        std::tm tm_buf{};
        localtime_r(&time, &tm_buf);

        std::ostream& out = level >= LogLevel::ERROR ? std::cerr : std::cout;
        out << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << "] "
            << "[" << LogLevelName(level) << "] " << message << std::endl;
    }

    static void SetLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = level;
    }

    static void SetSink(Sink sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        sink_ = std::move(sink);
    }

    template<typename... Args>
    static void Debug(Args... args) {
        std::stringstream ss;
        (ss << ... << args);
        Log(LogLevel::DEBUG, ss.str());
    }

    template<typename... Args>
    static void Info(Args... args) {
        std::stringstream ss;
        (ss << ... << args);
        Log(LogLevel::INFO, ss.str());
    }

    template<typename... Args>
    static void Warn(Args... args) {
        std::stringstream ss;
        (ss << ... << args);
        Log(LogLevel::WARNING, ss.str());
    }

    template<typename... Args>
    static void Error(Args... args) {
        std::stringstream ss;
        (ss << ... << args);
        Log(LogLevel::ERROR, ss.str());
    }

    template<typename... Args>
    static void Critical(Args... args) {
        std::stringstream ss;
        (ss << ... << args);
        Log(LogLevel::CRITICAL, ss.str());
    }

private:
    static inline std::mutex mutex_;
    static inline LogLevel min_level_ = LogLevel::INFO;
    static inline Sink sink_;
};

} // namespace aiexec
