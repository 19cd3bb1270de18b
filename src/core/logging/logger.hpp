#pragma once
#include <iostream>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>

namespace runvault::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    inline std::optional<LogLevel> parse_log_level(const std::string& text) {
        if (text == "debug") return LogLevel::DEBUG;
        if (text == "info") return LogLevel::INFO;
        if (text == "warn") return LogLevel::WARN;
        if (text == "error") return LogLevel::ERROR;
        return std::nullopt;
    }

    // 2. Global Logger Setup
    class Logger {
    public:
        // Singleton access so every component shares one sink
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        // The stream must outlive the logger or be reset before it is destroyed.
        void set_sink(std::ostream& sink) {
            std::lock_guard<std::mutex> lock(mutex_);
            sink_ = &sink;
        }

        void set_component(const std::string& component) {
            std::lock_guard<std::mutex> lock(mutex_);
            component_ = component;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            *sink_ << "[" << level_to_string(level) << "] "
                   << (component_.empty() ? "" : "[" + component_ + "] ")
                   << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::ostream* sink_ = &std::clog;
        LogLevel min_level_ = LogLevel::INFO;
        std::string component_;

        std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    // 3. Helper macros
    #define LOG_DEBUG(msg) runvault::core::logging::Logger::get().log(runvault::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  runvault::core::logging::Logger::get().log(runvault::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  runvault::core::logging::Logger::get().log(runvault::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) runvault::core::logging::Logger::get().log(runvault::core::logging::LogLevel::ERROR, msg)

} // namespace runvault::core::logging
