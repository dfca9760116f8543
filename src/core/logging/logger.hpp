#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace tclhub::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global Logger Setup
    // stdout carries the command responses, so every line goes to stderr.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_component(const std::string& component) {
            std::lock_guard<std::mutex> lock(mutex_);
            component_ = component;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        LogLevel min_level() {
            std::lock_guard<std::mutex> lock(mutex_);
            return min_level_;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            std::cerr << "[" << level_to_string(level) << "] "
                      << (component_.empty() ? "" : "[" + component_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string component_ = "tclhub";
        LogLevel min_level_ = LogLevel::INFO;

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
    #define LOG_DEBUG(msg) tclhub::core::logging::Logger::get().log(tclhub::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  tclhub::core::logging::Logger::get().log(tclhub::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  tclhub::core::logging::Logger::get().log(tclhub::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) tclhub::core::logging::Logger::get().log(tclhub::core::logging::LogLevel::ERROR, msg)

} // namespace tclhub::core::logging
