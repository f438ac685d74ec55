#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace hookguard::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global Logger Setup
    // stdout carries the hook response and stderr the error report, so
    // records below the threshold are dropped and the default threshold
    // keeps a normal run silent.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        LogLevel level() {
            std::lock_guard<std::mutex> lock(mutex_);
            return min_level_;
        }

        // The stream must outlive every subsequent log call.
        void set_stream(std::ostream& out) {
            std::lock_guard<std::mutex> lock(mutex_);
            out_ = &out;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level < min_level_) {
                return;
            }

            *out_ << "[" << level_to_string(level) << "] " << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::ostream* out_ = &std::clog;
        LogLevel min_level_ = LogLevel::WARN;

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
    #define LOG_DEBUG(msg) hookguard::core::logging::Logger::get().log(hookguard::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  hookguard::core::logging::Logger::get().log(hookguard::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  hookguard::core::logging::Logger::get().log(hookguard::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) hookguard::core::logging::Logger::get().log(hookguard::core::logging::LogLevel::ERROR, msg)

} // namespace hookguard::core::logging
