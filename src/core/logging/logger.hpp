#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace inobridge::core::logging {

    // 1. Log levels, lowest first
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    inline bool parse_log_level(const std::string& text, LogLevel& out) {
        if (text == "debug") { out = LogLevel::DEBUG; return true; }
        if (text == "info")  { out = LogLevel::INFO;  return true; }
        if (text == "warn")  { out = LogLevel::WARN;  return true; }
        if (text == "error") { out = LogLevel::ERROR; return true; }
        return false;
    }

    // 2. Global Logger
    class Logger {
    public:
        // Singleton access so the whole process shares one logger
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_invocation_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            invocation_id_ = id;
        }

        void set_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            // stderr keeps stdout free for the JSON report
            std::cerr << "[" << level_to_string(level) << "] "
                      << (invocation_id_.empty() ? "" : "[" + invocation_id_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string invocation_id_;
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
    #define LOG_DEBUG(msg) inobridge::core::logging::Logger::get().log(inobridge::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  inobridge::core::logging::Logger::get().log(inobridge::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  inobridge::core::logging::Logger::get().log(inobridge::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) inobridge::core::logging::Logger::get().log(inobridge::core::logging::LogLevel::ERROR, msg)

} // namespace inobridge::core::logging
