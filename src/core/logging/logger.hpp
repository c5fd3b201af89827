#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace tollgate::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global Logger Setup. Writes to stderr so tool output on stdout stays clean.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_session_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            session_id_ = id;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            std::cerr << "[" << level_to_string(level) << "] "
                      << (session_id_.empty() ? "" : "[" + session_id_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string session_id_;
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

    // 3. Helper macros for clean syntax everywhere else in the code
    #define LOG_DEBUG(msg) tollgate::core::logging::Logger::get().log(tollgate::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  tollgate::core::logging::Logger::get().log(tollgate::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  tollgate::core::logging::Logger::get().log(tollgate::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) tollgate::core::logging::Logger::get().log(tollgate::core::logging::LogLevel::ERROR, msg)

} // namespace tollgate::core::logging
