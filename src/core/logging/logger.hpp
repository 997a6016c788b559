#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace logcompact::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global Logger Setup
    class Logger {
    public:
        // Singleton access so every worker shares one sink
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_context(const std::string& tag) {
            std::lock_guard<std::mutex> lock(mutex_);
            context_ = tag;
        }

        std::string context() {
            std::lock_guard<std::mutex> lock(mutex_);
            return context_;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        // Keeps stdout free for machine-readable output such as the JSON report.
        void set_all_to_stderr(bool enabled) {
            std::lock_guard<std::mutex> lock(mutex_);
            all_to_stderr_ = enabled;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_); // Workers log concurrently
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            std::ostream& out =
                (all_to_stderr_ || level >= LogLevel::WARN) ? std::cerr : std::cout;
            out << "[" << level_to_string(level) << "] "
                << (context_.empty() ? "" : "[" + context_ + "] ")
                << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string context_;
        LogLevel min_level_ = LogLevel::INFO;
        bool all_to_stderr_ = false;

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
    #define LOG_DEBUG(msg) logcompact::core::logging::Logger::get().log(logcompact::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  logcompact::core::logging::Logger::get().log(logcompact::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  logcompact::core::logging::Logger::get().log(logcompact::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) logcompact::core::logging::Logger::get().log(logcompact::core::logging::LogLevel::ERROR, msg)

} // namespace logcompact::core::logging
