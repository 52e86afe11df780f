#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace mobilemcp::core::logging {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // Process-wide logger. Writes to stderr only: stdout carries the JSON-RPC stream.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        bool enabled(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            return static_cast<int>(level) >= static_cast<int>(min_level_);
        }

        // Tag prefixed to every line, e.g. the id of the request being served.
        void set_context(const std::string& context) {
            std::lock_guard<std::mutex> lock(mutex_);
            context_ = context;
        }

        void clear_context() {
            std::lock_guard<std::mutex> lock(mutex_);
            context_.clear();
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            std::cerr << "[" << level_to_string(level) << "] "
                      << (context_.empty() ? "" : "[" + context_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string context_;
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

    #define MOBILEMCP_LOG_DEBUG(msg) mobilemcp::core::logging::Logger::get().log(mobilemcp::core::logging::LogLevel::DEBUG, msg)
    #define MOBILEMCP_LOG_INFO(msg)  mobilemcp::core::logging::Logger::get().log(mobilemcp::core::logging::LogLevel::INFO, msg)
    #define MOBILEMCP_LOG_WARN(msg)  mobilemcp::core::logging::Logger::get().log(mobilemcp::core::logging::LogLevel::WARN, msg)
    #define MOBILEMCP_LOG_ERROR(msg) mobilemcp::core::logging::Logger::get().log(mobilemcp::core::logging::LogLevel::ERROR, msg)

} // namespace mobilemcp::core::logging
