#pragma once
#include <iostream>
#include <optional>
#include <string>
#include <mutex>

namespace warden::core::logging {

    // 1. Log levels, ordered by severity
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    inline std::optional<LogLevel> parse_log_level(const std::string& name) {
        if (name == "debug") return LogLevel::DEBUG;
        if (name == "info")  return LogLevel::INFO;
        if (name == "warn" || name == "warning") return LogLevel::WARN;
        if (name == "error") return LogLevel::ERROR;
        return std::nullopt;
    }

    // 2. Global logger. Everything goes to stderr: it is the operator channel,
    // and stdout belongs to the CLI's JSON verdicts.
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

        void set_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        LogLevel level() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return min_level_;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level < min_level_) {
                return;
            }

            std::cerr << "[" << level_to_string(level) << "] "
                      << (session_id_.empty() ? "" : "[" + session_id_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        mutable std::mutex mutex_;
        std::string session_id_;
        LogLevel min_level_ = LogLevel::INFO;

        static std::string level_to_string(LogLevel level) {
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
    #define LOG_DEBUG(msg) warden::core::logging::Logger::get().log(warden::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  warden::core::logging::Logger::get().log(warden::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  warden::core::logging::Logger::get().log(warden::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) warden::core::logging::Logger::get().log(warden::core::logging::LogLevel::ERROR, msg)

} // namespace warden::core::logging
