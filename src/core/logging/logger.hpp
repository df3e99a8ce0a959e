#pragma once
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

namespace hostbridge::core::logging {

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
        // Singleton access so the host, bridge threads and gateway share one logger
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_tag(const std::string& tag) {
            std::lock_guard<std::mutex> lock(mutex_);
            tag_ = tag;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        // Values registered here are masked in every line written afterwards.
        void add_redaction(const std::string& secret) {
            if (secret.empty()) {
                return;
            }
            std::lock_guard<std::mutex> lock(mutex_);
            redactions_.push_back(secret);
        }

        void clear_redactions() {
            std::lock_guard<std::mutex> lock(mutex_);
            redactions_.clear();
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            // stderr, so the gateway CLI keeps stdout for results
            std::cerr << "[" << level_to_string(level) << "] "
                      << (tag_.empty() ? "" : "[" + tag_ + "] ")
                      << redact(message) << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string tag_;
        LogLevel min_level_ = LogLevel::INFO;
        std::vector<std::string> redactions_;

        std::string redact(std::string text) const {
            for (const auto& secret : redactions_) {
                std::string::size_type pos = 0;
                while ((pos = text.find(secret, pos)) != std::string::npos) {
                    text.replace(pos, secret.size(), "[redacted]");
                    pos += 10;
                }
            }
            return text;
        }

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
    #define LOG_DEBUG(msg) hostbridge::core::logging::Logger::get().log(hostbridge::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  hostbridge::core::logging::Logger::get().log(hostbridge::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  hostbridge::core::logging::Logger::get().log(hostbridge::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) hostbridge::core::logging::Logger::get().log(hostbridge::core::logging::LogLevel::ERROR, msg)

} // namespace hostbridge::core::logging
