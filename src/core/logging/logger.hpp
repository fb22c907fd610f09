#pragma once
#include <iostream>
#include <mutex>
#include <string>
#include <utility>

namespace quotebridge::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    inline std::string level_to_string(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERROR: return "ERROR";
            default: return "UNKNOWN";
        }
    }

    // 2. Logging collaborator handed to the worker and the client.
    class Logger {
    public:
        virtual ~Logger() = default;
        virtual void log(LogLevel level, const std::string& message) = 0;

        void debug(const std::string& message) { log(LogLevel::DEBUG, message); }
        void info(const std::string& message) { log(LogLevel::INFO, message); }
        void warn(const std::string& message) { log(LogLevel::WARN, message); }
        void error(const std::string& message) { log(LogLevel::ERROR, message); }
    };

    // 3. Console implementation: "[LEVEL] [component] message"
    class StreamLogger : public Logger {
    public:
        StreamLogger(std::ostream& out, std::string component,
                     LogLevel min_level = LogLevel::INFO, bool colour = false)
            : out_(out),
              component_(std::move(component)),
              min_level_(min_level),
              colour_(colour) {}

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        void log(LogLevel level, const std::string& message) override {
            std::lock_guard<std::mutex> lock(mutex_); // Thread safety!
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            if (colour_) {
                out_ << colour_code(level);
            }
            out_ << "[" << level_to_string(level) << "] "
                 << (component_.empty() ? "" : "[" + component_ + "] ")
                 << message;
            if (colour_) {
                out_ << "\033[0m";
            }
            out_ << std::endl;
        }

    private:
        static const char* colour_code(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "\033[90m";
                case LogLevel::INFO:  return "\033[97m";
                case LogLevel::WARN:  return "\033[33m";
                case LogLevel::ERROR: return "\033[31m";
                default: return "\033[97m";
            }
        }

        std::mutex mutex_;
        std::ostream& out_;
        std::string component_;
        LogLevel min_level_;
        bool colour_;
    };

} // namespace quotebridge::core::logging
