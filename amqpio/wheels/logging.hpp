#pragma once

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>

enum LogLevel : int8_t {
    /*NOLINT*/ ERROR = 0,
    /*NOLINT*/ WARNING = 1,
    /*NOLINT*/ INFO = 2,
    /*NOLINT*/ DEBUG = 3,
    /*NOLINT*/ TRACE = 4,
};

namespace amqpio::wheels::logging {
    // Process-wide threshold. Initialised from AMQPIO_LOG_LEVEL
    // (error|warn|info|debug|trace), INFO otherwise.
    LogLevel &logLevel();

    LogLevel parseLogLevel(const std::string &name, LogLevel fallback);

    std::mutex &sinkMutex();

    class Logger {
    public:
        explicit Logger(const LogLevel level) : level_(level), enabled_(level <= logLevel()) {
        }

        ~Logger() {
            if (!enabled_) {
                return;
            }
            const std::lock_guard lock(sinkMutex());
            std::clog << getCurrentTime() << " [" << getLabel(level_) << "] " << stream_.str() << std::endl;
        }

        template<typename T>
        Logger &operator<<(const T &message) {
            if (enabled_) {
                stream_ << message;
            }
            return *this;
        }

    private:
        LogLevel level_;
        bool enabled_;
        std::ostringstream stream_;

        static std::string getLabel(LogLevel level) {
            switch (level) {
                case TRACE: {
                    return "TRACE";
                }
                case DEBUG: {
                    return "DEBUG";
                }
                case INFO: {
                    return "INFO";
                }
                case WARNING: { return "WARN"; }
                case ERROR: { return "ERROR"; }
                default: { return "UNKNOWN"; }
            }
        }

        static std::string getCurrentTime() {
            const auto &now = std::chrono::system_clock::now();
            const auto &time = std::chrono::system_clock::to_time_t(now);
            std::tm tm{};
            localtime_r(&time, &tm);
            const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                                    now.time_since_epoch()) % 1000;
            std::ostringstream oss;
            oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
                << millis.count();
            return oss.str();
        }
    };

#define LOG(level) (amqpio::wheels::logging::Logger{level})
} // namespace amqpio::wheels::logging
