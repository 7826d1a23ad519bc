#include "logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace amqpio::wheels::logging {
    LogLevel parseLogLevel(const std::string &name, const LogLevel fallback) {
        std::string lower(name);
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lower == "error") { return ERROR; }
        if (lower == "warn" || lower == "warning") { return WARNING; }
        if (lower == "info") { return INFO; }
        if (lower == "debug") { return DEBUG; }
        if (lower == "trace") { return TRACE; }
        return fallback;
    }

    LogLevel &logLevel() {
        static LogLevel ll = [] {
            const char *env = std::getenv("AMQPIO_LOG_LEVEL");
            return env == nullptr ? INFO : parseLogLevel(env, INFO);
        }();
        return ll;
    }

    std::mutex &sinkMutex() {
        static std::mutex m;
        return m;
    }
} // namespace amqpio::wheels::logging
