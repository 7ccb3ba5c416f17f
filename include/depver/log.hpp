#pragma once
#include <cstdio>
#include <format>
#include <print>
#include <string>
#include <string_view>
#include <utility>

namespace depver {

enum class LogLevel {
    INFO,
    VERBOSE,
    WARN,
    ERROR
};

// All output goes to stderr so stdout stays free for rendered tables.
class Logger {
public:
    static inline bool verbose_enabled = false;

    template <typename... Args>
    static void info(std::string_view fmt, Args&&... args) {
        log(LogLevel::INFO, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void verbose(std::string_view fmt, Args&&... args) {
        if (verbose_enabled) {
            log(LogLevel::VERBOSE, fmt, std::forward<Args>(args)...);
        }
    }

    template <typename... Args>
    static void warn(std::string_view fmt, Args&&... args) {
        log(LogLevel::WARN, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void error(std::string_view fmt, Args&&... args) {
        log(LogLevel::ERROR, fmt, std::forward<Args>(args)...);
    }

private:
    template <typename... Args>
    static void log(LogLevel level, std::string_view fmt, Args&&... args) {
        std::string message = std::vformat(fmt, std::make_format_args(args...));

        switch (level) {
            case LogLevel::VERBOSE:
                std::println(stderr, "\033[90m[DEBUG] {}\033[0m", message);
                break;
            case LogLevel::INFO:
                std::println(stderr, "[INFO]  {}", message);
                break;
            case LogLevel::WARN:
                std::println(stderr, "\033[33m[WARN]  {}\033[0m", message);
                break;
            case LogLevel::ERROR:
                std::println(stderr, "\033[31m[ERROR] {}\033[0m", message);
                break;
        }
    }
};

} // namespace depver
