#pragma once
#include <sstream>
#include <string>

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

/**
 * @brief Process-wide logger writing "[level] message" lines to stderr.
 *
 * Probes log from worker threads, so every line is written under one lock.
 */
class Logger {
public:
    static void set_debug(bool enabled);
    static bool debug_enabled();
    static void write(LogLevel level, const std::string &message);

    template <typename... Args>
    static void log(LogLevel level, const Args &...args) {
        if (level == LogLevel::DEBUG && !debug_enabled())
            return;
        std::ostringstream line;
        (line << ... << args);
        write(level, line.str());
    }
};

template <typename... Args>
void log_debug(const Args &...args) { Logger::log(LogLevel::DEBUG, args...); }

template <typename... Args>
void log_info(const Args &...args) { Logger::log(LogLevel::INFO, args...); }

template <typename... Args>
void log_warning(const Args &...args) { Logger::log(LogLevel::WARNING, args...); }

template <typename... Args>
void log_error(const Args &...args) { Logger::log(LogLevel::ERROR, args...); }
