#include "Logger.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace {
std::atomic<bool> debug_flag{false};
std::mutex output_mtx;

const char *level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:
            return "debug";
        case LogLevel::INFO:
            return "info";
        case LogLevel::WARNING:
            return "warning";
        case LogLevel::ERROR:
            return "error";
    }
    return "log";
}
}

void Logger::set_debug(bool enabled) {
    debug_flag.store(enabled);
}

bool Logger::debug_enabled() {
    return debug_flag.load();
}

void Logger::write(LogLevel level, const std::string &message) {
    std::lock_guard<std::mutex> lock(output_mtx);
    std::cerr << "[" << level_name(level) << "] " << message << std::endl;
}
