// =============================================================================
// log.cpp - Leveled stderr logger
// =============================================================================

#include "xlend/log.hpp"
#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace xlend {

LogLevel parse_log_level(std::string_view name) {
    if (name == "trace") return LogLevel::TRACE;
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info") return LogLevel::INFO;
    if (name == "warn" || name == "warning") return LogLevel::WARN;
    if (name == "error") return LogLevel::ERROR;
    if (name == "off") return LogLevel::OFF;
    return LogLevel::INFO;
}

namespace log {

namespace {

std::atomic<LogLevel> g_level{LogLevel::INFO};
std::mutex g_write_mutex;

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::OFF: return "OFF";
    }
    return "?";
}

} // namespace

void set_level(LogLevel level) {
    g_level.store(level, std::memory_order_relaxed);
}

LogLevel level() {
    return g_level.load(std::memory_order_relaxed);
}

bool enabled(LogLevel lvl) {
    LogLevel threshold = level();
    return threshold != LogLevel::OFF && lvl >= threshold;
}

void write(LogLevel lvl, std::string_view component, std::string_view message) {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);

    std::lock_guard lock(g_write_mutex);
    std::cerr << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ")
              << " [" << level_tag(lvl) << "] "
              << component << ": " << message << std::endl;
}

} // namespace log

} // namespace xlend
