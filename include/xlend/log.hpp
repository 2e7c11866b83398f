#ifndef XLEND_LOG_HPP
#define XLEND_LOG_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <sstream>

namespace xlend {

enum class LogLevel : uint8_t {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    OFF = 5
};

// Parses "trace" .. "off"; unknown names map to INFO
LogLevel parse_log_level(std::string_view name);

namespace log {

void set_level(LogLevel level);
LogLevel level();
bool enabled(LogLevel level);

// Writes "<iso8601> [LEVEL] <component>: <message>" to stderr
void write(LogLevel level, std::string_view component, std::string_view message);

template <typename... Args>
void emit(LogLevel lvl, std::string_view component, const Args&... args) {
    if (!enabled(lvl)) return;
    std::ostringstream os;
    (os << ... << args);
    write(lvl, component, os.str());
}

template <typename... Args>
void debug(std::string_view component, const Args&... args) { emit(LogLevel::DEBUG, component, args...); }

template <typename... Args>
void info(std::string_view component, const Args&... args) { emit(LogLevel::INFO, component, args...); }

template <typename... Args>
void warn(std::string_view component, const Args&... args) { emit(LogLevel::WARN, component, args...); }

template <typename... Args>
void error(std::string_view component, const Args&... args) { emit(LogLevel::ERROR, component, args...); }

} // namespace log

} // namespace xlend

#endif // XLEND_LOG_HPP
