/*
 * taintguard C++17 - Logger
 *
 * Process-wide printf-style logger writing to stderr. Messages must never
 * carry raw sensitive values: log entry ids, labels, lengths and counts.
 */
#ifndef taintguard_CORE_LOGGER_HPP
#define taintguard_CORE_LOGGER_HPP

#include <string>
#include <utility>
#include <mutex>
#include <cstdio>
#include <ctime>
#include <cstdarg>

namespace taintguard {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// Parse "debug" / "info" / "warn" / "error" (case-insensitive).
// Unknown names yield `fallback`.
LogLevel parse_log_level(const std::string& name, LogLevel fallback = LogLevel::INFO);

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const;

    // ANSI colors on stderr (default: on when stderr is a tty)
    void set_color(bool enabled);
    bool color() const { return color_; }

    void debug(const char* file, int line, const char* func, const char* fmt, ...);
    void info(const char* file, int line, const char* func, const char* fmt, ...);
    void warn(const char* file, int line, const char* func, const char* fmt, ...);
    void error(const char* file, int line, const char* func, const char* fmt, ...);

private:
    Logger();
    Logger(const Logger&);
    Logger& operator=(const Logger&);

    void log_impl(LogLevel level, const char* file, int line, const char* func, const char* fmt, va_list args);

    LogLevel level_;
    bool color_;
    std::mutex write_mutex_;   // one line at a time across worker threads
};

// Convenience macros
#define LOG_DEBUG(...) taintguard::Logger::instance().debug(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_INFO(...)  taintguard::Logger::instance().info(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_WARN(...)  taintguard::Logger::instance().warn(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_ERROR(...) taintguard::Logger::instance().error(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)

} // namespace taintguard

#endif // taintguard_CORE_LOGGER_HPP
