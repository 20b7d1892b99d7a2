/*
 * Primus C++ - Logger
 *
 * Colourised stderr logger with printf-style macros. An optional sink
 * receives every emitted line so front ends can mirror the log.
 */
#ifndef primus_CORE_LOGGER_HPP
#define primus_CORE_LOGGER_HPP

#include <string>
#include <utility>
#include <functional>
#include <mutex>
#include <cstdio>
#include <ctime>
#include <cstdarg>

namespace primus {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// Parse "debug" / "info" / "warn" / "error"; unknown names map to INFO
LogLevel parse_log_level(const std::string& name);
const char* log_level_name(LogLevel level);

typedef std::function<void(LogLevel, const std::string&)> LogSink;

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const;

    // Route formatted lines to a callback in addition to stderr.
    // Pass an empty function to remove it.
    void set_sink(LogSink sink);

    // Suppress stderr output (the sink still receives lines)
    void set_quiet(bool quiet);

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
    bool quiet_;
    LogSink sink_;
    std::mutex mutex_;
};

// Convenience macros
#define LOG_DEBUG(...) primus::Logger::instance().debug(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_INFO(...)  primus::Logger::instance().info(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_WARN(...)  primus::Logger::instance().warn(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_ERROR(...) primus::Logger::instance().error(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)

} // namespace primus

#endif // primus_CORE_LOGGER_HPP
