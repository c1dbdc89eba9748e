/*
 * sqlgate - Logger
 *
 * printf-style leveled logging to stderr. stdout carries protocol
 * responses, so nothing in the process may log there.
 *
 *   [2024-05-01 12:00:00.123] [INFO] Serving requests on stdin (4 workers)
 *
 * At debug level each record also names the emitting Class::method and
 * source file. Color is used only when stderr is a terminal.
 */
#ifndef sqlgate_CORE_LOGGER_HPP
#define sqlgate_CORE_LOGGER_HPP

#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <string>

namespace sqlgate {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const;

    // "debug", "info", "warn"/"warning", "error". Leaves `out` untouched
    // and returns false for anything else.
    static bool parse_level(const std::string& name, LogLevel& out);

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
    std::mutex write_mutex_;
};

#define LOG_DEBUG(...) sqlgate::Logger::instance().debug(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_INFO(...)  sqlgate::Logger::instance().info(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_WARN(...)  sqlgate::Logger::instance().warn(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_ERROR(...) sqlgate::Logger::instance().error(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)

} // namespace sqlgate

#endif // sqlgate_CORE_LOGGER_HPP
