#ifndef gatedrepl_CORE_LOGGER_HPP
#define gatedrepl_CORE_LOGGER_HPP

#include <string>
#include <utility>
#include <cstdio>
#include <ctime>
#include <cstdarg>

namespace gatedrepl {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// Parse "debug" / "info" / "warn" / "error" (case-insensitive).
// Unknown names yield the fallback.
LogLevel parse_log_level(const std::string& name, LogLevel fallback = LogLevel::INFO);

class Logger {
public:
    static Logger& instance();
    
    void set_level(LogLevel level);
    LogLevel level() const;

    // ANSI colours on stderr (default: on when stderr is a terminal)
    void set_color(bool enabled) { color_ = enabled; }
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
};

// Convenience macros
#define LOG_DEBUG(...) gatedrepl::Logger::instance().debug(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_INFO(...)  gatedrepl::Logger::instance().info(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_WARN(...)  gatedrepl::Logger::instance().warn(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_ERROR(...) gatedrepl::Logger::instance().error(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)

} // namespace gatedrepl

#endif // gatedrepl_CORE_LOGGER_HPP
