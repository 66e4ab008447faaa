#pragma once
#include <string>
#include <memory>

namespace midea_dehumidifier {

// Numeric values follow the common syslog-style ladder so that `--log 10`
// and `--log debug` mean the same thing.
enum class LogLevel {
    DEBUG    = 10,
    INFO     = 20,
    WARNING  = 30,
    ERROR    = 40,
    CRITICAL = 50
};

// Accepts a level name (any case) or a non-negative integer.
// Throws UsageError for anything else.
LogLevel parse_log_level(const std::string& text);

class Logger {
public:
    virtual ~Logger() = default;
    
    virtual void debug(const std::string& message) = 0;
    virtual void info(const std::string& message) = 0;
    virtual void warning(const std::string& message) = 0;
    virtual void error(const std::string& message) = 0;
    
    // Format string with variadic arguments (similar to printf)
    virtual void debugf(const char* format, ...) = 0;
    virtual void infof(const char* format, ...) = 0;
    virtual void warningf(const char* format, ...) = 0;
    virtual void errorf(const char* format, ...) = 0;

    void set_level(LogLevel level) { level_ = level; }
    bool enabled(LogLevel level) const { return static_cast<int>(level) >= static_cast<int>(level_); }
    
    // Singleton access
    static Logger& instance();
    static void initialize();
    // Replaces the process logger, e.g. with a capturing one in tests
    static void set_instance(std::unique_ptr<Logger> logger);

private:
    LogLevel level_ = LogLevel::WARNING;

    static std::unique_ptr<Logger> instance_;
};

} // namespace midea_dehumidifier
