#include "logger.h"
#include "errors.h"
#include <algorithm>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <iostream>
#include <memory>

namespace midea_dehumidifier {

std::unique_ptr<Logger> Logger::instance_;

namespace {

std::string vformat(const char* format, va_list args) {
    char buffer[256];
    vsnprintf(buffer, sizeof(buffer), format, args);
    return buffer;
}

} // namespace

LogLevel parse_log_level(const std::string& text) {
    if (!text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        int value = 0;
        try {
            value = std::stoi(text);
        } catch (const std::out_of_range&) {
            throw UsageError("Log level out of range: " + text);
        }
        // Same bucketing as a numeric threshold: anything above a level's value
        // but below the next one behaves like the lower level.
        if (value >= static_cast<int>(LogLevel::CRITICAL)) return LogLevel::CRITICAL;
        if (value >= static_cast<int>(LogLevel::ERROR)) return LogLevel::ERROR;
        if (value >= static_cast<int>(LogLevel::WARNING)) return LogLevel::WARNING;
        if (value >= static_cast<int>(LogLevel::INFO)) return LogLevel::INFO;
        return LogLevel::DEBUG;
    }

    std::string name = text;
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return std::toupper(c); });
    if (name == "DEBUG") return LogLevel::DEBUG;
    if (name == "INFO") return LogLevel::INFO;
    if (name == "WARNING" || name == "WARN") return LogLevel::WARNING;
    if (name == "ERROR") return LogLevel::ERROR;
    if (name == "CRITICAL" || name == "FATAL") return LogLevel::CRITICAL;
    throw UsageError("Unknown log level: " + text);
}

// stdout is reserved for appliance output, so every level goes to stderr
class StdLogger : public Logger {
public:
    void debug(const std::string& message) override {
        if (enabled(LogLevel::DEBUG)) std::cerr << "[DEBUG] " << message << std::endl;
    }

    void info(const std::string& message) override {
        if (enabled(LogLevel::INFO)) std::cerr << "[INFO] " << message << std::endl;
    }

    void warning(const std::string& message) override {
        if (enabled(LogLevel::WARNING)) std::cerr << "[WARNING] " << message << std::endl;
    }

    void error(const std::string& message) override {
        if (enabled(LogLevel::ERROR)) std::cerr << "[ERROR] " << message << std::endl;
    }

    void debugf(const char* format, ...) override {
        if (!enabled(LogLevel::DEBUG)) return;
        va_list args;
        va_start(args, format);
        std::string message = vformat(format, args);
        va_end(args);
        std::cerr << "[DEBUG] " << message << std::endl;
    }

    void infof(const char* format, ...) override {
        if (!enabled(LogLevel::INFO)) return;
        va_list args;
        va_start(args, format);
        std::string message = vformat(format, args);
        va_end(args);
        std::cerr << "[INFO] " << message << std::endl;
    }

    void warningf(const char* format, ...) override {
        if (!enabled(LogLevel::WARNING)) return;
        va_list args;
        va_start(args, format);
        std::string message = vformat(format, args);
        va_end(args);
        std::cerr << "[WARNING] " << message << std::endl;
    }

    void errorf(const char* format, ...) override {
        if (!enabled(LogLevel::ERROR)) return;
        va_list args;
        va_start(args, format);
        std::string message = vformat(format, args);
        va_end(args);
        std::cerr << "[ERROR] " << message << std::endl;
    }
};

void Logger::initialize() {
    instance_ = std::make_unique<StdLogger>();
}

Logger& Logger::instance() {
    if (!instance_) {
        initialize();
    }
    return *instance_;
}

void Logger::set_instance(std::unique_ptr<Logger> logger) {
    instance_ = std::move(logger);
}

} // namespace midea_dehumidifier
