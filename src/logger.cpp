#include "sengled/logger.h"
#include <cstdarg>
#include <cstdio>
#include <iostream>
#include <memory>
#include <mutex>

namespace sengled {

std::unique_ptr<Logger> Logger::instance_;

namespace {

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "[DEBUG] ";
        case LogLevel::Info:    return "[INFO] ";
        case LogLevel::Warning: return "[WARNING] ";
        case LogLevel::Error:   return "[ERROR] ";
    }
    return "[?] ";
}

} // namespace

// Linux/Mac implementation using stdout/stderr
class StdLogger : public Logger {
public:
    explicit StdLogger(LogLevel level) : level_(level) {}

    void debug(const std::string& message) override { write(LogLevel::Debug, message); }
    void info(const std::string& message) override { write(LogLevel::Info, message); }
    void warning(const std::string& message) override { write(LogLevel::Warning, message); }
    void error(const std::string& message) override { write(LogLevel::Error, message); }

    void debugf(const char* format, ...) override {
        va_list args;
        va_start(args, format);
        vwrite(LogLevel::Debug, format, args);
        va_end(args);
    }

    void infof(const char* format, ...) override {
        va_list args;
        va_start(args, format);
        vwrite(LogLevel::Info, format, args);
        va_end(args);
    }

    void warningf(const char* format, ...) override {
        va_list args;
        va_start(args, format);
        vwrite(LogLevel::Warning, format, args);
        va_end(args);
    }

    void errorf(const char* format, ...) override {
        va_list args;
        va_start(args, format);
        vwrite(LogLevel::Error, format, args);
        va_end(args);
    }

    void set_level(LogLevel level) override {
        std::lock_guard<std::mutex> lock(mutex_);
        level_ = level;
    }

    LogLevel level() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return level_;
    }

private:
    void vwrite(LogLevel level, const char* format, va_list args) {
        char buffer[512];
        vsnprintf(buffer, sizeof(buffer), format, args);
        write(level, buffer);
    }

    void write(LogLevel level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < level_) return;
        // warnings and errors go to stderr
        std::ostream& out = (level >= LogLevel::Warning) ? std::cerr : std::cout;
        out << level_tag(level) << message << std::endl;
    }

    mutable std::mutex mutex_;
    LogLevel level_;
};

void Logger::initialize(LogLevel level) {
    instance_ = std::make_unique<StdLogger>(level);
}

Logger& Logger::instance() {
    if (!instance_) {
        initialize();
    }
    return *instance_;
}

} // namespace sengled
