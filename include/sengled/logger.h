#pragma once
#include <string>
#include <memory>

namespace sengled {

enum class LogLevel {
    Debug   = 0,
    Info    = 1,
    Warning = 2,
    Error   = 3
};

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

    // Messages below the level are dropped
    virtual void set_level(LogLevel level) = 0;
    virtual LogLevel level() const = 0;
    
    // Singleton access
    static Logger& instance();
    static void initialize(LogLevel level = LogLevel::Info);

private:
    static std::unique_ptr<Logger> instance_;
};

} // namespace sengled
