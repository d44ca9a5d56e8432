#include "sengled/config.h"
#include "sengled/errors.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace sengled {

namespace {

std::string env_or_empty(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string required_env(const char* name) {
    std::string value = env_or_empty(name);
    if (value.empty()) {
        throw ConfigError(std::string(name) + " is not set");
    }
    return value;
}

} // namespace

LogLevel parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug")   return LogLevel::Debug;
    if (lower == "info")    return LogLevel::Info;
    if (lower == "warning" || lower == "warn") return LogLevel::Warning;
    if (lower == "error")   return LogLevel::Error;
    throw ConfigError("unknown log level \"" + name + "\"");
}

Config load_config_from_env() {
    Config config;
    config.account = required_env(ENV_USER);
    config.password = required_env(ENV_PASSWORD);

    std::string level = env_or_empty(ENV_LOG_LEVEL);
    if (!level.empty()) {
        config.log_level = parse_log_level(level);
    }
    config.device_name = env_or_empty(ENV_DEVICE);
    return config;
}

} // namespace sengled
