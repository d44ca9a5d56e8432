#pragma once

#include <string>
#include "sengled/logger.h"

namespace sengled {

// Environment variables read by load_config_from_env
constexpr const char* ENV_USER      = "SENGLED_USER";
constexpr const char* ENV_PASSWORD  = "SENGLED_PASS";
constexpr const char* ENV_LOG_LEVEL = "SENGLED_LOG_LEVEL";
constexpr const char* ENV_DEVICE    = "SENGLED_DEVICE";

struct Config {
    std::string account;
    std::string password;
    LogLevel log_level = LogLevel::Info;
    std::string device_name;    // empty when not set
};

// Throws ConfigError when SENGLED_USER or SENGLED_PASS is missing or empty,
// or SENGLED_LOG_LEVEL is not one of debug, info, warning, error.
Config load_config_from_env();

LogLevel parse_log_level(const std::string& name);

} // namespace sengled
