#pragma once

#include <cstdint>
#include <string>
#include "sengled/mac_address.h"

namespace sengled {

enum class CommandType {
    Switch,
    Brightness,
    Color
};

// Wire tag for the "type" field: "switch", "brightness" or "color"
const char* command_type_tag(CommandType type);

// A single state change for one device. Holds its own copy of the MAC so it
// stays publishable after the Device it came from is gone. The timestamp is
// not stored; it is taken when the command is serialized.
struct Command {
    CommandType type;
    MacAddress dn;
    std::string value;
};

struct RgbColor {
    uint8_t red;
    uint8_t green;
    uint8_t blue;
};

Command build_command(CommandType type, const MacAddress& mac, const std::string& value);

Command switch_command(const MacAddress& mac, bool on);

// level is 0-255 and is sent as a truncated 0-100 percentage
Command brightness_command(const MacAddress& mac, uint8_t level);

// value is "R:G:B" in decimal
Command color_command(const MacAddress& mac, const RgbColor& color);

uint8_t brightness_percent(uint8_t level);

// "wifielement/<MAC>/update"
std::string topic_for(const MacAddress& mac);

// {"type":..., "dn":..., "value":..., "time":<epoch ms>} stamped with the current time
std::string serialize_command(const Command& command);
std::string serialize_command(const Command& command, int64_t time_ms);

} // namespace sengled
