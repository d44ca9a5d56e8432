#include "sengled/command.h"
#include "sengled/constants.h"
#include "sengled/errors.h"
#include "sengled/time_utils.h"

#include <nlohmann/json.hpp>
using json = nlohmann::json;

namespace sengled {

const char* command_type_tag(CommandType type) {
    switch (type) {
        case CommandType::Switch:     return "switch";
        case CommandType::Brightness: return "brightness";
        case CommandType::Color:      return "color";
    }
    throw std::invalid_argument("unknown command type");
}

Command build_command(CommandType type, const MacAddress& mac, const std::string& value) {
    return Command{type, mac, value};
}

Command switch_command(const MacAddress& mac, bool on) {
    return build_command(CommandType::Switch, mac, on ? "1" : "0");
}

uint8_t brightness_percent(uint8_t level) {
    // truncating, 128 -> 50
    return static_cast<uint8_t>(static_cast<unsigned>(level) * 100 / 255);
}

Command brightness_command(const MacAddress& mac, uint8_t level) {
    return build_command(CommandType::Brightness, mac, std::to_string(brightness_percent(level)));
}

Command color_command(const MacAddress& mac, const RgbColor& color) {
    std::string value = std::to_string(color.red) + ":" +
                        std::to_string(color.green) + ":" +
                        std::to_string(color.blue);
    return build_command(CommandType::Color, mac, value);
}

std::string topic_for(const MacAddress& mac) {
    return std::string(TOPIC_PREFIX) + mac.to_string() + TOPIC_SUFFIX;
}

std::string serialize_command(const Command& command) {
    return serialize_command(command, current_time_millis());
}

std::string serialize_command(const Command& command, int64_t time_ms) {
    json j = {
        {"type",  command_type_tag(command.type)},
        {"dn",    command.dn.to_string()},
        {"value", command.value},
        {"time",  time_ms}
    };
    try {
        return j.dump();
    } catch (const json::type_error& e) {
        throw SerializationError(std::string("cannot encode command: ") + e.what());
    }
}

} // namespace sengled
