#include <iostream>
#include <string>
#include <chrono>
#include <thread>
#include <stdexcept>
#include <optional>
#include "sengled/config.h"
#include "sengled/errors.h"
#include "sengled/logger.h"
#include "sengled/sengled_client.h"

using namespace sengled;

namespace {

void print_usage(Logger& logger) {
    logger.info("Usage:");
    logger.info("  ./sengled-cli list                        - List devices");
    logger.info("  ./sengled-cli on [name]                   - Turn device on");
    logger.info("  ./sengled-cli off [name]                  - Turn device off");
    logger.info("  ./sengled-cli brightness [name] <0-255>   - Set brightness");
    logger.info("  ./sengled-cli color [name] <r> <g> <b>    - Set color");
    logger.info("  ./sengled-cli blink [name] [count]        - Alternate red and blue");
    logger.info("[name] defaults to $SENGLED_DEVICE; credentials come from $SENGLED_USER and $SENGLED_PASS");
}

uint8_t parse_channel(const std::string& text) {
    size_t used = 0;
    int value = std::stoi(text, &used);
    if (used != text.size() || value < 0 || value > 255) {
        throw std::invalid_argument("expected a value between 0 and 255, got \"" + text + "\"");
    }
    return static_cast<uint8_t>(value);
}

// Device name comes from argv when there are more arguments than the command needs
std::string device_name_arg(int argc, char* argv[], int value_args, const Config& config) {
    if (argc > 2 + value_args) {
        return argv[2];
    }
    if (config.device_name.empty()) {
        throw std::invalid_argument("no device name given and SENGLED_DEVICE is not set");
    }
    return config.device_name;
}

Device require_device(const SengledClient& client, const std::string& name) {
    std::optional<Device> device = client.find_device(name);
    if (!device) throw std::runtime_error("Device not found: " + name);
    return *device;
}

// First positional value after the optional device name
int value_index(int argc, int value_args) {
    return argc > 2 + value_args ? 3 : 2;
}

} // namespace

int main(int argc, char* argv[]) {
    Logger::initialize();
    auto& logger = Logger::instance();

    logger.info("Sengled Desktop Client");
    logger.info("======================");

    if (argc < 2) {
        print_usage(logger);
        return 1;
    }

    std::string command = argv[1];

    try {
        Config config = load_config_from_env();
        logger.set_level(config.log_level);

        SengledClient client{config.account, config.password};

        if (command == "list") {
            for (const Device& device : client.list_devices()) {
                logger.infof("Device: %s", device.to_string().c_str());
            }
        }
        else if (command == "on" || command == "off") {
            Device device = require_device(client, device_name_arg(argc, argv, 0, config));
            logger.infof("Turning %s device: %s", command == "on" ? "ON" : "OFF", device.name().c_str());
            if (command == "on") client.turn_on(device);
            else client.turn_off(device);
            logger.info("Command sent successfully");
        }
        else if (command == "brightness") {
            if (argc < 3) { print_usage(logger); return 1; }
            Device device = require_device(client, device_name_arg(argc, argv, 1, config));
            uint8_t level = parse_channel(argv[value_index(argc, 1)]);
            logger.infof("Setting brightness of %s to %u", device.name().c_str(), static_cast<unsigned>(level));
            client.set_brightness(device, level);
            logger.info("Command sent successfully");
        }
        else if (command == "color") {
            if (argc < 5) { print_usage(logger); return 1; }
            Device device = require_device(client, device_name_arg(argc, argv, 3, config));
            int first = value_index(argc, 3);
            RgbColor color{parse_channel(argv[first]), parse_channel(argv[first + 1]), parse_channel(argv[first + 2])};
            logger.infof("Setting color of %s to %u:%u:%u", device.name().c_str(),
                         static_cast<unsigned>(color.red), static_cast<unsigned>(color.green), static_cast<unsigned>(color.blue));
            client.set_color(device, color);
            logger.info("Command sent successfully");
        }
        else if (command == "blink") {
            std::string name = argc > 2 ? argv[2] : device_name_arg(argc, argv, 0, config);
            long count = argc > 3 ? std::stol(argv[3]) : 0;
            Device device = require_device(client, name);
            logger.infof("Blinking %s (%s)", device.name().c_str(),
                         count > 0 ? std::to_string(count).c_str() : "until interrupted");
            for (long i = 0; count <= 0 || i < count; ++i) {
                client.set_color(device, RgbColor{255, 0, 0});
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
                client.set_color(device, RgbColor{0, 0, 255});
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
        }
        else {
            logger.warning("Unknown command. Use 'list', 'on', 'off', 'brightness', 'color' or 'blink'");
            return 1;
        }
    }
    catch (const AuthenticationFailure& e) {
        logger.errorf("Error: %s (check SENGLED_USER and SENGLED_PASS)", e.what());
        return 2;
    }
    catch (const std::exception& e) {
        logger.errorf("Error: %s", e.what());
        return 1;
    }

    return 0;
}
