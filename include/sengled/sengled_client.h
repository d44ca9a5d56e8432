#pragma once

#include "sengled/command.h"
#include "sengled/data_structures.h"
#include "sengled/http_transport.h"
#include "sengled/mqtt_transport.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sengled {

// Logged-in session with the Sengled cloud. Construction logs in and opens
// the MQTT connection; a constructed client is always ready. There is no
// reconnect or token refresh: after a transport failure, make a new client.
// Command methods may be called concurrently; their relative order is not kept.
class SengledClient {
public:
    SengledClient(const std::string& account, const std::string& password);
    SengledClient(const std::string& account, const std::string& password,
                  std::unique_ptr<HttpTransport> http,
                  std::unique_ptr<MessageTransport> mqtt);

    SengledClient(const SengledClient&) = delete;
    SengledClient& operator=(const SengledClient&) = delete;

    // Device operations
    std::vector<Device> list_devices() const;
    std::optional<Device> find_device(const std::string& name) const;

    void turn_on(const Device& device) const;
    void turn_off(const Device& device) const;
    void set_brightness(const Device& device, uint8_t level) const;
    void set_color(const Device& device, const RgbColor& color) const;

    const std::string& session_id() const { return session_id_; }

private:
    std::string login(const std::string& account, const std::string& password);
    void connect();
    void send_command(const Command& command) const;
    std::string session_cookie() const;

    std::unique_ptr<HttpTransport> http_;
    std::unique_ptr<MessageTransport> mqtt_;
    std::string session_id_;
};

} // namespace sengled
