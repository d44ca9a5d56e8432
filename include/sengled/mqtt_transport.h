#pragma once

#include <memory>
#include <string>
#include "sengled/http_transport.h"

namespace mqtt {
class async_client;
}

namespace sengled {

struct MqttConnectOptions {
    std::string server_uri;
    std::string client_id;
    HeaderList http_headers;    // sent with the websocket upgrade request
    int connect_timeout_secs;
};

// Persistent publish channel used for commands
class MessageTransport {
public:
    virtual ~MessageTransport() = default;

    // Throws TransportError if the broker cannot be reached or refuses the session
    virtual void connect(const MqttConnectOptions& options) = 0;

    // Returns once the transport has delivered the message; throws PublishError
    virtual void publish(const std::string& topic, const std::string& payload) = 0;
};

// Eclipse Paho MQTT C++ implementation over TLS websockets, QoS 0, no persistence
class PahoMqttTransport : public MessageTransport {
public:
    PahoMqttTransport();
    ~PahoMqttTransport() override;

    PahoMqttTransport(const PahoMqttTransport&) = delete;
    PahoMqttTransport& operator=(const PahoMqttTransport&) = delete;

    void connect(const MqttConnectOptions& options) override;
    void publish(const std::string& topic, const std::string& payload) override;

private:
    std::unique_ptr<mqtt::async_client> client_;
};

} // namespace sengled
