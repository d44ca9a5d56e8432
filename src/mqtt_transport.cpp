#include "sengled/mqtt_transport.h"
#include "sengled/errors.h"
#include "sengled/logger.h"
#include <mqtt/async_client.h>
#include <chrono>

namespace sengled {

PahoMqttTransport::PahoMqttTransport() = default;

PahoMqttTransport::~PahoMqttTransport() {
    if (client_ && client_->is_connected()) {
        try {
            client_->disconnect()->wait();
        } catch (const mqtt::exception& e) {
            Logger::instance().warningf("MQTT disconnect failed: %s", e.what());
        }
    }
}

void PahoMqttTransport::connect(const MqttConnectOptions& options) {
    auto& logger = Logger::instance();

    if (client_) {
        throw TransportError("MQTT transport is already connected");
    }

    mqtt::name_value_collection headers;
    for (const auto& header : options.http_headers) {
        headers.insert(header);
    }

    auto ssl_opts = mqtt::ssl_options_builder().finalize();
    auto conn_opts = mqtt::connect_options_builder()
        .http_headers(headers)
        .ssl(std::move(ssl_opts))
        .clean_session(true)
        .connect_timeout(std::chrono::seconds(options.connect_timeout_secs))
        .finalize();

    try {
        // nullptr persistence: messages are not stored across restarts
        client_ = std::make_unique<mqtt::async_client>(
            options.server_uri, options.client_id, static_cast<mqtt::iclient_persistence*>(nullptr));

        logger.infof("Connecting to %s", options.server_uri.c_str());
        client_->connect(conn_opts)->wait();
        logger.info("MQTT connection established");
    } catch (const mqtt::exception& e) {
        client_.reset();
        logger.errorf("MQTT connect to %s failed: %s", options.server_uri.c_str(), e.what());
        throw TransportError(std::string("MQTT connect failed: ") + e.what());
    }
}

void PahoMqttTransport::publish(const std::string& topic, const std::string& payload) {
    if (!client_) {
        throw PublishError("MQTT transport is not connected");
    }

    try {
        client_->publish(mqtt::make_message(topic, payload))->wait();
    } catch (const mqtt::exception& e) {
        Logger::instance().errorf("Publish to %s failed: %s", topic.c_str(), e.what());
        throw PublishError("publish to " + topic + " failed: " + e.what());
    }
}

} // namespace sengled
