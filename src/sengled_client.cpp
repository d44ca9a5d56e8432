#include "sengled/sengled_client.h"
#include "sengled/constants.h"
#include "sengled/errors.h"
#include "sengled/json_helpers.h"
#include "sengled/logger.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace sengled {

namespace {

// Enough of the token to tell sessions apart in logs
std::string redact(const std::string& session_id) {
    return session_id.substr(0, 6) + "...";
}

} // namespace

SengledClient::SengledClient(const std::string& account, const std::string& password)
    : SengledClient(account, password,
                    std::make_unique<CurlHttpTransport>(HTTP_TIMEOUT_SECS),
                    std::make_unique<PahoMqttTransport>()) {}

SengledClient::SengledClient(const std::string& account, const std::string& password,
                             std::unique_ptr<HttpTransport> http,
                             std::unique_ptr<MessageTransport> mqtt)
    : http_(std::move(http)), mqtt_(std::move(mqtt)) {
    if (!http_ || !mqtt_) throw std::invalid_argument("SengledClient needs both transports");
    session_id_ = login(account, password);
    connect();
}

std::string SengledClient::login(const std::string& account, const std::string& password) {
    auto& logger = Logger::instance();

    HttpRequest request;
    request.url = AUTH_URL;
    request.body = build_login_request(account, password);
    request.headers = {{"Content-Type", "application/json"}};

    std::string response = http_->post(request);
    std::optional<std::string> session_id = extract_session_id(response);
    if (!session_id) {
        logger.error("Login rejected by the server");
        throw AuthenticationFailure();
    }

    logger.infof("Login successful with session ID: %s", redact(*session_id).c_str());
    return *session_id;
}

void SengledClient::connect() {
    MqttConnectOptions options;
    options.server_uri = MQTT_SERVER_URI;
    options.client_id = session_id_ + MQTT_CLIENT_ID_SUFFIX;
    options.http_headers = {
        {SESSION_COOKIE_HEADER, session_cookie()},
        {CLIENT_IDENTITY_HEADER, CLIENT_IDENTITY_VALUE}
    };
    options.connect_timeout_secs = MQTT_CONNECT_TIMEOUT_SECS;
    mqtt_->connect(options);
}

std::string SengledClient::session_cookie() const {
    return std::string(SESSION_COOKIE_PREFIX) + session_id_;
}

std::vector<Device> SengledClient::list_devices() const {
    auto& logger = Logger::instance();

    HttpRequest request;
    request.url = DEVICE_LIST_URL;
    request.headers = {{SESSION_COOKIE_HEADER, session_cookie()}};

    std::string response = http_->post(request);
    std::vector<Device> devices;
    try {
        devices = extract_device_list(response);
    } catch (const DirectoryError& e) {
        logger.errorf("Failed to extract device list: %s", e.what());
        throw;
    }

    logger.infof("Got %zu devices", devices.size());
    return devices;
}

std::optional<Device> SengledClient::find_device(const std::string& name) const {
    std::vector<Device> devices = list_devices();
    auto it = std::find_if(devices.begin(), devices.end(), [&](const Device& d) { return d.name() == name; });
    if (it == devices.end()) {
        return std::nullopt;
    }
    return *it;
}

void SengledClient::turn_on(const Device& device) const {
    send_command(switch_command(device.mac(), true));
}

void SengledClient::turn_off(const Device& device) const {
    send_command(switch_command(device.mac(), false));
}

void SengledClient::set_brightness(const Device& device, uint8_t level) const {
    send_command(brightness_command(device.mac(), level));
}

void SengledClient::set_color(const Device& device, const RgbColor& color) const {
    send_command(color_command(device.mac(), color));
}

void SengledClient::send_command(const Command& command) const {
    std::string topic = topic_for(command.dn);
    std::string payload = serialize_command(command);
    Logger::instance().debugf("Publishing %s to %s", payload.c_str(), topic.c_str());
    mqtt_->publish(topic, payload);
}

} // namespace sengled
