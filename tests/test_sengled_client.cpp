#include <doctest/doctest.h>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <thread>
#include <vector>
#include "sengled/constants.h"
#include "sengled/errors.h"
#include "sengled/sengled_client.h"

using namespace sengled;
using json = nlohmann::json;

namespace {

const char* kDeviceListBody = R"({
    "deviceList": [
        {"deviceUuid": "B0:CE:18:00:00:01", "attributeList": [{"name": "name", "value": "Kitchen"}]},
        {"deviceUuid": "B0:CE:18:00:00:02", "attributeList": [{"name": "type", "value": "wifi"},
                                                              {"name": "name", "value": "Guess"}]}
    ]
})";

// Answers by URL and records every request
class FakeHttp : public HttpTransport {
public:
    std::string login_response = R"({"jsessionId":"token-123"})";
    std::string device_list_response = kDeviceListBody;
    bool fail_device_list = false;
    std::vector<HttpRequest> requests;

    std::string post(const HttpRequest& request) override {
        requests.push_back(request);
        if (request.url == AUTH_URL) return login_response;
        if (request.url == DEVICE_LIST_URL) {
            if (fail_device_list) throw TransportError("HTTP 500");
            return device_list_response;
        }
        throw TransportError("unexpected url " + request.url);
    }
};

struct Published {
    std::string topic;
    std::string payload;
};

class FakeMqtt : public MessageTransport {
public:
    explicit FakeMqtt(bool fail_connect = false, bool fail_publish = false)
        : fail_connect_(fail_connect), fail_publish_(fail_publish) {}

    std::vector<MqttConnectOptions> connects;
    std::vector<Published> published;

    void connect(const MqttConnectOptions& options) override {
        if (fail_connect_) throw TransportError("connection refused");
        connects.push_back(options);
    }

    void publish(const std::string& topic, const std::string& payload) override {
        if (fail_publish_) throw PublishError("publish failed");
        std::lock_guard<std::mutex> lock(mutex_);
        published.push_back(Published{topic, payload});
    }

private:
    bool fail_connect_;
    bool fail_publish_;
    std::mutex mutex_;
};

struct Fixture {
    FakeHttp* http = nullptr;
    FakeMqtt* mqtt = nullptr;

    std::unique_ptr<SengledClient> make_client(std::unique_ptr<FakeHttp> h = std::make_unique<FakeHttp>(),
                                               std::unique_ptr<FakeMqtt> m = std::make_unique<FakeMqtt>()) {
        http = h.get();
        mqtt = m.get();
        return std::make_unique<SengledClient>("alice@example.com", "s3cret", std::move(h), std::move(m));
    }
};

std::string header_value(const HeaderList& headers, const std::string& name) {
    for (const auto& header : headers) {
        if (header.first == name) return header.second;
    }
    return "";
}

} // namespace

TEST_CASE_FIXTURE(Fixture, "Construction logs in and connects with the session id") {
    auto client = make_client();
    CHECK(client->session_id() == "token-123");

    REQUIRE(http->requests.size() == 1);
    const HttpRequest& login = http->requests[0];
    CHECK(login.url == AUTH_URL);
    json body = json::parse(login.body);
    CHECK(body["user"] == "alice@example.com");
    CHECK(body["pwd"] == "s3cret");
    CHECK(header_value(login.headers, "Content-Type") == "application/json");

    REQUIRE(mqtt->connects.size() == 1);
    const MqttConnectOptions& options = mqtt->connects[0];
    CHECK(options.server_uri == MQTT_SERVER_URI);
    CHECK(options.client_id == "token-123@lifeApp");
    CHECK(header_value(options.http_headers, "Cookie") == "JSESSIONID=token-123");
    CHECK(header_value(options.http_headers, "X-Requested-With") == "com.sengled.life2");
}

TEST_CASE_FIXTURE(Fixture, "Rejected login is an authentication failure and never connects") {
    auto h = std::make_unique<FakeHttp>();
    h->login_response = R"({"ret":1,"msg":"bad password"})";
    CHECK_THROWS_AS(make_client(std::move(h), std::make_unique<FakeMqtt>(true)), AuthenticationFailure);
}

TEST_CASE_FIXTURE(Fixture, "Empty and array login responses are authentication failures") {
    auto h = std::make_unique<FakeHttp>();
    h->login_response = "[]";
    CHECK_THROWS_AS(make_client(std::move(h)), AuthenticationFailure);

    auto h2 = std::make_unique<FakeHttp>();
    h2->login_response = "";
    CHECK_THROWS_AS(make_client(std::move(h2)), AuthenticationFailure);
}

TEST_CASE_FIXTURE(Fixture, "Garbage login response is a transport error, not an authentication failure") {
    auto h = std::make_unique<FakeHttp>();
    h->login_response = "<html>";
    CHECK_THROWS_AS(make_client(std::move(h)), TransportError);
}

TEST_CASE_FIXTURE(Fixture, "Failed MQTT connect fails construction") {
    CHECK_THROWS_AS(make_client(std::make_unique<FakeHttp>(), std::make_unique<FakeMqtt>(true)), TransportError);
}

TEST_CASE("Missing transports are rejected") {
    CHECK_THROWS_AS(SengledClient("a", "b", nullptr, std::make_unique<FakeMqtt>()), std::invalid_argument);
}

TEST_CASE_FIXTURE(Fixture, "Device listing sends the session cookie and keeps order") {
    auto client = make_client();
    std::vector<Device> devices = client->list_devices();

    REQUIRE(http->requests.size() == 2);
    const HttpRequest& request = http->requests[1];
    CHECK(request.url == DEVICE_LIST_URL);
    CHECK(request.body.empty());
    CHECK(header_value(request.headers, "Cookie") == "JSESSIONID=token-123");

    REQUIRE(devices.size() == 2);
    CHECK(devices[0].name() == "Kitchen");
    CHECK(devices[0].mac().to_string() == "B0:CE:18:00:00:01");
    CHECK(devices[1].name() == "Guess");
    CHECK(devices[1].mac().to_string() == "B0:CE:18:00:00:02");
}

TEST_CASE_FIXTURE(Fixture, "Device listing errors propagate") {
    auto client = make_client();

    http->device_list_response = R"({"deviceList":[{"deviceUuid":"B0:CE:18:00:00:01","attributeList":[]}]})";
    CHECK_THROWS_AS(client->list_devices(), DirectoryError);

    http->fail_device_list = true;
    CHECK_THROWS_AS(client->list_devices(), TransportError);
}

TEST_CASE_FIXTURE(Fixture, "find_device looks devices up by display name") {
    auto client = make_client();
    std::optional<Device> guess = client->find_device("Guess");
    REQUIRE(guess.has_value());
    CHECK(guess->mac().to_string() == "B0:CE:18:00:00:02");
    CHECK_FALSE(client->find_device("Garage").has_value());
}

TEST_CASE_FIXTURE(Fixture, "Commands are published to the device topic") {
    auto client = make_client();
    Device device("Guess", MacAddress::parse("B0:CE:18:00:00:02"));

    client->turn_on(device);
    client->turn_off(device);
    client->set_brightness(device, 128);
    client->set_color(device, RgbColor{255, 0, 0});

    REQUIRE(mqtt->published.size() == 4);
    for (const auto& message : mqtt->published) {
        CHECK(message.topic == "wifielement/B0:CE:18:00:00:02/update");
        CHECK(json::parse(message.payload)["dn"] == "B0:CE:18:00:00:02");
        CHECK(json::parse(message.payload)["time"].is_number_integer());
    }

    json on = json::parse(mqtt->published[0].payload);
    CHECK(on["type"] == "switch");
    CHECK(on["value"] == "1");

    json off = json::parse(mqtt->published[1].payload);
    CHECK(off["type"] == "switch");
    CHECK(off["value"] == "0");

    json brightness = json::parse(mqtt->published[2].payload);
    CHECK(brightness["type"] == "brightness");
    CHECK(brightness["value"] == "50");

    json color = json::parse(mqtt->published[3].payload);
    CHECK(color["type"] == "color");
    CHECK(color["value"] == "255:0:0");
}

TEST_CASE_FIXTURE(Fixture, "Publish failures surface from the command call") {
    auto client = make_client(std::make_unique<FakeHttp>(), std::make_unique<FakeMqtt>(false, true));
    Device device("Guess", MacAddress::parse("B0:CE:18:00:00:02"));
    CHECK_THROWS_AS(client->turn_on(device), PublishError);
}

TEST_CASE_FIXTURE(Fixture, "Commands can be issued from several threads") {
    auto client = make_client();
    Device kitchen("Kitchen", MacAddress::parse("B0:CE:18:00:00:01"));
    Device guess("Guess", MacAddress::parse("B0:CE:18:00:00:02"));

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&, i] {
            const Device& target = (i % 2 == 0) ? kitchen : guess;
            for (int n = 0; n < 10; ++n) {
                client->set_color(target, RgbColor{static_cast<uint8_t>(n), 0, 0});
            }
        });
    }
    for (auto& t : threads) t.join();

    CHECK(mqtt->published.size() == 40);
}
