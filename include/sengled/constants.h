#pragma once

namespace sengled {

// Cloud endpoints
constexpr const char* AUTH_URL        = "https://ucenter.cloud.sengled.com/user/app/customer/v2/AuthenCross.json";
constexpr const char* DEVICE_LIST_URL = "https://life2.cloud.sengled.com/life2/device/list.json";
constexpr const char* MQTT_SERVER_URI = "wss://us-mqtt.cloud.sengled.com:443/mqtt";

// Fixed login fields; the service only accepts these exact values
constexpr const char* LOGIN_OS_TYPE      = "ios";
constexpr const char* LOGIN_UUID         = "xxx";
constexpr const char* LOGIN_PRODUCT_CODE = "life";
constexpr const char* LOGIN_APP_CODE     = "life";

// JSON keys
constexpr const char* KEY_SESSION_ID     = "jsessionId";
constexpr const char* KEY_DEVICE_LIST    = "deviceList";
constexpr const char* KEY_DEVICE_UUID    = "deviceUuid";
constexpr const char* KEY_ATTRIBUTE_LIST = "attributeList";
constexpr const char* ATTRIBUTE_NAME     = "name";

// Session credential, sent as a cookie on HTTP requests and on the MQTT websocket upgrade
constexpr const char* SESSION_COOKIE_HEADER = "Cookie";
constexpr const char* SESSION_COOKIE_PREFIX = "JSESSIONID=";
constexpr const char* CLIENT_IDENTITY_HEADER = "X-Requested-With";
constexpr const char* CLIENT_IDENTITY_VALUE  = "com.sengled.life2";

// MQTT client id is "<session id>" + suffix
constexpr const char* MQTT_CLIENT_ID_SUFFIX = "@lifeApp";

// Command topics are TOPIC_PREFIX + "<MAC>" + TOPIC_SUFFIX
constexpr const char* TOPIC_PREFIX = "wifielement/";
constexpr const char* TOPIC_SUFFIX = "/update";

constexpr int MAC_ADDRESS_SIZE = 6;

constexpr long HTTP_TIMEOUT_SECS = 15;
constexpr int MQTT_CONNECT_TIMEOUT_SECS = 15;

} // namespace sengled
