#include "sengled/json_helpers.h"
#include "sengled/constants.h"
#include "sengled/errors.h"
#include "sengled/logger.h"
#include <algorithm>
#include <cctype>
#include <utility>

#include <nlohmann/json.hpp>
using json = nlohmann::json;

namespace sengled {

namespace {

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

json parse_body(const std::string& json_str) {
    try {
        return json::parse(json_str);
    } catch (const json::parse_error& e) {
        Logger::instance().errorf("Malformed JSON response: %s", e.what());
        throw TransportError(std::string("malformed JSON response: ") + e.what());
    }
}

std::string required_string(const json& obj, const char* key, size_t index) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) {
        throw DirectoryError("device " + std::to_string(index) + ": missing string field \"" + key + "\"");
    }
    return it->get<std::string>();
}

} // namespace

std::string build_login_request(const std::string& user, const std::string& password) {
    json j = {
        {"user",        user},
        {"pwd",         password},
        {"osType",      LOGIN_OS_TYPE},
        {"uuid",        LOGIN_UUID},
        {"productCode", LOGIN_PRODUCT_CODE},
        {"appCode",     LOGIN_APP_CODE}
    };
    try {
        return j.dump();
    } catch (const json::type_error& e) {
        throw SerializationError(std::string("cannot encode login request: ") + e.what());
    }
}

std::optional<std::string> extract_session_id(const std::string& json_str) {
    if (is_blank(json_str)) {
        return std::nullopt;
    }

    json j = parse_body(json_str);

    // Anything but the success shape is a failed login, never a parse error
    if (!j.is_object()) {
        return std::nullopt;
    }
    auto it = j.find(KEY_SESSION_ID);
    if (it == j.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

std::vector<DeviceRecord> extract_device_records(const std::string& json_str) {
    json j = parse_body(json_str);

    if (!j.is_object() || !j.contains(KEY_DEVICE_LIST) || !j[KEY_DEVICE_LIST].is_array()) {
        throw DirectoryError("response has no deviceList array");
    }

    std::vector<DeviceRecord> records;
    size_t index = 0;
    for (const auto& item : j[KEY_DEVICE_LIST]) {
        if (!item.is_object()) {
            throw DirectoryError("device " + std::to_string(index) + ": not an object");
        }

        DeviceRecord record;
        record.device_uuid = required_string(item, KEY_DEVICE_UUID, index);

        auto attrs = item.find(KEY_ATTRIBUTE_LIST);
        if (attrs == item.end() || !attrs->is_array()) {
            throw DirectoryError("device " + std::to_string(index) + ": missing attributeList");
        }
        for (const auto& attr : *attrs) {
            if (!attr.is_object()) {
                throw DirectoryError("device " + std::to_string(index) + ": attribute is not an object");
            }
            record.attributes.push_back(Attribute{required_string(attr, "name", index),
                                                  required_string(attr, "value", index)});
        }

        records.push_back(std::move(record));
        ++index;
    }
    return records;
}

std::vector<Device> extract_device_list(const std::string& json_str) {
    std::vector<DeviceRecord> records = extract_device_records(json_str);

    std::vector<Device> devices;
    devices.reserve(records.size());
    for (const auto& record : records) {
        devices.push_back(Device::from_record(record));
    }
    return devices;
}

} // namespace sengled
