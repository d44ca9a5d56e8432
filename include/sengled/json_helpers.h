#pragma once

#include <optional>
#include <string>
#include <vector>
#include "sengled/data_structures.h"

namespace sengled {

// Body for the login request: credentials plus the fixed client fields.
// Throws SerializationError if the document cannot be encoded.
std::string build_login_request(const std::string& user, const std::string& password);

// Session id from a login response. Any well-formed JSON without a string
// "jsessionId" (including an empty body) yields nullopt.
// Throws TransportError if the body is not JSON at all.
std::optional<std::string> extract_session_id(const std::string& json_str);

// Raw records of a device list response, in response order.
// Throws TransportError on malformed JSON and DirectoryError on a wrong shape.
std::vector<DeviceRecord> extract_device_records(const std::string& json_str);

// extract_device_records followed by Device::from_record on each record;
// the first bad record fails the whole list.
std::vector<Device> extract_device_list(const std::string& json_str);

} // namespace sengled
