#pragma once

#include <string>
#include <vector>
#include "sengled/mac_address.h"

namespace sengled {

struct DeviceRecord;

// A registered device as listed by the cloud directory. Immutable.
class Device {
public:
    Device(std::string name, const MacAddress& mac);

    // Display name is the value of the first attribute called "name".
    // Throws DirectoryError if there is none or the uuid is not a valid MAC.
    static Device from_record(const DeviceRecord& record);

    const std::string& name() const { return name_; }
    const MacAddress& mac() const { return mac_; }

    std::string to_string() const;

private:
    std::string name_;
    MacAddress mac_;
};

// Raw directory record before the display name is pulled out of it
struct Attribute {
    std::string name;
    std::string value;
};

struct DeviceRecord {
    std::string device_uuid;
    std::vector<Attribute> attributes;
};

} // namespace sengled
