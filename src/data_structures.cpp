#include "sengled/data_structures.h"
#include "sengled/constants.h"
#include "sengled/errors.h"
#include <algorithm>
#include <utility>

namespace sengled {

Device::Device(std::string name, const MacAddress& mac)
    : name_(std::move(name)), mac_(mac) {}

Device Device::from_record(const DeviceRecord& record) {
    auto it = std::find_if(record.attributes.begin(), record.attributes.end(),
                           [](const Attribute& a) { return a.name == ATTRIBUTE_NAME; });
    if (it == record.attributes.end()) {
        throw DirectoryError("no name field in attributes of device " + record.device_uuid);
    }

    try {
        return Device(it->value, MacAddress::parse(record.device_uuid));
    } catch (const InvalidIdentifier& e) {
        throw DirectoryError(std::string("invalid UUID: ") + e.what());
    }
}

std::string Device::to_string() const {
    std::string result;
    result += "{ name: \"" + name_ + "\", ";
    result += "  mac: " + mac_.to_string() + " }";
    return result;
}

} // namespace sengled
