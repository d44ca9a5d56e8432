#include "sengled/mac_address.h"
#include "sengled/constants.h"
#include "sengled/errors.h"
#include <cstdio>

namespace sengled {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

uint8_t parse_octet(const std::string& segment, const std::string& text) {
    if (segment.empty() || segment.size() > 2) {
        throw InvalidIdentifier("invalid MAC address \"" + text + "\": bad segment \"" + segment + "\"");
    }
    int value = 0;
    for (char c : segment) {
        int digit = hex_value(c);
        if (digit < 0) {
            throw InvalidIdentifier("invalid MAC address \"" + text + "\": non-hex segment \"" + segment + "\"");
        }
        value = value * 16 + digit;
    }
    return static_cast<uint8_t>(value);
}

} // namespace

MacAddress::MacAddress() : bytes_{} {}

MacAddress::MacAddress(const Bytes& bytes) : bytes_(bytes) {}

MacAddress MacAddress::parse(const std::string& text) {
    Bytes bytes{};
    size_t count = 0;
    size_t start = 0;
    while (true) {
        size_t colon = text.find(':', start);
        std::string segment = text.substr(start, colon == std::string::npos ? std::string::npos : colon - start);
        if (count == bytes.size()) {
            throw InvalidIdentifier("invalid MAC address \"" + text + "\": more than 6 segments");
        }
        bytes[count++] = parse_octet(segment, text);
        if (colon == std::string::npos) break;
        start = colon + 1;
    }
    if (count != static_cast<size_t>(MAC_ADDRESS_SIZE)) {
        throw InvalidIdentifier("invalid MAC address \"" + text + "\": expected 6 segments, got " + std::to_string(count));
    }
    return MacAddress(bytes);
}

std::string MacAddress::to_string() const {
    char out[18];
    snprintf(out, sizeof(out), "%02X:%02X:%02X:%02X:%02X:%02X",
             bytes_[0], bytes_[1], bytes_[2], bytes_[3], bytes_[4], bytes_[5]);
    return std::string(out);
}

} // namespace sengled
