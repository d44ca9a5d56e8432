#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace sengled {

// 6-byte device address. Rendered as uppercase hex octets joined by ':'
// ("AA:BB:CC:DD:EE:FF"). Held by value everywhere it is used.
class MacAddress {
public:
    using Bytes = std::array<uint8_t, 6>;

    MacAddress();
    explicit MacAddress(const Bytes& bytes);

    // Accepts 1 or 2 hex digits per segment, either case.
    // Throws InvalidIdentifier unless there are exactly 6 valid segments.
    static MacAddress parse(const std::string& text);

    std::string to_string() const;
    const Bytes& bytes() const { return bytes_; }

    bool operator==(const MacAddress& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const MacAddress& other) const { return bytes_ != other.bytes_; }

private:
    Bytes bytes_;
};

} // namespace sengled
