#pragma once

#include <cstdint>

namespace sengled {

// Wall-clock milliseconds since the Unix epoch.
// Throws std::runtime_error if the system clock reads before the epoch.
int64_t current_time_millis();

} // namespace sengled
