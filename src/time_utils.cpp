#include "sengled/time_utils.h"
#include "sengled/logger.h"
#include <chrono>
#include <stdexcept>

namespace sengled {

int64_t current_time_millis() {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    int64_t ms = std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count();
    if (ms < 0) {
        Logger::instance().error("System clock is set before the Unix epoch");
        throw std::runtime_error("Time went backwards");
    }
    return ms;
}

} // namespace sengled
