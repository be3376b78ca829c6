#pragma once

#include <deadline.hpp>
#include <chrono>

namespace platform {

/**
 * @brief Milliseconds since an arbitrary epoch on the steady clock
 */
inline trainer::TimeMs monotonicMillis() {
    auto sinceEpoch = std::chrono::steady_clock::now().time_since_epoch();
    return static_cast<trainer::TimeMs>(
        std::chrono::duration_cast<std::chrono::milliseconds>(sinceEpoch).count());
}

} // namespace platform
