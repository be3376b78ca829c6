#pragma once

#include <cstdint>

namespace trainer {

/**
 * @brief Milliseconds on a monotonic clock. Wraps after ~49 days; all
 * comparisons below are wrap-safe.
 */
using TimeMs = uint32_t;

/**
 * @brief Cancellable one-shot deadline
 * 
 * Polled rather than scheduled: the owner asks hasExpired() on each tick.
 * A cancelled deadline never reports expiry, which is what keeps a cooldown
 * armed before a reset from advancing the session after it.
 */
class Deadline {
public:
    /**
     * @brief Longer delays are indistinguishable from an already expired deadline
     */
    static constexpr TimeMs MAX_DELAY_MS = 0x7FFFFFFF;

    void arm(TimeMs now, TimeMs delayMs) {
        at_ = now + delayMs;
        armed_ = true;
    }

    void cancel() {
        armed_ = false;
    }

    bool isArmed() const {
        return armed_;
    }

    bool hasExpired(TimeMs now) const {
        return armed_ && static_cast<int32_t>(now - at_) >= 0;
    }

    /**
     * @brief Milliseconds left before expiry (0 if expired or not armed)
     */
    TimeMs remaining(TimeMs now) const {
        if (!armed_ || hasExpired(now)) {
            return 0;
        }
        return at_ - now;
    }

    /**
     * @brief Push the deadline later, e.g. by the length of a pause
     */
    void postpone(TimeMs deltaMs) {
        if (armed_) {
            at_ += deltaMs;
        }
    }

private:
    TimeMs at_ = 0;
    bool armed_ = false;
};

} // namespace trainer
