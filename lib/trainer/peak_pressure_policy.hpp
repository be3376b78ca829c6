#ifndef PEAK_PRESSURE_POLICY_HPP
#define PEAK_PRESSURE_POLICY_HPP

#include "pressure_policy.hpp"
#include <algorithm>

namespace trainer {

  /**
   * @brief Tracks the deepest press while the target key is down and judges it on release
   */
  class PeakPressurePolicy : public PressurePolicy {
  public:
    bool onPressed(float analogValue, TimeMs now, float& /*observedValue*/) override {
        if (!holding_) {
            holding_ = true;
            pressStart_ = now;
            peak_ = analogValue;
        } else {
            peak_ = std::max(peak_, analogValue);
        }
        return false;
    }

    bool onReleased(TimeMs /*now*/, float& observedValue) override {
        if (!holding_) {
            return false;
        }
        observedValue = peak_;
        reset();
        return true;
    }

    bool onTimer(TimeMs /*now*/, float& /*observedValue*/) override {
        return false;
    }

    bool isHolding() const override { return holding_; }

    TimeMs heldFor(TimeMs now) const override {
        return holding_ ? now - pressStart_ : 0;
    }

    void postpone(TimeMs deltaMs) override {
        if (holding_) {
            pressStart_ += deltaMs;
        }
    }

    void reset() override {
        holding_ = false;
        pressStart_ = 0;
        peak_ = 0.0f;
    }

    const char* getName() const override { return "peak"; }

    float getPeak() const { return peak_; }

  private:
    bool holding_ = false;
    TimeMs pressStart_ = 0;
    float peak_ = 0.0f;
  };

} // namespace trainer

#endif // PEAK_PRESSURE_POLICY_HPP
