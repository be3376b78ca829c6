#ifndef DWELL_PRESSURE_POLICY_HPP
#define DWELL_PRESSURE_POLICY_HPP

#include "pressure_policy.hpp"

namespace trainer {

  /**
   * @brief Resolves once the target key has been held continuously for the dwell time
   * 
   * The hold clock starts at first contact, whatever the pressure. When it
   * reaches dwellMs the most recent sample is judged. Releasing before then
   * abandons the hold without an outcome.
   */
  class DwellPressurePolicy : public PressurePolicy {
  public:
    static constexpr TimeMs DEFAULT_DWELL_MS = 750;

    explicit DwellPressurePolicy(TimeMs dwellMs = DEFAULT_DWELL_MS)
        : dwellMs_(dwellMs) {}

    bool onPressed(float analogValue, TimeMs now, float& observedValue) override {
        if (!holding_) {
            holding_ = true;
            holdStart_ = now;
        }
        lastSample_ = analogValue;
        return resolveIfDwellElapsed(now, observedValue);
    }

    bool onReleased(TimeMs /*now*/, float& /*observedValue*/) override {
        reset();
        return false;
    }

    bool onTimer(TimeMs now, float& observedValue) override {
        return resolveIfDwellElapsed(now, observedValue);
    }

    bool isHolding() const override { return holding_; }

    TimeMs heldFor(TimeMs now) const override {
        return holding_ ? now - holdStart_ : 0;
    }

    void postpone(TimeMs deltaMs) override {
        if (holding_) {
            holdStart_ += deltaMs;
        }
    }

    void reset() override {
        holding_ = false;
        holdStart_ = 0;
        lastSample_ = 0.0f;
    }

    const char* getName() const override { return "dwell"; }

    TimeMs getDwellMs() const { return dwellMs_; }

  private:
    TimeMs dwellMs_;
    bool holding_ = false;
    TimeMs holdStart_ = 0;
    float lastSample_ = 0.0f;

    bool resolveIfDwellElapsed(TimeMs now, float& observedValue) {
        if (!holding_ || now - holdStart_ < dwellMs_) {
            return false;
        }
        observedValue = lastSample_;
        reset();
        return true;
    }
  };

} // namespace trainer

#endif // DWELL_PRESSURE_POLICY_HPP
