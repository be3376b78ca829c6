#ifndef PRESSURE_POLICY_HPP
#define PRESSURE_POLICY_HPP

#include "deadline.hpp"

namespace trainer {

  /**
   * @brief Strategy deciding when a held target key has produced a judgeable pressure
   * 
   * The evaluator owns wrong-key detection, scoring and cooldown; a policy
   * only tracks the target key between first contact and resolution and
   * reports the analog value that should be judged.
   */
  class PressurePolicy {
  public:
    virtual ~PressurePolicy() = default;

    /**
     * @brief Target key reported pressed
     * @param analogValue Current analog reading [0.0, 1.0]
     * @param now Frame time
     * @param[out] observedValue Value to judge, set only when returning true
     * @return true if the attempt resolves on this sample
     */
    virtual bool onPressed(float analogValue, TimeMs now, float& observedValue) = 0;

    /**
     * @brief Target key reported not pressed (or absent from the frame)
     * @param[out] observedValue Value to judge, set only when returning true
     * @return true if the attempt resolves on this release
     */
    virtual bool onReleased(TimeMs now, float& observedValue) = 0;

    /**
     * @brief Time passed without new telemetry
     * @param[out] observedValue Value to judge, set only when returning true
     * @return true if the attempt resolves on the elapsed time alone
     */
    virtual bool onTimer(TimeMs now, float& observedValue) = 0;

    /**
     * @brief Whether the target key is currently being tracked
     */
    virtual bool isHolding() const = 0;

    /**
     * @brief Milliseconds the target key has been held (0 when not holding)
     */
    virtual TimeMs heldFor(TimeMs now) const = 0;

    /**
     * @brief Shift all internal timestamps later, used when resuming from pause
     */
    virtual void postpone(TimeMs deltaMs) = 0;

    /**
     * @brief Forget the current hold
     */
    virtual void reset() = 0;

    virtual const char* getName() const = 0;
  };

} // namespace trainer

#endif // PRESSURE_POLICY_HPP
