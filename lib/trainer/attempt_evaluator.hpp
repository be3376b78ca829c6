#ifndef ATTEMPT_EVALUATOR_HPP
#define ATTEMPT_EVALUATOR_HPP

#include "attempt_outcome.hpp"
#include "deadline.hpp"
#include "key_snapshot.hpp"
#include "pressure_policy.hpp"
#include "target_sequence.hpp"
#include <memory>
#include <vector>

namespace trainer {

  /**
   * @brief Scoring constants shared by all pressure policies
   */
  struct EvaluatorSettings {
    TimeMs cooldownMs = 3000;
    float tolerancePercent = 10.0f;
    float wrongKeyPenalty = 100.0f;
  };

  /**
   * @brief Per-attempt state machine for one target at a time
   * 
   * IDLE -> HOLDING -> COOLDOWN -> (ADVANCE) -> IDLE
   * 
   * - Any pressed key other than the target resolves the attempt as WRONG_KEY
   *   immediately, even while the target is also held.
   * - Target key handling (when to judge, which value to judge) is delegated
   *   to the PressurePolicy.
   * - After a resolution every frame is ignored until the cooldown deadline
   *   passes; the next tick or update() then reports ADVANCE.
   * 
   * The evaluator never reads a clock. Callers pass the frame time in, which
   * keeps every transition reproducible in tests.
   */
  class AttemptEvaluator {
  public:
    enum class Phase {
        IDLE,
        HOLDING,
        COOLDOWN
    };

    enum class TransitionKind {
        NONE,
        HOLD_STARTED,    // Target key made contact
        HOLD_CANCELLED,  // Target key released before the policy resolved
        RESOLVED,        // outcome is valid; cooldown started
        ADVANCE          // Cooldown over; caller moves to the next target
    };

    struct Transition {
        TransitionKind kind = TransitionKind::NONE;
        AttemptOutcome outcome;  // Only meaningful for RESOLVED
    };

    /**
     * @param policy Target key tracking strategy (owned)
     * @param settings Tolerance, wrong-key penalty and cooldown length
     */
    AttemptEvaluator(std::unique_ptr<PressurePolicy> policy,
                     EvaluatorSettings settings = EvaluatorSettings());

    AttemptEvaluator(AttemptEvaluator&& other) = default;
    AttemptEvaluator& operator=(AttemptEvaluator&& other) = default;
    AttemptEvaluator(const AttemptEvaluator&) = delete;
    AttemptEvaluator& operator=(const AttemptEvaluator&) = delete;

    /**
     * @brief Apply one telemetry frame
     * @param target Current target
     * @param keys Complete key set from the frame
     * @param now Frame arrival time
     */
    Transition tick(const TargetSpec& target, const std::vector<KeySnapshot>& keys, TimeMs now);

    /**
     * @brief Check deadlines without new telemetry
     * 
     * Call periodically so a cooldown ends (and a dwell completes) even when
     * the bridge sends nothing.
     */
    Transition update(const TargetSpec& target, TimeMs now);

    /**
     * @brief Freeze the attempt; ticks and updates are ignored until resume()
     */
    void suspend(TimeMs now);

    /**
     * @brief Unfreeze, shifting hold and cooldown timers by the time spent suspended
     */
    void resume(TimeMs now);

    /**
     * @brief Drop an in-progress hold without an outcome (cooldown is kept)
     */
    void abandonHold();

    /**
     * @brief Return to IDLE, cancelling any hold and cooldown
     */
    void reset();

    Phase getPhase() const { return phase_; }
    bool isSuspended() const { return suspended_; }
    TimeMs cooldownRemaining(TimeMs now) const;
    TimeMs heldFor(TimeMs now) const;
    const PressurePolicy& getPolicy() const { return *policy_; }
    const EvaluatorSettings& getSettings() const { return settings_; }

  private:
    std::unique_ptr<PressurePolicy> policy_;
    EvaluatorSettings settings_;

    Phase phase_ = Phase::IDLE;
    Deadline cooldown_;
    bool suspended_ = false;
    TimeMs suspendedAt_ = 0;

    AttemptOutcome judge(const TargetSpec& target, float observedValue) const;
    AttemptOutcome wrongKey(const TargetSpec& target, const KeySnapshot& decoy) const;
    Transition resolve(const AttemptOutcome& outcome, TimeMs now);
    Transition advance();
    void syncPhaseWithPolicy();
  };

  const char* evaluationPhaseName(AttemptEvaluator::Phase phase);

} // namespace trainer

#endif // ATTEMPT_EVALUATOR_HPP
