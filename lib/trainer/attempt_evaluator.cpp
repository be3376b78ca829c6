#include "attempt_evaluator.hpp"
#include <cmath>
#include <stdexcept>
#include <utility>

namespace trainer {

AttemptEvaluator::AttemptEvaluator(std::unique_ptr<PressurePolicy> policy, EvaluatorSettings settings)
    : policy_(std::move(policy))
    , settings_(settings)
{
    if (!policy_) {
        throw std::invalid_argument("AttemptEvaluator requires a pressure policy");
    }
}

AttemptEvaluator::Transition AttemptEvaluator::tick(
        const TargetSpec& target, const std::vector<KeySnapshot>& keys, TimeMs now)
{
    if (suspended_) {
        return Transition();
    }

    if (phase_ == Phase::COOLDOWN) {
        // Telemetry is ignored entirely until the cooldown is over
        if (cooldown_.hasExpired(now)) {
            return advance();
        }
        return Transition();
    }

    // A decoy press wins over anything the target key is doing
    for (const auto& key : keys) {
        if (key.pressed && key.keyCode != target.keyCode) {
            policy_->reset();
            return resolve(wrongKey(target, key), now);
        }
    }

    bool wasHolding = policy_->isHolding();
    const KeySnapshot* targetKey = findKey(keys, target.keyCode);
    float observedValue = 0.0f;

    if (targetKey != nullptr && targetKey->pressed) {
        if (policy_->onPressed(targetKey->analogValue, now, observedValue)) {
            return resolve(judge(target, observedValue), now);
        }
    } else if (policy_->onReleased(now, observedValue)) {
        return resolve(judge(target, observedValue), now);
    }

    syncPhaseWithPolicy();

    Transition transition;
    if (!wasHolding && policy_->isHolding()) {
        transition.kind = TransitionKind::HOLD_STARTED;
    } else if (wasHolding && !policy_->isHolding()) {
        transition.kind = TransitionKind::HOLD_CANCELLED;
    }
    return transition;
}

AttemptEvaluator::Transition AttemptEvaluator::update(const TargetSpec& target, TimeMs now)
{
    if (suspended_) {
        return Transition();
    }

    if (phase_ == Phase::COOLDOWN) {
        if (cooldown_.hasExpired(now)) {
            return advance();
        }
        return Transition();
    }

    float observedValue = 0.0f;
    if (phase_ == Phase::HOLDING && policy_->onTimer(now, observedValue)) {
        return resolve(judge(target, observedValue), now);
    }
    return Transition();
}

void AttemptEvaluator::suspend(TimeMs now)
{
    if (suspended_) {
        return;
    }
    suspended_ = true;
    suspendedAt_ = now;
}

void AttemptEvaluator::resume(TimeMs now)
{
    if (!suspended_) {
        return;
    }
    TimeMs pausedFor = now - suspendedAt_;
    cooldown_.postpone(pausedFor);
    policy_->postpone(pausedFor);
    suspended_ = false;
}

void AttemptEvaluator::abandonHold()
{
    if (phase_ == Phase::HOLDING) {
        policy_->reset();
        phase_ = Phase::IDLE;
    }
}

void AttemptEvaluator::reset()
{
    cooldown_.cancel();
    policy_->reset();
    phase_ = Phase::IDLE;
    suspended_ = false;
    suspendedAt_ = 0;
}

TimeMs AttemptEvaluator::cooldownRemaining(TimeMs now) const
{
    return cooldown_.remaining(suspended_ ? suspendedAt_ : now);
}

TimeMs AttemptEvaluator::heldFor(TimeMs now) const
{
    return policy_->heldFor(suspended_ ? suspendedAt_ : now);
}

AttemptOutcome AttemptEvaluator::judge(const TargetSpec& target, float observedValue) const
{
    AttemptOutcome outcome;
    outcome.target = target;
    outcome.observedPercent = observedValue * 100.0f;
    outcome.deviationPercent = std::fabs(outcome.observedPercent - static_cast<float>(target.targetPressure));
    outcome.success = outcome.deviationPercent <= settings_.tolerancePercent;
    outcome.reason = outcome.success ? AttemptReason::PERFECT : AttemptReason::WRONG_PRESSURE;
    return outcome;
}

AttemptOutcome AttemptEvaluator::wrongKey(const TargetSpec& target, const KeySnapshot& decoy) const
{
    AttemptOutcome outcome;
    outcome.target = target;
    outcome.observedPercent = decoy.analogValue * 100.0f;
    outcome.deviationPercent = settings_.wrongKeyPenalty;
    outcome.success = false;
    outcome.reason = AttemptReason::WRONG_KEY;
    return outcome;
}

AttemptEvaluator::Transition AttemptEvaluator::resolve(const AttemptOutcome& outcome, TimeMs now)
{
    phase_ = Phase::COOLDOWN;
    cooldown_.arm(now, settings_.cooldownMs);

    Transition transition;
    transition.kind = TransitionKind::RESOLVED;
    transition.outcome = outcome;
    return transition;
}

AttemptEvaluator::Transition AttemptEvaluator::advance()
{
    cooldown_.cancel();
    policy_->reset();
    phase_ = Phase::IDLE;

    Transition transition;
    transition.kind = TransitionKind::ADVANCE;
    return transition;
}

void AttemptEvaluator::syncPhaseWithPolicy()
{
    phase_ = policy_->isHolding() ? Phase::HOLDING : Phase::IDLE;
}

const char* evaluationPhaseName(AttemptEvaluator::Phase phase)
{
    switch (phase) {
        case AttemptEvaluator::Phase::IDLE:     return "Idle";
        case AttemptEvaluator::Phase::HOLDING:  return "Holding";
        case AttemptEvaluator::Phase::COOLDOWN: return "Cooldown";
    }
    return "Unknown";
}

} // namespace trainer
