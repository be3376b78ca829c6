#include "session_controller.hpp"
#include <log.hpp>
#include <stdexcept>
#include <utility>

namespace trainer {

namespace {

TrainerConfig sanitized(TrainerConfig config)
{
    config.sanitize();
    return config;
}

} // namespace

SessionController::SessionController(
        features::TelemetryConnection& connection,
        const TrainerConfig& config,
        Clock clock,
        std::unique_ptr<features::PresentationSink<SessionView>> sink,
        uint32_t seed)
    : connection_(connection)
    , config_(sanitized(config))
    , clock_(std::move(clock))
    , sink_(std::move(sink))
    , rng_(seed)
    , evaluator_(config_.createPressurePolicy(), config_.evaluatorSettings())
{
    if (!clock_) {
        throw std::invalid_argument("SessionController requires a clock");
    }
    if (!sink_) {
        sink_ = std::make_unique<features::NoPresentationSink<SessionView>>();
    }

    state_.levelCount = config_.levelCount;
    state_.levels = pressureLevelsFor(static_cast<uint8_t>(state_.levelCount));
    state_.sequence = generateSequence(state_.levels, config_.sequenceLength, rng_);

    connection_.subscribe(
        [this](const SnapshotFrame& frame) { onFrame(frame); },
        [this](features::ConnectionStatus status) { onConnectionStatus(status); });

    logInfo("Session ready: %u targets, %u pressure levels, %s policy",
            static_cast<unsigned>(state_.sequence.size()), state_.levelCount,
            evaluator_.getPolicy().getName());
}

SessionController::~SessionController()
{
    connection_.subscribe(nullptr, nullptr);
}

bool SessionController::start()
{
    switch (state_.status) {
        case SessionStatus::ACTIVE:
            return true;
        case SessionStatus::COMPLETED:
            logWarn("Session already completed; reset to start again");
            return false;
        case SessionStatus::NOT_STARTED:
        case SessionStatus::PAUSED:
            break;
    }

    if (connection_.getStatus() != features::ConnectionStatus::CONNECTED) {
        if (!state_.activationPending) {
            logInfo("Connecting... Please wait while we connect to your keyboard");
        }
        state_.activationPending = true;
        if (connection_.getStatus() != features::ConnectionStatus::CONNECTING) {
            connection_.connect();
        }
        publishView();
        return false;
    }

    activate(clock_());
    return true;
}

void SessionController::pause()
{
    if (state_.activationPending) {
        state_.activationPending = false;
        logInfo("Deferred start cancelled");
    }

    if (state_.status != SessionStatus::ACTIVE) {
        publishView();
        return;
    }

    evaluator_.suspend(clock_());
    setStatus(SessionStatus::PAUSED);
}

void SessionController::reset()
{
    evaluator_.reset();
    aggregator_.reset();

    state_.sequence = generateSequence(state_.levels, config_.sequenceLength, rng_);
    state_.currentIndex = 0;
    state_.activationPending = false;

    logInfo("Session reset: new sequence of %u targets", static_cast<unsigned>(state_.sequence.size()));
    setStatus(SessionStatus::NOT_STARTED);
}

bool SessionController::regenerate(uint32_t levelCount)
{
    std::vector<uint8_t> levels = levelCount <= 3 ? pressureLevelsFor(static_cast<uint8_t>(levelCount))
                                                  : std::vector<uint8_t>();
    if (levels.empty()) {
        logWarn("Unsupported level count %u (use 2 or 3)", levelCount);
        return false;
    }

    state_.levelCount = levelCount;
    state_.levels = levels;
    reset();
    return true;
}

void SessionController::update()
{
    if (state_.status != SessionStatus::ACTIVE || !hasCurrentTarget()) {
        return;
    }

    AttemptEvaluator::Transition transition = evaluator_.update(currentTarget(), clock_());
    if (transition.kind != AttemptEvaluator::TransitionKind::NONE) {
        handleTransition(transition);
        publishView();
    }
}

SessionView SessionController::getView() const
{
    TimeMs now = clock_();

    SessionView view;
    view.status = state_.status;
    view.connection = connection_.getStatus();
    view.activationPending = state_.activationPending;
    view.currentIndex = state_.currentIndex;
    view.sequenceLength = static_cast<uint32_t>(state_.sequence.size());
    view.phase = evaluator_.getPhase();
    view.heldForMs = evaluator_.heldFor(now);
    view.cooldownRemainingMs = evaluator_.cooldownRemaining(now);
    view.stats = aggregator_.getStats();

    if (hasCurrentTarget()) {
        view.hasTarget = true;
        view.target = currentTarget();
        const KeySnapshot* live = findKey(state_.liveKeys, view.target.keyCode);
        if (live != nullptr) {
            view.targetKey = *live;
        } else {
            view.targetKey.keyCode = view.target.keyCode;
        }
    }
    return view;
}

void SessionController::onFrame(const SnapshotFrame& frame)
{
    if (state_.hasFrame && static_cast<int32_t>(frame.sequence - state_.lastFrameSequence) <= 0) {
        logDebug("Dropping stale frame %u (last applied %u)",
                 static_cast<unsigned>(frame.sequence), static_cast<unsigned>(state_.lastFrameSequence));
        return;
    }
    state_.hasFrame = true;
    state_.lastFrameSequence = frame.sequence;
    state_.liveKeys = frame.keys;

    if (state_.status != SessionStatus::ACTIVE || !hasCurrentTarget()) {
        return;
    }

    AttemptEvaluator::Transition transition = evaluator_.tick(currentTarget(), state_.liveKeys, clock_());
    handleTransition(transition);
    publishView();
}

void SessionController::onConnectionStatus(features::ConnectionStatus status)
{
    logInfo("Telemetry connection %s", features::connectionStatusName(status));

    if (status == features::ConnectionStatus::CONNECTED) {
        if (state_.activationPending) {
            activate(clock_());
            return;
        }
    } else if (status != features::ConnectionStatus::CONNECTING) {
        // The feed is gone: nothing is known to be pressed any more
        state_.liveKeys.clear();
        if (evaluator_.getPhase() == AttemptEvaluator::Phase::HOLDING) {
            logWarn("Connection lost during a hold; attempt abandoned");
            evaluator_.abandonHold();
        }
    }
    publishView();
}

void SessionController::activate(TimeMs now)
{
    state_.activationPending = false;

    if (state_.status == SessionStatus::PAUSED) {
        evaluator_.resume(now);
    } else if (state_.status != SessionStatus::NOT_STARTED) {
        publishView();
        return;
    }
    setStatus(SessionStatus::ACTIVE);
}

void SessionController::handleTransition(const AttemptEvaluator::Transition& transition)
{
    switch (transition.kind) {
        case AttemptEvaluator::TransitionKind::NONE:
        case AttemptEvaluator::TransitionKind::HOLD_STARTED:
        case AttemptEvaluator::TransitionKind::HOLD_CANCELLED:
            break;

        case AttemptEvaluator::TransitionKind::RESOLVED: {
            const AttemptOutcome& outcome = transition.outcome;
            const RunningStats& stats = aggregator_.record(outcome);
            logDebug("Attempt %u/%u on '%c' at %u%%: %s (observed %.0f%%, deviation %.1f)",
                    state_.currentIndex + 1, static_cast<unsigned>(state_.sequence.size()),
                    outcome.target.key, static_cast<unsigned>(outcome.target.targetPressure),
                    attemptReasonName(outcome.reason), outcome.observedPercent, outcome.deviationPercent);
            if (outcomeCallback_) {
                outcomeCallback_(outcome, stats);
            }
            break;
        }

        case AttemptEvaluator::TransitionKind::ADVANCE:
            state_.currentIndex++;
            if (state_.currentIndex >= state_.sequence.size()) {
                evaluator_.reset();
                setStatus(SessionStatus::COMPLETED);
            }
            break;
    }
}

void SessionController::setStatus(SessionStatus status)
{
    if (state_.status != status) {
        logInfo("Session %s -> %s", sessionStatusName(state_.status), sessionStatusName(status));
        state_.status = status;
        if (statusCallback_) {
            statusCallback_(status, aggregator_.getStats());
        }
    }
    publishView();
}

void SessionController::publishView()
{
    sink_->publish(getView());
}

bool SessionController::hasCurrentTarget() const
{
    return state_.currentIndex < state_.sequence.size();
}

const TargetSpec& SessionController::currentTarget() const
{
    return state_.sequence[state_.currentIndex];
}

} // namespace trainer
