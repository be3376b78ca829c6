#ifndef SESSION_CONTROLLER_HPP
#define SESSION_CONTROLLER_HPP

#include "attempt_evaluator.hpp"
#include "running_stats.hpp"
#include "session_view.hpp"
#include "target_sequence.hpp"
#include "trainer_config.hpp"
#include <presentation_sink.hpp>
#include <telemetry_connection.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <random>
#include <vector>

namespace trainer {

  /**
   * @brief Owns one practice session: sequence, position, evaluator and statistics
   * 
   * NOT_STARTED -> ACTIVE <-> PAUSED, ACTIVE -> COMPLETED, reset() -> NOT_STARTED
   * 
   * - start() needs a connected feed. Otherwise it asks the connection to
   *   connect and activates when the connection reports CONNECTED.
   * - pause() freezes the evaluator in place. Hold and cooldown timers are
   *   kept and shifted by the paused time on resume.
   * - reset() regenerates the sequence, zeroes statistics and cancels every
   *   pending deadline so nothing armed before the reset can fire after it.
   * 
   * Subscribes to the connection on construction and unsubscribes on
   * destruction; the connection must outlive the controller.
   */
  class SessionController {
  public:
    using Clock = std::function<TimeMs()>;
    using OutcomeCallback = std::function<void(const AttemptOutcome&, const RunningStats&)>;
    using StatusCallback = std::function<void(SessionStatus, const RunningStats&)>;

    /**
     * @param connection Telemetry feed (must outlive this controller)
     * @param config Scoring and sequence settings (sanitized copy is kept)
     * @param clock Monotonic millisecond clock
     * @param sink Destination for session views (use NoPresentationSink if not needed)
     * @param seed Random seed for sequence generation
     */
    SessionController(features::TelemetryConnection& connection,
                      const TrainerConfig& config,
                      Clock clock,
                      std::unique_ptr<features::PresentationSink<SessionView>> sink,
                      uint32_t seed = std::random_device{}());

    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    /**
     * @brief Start or resume the session
     * @return true if the session is ACTIVE on return; false if activation was
     *         deferred until the connection is up, or start is not allowed
     */
    bool start();

    /**
     * @brief Pause an active session (also cancels a deferred start)
     */
    void pause();

    /**
     * @brief New sequence, zeroed statistics, idle evaluator, NOT_STARTED
     */
    void reset();

    /**
     * @brief Switch the pressure level set and reset
     * @param levelCount 2 for {50, 100} or 3 for {30, 60, 100}
     * @return false if levelCount is unsupported (nothing changes)
     */
    bool regenerate(uint32_t levelCount);

    /**
     * @brief Check hold and cooldown deadlines; call periodically
     */
    void update();

    SessionView getView() const;
    SessionStatus getStatus() const { return state_.status; }
    bool isActivationPending() const { return state_.activationPending; }
    const Sequence& getSequence() const { return state_.sequence; }
    uint32_t getCurrentIndex() const { return state_.currentIndex; }
    uint32_t getLevelCount() const { return state_.levelCount; }
    const RunningStats& getStats() const { return aggregator_.getStats(); }
    const AttemptEvaluator& getEvaluator() const { return evaluator_; }
    const std::vector<KeySnapshot>& getLiveKeys() const { return state_.liveKeys; }

    void setOutcomeCallback(OutcomeCallback callback) { outcomeCallback_ = std::move(callback); }
    void setStatusCallback(StatusCallback callback) { statusCallback_ = std::move(callback); }

  private:
    /**
     * @brief Everything that a reset clears or regenerates
     */
    struct SessionState {
        Sequence sequence;
        uint32_t currentIndex = 0;
        SessionStatus status = SessionStatus::NOT_STARTED;
        bool activationPending = false;
        uint32_t levelCount = 3;
        std::vector<uint8_t> levels;

        // Latest frame from the feed (kept even while inactive, for display)
        std::vector<KeySnapshot> liveKeys;
        bool hasFrame = false;
        uint32_t lastFrameSequence = 0;
    };

    features::TelemetryConnection& connection_;
    TrainerConfig config_;
    Clock clock_;
    std::unique_ptr<features::PresentationSink<SessionView>> sink_;
    std::mt19937 rng_;

    SessionState state_;
    AttemptEvaluator evaluator_;
    StatsAggregator aggregator_;

    OutcomeCallback outcomeCallback_;
    StatusCallback statusCallback_;

    void onFrame(const SnapshotFrame& frame);
    void onConnectionStatus(features::ConnectionStatus status);
    void activate(TimeMs now);
    void handleTransition(const AttemptEvaluator::Transition& transition);
    void setStatus(SessionStatus status);
    void publishView();
    bool hasCurrentTarget() const;
    const TargetSpec& currentTarget() const;
  };

} // namespace trainer

#endif // SESSION_CONTROLLER_HPP
