#pragma once

#include "attempt_evaluator.hpp"
#include "key_snapshot.hpp"
#include "running_stats.hpp"
#include "target_sequence.hpp"
#include <telemetry_connection.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>

namespace trainer {

enum class SessionStatus {
    NOT_STARTED,
    ACTIVE,
    PAUSED,
    COMPLETED
};

inline const char* sessionStatusName(SessionStatus status) {
    switch (status) {
        case SessionStatus::NOT_STARTED: return "NotStarted";
        case SessionStatus::ACTIVE:      return "Active";
        case SessionStatus::PAUSED:      return "Paused";
        case SessionStatus::COMPLETED:   return "Completed";
    }
    return "Unknown";
}

/**
 * @brief Read-only picture of a session for display
 */
struct SessionView {
    SessionStatus status = SessionStatus::NOT_STARTED;
    features::ConnectionStatus connection = features::ConnectionStatus::DISCONNECTED;
    bool activationPending = false;  // start requested, waiting for the connection

    uint32_t currentIndex = 0;
    uint32_t sequenceLength = 0;

    bool hasTarget = false;
    TargetSpec target;
    KeySnapshot targetKey;  // Live reading for the target key (zeroed if not reported)

    AttemptEvaluator::Phase phase = AttemptEvaluator::Phase::IDLE;
    TimeMs heldForMs = 0;
    TimeMs cooldownRemainingMs = 0;

    RunningStats stats;
};

inline void to_json(nlohmann::json& j, const SessionView& v) {
    j = nlohmann::json{
        {"type", "session"},
        {"status", sessionStatusName(v.status)},
        {"connection", features::connectionStatusName(v.connection)},
        {"activationPending", v.activationPending},
        {"currentIndex", v.currentIndex},
        {"sequenceLength", v.sequenceLength},
        {"phase", evaluationPhaseName(v.phase)},
        {"heldForMs", v.heldForMs},
        {"cooldownRemainingMs", v.cooldownRemainingMs},
        {"stats", v.stats}
    };
    if (v.hasTarget) {
        j["target"] = v.target;
        j["targetKey"] = v.targetKey;
    }
}

} // namespace trainer
