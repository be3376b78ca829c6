#pragma once

#include "target_sequence.hpp"
#include <nlohmann/json.hpp>

namespace trainer {

enum class AttemptReason {
    PERFECT,
    WRONG_PRESSURE,
    WRONG_KEY
};

inline const char* attemptReasonName(AttemptReason reason) {
    switch (reason) {
        case AttemptReason::PERFECT:        return "Perfect";
        case AttemptReason::WRONG_PRESSURE: return "WrongPressure";
        case AttemptReason::WRONG_KEY:      return "WrongKey";
    }
    return "Unknown";
}

/**
 * @brief Judgment of one completed attempt
 */
struct AttemptOutcome {
    TargetSpec target;
    float observedPercent = 0.0f;   // Judged pressure, or the decoy's pressure for WRONG_KEY
    float deviationPercent = 0.0f;  // |observed - target|, or the fixed penalty for WRONG_KEY
    bool success = false;
    AttemptReason reason = AttemptReason::WRONG_PRESSURE;
};

inline void to_json(nlohmann::json& j, const AttemptOutcome& o) {
    j = nlohmann::json{
        {"type", "outcome"},
        {"target", o.target},
        {"observedPercent", o.observedPercent},
        {"deviationPercent", o.deviationPercent},
        {"success", o.success},
        {"reason", attemptReasonName(o.reason)}
    };
}

} // namespace trainer
