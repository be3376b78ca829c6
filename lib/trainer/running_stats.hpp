#pragma once

#include "attempt_outcome.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>

namespace trainer {

/**
 * @brief Aggregate scoring for the current session
 */
struct RunningStats {
    uint32_t totalAttempts = 0;
    uint32_t successfulHits = 0;
    float accuracyPercent = 0.0f;          // successfulHits / totalAttempts * 100, 0 before any attempt
    float averageDeviationPercent = 0.0f;  // Mean of all recorded deviations
};

/**
 * @brief Folds attempt outcomes into RunningStats without retaining them
 * 
 * Records are only ever added; the only way back to zero is reset().
 */
class StatsAggregator {
public:
    /**
     * @brief Add one outcome to the totals
     * @return Updated statistics
     */
    const RunningStats& record(const AttemptOutcome& outcome) {
        uint32_t previousTotal = stats_.totalAttempts;
        uint32_t newTotal = previousTotal + 1;

        stats_.totalAttempts = newTotal;
        if (outcome.success) {
            stats_.successfulHits++;
        }
        stats_.accuracyPercent =
            static_cast<float>(stats_.successfulHits) / static_cast<float>(newTotal) * 100.0f;
        stats_.averageDeviationPercent =
            (stats_.averageDeviationPercent * static_cast<float>(previousTotal) + outcome.deviationPercent)
            / static_cast<float>(newTotal);
        return stats_;
    }

    const RunningStats& getStats() const {
        return stats_;
    }

    void reset() {
        stats_ = RunningStats();
    }

private:
    RunningStats stats_;
};

inline void to_json(nlohmann::json& j, const RunningStats& s) {
    j = nlohmann::json{
        {"totalAttempts", s.totalAttempts},
        {"successfulHits", s.successfulHits},
        {"accuracyPercent", s.accuracyPercent},
        {"averageDeviationPercent", s.averageDeviationPercent}
    };
}

} // namespace trainer
