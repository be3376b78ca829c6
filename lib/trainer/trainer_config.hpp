#ifndef TRAINER_CONFIG_HPP
#define TRAINER_CONFIG_HPP

#include "attempt_evaluator.hpp"
#include "deadline.hpp"
#include "dwell_pressure_policy.hpp"
#include "peak_pressure_policy.hpp"
#include "target_sequence.hpp"
#include <log.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <memory>
#include <string>

namespace trainer {

/**
 * @brief Runtime configuration for a training session and its bridge connection
 * 
 * Uses nlohmann/json for serialization. Fields missing from a config file
 * keep the defaults below. Add new settings as members and to the
 * NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT list.
 */
struct TrainerConfig {
    // Bridge connection
    std::string host = "127.0.0.1";
    uint16_t port = 32312;
    uint32_t reconnectDelayMs = 3000;

    // Sequence
    uint32_t levelCount = 3;
    uint32_t sequenceLength = DEFAULT_SEQUENCE_LENGTH;

    // Scoring
    std::string pressurePolicy = "dwell";  // "dwell" or "peak"
    uint32_t dwellMs = DwellPressurePolicy::DEFAULT_DWELL_MS;
    uint32_t cooldownMs = 3000;
    float tolerancePercent = 10.0f;
    float wrongKeyPenalty = 100.0f;

    /**
     * @brief Replace out-of-range values with defaults
     * @return true if every value was already valid
     */
    bool sanitize() {
        const TrainerConfig defaults;
        bool valid = true;

        if (pressureLevelsFor(static_cast<uint8_t>(levelCount)).empty() || levelCount > 3) {
            logWarn("Unsupported levelCount %u, using %u", levelCount, defaults.levelCount);
            levelCount = defaults.levelCount;
            valid = false;
        }
        if (sequenceLength == 0) {
            logWarn("sequenceLength must be positive, using %u", defaults.sequenceLength);
            sequenceLength = defaults.sequenceLength;
            valid = false;
        }
        if (pressurePolicy != "dwell" && pressurePolicy != "peak") {
            logWarn("Unknown pressurePolicy '%s', using '%s'",
                    pressurePolicy.c_str(), defaults.pressurePolicy.c_str());
            pressurePolicy = defaults.pressurePolicy;
            valid = false;
        }
        if (!(tolerancePercent >= 0.0f && tolerancePercent <= 100.0f)) {
            logWarn("tolerancePercent out of range, using %.1f", defaults.tolerancePercent);
            tolerancePercent = defaults.tolerancePercent;
            valid = false;
        }
        if (dwellMs >= Deadline::MAX_DELAY_MS) {
            logWarn("dwellMs %u too large, using %u", dwellMs, defaults.dwellMs);
            dwellMs = defaults.dwellMs;
            valid = false;
        }
        if (cooldownMs >= Deadline::MAX_DELAY_MS) {
            logWarn("cooldownMs %u too large, using %u", cooldownMs, defaults.cooldownMs);
            cooldownMs = defaults.cooldownMs;
            valid = false;
        }
        if (reconnectDelayMs >= Deadline::MAX_DELAY_MS) {
            logWarn("reconnectDelayMs %u too large, using %u", reconnectDelayMs, defaults.reconnectDelayMs);
            reconnectDelayMs = defaults.reconnectDelayMs;
            valid = false;
        }
        if (port == 0) {
            logWarn("port must be non-zero, using %u", static_cast<unsigned>(defaults.port));
            port = defaults.port;
            valid = false;
        }
        return valid;
    }

    EvaluatorSettings evaluatorSettings() const {
        EvaluatorSettings settings;
        settings.cooldownMs = cooldownMs;
        settings.tolerancePercent = tolerancePercent;
        settings.wrongKeyPenalty = wrongKeyPenalty;
        return settings;
    }

    /**
     * @brief Create the configured pressure policy
     */
    std::unique_ptr<PressurePolicy> createPressurePolicy() const {
        if (pressurePolicy == "peak") {
            return std::make_unique<PeakPressurePolicy>();
        }
        return std::make_unique<DwellPressurePolicy>(dwellMs);
    }

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(TrainerConfig,
        host,
        port,
        reconnectDelayMs,
        levelCount,
        sequenceLength,
        pressurePolicy,
        dwellMs,
        cooldownMs,
        tolerancePercent,
        wrongKeyPenalty
    )
};

} // namespace trainer

#endif // TRAINER_CONFIG_HPP
