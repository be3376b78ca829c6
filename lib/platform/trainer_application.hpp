#pragma once

#include <session_controller.hpp>
#include <trainer_config.hpp>
#include <telemetry_connection.hpp>
#include <presentation_sink.hpp>
#include <log.hpp>
#include <cmath>
#include <cstdlib>
#include <memory>
#include <random>
#include <sstream>
#include <string>

namespace platform {

/**
 * @brief Platform-agnostic trainer application
 * 
 * Wires a session controller to a telemetry connection, turns outcomes
 * into user-facing notices, and maps text commands to session intents.
 * Platform-specific code provides the connection, clock and command input.
 */
class TrainerApplication {
public:
    TrainerApplication(features::TelemetryConnection& connection,
                       const trainer::TrainerConfig& config,
                       trainer::SessionController::Clock clock,
                       std::unique_ptr<features::PresentationSink<trainer::SessionView>> sink,
                       uint32_t seed = std::random_device{}())
        : connection_(connection)
        , controller_(connection, config, std::move(clock), std::move(sink), seed) {

        controller_.setOutcomeCallback(
            [this](const trainer::AttemptOutcome& outcome, const trainer::RunningStats& stats) {
                handleOutcome(outcome, stats);
            });
        controller_.setStatusCallback(
            [this](trainer::SessionStatus status, const trainer::RunningStats& stats) {
                handleStatus(status, stats);
            });

        logInfo("Trainer ready. Commands: start, pause, reset, levels <2|3>, connect, disconnect, quit");
    }

    /**
     * @brief Execute one text command
     * @return false when the application should exit
     */
    bool handleCommand(const std::string& line) {
        std::istringstream words(line);
        std::string command;
        words >> command;

        if (command.empty()) {
            return true;
        } else if (command == "start") {
            controller_.start();
        } else if (command == "pause") {
            controller_.pause();
        } else if (command == "reset") {
            controller_.reset();
        } else if (command == "levels") {
            std::string argument;
            words >> argument;
            char* end = nullptr;
            unsigned long levelCount = std::strtoul(argument.c_str(), &end, 10);
            if (argument.empty() || *end != '\0' || !controller_.regenerate(static_cast<uint32_t>(levelCount))) {
                logWarn("Usage: levels <2|3>");
            } else {
                logInfo("Using %lu pressure levels", levelCount);
            }
        } else if (command == "connect") {
            connection_.connect();
        } else if (command == "disconnect") {
            connection_.disconnect();
        } else if (command == "quit" || command == "exit") {
            return false;
        } else {
            logWarn("Unknown command '%s'", command.c_str());
        }
        return true;
    }

    /**
     * @brief Periodic deadline check
     */
    void update() {
        controller_.update();
    }

    trainer::SessionController& getController() { return controller_; }

    /**
     * @brief Text of the most recent notice, for hosts that display it elsewhere
     */
    const std::string& getLastNotice() const { return lastNotice_; }

private:
    void handleOutcome(const trainer::AttemptOutcome& outcome, const trainer::RunningStats& stats) {
        switch (outcome.reason) {
            case trainer::AttemptReason::PERFECT:
                notify("Perfect! Held correct pressure");
                break;
            case trainer::AttemptReason::WRONG_PRESSURE:
                notify("Wrong pressure! Target: " + std::to_string(outcome.target.targetPressure) +
                       "%, You: " + std::to_string(static_cast<int>(std::lround(outcome.observedPercent))) + "%");
                break;
            case trainer::AttemptReason::WRONG_KEY:
                notify("Wrong key! Deviation: " +
                       std::to_string(static_cast<int>(std::lround(outcome.deviationPercent))) + "%");
                break;
        }
        logInfo("Accuracy %.0f%% (%u/%u), average deviation %.0f%%",
                stats.accuracyPercent, stats.successfulHits, stats.totalAttempts,
                stats.averageDeviationPercent);
    }

    void handleStatus(trainer::SessionStatus status, const trainer::RunningStats& stats) {
        if (status == trainer::SessionStatus::COMPLETED) {
            notify("Test Complete! Final accuracy: " +
                   std::to_string(static_cast<int>(std::lround(stats.accuracyPercent))) + "%");
        }
    }

    void notify(const std::string& message) {
        lastNotice_ = message;
        logInfo("%s", message.c_str());
    }

    features::TelemetryConnection& connection_;
    trainer::SessionController controller_;
    std::string lastNotice_;
};

} // namespace platform
