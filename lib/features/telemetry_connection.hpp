#pragma once

#include <key_snapshot.hpp>
#include <functional>

namespace features {

enum class ConnectionStatus {
    DISCONNECTED,
    CONNECTING,
    CONNECTED,
    ERROR
};

inline const char* connectionStatusName(ConnectionStatus status) {
    switch (status) {
        case ConnectionStatus::DISCONNECTED: return "disconnected";
        case ConnectionStatus::CONNECTING:   return "connecting";
        case ConnectionStatus::CONNECTED:    return "connected";
        case ConnectionStatus::ERROR:        return "error";
    }
    return "unknown";
}

/**
 * @brief Abstract interface for the analog keyboard telemetry feed
 * 
 * Implementations own the transport (socket, replay file, etc.) and deliver
 * decoded frames in arrival order with increasing sequence numbers. After an
 * unexpected disconnect they retry on their own until disconnect() is called.
 */
class TelemetryConnection {
public:
    using FrameHandler = std::function<void(const trainer::SnapshotFrame&)>;
    using StatusHandler = std::function<void(ConnectionStatus)>;

    virtual ~TelemetryConnection() = default;

    /**
     * @brief Begin connecting (non-blocking); no-op if already connected or connecting
     */
    virtual void connect() = 0;

    /**
     * @brief Close the connection and stop retrying
     */
    virtual void disconnect() = 0;

    virtual ConnectionStatus getStatus() const = 0;

    /**
     * @brief Register the consumer of frames and status changes
     * @param onFrame Called for every decoded message
     * @param onStatus Called whenever getStatus() changes
     */
    virtual void subscribe(FrameHandler onFrame, StatusHandler onStatus) = 0;
};

} // namespace features
