#ifndef TCP_TELEMETRY_CONNECTION_HPP
#define TCP_TELEMETRY_CONNECTION_HPP

#include <telemetry_connection.hpp>
#include <telemetry_decoder.hpp>
#include <deadline.hpp>
#include <log.hpp>
#include <sys/socket.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <netdb.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <functional>
#include <string>
#include <utility>

namespace linux {

/**
 * @brief Telemetry feed from the keyboard bridge over a TCP stream
 * 
 * The bridge writes one telemetry message per line. Everything is
 * non-blocking: call poll() from the main loop to advance the connect
 * handshake, drain received lines, and fire the reconnect timer.
 * 
 * After an unexpected close or a failed attempt the connection retries
 * every reconnectDelayMs until disconnect() is called.
 * 
 * A numeric host (the default 127.0.0.1, or an IPv6 literal) is used as
 * is. A host name goes through a synchronous DNS lookup on each attempt,
 * which can stall the loop while the resolver waits.
 */
class TcpTelemetryConnection : public features::TelemetryConnection {
public:
    using Clock = std::function<trainer::TimeMs()>;

    static constexpr size_t MAX_LINE_LENGTH = 64 * 1024;

    /**
     * @param host Bridge host name or address
     * @param port Bridge TCP port
     * @param clock Monotonic millisecond clock for the retry timer
     * @param reconnectDelayMs Fixed backoff between connection attempts
     */
    TcpTelemetryConnection(std::string host, uint16_t port, Clock clock,
                           trainer::TimeMs reconnectDelayMs = 3000)
        : host_(std::move(host))
        , port_(port)
        , clock_(std::move(clock))
        , reconnectDelayMs_(reconnectDelayMs) {}

    ~TcpTelemetryConnection() {
        closeSocket();
    }

    // Delete copy constructor and assignment
    TcpTelemetryConnection(const TcpTelemetryConnection&) = delete;
    TcpTelemetryConnection& operator=(const TcpTelemetryConnection&) = delete;

    void connect() override {
        if (status_ == features::ConnectionStatus::CONNECTED ||
            status_ == features::ConnectionStatus::CONNECTING) {
            return;
        }
        retryEnabled_ = true;
        retryTimer_.cancel();
        beginConnect();
    }

    void disconnect() override {
        retryEnabled_ = false;
        retryTimer_.cancel();
        closeSocket();
        setStatus(features::ConnectionStatus::DISCONNECTED);
    }

    features::ConnectionStatus getStatus() const override {
        return status_;
    }

    void subscribe(FrameHandler onFrame, StatusHandler onStatus) override {
        onFrame_ = std::move(onFrame);
        onStatus_ = std::move(onStatus);
    }

    /**
     * @brief Advance the connection; non-blocking
     * @return Number of frames delivered
     */
    size_t poll() {
        if (retryTimer_.hasExpired(clock_())) {
            retryTimer_.cancel();
            logInfo("Reconnecting to %s:%u", host_.c_str(), static_cast<unsigned>(port_));
            beginConnect();
        }

        if (status_ == features::ConnectionStatus::CONNECTING) {
            checkConnectProgress();
        }

        if (status_ == features::ConnectionStatus::CONNECTED) {
            return readAvailable();
        }
        return 0;
    }

    /**
     * @brief True if host is an IPv4 or IPv6 literal (no resolver lookup needed)
     */
    static bool isNumericHost(const std::string& host) {
        in_addr v4;
        in6_addr v6;
        return inet_pton(AF_INET, host.c_str(), &v4) == 1 ||
               inet_pton(AF_INET6, host.c_str(), &v6) == 1;
    }

    const std::string& getHost() const { return host_; }
    uint16_t getPort() const { return port_; }

private:
    std::string host_;
    uint16_t port_;
    Clock clock_;
    trainer::TimeMs reconnectDelayMs_;

    int socket_ = -1;
    features::ConnectionStatus status_ = features::ConnectionStatus::DISCONNECTED;
    bool retryEnabled_ = false;
    trainer::Deadline retryTimer_;

    FrameHandler onFrame_;
    StatusHandler onStatus_;

    std::string lineBuffer_;
    uint32_t nextSequence_ = 1;

    void beginConnect() {
        setStatus(features::ConnectionStatus::CONNECTING);

        addrinfo hints;
        std::memset(&hints, 0, sizeof(hints));
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        hints.ai_flags = AI_NUMERICSERV;
        if (isNumericHost(host_)) {
            hints.ai_flags |= AI_NUMERICHOST;
        } else {
            logDebug("Resolving %s (blocking lookup)", host_.c_str());
        }

        addrinfo* result = nullptr;
        std::string portText = std::to_string(port_);
        int err = getaddrinfo(host_.c_str(), portText.c_str(), &hints, &result);
        if (err != 0) {
            logError("Cannot resolve %s: %s", host_.c_str(), gai_strerror(err));
            fail();
            return;
        }

        socket_ = ::socket(result->ai_family, result->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC,
                           result->ai_protocol);
        if (socket_ < 0) {
            logError("socket() failed: %s", strerror(errno));
            freeaddrinfo(result);
            fail();
            return;
        }

        int rc = ::connect(socket_, result->ai_addr, result->ai_addrlen);
        freeaddrinfo(result);

        if (rc == 0) {
            onConnected();
        } else if (errno != EINPROGRESS) {
            logError("Cannot connect to %s:%u: %s", host_.c_str(), static_cast<unsigned>(port_), strerror(errno));
            fail();
        }
    }

    void checkConnectProgress() {
        pollfd pfd;
        pfd.fd = socket_;
        pfd.events = POLLOUT;
        pfd.revents = 0;

        int ready = ::poll(&pfd, 1, 0);
        if (ready == 0) {
            return;  // Handshake still in progress
        }
        if (ready < 0) {
            if (errno != EINTR) {
                logError("poll() failed: %s", strerror(errno));
                fail();
            }
            return;
        }

        int socketError = 0;
        socklen_t length = sizeof(socketError);
        if (getsockopt(socket_, SOL_SOCKET, SO_ERROR, &socketError, &length) < 0) {
            socketError = errno;
        }
        if (socketError != 0) {
            logError("Cannot connect to %s:%u: %s", host_.c_str(), static_cast<unsigned>(port_), strerror(socketError));
            fail();
            return;
        }
        onConnected();
    }

    size_t readAvailable() {
        size_t framesDelivered = 0;
        char buffer[4096];

        while (socket_ >= 0) {
            ssize_t bytesRead = ::recv(socket_, buffer, sizeof(buffer), 0);

            if (bytesRead < 0) {
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    // No more data available (normal in non-blocking mode)
                    break;
                }
                if (errno == EINTR) {
                    continue;
                }
                logError("Telemetry read error: %s", strerror(errno));
                fail();
                break;
            }

            if (bytesRead == 0) {
                logWarn("Telemetry bridge closed the connection");
                dropAndRetry(features::ConnectionStatus::DISCONNECTED);
                break;
            }

            for (ssize_t i = 0; i < bytesRead; ++i) {
                char c = buffer[i];
                if (c == '\n') {
                    deliverLine();
                    framesDelivered++;
                } else if (lineBuffer_.size() < MAX_LINE_LENGTH) {
                    lineBuffer_.push_back(c);
                } else {
                    // Oversized message; whatever arrives up to the next newline is discarded
                    logDebug("Telemetry line exceeds %zu bytes, truncating", MAX_LINE_LENGTH);
                }
            }
        }
        return framesDelivered;
    }

    void deliverLine() {
        trainer::SnapshotFrame frame;
        frame.sequence = nextSequence_++;
        frame.keys = trainer::TelemetryDecoder::decode(lineBuffer_);
        lineBuffer_.clear();
        if (onFrame_) {
            onFrame_(frame);
        }
    }

    void onConnected() {
        lineBuffer_.clear();
        logInfo("Connected to telemetry bridge at %s:%u", host_.c_str(), static_cast<unsigned>(port_));
        setStatus(features::ConnectionStatus::CONNECTED);
    }

    void fail() {
        dropAndRetry(features::ConnectionStatus::ERROR);
    }

    void dropAndRetry(features::ConnectionStatus reason) {
        closeSocket();
        setStatus(reason);
        if (reason == features::ConnectionStatus::ERROR) {
            setStatus(features::ConnectionStatus::DISCONNECTED);
        }
        if (retryEnabled_) {
            retryTimer_.arm(clock_(), reconnectDelayMs_);
            logInfo("Retrying in %u ms", static_cast<unsigned>(reconnectDelayMs_));
        }
    }

    void closeSocket() {
        if (socket_ >= 0) {
            ::close(socket_);
            socket_ = -1;
        }
        lineBuffer_.clear();
    }

    void setStatus(features::ConnectionStatus status) {
        if (status_ == status) {
            return;
        }
        status_ = status;
        if (onStatus_) {
            onStatus_(status);
        }
    }
};

} // namespace linux

#endif // TCP_TELEMETRY_CONNECTION_HPP
