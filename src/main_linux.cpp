#include <tcp_telemetry_connection.hpp>
#include <trainer_application.hpp>
#include <filesystem_config_storage.hpp>
#include <json_lines_sink.hpp>
#include <monotonic_clock.hpp>
#include <log.hpp>
#include <poll.h>
#include <unistd.h>
#include <csignal>
#include <atomic>
#include <cstring>
#include <string>

std::atomic<bool> running(true);

void signalHandler(int signum) {
    running = false;
}

extern "C" {
  int app_main(const char* configPath, bool jsonOutput);
  int main(int argc, char** argv);
}

namespace {

/**
 * @brief Reads whole lines from stdin without blocking
 */
class StdinLineReader {
public:
    /**
     * @brief Wait up to timeoutMs for input and pass each complete line to callback
     * @return false once stdin has been closed
     */
    template<typename Callback>
    bool poll(int timeoutMs, Callback callback) {
        if (closed_) {
            usleep(timeoutMs * 1000);
            return false;
        }

        pollfd pfd;
        pfd.fd = STDIN_FILENO;
        pfd.events = POLLIN;
        pfd.revents = 0;

        if (::poll(&pfd, 1, timeoutMs) <= 0) {
            return true;
        }

        char buffer[256];
        ssize_t bytesRead = ::read(STDIN_FILENO, buffer, sizeof(buffer));
        if (bytesRead <= 0) {
            closed_ = true;
            return false;
        }

        for (ssize_t i = 0; i < bytesRead; ++i) {
            if (buffer[i] == '\n') {
                callback(pending_);
                pending_.clear();
            } else {
                pending_.push_back(buffer[i]);
            }
        }
        return true;
    }

private:
    std::string pending_;
    bool closed_ = false;
};

} // namespace

int app_main(const char* configPath, bool jsonOutput) {
    try {
        logInfo("Analog Precision Trainer - Linux");
        logInfo("================================");

        // Setup signal handler for graceful shutdown
        signal(SIGINT, signalHandler);
        signal(SIGTERM, signalHandler);

        // Main loop period; also bounds how late a deadline can be noticed
        const int LOOP_INTERVAL_MS = 10;

        features::FilesystemConfigStorage configStorage(configPath != nullptr ? configPath : "trainer.json");
        trainer::TrainerConfig config;
        configStorage.loadConfig(config);

        logInfo("Telemetry bridge: %s:%u", config.host.c_str(), static_cast<unsigned>(config.port));
        linux::TcpTelemetryConnection connection(
            config.host, config.port, platform::monotonicMillis, config.reconnectDelayMs);

        std::unique_ptr<features::PresentationSink<trainer::SessionView>> sink;
        if (jsonOutput) {
            sink = std::make_unique<platform::JsonLinesSink<trainer::SessionView>>();
        } else {
            sink = std::make_unique<features::NoPresentationSink<trainer::SessionView>>();
        }

        platform::TrainerApplication app(connection, config, platform::monotonicMillis, std::move(sink));
        connection.connect();

        StdinLineReader input;
        while (running) {
            input.poll(LOOP_INTERVAL_MS, [&](const std::string& line) {
                if (!app.handleCommand(line)) {
                    running = false;
                }
            });

            connection.poll();
            app.update();
        }

        connection.disconnect();
        logInfo("\nShutting down...");
        return 0;

    } catch (const std::exception& e) {
        logError("Error: %s", e.what());
        return 1;
    }
}

int main(int argc, char** argv) {
    const char* configPath = nullptr;
    bool jsonOutput = false;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--json") == 0) {
            jsonOutput = true;
        } else if (std::strcmp(argv[i], "--help") == 0) {
            logInfo("Usage: %s [config.json] [--json]", argv[0]);
            return 0;
        } else {
            configPath = argv[i];
        }
    }
    return app_main(configPath, jsonOutput);
}
