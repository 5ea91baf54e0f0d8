/**
 * @file main.cpp
 * @brief airvold entry point
 *
 * This is the thin executable that wires together the library components:
 * - Discovery listener for UDP broadcast announces
 * - Target selector fed through the candidate queue
 * - Connection supervisor with the WebSocket transport
 * - Volume gate in front of the command-based volume sink
 */

#include <airvol/core/connection_supervisor.hpp>
#include <airvol/core/discovery_listener.hpp>
#include <airvol/core/event_history.hpp>
#include <airvol/core/target_selector.hpp>
#include <airvol/core/volume_gate.hpp>
#include <airvol/daemon/config.hpp>
#include <airvol/net/websocket_transport.hpp>
#include <airvol/utils/logger.hpp>

#include <google/protobuf/stubs/common.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace airvol;
using namespace airvol::daemon;

// Set by the signal handlers, polled by main
static std::atomic<int> g_signal{0};
static std::atomic<bool> g_dumpRequested{false};

void signalHandler(int signal) {
    g_signal.store(signal);
}

void dumpSignalHandler(int) {
    g_dumpRequested.store(true);
}

/**
 * @brief Write the event history to the configured file, or to stderr.
 */
static void exportHistory(const core::EventHistory& history, const std::string& path) {
    if (path.empty()) {
        std::cerr << "---- event history ----\n" << history.dump() << "\n----\n" << std::flush;
        return;
    }

    std::string error;
    if (history.exportTo(path, error)) {
        LOG_INFO("Daemon", "Event history written to {}", path);
    } else {
        LOG_ERROR("Daemon", "Event history export failed: {}", error);
    }
}

int main(int argc, char* argv[]) {
    GOOGLE_PROTOBUF_VERIFY_VERSION;

    Config base;
    applyEnvironment(base, [](const char* name) { return std::getenv(name); });
    Config config = parseArgs(argc, argv, base);

    if (config.help) {
        if (!config.error.empty()) {
            std::cerr << "Error: " << config.error << "\n\n";
        }
        printUsage(argv[0]);
        return config.error.empty() ? 0 : 2;
    }

    // Configure logging
    utils::Logger::instance().setLevel(parseLogLevel(config.log_level));
    utils::Logger::instance().setColorEnabled(config.color);

    for (const auto& warning : config.warnings) {
        LOG_WARN("Daemon", "{}", warning);
    }

    LOG_INFO("Daemon", "airvold starting...");
    LOG_INFO("Daemon", "Service: {}", config.service);
    LOG_INFO("Daemon", "Discovery: {}:{}", config.broadcast_addr, config.discovery_port);
    if (config.forced_ip) {
        LOG_INFO("Daemon", "Forced target: {}:{}", *config.forced_ip,
                 config.forced_port ? std::to_string(*config.forced_port) : std::string("auto"));
    }
    if (config.forced_name) {
        LOG_INFO("Daemon", "Forced name: {}", *config.forced_name);
    }
    if (config.volume_command.empty()) {
        LOG_INFO("Daemon", "No volume command, running dry");
    }

    // Install signal handlers
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
#ifdef SIGUSR1
    std::signal(SIGUSR1, dumpSignalHandler);
#endif

    try {
        const core::ForcedConfig forced = toForcedConfig(config);

        auto history = std::make_shared<core::EventHistory>();
        auto status = std::make_shared<core::ConnectionStatus>(history);
        auto candidates = std::make_shared<core::CandidateQueue>();

        auto selector = std::make_shared<core::TargetSelector>(forced, status, history);
        auto sink = std::make_shared<core::CommandVolumeSink>(config.volume_command);
        auto gate = std::make_shared<core::VolumeGate>(sink, config.threshold, history);

        core::DiscoveryListener discovery(toDiscoveryConfig(config), forced, candidates, history);
        core::ConnectionSupervisor supervisor(toSupervisorConfig(config), selector, gate,
                                              net::WebSocketTransport::factory(),
                                              status, history);

        selector->start(candidates);

        if (!discovery.start()) {
            if (forced.hasForcedIp()) {
                LOG_WARN("Daemon", "Discovery unavailable, continuing with the forced target");
            } else {
                LOG_ERROR("Daemon", "Discovery unavailable, no target will be found");
            }
        }

        supervisor.start();
        LOG_INFO("Daemon", "airvold is ready");

        // Main loop - wait for shutdown signal
        while (g_signal.load() == 0) {
            if (g_dumpRequested.exchange(false)) {
                exportHistory(*history, config.history_file);
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        LOG_INFO("Daemon", "Received signal {}, shutting down...", g_signal.load());

        supervisor.stop();
        discovery.stop();
        candidates->close();
        selector->stop();

        LOG_INFO("Daemon", "Last state: {} ({} transitions)",
                 history->lastState().toString(), history->transitionCount());
        if (!config.history_file.empty()) {
            exportHistory(*history, config.history_file);
        }
        LOG_INFO("Daemon", "airvold stopped");
    } catch (const std::exception& e) {
        LOG_ERROR("Daemon", "Fatal error: {}", e.what());
        google::protobuf::ShutdownProtobufLibrary();
        return 1;
    }

    google::protobuf::ShutdownProtobufLibrary();
    return 0;
}
