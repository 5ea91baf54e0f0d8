/**
 * @file connection_supervisor.hpp
 * @brief Connection state machine: target to session, with retry and liveness.
 *
 * The ConnectionSupervisor handles:
 * - Pulling the current target from the TargetSelector each iteration
 * - Skipping stale targets
 * - Trying every candidate URL of a target in order
 * - Heartbeat and watchdog while a session is open
 * - Multiplicative backoff when a whole candidate list fails
 *
 * @copyright Copyright (c) 2025 AirVol Contributors
 * @license MIT License
 */

#pragma once

#include "airvol/core/connection_state.hpp"
#include "airvol/core/export.hpp"
#include "airvol/core/retry_backoff.hpp"
#include "airvol/core/target.hpp"
#include "airvol/core/target_selector.hpp"
#include "airvol/core/volume_gate.hpp"
#include "airvol/net/stream_transport.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace airvol {
namespace core {

/**
 * @struct SupervisorConfig
 * @brief Timing of the supervisor loop and its sessions.
 */
struct AIRVOL_CORE_API SupervisorConfig {
    std::chrono::milliseconds stale_ttl{20000};          ///< Discovered targets older than this are skipped
    std::chrono::milliseconds idle_poll{500};            ///< Sleep while there is no usable target
    std::chrono::milliseconds connect_timeout{15000};
    std::chrono::milliseconds heartbeat_interval{5000};
    std::chrono::milliseconds watchdog_timeout{12000};   ///< Max silence before the session is dropped
    std::chrono::milliseconds watchdog_tick{1000};
    RetryPolicy retry;
};

/**
 * @class ConnectionSupervisor
 * @brief Keeps one session to the current target alive.
 *
 * Runs a single loop thread. Each session runs its receive duty on that
 * thread plus a heartbeat thread and a watchdog thread; all three are
 * finished before the loop moves on, so frames from an old session can
 * never reach the VolumeGate once the next attempt has started.
 *
 * A session to a target that is replaced by discovery is not torn down;
 * it runs until it fails on its own.
 *
 * Usage:
 * @code
 * ConnectionSupervisor supervisor(config, selector, gate,
 *                                 net::WebSocketTransport::factory(),
 *                                 status, events);
 * supervisor.start();
 * // ... run ...
 * supervisor.stop();
 * @endcode
 */
class AIRVOL_CORE_API ConnectionSupervisor {
public:
    ConnectionSupervisor(const SupervisorConfig& config,
                         std::shared_ptr<TargetSelector> selector,
                         std::shared_ptr<VolumeGate> gate,
                         net::TransportFactory transportFactory,
                         std::shared_ptr<ConnectionStatus> status,
                         std::shared_ptr<EventSink> events = nullptr);

    /**
     * @brief Destructor - stops the supervisor if running.
     */
    ~ConnectionSupervisor();

    // Non-copyable
    ConnectionSupervisor(const ConnectionSupervisor&) = delete;
    ConnectionSupervisor& operator=(const ConnectionSupervisor&) = delete;

    /**
     * @brief Start the loop thread.
     * @return False if already running.
     */
    bool start();

    /**
     * @brief Stop the loop and any open session. Idempotent.
     *
     * Returns once the loop thread and all session duties have finished.
     */
    void stop();

    bool isRunning() const { return running_.load(); }

    /**
     * @brief Ordered URLs to try for @p target.
     *
     * Ports: @p forcedPort first, then the target's port if different.
     * Paths: the target's path, "/ws", "/", without duplicates.
     * Port-major, e.g. ws://10.0.0.5:81/ws, ws://10.0.0.5:81/, ...
     */
    static std::vector<std::string> buildCandidateUrls(const Target& target,
                                                       const std::optional<uint16_t>& forcedPort);

    /// Transports that completed their handshake.
    uint64_t sessionsOpened() const { return sessionsOpened_.load(); }

    /// Connection attempts, successful or not.
    uint64_t attempts() const { return attempts_.load(); }

private:
    struct Session;

    SupervisorConfig config_;
    std::shared_ptr<TargetSelector> selector_;
    std::shared_ptr<VolumeGate> gate_;
    net::TransportFactory transportFactory_;
    std::shared_ptr<ConnectionStatus> status_;
    std::shared_ptr<EventSink> events_;

    std::string heartbeatPayload_;

    std::mutex lifecycleMutex_;
    std::atomic<bool> running_{false};
    std::thread loopThread_;

    // Wakes interruptible sleeps on stop()
    std::mutex wakeMutex_;
    std::condition_variable wakeCv_;

    // The session currently alive, if any; stop() ends it
    std::mutex sessionMutex_;
    std::shared_ptr<Session> activeSession_;

    std::atomic<uint64_t> sessionsOpened_{0};
    std::atomic<uint64_t> attempts_{0};

    void runLoop();

    /**
     * @brief Open @p url and run the session until it ends.
     * @return True if the transport opened.
     */
    bool runSession(const std::string& url);

    void receiveDuty(Session& session);
    void heartbeatDuty(Session& session);
    void watchdogDuty(Session& session);

    bool isStale(const Target& target) const;

    /// Sleep unless stopped first; false if stopped.
    bool sleepFor(std::chrono::milliseconds duration);
};

}  // namespace core
}  // namespace airvol
