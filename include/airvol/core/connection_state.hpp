/**
 * @file connection_state.hpp
 * @brief Supervisor state and the collaborator that observes it.
 *
 * @copyright Copyright (c) 2025 AirVol Contributors
 * @license MIT License
 */

#pragma once

#include "airvol/core/export.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace airvol {
namespace core {

/**
 * @enum ConnectionPhase
 * @brief Phase of the connection supervisor.
 */
enum class ConnectionPhase {
    IDLE,               ///< Not started
    DISCOVERING,        ///< Waiting for the first announce
    CONNECTING,         ///< Opening a candidate endpoint
    CONNECTED,          ///< Session running
    WAITING_FOR_TARGET, ///< No target, or the target went stale
    RECONNECTING,       ///< Backing off after every candidate failed
    ERROR               ///< Last session ended with an error
};

inline const char* connectionPhaseToString(ConnectionPhase phase) {
    switch (phase) {
        case ConnectionPhase::IDLE: return "idle";
        case ConnectionPhase::DISCOVERING: return "discovering";
        case ConnectionPhase::CONNECTING: return "connecting";
        case ConnectionPhase::CONNECTED: return "connected";
        case ConnectionPhase::WAITING_FOR_TARGET: return "waiting-for-target";
        case ConnectionPhase::RECONNECTING: return "reconnecting";
        case ConnectionPhase::ERROR: return "error";
        default: return "unknown";
    }
}

/**
 * @struct ConnectionState
 * @brief A phase plus its payload.
 *
 * endpoint is set for CONNECTING/CONNECTED, delay for RECONNECTING and
 * reason for ERROR.
 */
struct AIRVOL_CORE_API ConnectionState {
    ConnectionPhase phase = ConnectionPhase::IDLE;
    std::string endpoint;
    std::chrono::milliseconds delay{0};
    std::string reason;

    static ConnectionState idle() { return ConnectionState{}; }
    static ConnectionState discovering();
    static ConnectionState connecting(const std::string& endpoint);
    static ConnectionState connected(const std::string& endpoint);
    static ConnectionState waitingForTarget();
    static ConnectionState reconnecting(std::chrono::milliseconds delay);
    static ConnectionState error(const std::string& reason);

    /// Active phases are CONNECTING and CONNECTED.
    bool isActive() const {
        return phase == ConnectionPhase::CONNECTING || phase == ConnectionPhase::CONNECTED;
    }

    std::string toString() const;

    bool operator==(const ConnectionState& other) const {
        return phase == other.phase && endpoint == other.endpoint
            && delay == other.delay && reason == other.reason;
    }

    bool operator!=(const ConnectionState& other) const { return !(*this == other); }
};

/**
 * @class EventSink
 * @brief Consumer of log lines and state transitions (UI, log collectors).
 *
 * Called from the core's worker threads. Implementations must return
 * quickly and must not call back into the core.
 */
class AIRVOL_CORE_API EventSink {
public:
    virtual ~EventSink() = default;

    virtual void onLog(std::chrono::system_clock::time_point timestamp,
                       const std::string& message) = 0;

    virtual void onStateChanged(const ConnectionState& state) = 0;
};

/**
 * @class ConnectionStatus
 * @brief The single ConnectionState instance, shared by the supervisor
 *        (writer) and the target selector (conditional writer).
 *
 * Every effective change is forwarded to the EventSink. Setting the
 * current value again is not reported.
 */
class AIRVOL_CORE_API ConnectionStatus {
public:
    explicit ConnectionStatus(std::shared_ptr<EventSink> events = nullptr);

    ConnectionStatus(const ConnectionStatus&) = delete;
    ConnectionStatus& operator=(const ConnectionStatus&) = delete;

    ConnectionState get() const;

    /**
     * @brief Replace the state.
     * @return True if the state changed.
     */
    bool set(const ConnectionState& state);

    /**
     * @brief Move to DISCOVERING unless a session is connecting or connected.
     * @return True if the state changed.
     */
    bool markDiscoveringUnlessActive();

private:
    std::shared_ptr<EventSink> events_;
    mutable std::mutex mutex_;
    ConnectionState state_;

    bool setLocked(const ConnectionState& state);
};

}  // namespace core
}  // namespace airvol
