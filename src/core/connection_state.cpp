/**
 * @file connection_state.cpp
 * @brief ConnectionState and ConnectionStatus implementation.
 *
 * @copyright Copyright (c) 2025 AirVol Contributors
 * @license MIT License
 */

#include "airvol/core/connection_state.hpp"
#include "airvol/utils/logger.hpp"

#include <cstdio>

namespace airvol {
namespace core {

ConnectionState ConnectionState::discovering() {
    ConnectionState state;
    state.phase = ConnectionPhase::DISCOVERING;
    return state;
}

ConnectionState ConnectionState::connecting(const std::string& endpoint) {
    ConnectionState state;
    state.phase = ConnectionPhase::CONNECTING;
    state.endpoint = endpoint;
    return state;
}

ConnectionState ConnectionState::connected(const std::string& endpoint) {
    ConnectionState state;
    state.phase = ConnectionPhase::CONNECTED;
    state.endpoint = endpoint;
    return state;
}

ConnectionState ConnectionState::waitingForTarget() {
    ConnectionState state;
    state.phase = ConnectionPhase::WAITING_FOR_TARGET;
    return state;
}

ConnectionState ConnectionState::reconnecting(std::chrono::milliseconds delay) {
    ConnectionState state;
    state.phase = ConnectionPhase::RECONNECTING;
    state.delay = delay;
    return state;
}

ConnectionState ConnectionState::error(const std::string& reason) {
    ConnectionState state;
    state.phase = ConnectionPhase::ERROR;
    state.reason = reason;
    return state;
}

std::string ConnectionState::toString() const {
    switch (phase) {
        case ConnectionPhase::CONNECTING:
            return "connecting to " + endpoint;
        case ConnectionPhase::CONNECTED:
            return "connected to " + endpoint;
        case ConnectionPhase::RECONNECTING: {
            char buf[48];
            std::snprintf(buf, sizeof(buf), "reconnecting in %.3fs",
                          static_cast<double>(delay.count()) / 1000.0);
            return buf;
        }
        case ConnectionPhase::ERROR:
            return "error: " + reason;
        default:
            return connectionPhaseToString(phase);
    }
}

// =============================================================================
// ConnectionStatus
// =============================================================================

ConnectionStatus::ConnectionStatus(std::shared_ptr<EventSink> events)
    : events_(std::move(events))
{}

ConnectionState ConnectionStatus::get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool ConnectionStatus::set(const ConnectionState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    return setLocked(state);
}

bool ConnectionStatus::markDiscoveringUnlessActive() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.isActive()) {
        return false;
    }
    return setLocked(ConnectionState::discovering());
}

bool ConnectionStatus::setLocked(const ConnectionState& state) {
    if (state_ == state) {
        return false;
    }
    state_ = state;
    LOG_DEBUG("Status", "State -> {}", state.toString());

    // Still under the lock so observers see transitions in order
    if (events_) {
        events_->onStateChanged(state);
    }
    return true;
}

}  // namespace core
}  // namespace airvol
