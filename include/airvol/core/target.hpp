/**
 * @file target.hpp
 * @brief Streaming endpoints and operator overrides.
 *
 * @copyright Copyright (c) 2025 AirVol Contributors
 * @license MIT License
 */

#pragma once

#include "airvol/core/export.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace airvol {
namespace core {

/// Port used for a forced IP when neither a forced nor an announced port is known.
constexpr uint16_t kFallbackWsPort = 81;

/**
 * @struct Target
 * @brief A discovered or forced WebSocket endpoint.
 *
 * Two targets denote the same device when ip and ws_port match.
 */
struct AIRVOL_CORE_API Target {
    using Clock = std::chrono::steady_clock;

    std::string ip;
    uint16_t ws_port;                   ///< 1..65535
    std::optional<std::string> name;
    std::optional<std::string> path;    ///< Starts with '/' when set
    Clock::time_point last_seen;        ///< time_point::max() for forced targets

    Target()
        : ws_port(0)
        , last_seen(Clock::now())
    {}

    Target(std::string ip_, uint16_t port_)
        : ip(std::move(ip_))
        , ws_port(port_)
        , last_seen(Clock::now())
    {}

    bool sameDevice(const Target& other) const {
        return ip == other.ip && ws_port == other.ws_port;
    }

    /// Name if known, otherwise "ip:port".
    std::string label() const {
        return name ? *name : ip + ":" + std::to_string(ws_port);
    }

    bool operator==(const Target& other) const {
        return ip == other.ip && ws_port == other.ws_port && name == other.name
            && path == other.path && last_seen == other.last_seen;
    }

    bool operator!=(const Target& other) const { return !(*this == other); }
};

/**
 * @struct ForcedConfig
 * @brief Operator overrides, read once at startup and immutable afterwards.
 *
 * With forced_ip set, the target is synthesized from these values and
 * discovery only contributes hints for the same ip.
 */
struct AIRVOL_CORE_API ForcedConfig {
    std::optional<std::string> forced_ip;
    std::optional<uint16_t> forced_port;
    std::optional<std::string> forced_name;

    bool hasForcedIp() const { return forced_ip.has_value(); }

    /**
     * @brief Check a candidate against the forced name and ip filters.
     *
     * A candidate without a name never matches a forced name.
     */
    bool admits(const Target& candidate) const {
        if (forced_name && candidate.name.value_or("") != *forced_name) {
            return false;
        }
        if (forced_ip && candidate.ip != *forced_ip) {
            return false;
        }
        return true;
    }
};

}  // namespace core
}  // namespace airvol
