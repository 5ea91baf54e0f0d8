/**
 * @file announce.hpp
 * @brief Decoding of discovery datagrams into candidate targets.
 *
 * @copyright Copyright (c) 2025 AirVol Contributors
 * @license MIT License
 */

#pragma once

#include "airvol/core/export.hpp"
#include "airvol/core/target.hpp"

#include <google/protobuf/struct.pb.h>

#include <optional>
#include <string>

namespace airvol {
namespace core {

/**
 * @enum AnnounceStatus
 * @brief Outcome of decoding one discovery datagram.
 */
enum class AnnounceStatus {
    ACCEPTED,   ///< Valid announce/response; candidate filled in
    PROBE,      ///< A discover probe (possibly our own); ignore silently
    REJECTED    ///< Malformed or foreign; reason filled in
};

/**
 * @struct AnnounceResult
 * @brief Decoded datagram.
 */
struct AIRVOL_CORE_API AnnounceResult {
    AnnounceStatus status = AnnounceStatus::REJECTED;
    Target candidate;
    std::string reason;
};

/**
 * @brief Interpret a ws_port style value as a TCP port.
 *
 * Accepts JSON numbers and numeric strings; fractional values are rounded
 * to the nearest integer. Values outside 1..65535 are rejected.
 */
AIRVOL_CORE_API std::optional<uint16_t> parsePort(const google::protobuf::Value& value);

/**
 * @brief Decode a discovery datagram.
 *
 * @param datagram Raw UDP payload.
 * @param senderIp Source address of the datagram, used when the payload has no ip.
 * @param serviceName Expected "service" value.
 */
AIRVOL_CORE_API AnnounceResult parseAnnounce(const std::string& datagram,
                                             const std::string& senderIp,
                                             const std::string& serviceName);

}  // namespace core
}  // namespace airvol
