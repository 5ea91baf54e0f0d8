/**
 * @file announce.cpp
 * @brief Discovery datagram decoding.
 *
 * @copyright Copyright (c) 2025 AirVol Contributors
 * @license MIT License
 */

#include "airvol/core/announce.hpp"
#include "airvol/core/json_codec.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace airvol {
namespace core {

namespace {

std::string toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

AnnounceResult reject(std::string reason) {
    AnnounceResult result;
    result.status = AnnounceStatus::REJECTED;
    result.reason = std::move(reason);
    return result;
}

}  // namespace

std::optional<uint16_t> parsePort(const google::protobuf::Value& value) {
    auto number = json::asNumber(value);
    if (!number) {
        return std::nullopt;
    }
    double rounded = std::round(*number);
    if (rounded < 1.0 || rounded > 65535.0) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(rounded);
}

AnnounceResult parseAnnounce(const std::string& datagram,
                             const std::string& senderIp,
                             const std::string& serviceName) {
    google::protobuf::Struct doc;
    std::string parseError;
    if (!json::parseObject(datagram, doc, &parseError)) {
        return reject("payload is not a JSON object: " + datagram);
    }

    const auto* service = json::firstField(doc, {"service"});
    auto serviceValue = service ? json::asString(*service) : std::nullopt;
    if (!serviceValue || *serviceValue != serviceName) {
        return reject("foreign service: " + json::describe(doc));
    }

    const auto* type = json::firstField(doc, {"type"});
    auto typeValue = type ? json::asString(*type) : std::nullopt;
    if (!typeValue) {
        return reject("payload without type: " + json::describe(doc));
    }

    std::string messageType = toLower(*typeValue);
    if (messageType == "discover") {
        AnnounceResult result;
        result.status = AnnounceStatus::PROBE;
        return result;
    }
    if (messageType != "announce" && messageType != "response") {
        return reject("unhandled type (" + messageType + "): " + json::describe(doc));
    }

    const auto* portField = json::firstField(doc, {"ws_port", "wsPort", "port"});
    auto port = portField ? parsePort(*portField) : std::nullopt;
    if (!port) {
        return reject("announce without usable ws_port: " + json::describe(doc));
    }

    AnnounceResult result;
    result.status = AnnounceStatus::ACCEPTED;
    Target& candidate = result.candidate;
    candidate.ws_port = *port;

    const auto* ipField = json::firstField(doc, {"ip"});
    auto ip = ipField ? json::asString(*ipField) : std::nullopt;
    if (ip && !ip->empty()) {
        candidate.ip = *ip;
    } else if (!senderIp.empty()) {
        candidate.ip = senderIp;
    } else {
        return reject("announce without ip and unknown sender: " + json::describe(doc));
    }

    const auto* nameField = json::firstField(doc, {"name", "device_name"});
    if (nameField) {
        candidate.name = json::asString(*nameField);
    }

    const auto* pathField = json::firstField(doc, {"ws_path", "path"});
    auto path = pathField ? json::asString(*pathField) : std::nullopt;
    if (path && !path->empty() && path->front() == '/') {
        candidate.path = *path;
    }

    candidate.last_seen = Target::Clock::now();
    return result;
}

}  // namespace core
}  // namespace airvol
