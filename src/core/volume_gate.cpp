/**
 * @file volume_gate.cpp
 * @brief VolumeGate and CommandVolumeSink implementation.
 *
 * @copyright Copyright (c) 2025 AirVol Contributors
 * @license MIT License
 */

#include "airvol/core/volume_gate.hpp"
#include "airvol/core/event_report.hpp"
#include "airvol/core/json_codec.hpp"
#include "airvol/utils/logger.hpp"

#include <google/protobuf/struct.pb.h>

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>

#ifndef _WIN32
#include <sys/wait.h>
#endif

namespace airvol {
namespace core {

using utils::LogLevel;

namespace {

double clampPercent(double value) {
    return std::min(100.0, std::max(0.0, value));
}

VolumeSample makeSample(double exact, const char* key) {
    VolumeSample sample;
    sample.exact = exact;
    sample.percent = static_cast<int>(std::lround(clampPercent(exact)));
    sample.source_key = key;
    return sample;
}

}  // namespace

// =============================================================================
// CommandVolumeSink
// =============================================================================

CommandVolumeSink::CommandVolumeSink(std::string commandTemplate)
    : template_(std::move(commandTemplate))
{}

std::string CommandVolumeSink::commandFor(int percent) const {
    std::string command = template_;
    const std::string value = std::to_string(percent);
    size_t pos = 0;
    while ((pos = command.find("{}", pos)) != std::string::npos) {
        command.replace(pos, 2, value);
        pos += value.size();
    }
    return command;
}

bool CommandVolumeSink::apply(int percent, std::string& error) {
    if (template_.empty()) {
        return true;
    }

    std::string command = commandFor(percent);
    int rc = std::system(command.c_str());
    if (rc == -1) {
        error = "cannot run '" + command + "': " + utils::describeError(errno);
        return false;
    }
#ifndef _WIN32
    if (!WIFEXITED(rc) || WEXITSTATUS(rc) != 0) {
        error = "'" + command + "' exited with status "
              + std::to_string(WIFEXITED(rc) ? WEXITSTATUS(rc) : rc);
        return false;
    }
#else
    if (rc != 0) {
        error = "'" + command + "' exited with status " + std::to_string(rc);
        return false;
    }
#endif
    return true;
}

// =============================================================================
// VolumeGate
// =============================================================================

VolumeGate::VolumeGate(std::shared_ptr<VolumeSink> sink,
                       double threshold,
                       std::shared_ptr<EventSink> events)
    : sink_(std::move(sink))
    , threshold_(threshold)
    , events_(std::move(events))
{}

std::optional<VolumeSample> VolumeGate::interpret(const std::string& payload) {
    google::protobuf::Struct doc;
    if (!json::parseObject(payload, doc)) {
        LOG_DEBUG("VolumeGate", "Ignoring non-JSON frame: {}", payload);
        return std::nullopt;
    }

    for (const char* key : {"percent", "pct", "volume_percent"}) {
        const auto* field = json::firstField(doc, {key});
        if (!field) {
            continue;
        }
        if (auto value = json::asNumber(*field)) {
            return makeSample(*value, key);
        }
    }

    if (const auto* raw = json::firstField(doc, {"raw"})) {
        if (auto value = json::asNumber(*raw)) {
            return makeSample(*value * 100.0 / kRawFullScale, "raw");
        }
    }

    LOG_TRACE("VolumeGate", "Frame without volume: {}", payload);
    return std::nullopt;
}

GateResult VolumeGate::gate(int percent, double threshold) {
    int clamped = std::min(100, std::max(0, percent));

    std::lock_guard<std::mutex> lock(mutex_);

    if (lastApplied_ && std::fabs(static_cast<double>(*lastApplied_ - clamped)) < threshold) {
        return GateResult::UNCHANGED;
    }

    std::string error;
    if (sink_ && !sink_->apply(clamped, error)) {
        report(events_.get(), LogLevel::ERROR, "VolumeGate", "Cannot set volume to {}%: {}",
               clamped, error);
    } else {
        report(events_.get(), LogLevel::INFO, "VolumeGate", "Volume {}%", clamped);
    }

    lastApplied_ = clamped;
    return GateResult::CHANGED;
}

std::optional<GateResult> VolumeGate::process(const std::string& payload) {
    auto sample = interpret(payload);
    if (!sample) {
        return std::nullopt;
    }
    return gate(sample->percent);
}

std::optional<int> VolumeGate::lastApplied() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastApplied_;
}

}  // namespace core
}  // namespace airvol
