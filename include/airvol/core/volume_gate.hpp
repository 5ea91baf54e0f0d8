/**
 * @file volume_gate.hpp
 * @brief Decoding of volume frames and suppression of insignificant changes.
 *
 * @copyright Copyright (c) 2025 AirVol Contributors
 * @license MIT License
 */

#pragma once

#include "airvol/core/connection_state.hpp"
#include "airvol/core/export.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace airvol {
namespace core {

/// Full scale of the device's "raw" ADC reading.
constexpr double kRawFullScale = 4095.0;

/// Default minimum change, in percent points, that reaches the sink.
constexpr double kDefaultChangeThreshold = 0.5;

/**
 * @class VolumeSink
 * @brief Whatever actually changes the output volume.
 */
class AIRVOL_CORE_API VolumeSink {
public:
    virtual ~VolumeSink() = default;

    /**
     * @brief Set the output volume.
     * @param percent 0..100
     * @param error Output: description of the failure.
     * @return True on success.
     */
    virtual bool apply(int percent, std::string& error) = 0;
};

/**
 * @class CommandVolumeSink
 * @brief Runs a shell command per change, "{}" replaced by the percentage.
 *
 * An empty command makes apply() a successful no-op (dry run).
 */
class AIRVOL_CORE_API CommandVolumeSink : public VolumeSink {
public:
    static constexpr const char* kDefaultCommand = "amixer -q sset Master {}%";

    explicit CommandVolumeSink(std::string commandTemplate = kDefaultCommand);

    bool apply(int percent, std::string& error) override;

    /// The command that apply(@p percent) would run.
    std::string commandFor(int percent) const;

private:
    std::string template_;
};

/**
 * @struct VolumeSample
 * @brief A decoded volume frame.
 */
struct AIRVOL_CORE_API VolumeSample {
    int percent = 0;            ///< Rounded and clamped to 0..100
    double exact = 0.0;         ///< Before rounding and clamping
    std::string source_key;     ///< Field the value came from
};

/**
 * @enum GateResult
 * @brief Whether a sample reached the sink.
 */
enum class GateResult {
    CHANGED,
    UNCHANGED
};

/**
 * @class VolumeGate
 * @brief Applies volume samples that differ enough from the last applied one.
 *
 * Only the active session's receive duty feeds the gate, but the last
 * applied value is still guarded so stray calls cannot tear it.
 */
class AIRVOL_CORE_API VolumeGate {
public:
    explicit VolumeGate(std::shared_ptr<VolumeSink> sink,
                        double threshold = kDefaultChangeThreshold,
                        std::shared_ptr<EventSink> events = nullptr);

    /**
     * @brief Decode a frame.
     *
     * Looks at "percent", "pct", "volume_percent" in that order, then "raw"
     * (0..4095, rescaled to percent). Each may be a number or a numeric
     * string. Anything else yields nullopt.
     */
    static std::optional<VolumeSample> interpret(const std::string& payload);

    /**
     * @brief Apply @p percent unless it is within @p threshold of the last applied value.
     *
     * A failed apply still becomes the last applied value; the next sample
     * that clears the threshold retries naturally.
     */
    GateResult gate(int percent, double threshold);

    GateResult gate(int percent) { return gate(percent, threshold_); }

    /**
     * @brief interpret() then gate(); nullopt when the payload carries no volume.
     */
    std::optional<GateResult> process(const std::string& payload);

    std::optional<int> lastApplied() const;

    double threshold() const { return threshold_; }

private:
    std::shared_ptr<VolumeSink> sink_;
    double threshold_;
    std::shared_ptr<EventSink> events_;

    mutable std::mutex mutex_;
    std::optional<int> lastApplied_;
};

}  // namespace core
}  // namespace airvol
