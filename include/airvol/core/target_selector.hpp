/**
 * @file target_selector.hpp
 * @brief Holder of the single current target.
 *
 * The TargetSelector maintains:
 * - The current target and its last-seen time
 * - Enrichment of the current target from re-announces
 * - The synthetic target when an IP is forced
 *
 * @copyright Copyright (c) 2025 AirVol Contributors
 * @license MIT License
 */

#pragma once

#include "airvol/core/connection_state.hpp"
#include "airvol/core/discovery_listener.hpp"
#include "airvol/core/export.hpp"
#include "airvol/core/target.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace airvol {
namespace core {

/**
 * @enum CandidateOutcome
 * @brief What onCandidate() did with a candidate.
 */
enum class CandidateOutcome {
    FILTERED,   ///< Rejected by the forced name/ip filter
    REFRESHED,  ///< Same device as current; merged and last_seen refreshed
    REPLACED,   ///< Became the new current target
    HINTED      ///< Forced IP mode: recorded as port/path/name hint only
};

/**
 * @class TargetSelector
 * @brief Thread-safe owner of the current target.
 *
 * All access is serialized by one mutex, so readers always observe a
 * complete Target. Candidates arrive either through onCandidate() or
 * through a CandidateQueue drained by the pump thread (start()/stop()).
 *
 * Usage:
 * @code
 * auto status = std::make_shared<ConnectionStatus>(events);
 * TargetSelector selector(forced, status, events);
 * selector.start(queue);
 *
 * if (auto target = selector.select()) {
 *     // connect to target->ip:target->ws_port
 * }
 * @endcode
 */
class AIRVOL_CORE_API TargetSelector {
public:
    TargetSelector(const ForcedConfig& forced,
                   std::shared_ptr<ConnectionStatus> status = nullptr,
                   std::shared_ptr<EventSink> events = nullptr);

    ~TargetSelector();

    // Non-copyable
    TargetSelector(const TargetSelector&) = delete;
    TargetSelector& operator=(const TargetSelector&) = delete;

    /**
     * @brief Snapshot of the target to connect to.
     *
     * With a forced IP this is always the synthesized forced target, whose
     * last_seen is time_point::max().
     */
    std::optional<Target> select();

    /**
     * @brief Current target without synthesizing a forced one.
     */
    std::optional<Target> current() const;

    /**
     * @brief Merge or adopt a discovered candidate.
     */
    CandidateOutcome onCandidate(const Target& candidate);

    /**
     * @brief Drain @p queue on a background thread until stop().
     * @return False if already pumping.
     */
    bool start(std::shared_ptr<CandidateQueue> queue);

    /**
     * @brief Stop the pump thread. Idempotent.
     */
    void stop();

    const ForcedConfig& forced() const { return forced_; }

private:
    ForcedConfig forced_;
    std::shared_ptr<ConnectionStatus> status_;
    std::shared_ptr<EventSink> events_;

    mutable std::mutex mutex_;
    std::optional<Target> current_;

    // Forced-IP mode: what discovery told us about the forced device
    std::optional<uint16_t> announcedPort_;
    std::optional<std::string> announcedPath_;
    std::optional<std::string> announcedName_;

    std::mutex pumpMutex_;
    std::atomic<bool> pumping_{false};
    std::shared_ptr<CandidateQueue> queue_;
    std::thread pumpThread_;

    void pumpLoop();
    Target forcedTargetLocked() const;
};

}  // namespace core
}  // namespace airvol
