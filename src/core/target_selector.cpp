/**
 * @file target_selector.cpp
 * @brief TargetSelector implementation.
 *
 * @copyright Copyright (c) 2025 AirVol Contributors
 * @license MIT License
 */

#include "airvol/core/target_selector.hpp"
#include "airvol/core/event_report.hpp"
#include "airvol/utils/logger.hpp"

#include <algorithm>

namespace airvol {
namespace core {

using utils::LogLevel;

namespace {
constexpr std::chrono::milliseconds kPumpPoll{200};
}

TargetSelector::TargetSelector(const ForcedConfig& forced,
                               std::shared_ptr<ConnectionStatus> status,
                               std::shared_ptr<EventSink> events)
    : forced_(forced)
    , status_(std::move(status))
    , events_(std::move(events))
{}

TargetSelector::~TargetSelector() {
    stop();
}

std::optional<Target> TargetSelector::select() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (forced_.hasForcedIp()) {
        Target forced = forcedTargetLocked();
        if (!current_ || *current_ != forced) {
            current_ = forced;
            LOG_DEBUG("Selector", "Forced target {}:{}", forced.ip, forced.ws_port);
        }
        return forced;
    }

    return current_;
}

std::optional<Target> TargetSelector::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

CandidateOutcome TargetSelector::onCandidate(const Target& candidate) {
    if (!forced_.admits(candidate)) {
        LOG_DEBUG("Selector", "Ignoring {} at {}: forced filter", candidate.label(), candidate.ip);
        return CandidateOutcome::FILTERED;
    }

    std::unique_lock<std::mutex> lock(mutex_);

    if (forced_.hasForcedIp()) {
        // The forced target is rebuilt by select(); keep only what it can use
        announcedPort_ = candidate.ws_port;
        if (candidate.path) announcedPath_ = candidate.path;
        if (candidate.name) announcedName_ = candidate.name;
        return CandidateOutcome::HINTED;
    }

    if (current_ && current_->sameDevice(candidate)) {
        Target merged = candidate;
        if (!merged.name) merged.name = current_->name;
        if (!merged.path) merged.path = current_->path;
        merged.last_seen = std::max(current_->last_seen, candidate.last_seen);
        current_ = merged;
        LOG_TRACE("Selector", "Refreshed {}", merged.label());
        return CandidateOutcome::REFRESHED;
    }

    current_ = candidate;
    lock.unlock();

    // A session to the previous target keeps running until it fails on its own
    if (status_) {
        status_->markDiscoveringUnlessActive();
    }
    report(events_.get(), LogLevel::INFO, "Selector", "Target selected -> {} ({}:{})",
           candidate.label(), candidate.ip, candidate.ws_port);
    return CandidateOutcome::REPLACED;
}

bool TargetSelector::start(std::shared_ptr<CandidateQueue> queue) {
    std::lock_guard<std::mutex> lifecycle(pumpMutex_);

    if (pumping_.load() || !queue) {
        return false;
    }

    queue_ = std::move(queue);
    pumping_.store(true);
    pumpThread_ = std::thread(&TargetSelector::pumpLoop, this);
    return true;
}

void TargetSelector::stop() {
    std::lock_guard<std::mutex> lifecycle(pumpMutex_);

    pumping_.store(false);
    if (pumpThread_.joinable()) {
        pumpThread_.join();
    }
    queue_.reset();
}

void TargetSelector::pumpLoop() {
    LOG_DEBUG("Selector", "Pump thread started");

    while (pumping_.load()) {
        auto candidate = queue_->dequeueFor(kPumpPoll);
        if (candidate) {
            onCandidate(*candidate);
        } else if (queue_->isClosed() && queue_->empty()) {
            break;
        }
    }

    LOG_DEBUG("Selector", "Pump thread stopped");
}

Target TargetSelector::forcedTargetLocked() const {
    Target forced;
    forced.ip = *forced_.forced_ip;
    forced.ws_port = forced_.forced_port.value_or(announcedPort_.value_or(kFallbackWsPort));
    forced.name = forced_.forced_name ? forced_.forced_name : announcedName_;
    forced.path = announcedPath_;
    forced.last_seen = Target::Clock::time_point::max();
    return forced;
}

}  // namespace core
}  // namespace airvol
