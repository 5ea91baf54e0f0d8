/**
 * @file connection_supervisor.cpp
 * @brief ConnectionSupervisor implementation.
 *
 * @copyright Copyright (c) 2025 AirVol Contributors
 * @license MIT License
 */

#include "airvol/core/connection_supervisor.hpp"
#include "airvol/core/event_report.hpp"
#include "airvol/core/json_codec.hpp"
#include "airvol/utils/logger.hpp"
#include "airvol/utils/utf8.hpp"

#include "airvol/proto/wire.pb.h"

#include <algorithm>

namespace airvol {
namespace core {

using utils::LogLevel;
using std::chrono::milliseconds;

// =============================================================================
// Session
// =============================================================================

/**
 * One opened transport and the shared state of its three duties.
 * The first duty to call end() records the reason and closes the
 * transport, which unblocks the receive duty.
 */
struct ConnectionSupervisor::Session {
    using Clock = std::chrono::steady_clock;

    explicit Session(std::unique_ptr<net::StreamTransport> t)
        : transport(std::move(t))
        , lastReceive(Clock::now())
    {}

    bool end(const std::string& why) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (ended) {
                return false;
            }
            ended = true;
            reason = why;
        }
        cv.notify_all();
        transport->close();
        return true;
    }

    bool isEnded() {
        std::lock_guard<std::mutex> lock(mutex);
        return ended;
    }

    /// Wait up to @p duration; true if the session ended meanwhile.
    bool waitFor(milliseconds duration) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, duration, [this] { return ended; });
    }

    void touch() {
        std::lock_guard<std::mutex> lock(mutex);
        lastReceive = Clock::now();
    }

    milliseconds silence() {
        std::lock_guard<std::mutex> lock(mutex);
        return std::chrono::duration_cast<milliseconds>(Clock::now() - lastReceive);
    }

    std::string endReason() {
        std::lock_guard<std::mutex> lock(mutex);
        return reason;
    }

    std::unique_ptr<net::StreamTransport> transport;

    std::mutex mutex;
    std::condition_variable cv;
    bool ended = false;
    std::string reason;
    Clock::time_point lastReceive;
};

// =============================================================================
// ConnectionSupervisor
// =============================================================================

ConnectionSupervisor::ConnectionSupervisor(const SupervisorConfig& config,
                                           std::shared_ptr<TargetSelector> selector,
                                           std::shared_ptr<VolumeGate> gate,
                                           net::TransportFactory transportFactory,
                                           std::shared_ptr<ConnectionStatus> status,
                                           std::shared_ptr<EventSink> events)
    : config_(config)
    , selector_(std::move(selector))
    , gate_(std::move(gate))
    , transportFactory_(std::move(transportFactory))
    , status_(status ? std::move(status) : std::make_shared<ConnectionStatus>(events))
    , events_(std::move(events))
{
    wire::Heartbeat heartbeat;
    heartbeat.set_hb(1);
    if (!json::render(heartbeat, heartbeatPayload_)) {
        LOG_ERROR("Supervisor", "Failed to render heartbeat");
    }
}

ConnectionSupervisor::~ConnectionSupervisor() {
    stop();
}

bool ConnectionSupervisor::start() {
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);

    if (running_.load()) {
        LOG_WARN("Supervisor", "Already running");
        return false;
    }
    if (!selector_ || !transportFactory_) {
        LOG_ERROR("Supervisor", "Cannot start without a target selector and a transport");
        return false;
    }

    // Nothing to discover when the target is forced
    if (selector_->forced().hasForcedIp()) {
        status_->set(ConnectionState::connecting(*selector_->forced().forced_ip));
    } else {
        status_->set(ConnectionState::discovering());
    }

    running_.store(true);
    loopThread_ = std::thread(&ConnectionSupervisor::runLoop, this);

    LOG_INFO("Supervisor", "Started");
    return true;
}

void ConnectionSupervisor::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);

    bool wasRunning = running_.exchange(false);

    {
        std::lock_guard<std::mutex> lock(wakeMutex_);
    }
    wakeCv_.notify_all();

    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(sessionMutex_);
        session = activeSession_;
    }
    if (session) {
        session->end("stopped");
    }

    if (loopThread_.joinable()) {
        loopThread_.join();
    }

    if (wasRunning) {
        status_->set(ConnectionState::idle());
        report(events_.get(), LogLevel::INFO, "Supervisor", "Stopped");
    }
}

std::vector<std::string> ConnectionSupervisor::buildCandidateUrls(
    const Target& target, const std::optional<uint16_t>& forcedPort) {

    std::vector<uint16_t> ports;
    if (forcedPort) {
        ports.push_back(*forcedPort);
    }
    if (std::find(ports.begin(), ports.end(), target.ws_port) == ports.end()) {
        ports.push_back(target.ws_port);
    }

    std::vector<std::string> paths;
    if (target.path && !target.path->empty() && target.path->front() == '/') {
        paths.push_back(*target.path);
    }
    for (const char* fallback : {"/ws", "/"}) {
        if (std::find(paths.begin(), paths.end(), fallback) == paths.end()) {
            paths.push_back(fallback);
        }
    }

    std::vector<std::string> urls;
    urls.reserve(ports.size() * paths.size());
    for (uint16_t port : ports) {
        for (const auto& path : paths) {
            urls.push_back("ws://" + target.ip + ":" + std::to_string(port) + path);
        }
    }
    return urls;
}

void ConnectionSupervisor::runLoop() {
    LOG_DEBUG("Supervisor", "Loop thread started");

    RetryBackoff backoff(config_.retry);

    while (running_.load()) {
        auto target = selector_->select();
        if (!target) {
            status_->set(ConnectionState::waitingForTarget());
            sleepFor(config_.idle_poll);
            continue;
        }

        if (isStale(*target)) {
            if (status_->set(ConnectionState::waitingForTarget())) {
                report(events_.get(), LogLevel::INFO, "Supervisor",
                       "Target {} is stale, waiting for a fresh announce", target->label());
            }
            sleepFor(config_.idle_poll);
            continue;
        }

        auto urls = buildCandidateUrls(*target, selector_->forced().forced_port);
        bool opened = false;
        for (const auto& url : urls) {
            if (!running_.load()) {
                break;
            }
            status_->set(ConnectionState::connecting(url));
            report(events_.get(), LogLevel::INFO, "Supervisor", "Connecting to {} ...", url);
            if (runSession(url)) {
                opened = true;
                break;
            }
        }

        if (!running_.load()) {
            break;
        }
        if (opened) {
            backoff.reset();
            continue;
        }

        milliseconds delay = backoff.sleepDuration();
        status_->set(ConnectionState::reconnecting(delay));
        report(events_.get(), LogLevel::INFO, "Supervisor",
               "No candidate for {} answered, retrying in {} ms", target->label(), delay.count());
        sleepFor(delay);
        backoff.advance();
    }

    LOG_DEBUG("Supervisor", "Loop thread stopped");
}

bool ConnectionSupervisor::runSession(const std::string& url) {
    attempts_.fetch_add(1);

    std::unique_ptr<net::StreamTransport> transport = transportFactory_();
    if (!transport) {
        report(events_.get(), LogLevel::ERROR, "Session", "No transport for {}", url);
        return false;
    }

    auto session = std::make_shared<Session>(std::move(transport));
    {
        std::lock_guard<std::mutex> lock(sessionMutex_);
        if (!running_.load()) {
            return false;
        }
        activeSession_ = session;
    }

    auto release = [this]() {
        std::lock_guard<std::mutex> lock(sessionMutex_);
        activeSession_.reset();
    };

    std::string error;
    if (!session->transport->open(url, config_.connect_timeout, error)) {
        release();
        if (running_.load()) {
            report(events_.get(), LogLevel::WARN, "Session", "Connect to {} failed: {}", url, error);
        }
        return false;
    }

    sessionsOpened_.fetch_add(1);
    session->touch();
    status_->set(ConnectionState::connected(url));
    report(events_.get(), LogLevel::INFO, "Session", "Connected to {}", url);

    std::thread heartbeat(&ConnectionSupervisor::heartbeatDuty, this, std::ref(*session));
    std::thread watchdog(&ConnectionSupervisor::watchdogDuty, this, std::ref(*session));

    receiveDuty(*session);

    // All duties are gone before the next attempt may start
    session->end("session finished");
    heartbeat.join();
    watchdog.join();
    release();

    std::string reason = session->endReason();
    if (running_.load()) {
        status_->set(ConnectionState::error(reason));
        report(events_.get(), LogLevel::WARN, "Session", "Session with {} ended: {}", url, reason);
    } else {
        report(events_.get(), LogLevel::INFO, "Session", "Session with {} closed", url);
    }
    return true;
}

void ConnectionSupervisor::receiveDuty(Session& session) {
    net::Frame frame;
    std::string error;

    while (true) {
        if (!session.transport->read(frame, error)) {
            session.end("receive failed: " + error);
            return;
        }
        if (session.isEnded()) {
            return;
        }
        session.touch();

        if (frame.binary && !utils::isValidUtf8(frame.data)) {
            report(events_.get(), LogLevel::DEBUG, "Session",
                   "Dropped binary frame of {} bytes: not UTF-8", frame.data.size());
            continue;
        }

        LOG_TRACE("Session", "Frame: {}", frame.data);
        if (gate_) {
            gate_->process(frame.data);
        }
    }
}

void ConnectionSupervisor::heartbeatDuty(Session& session) {
    while (!session.waitFor(config_.heartbeat_interval)) {
        std::string error;
        if (!session.transport->send(heartbeatPayload_, error)) {
            session.end("heartbeat failed: " + error);
            return;
        }
        LOG_TRACE("Session", "Heartbeat sent");
    }
}

void ConnectionSupervisor::watchdogDuty(Session& session) {
    while (!session.waitFor(config_.watchdog_tick)) {
        milliseconds silence = session.silence();
        if (silence > config_.watchdog_timeout) {
            report(events_.get(), LogLevel::WARN, "Session",
                   "Watchdog: no message for {} ms, closing connection", silence.count());
            session.end("watchdog timeout after " + std::to_string(silence.count()) + " ms");
            return;
        }
    }
}

bool ConnectionSupervisor::isStale(const Target& target) const {
    if (selector_->forced().hasForcedIp()) {
        return false;
    }
    return Target::Clock::now() - target.last_seen > config_.stale_ttl;
}

bool ConnectionSupervisor::sleepFor(milliseconds duration) {
    std::unique_lock<std::mutex> lock(wakeMutex_);
    return !wakeCv_.wait_for(lock, duration, [this] { return !running_.load(); });
}

}  // namespace core
}  // namespace airvol
