/**
 * @file discovery_listener.cpp
 * @brief DiscoveryListener implementation.
 *
 * @copyright Copyright (c) 2025 AirVol Contributors
 * @license MIT License
 */

#include "airvol/core/discovery_listener.hpp"
#include "airvol/core/announce.hpp"
#include "airvol/core/event_report.hpp"
#include "airvol/core/json_codec.hpp"
#include "airvol/utils/logger.hpp"

#include "airvol/proto/wire.pb.h"

#include <algorithm>
#include <random>

namespace airvol {
namespace core {

using utils::LogLevel;

DiscoveryListener::DiscoveryListener(const DiscoveryConfig& config,
                                     const ForcedConfig& forced,
                                     std::shared_ptr<CandidateQueue> candidates,
                                     std::shared_ptr<EventSink> events)
    : config_(config)
    , forced_(forced)
    , candidates_(std::move(candidates))
    , events_(std::move(events))
{
    wire::DiscoveryProbe probe;
    probe.set_type("discover");
    probe.set_service(config_.service_name);
    if (!json::render(probe, probePayload_)) {
        LOG_ERROR("Discovery", "Failed to render discover probe");
    }

    LOG_DEBUG("Discovery", "Created listener for service '{}' on port {}",
              config_.service_name, config_.listen_port);
}

DiscoveryListener::~DiscoveryListener() {
    stop();
}

bool DiscoveryListener::start() {
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);

    if (running_.load()) {
        LOG_WARN("Discovery", "Listener already running");
        return false;
    }

    auto socket = std::make_shared<net::UdpSocket>(config_.max_datagram);
    if (!socket->isValid()) {
        report(events_.get(), LogLevel::ERROR, "Discovery", "Socket open failed: {}",
               utils::describeError(socket->getLastError()));
        return false;
    }

    if (!socket->enableBroadcast()) {
        report(events_.get(), LogLevel::WARN, "Discovery", "SO_BROADCAST failed: {}",
               utils::describeError(socket->getLastError()));
    }

    if (!socket->enableAddressReuse()) {
        report(events_.get(), LogLevel::WARN, "Discovery", "SO_REUSEADDR failed: {}",
               utils::describeError(socket->getLastError()));
    }

    if (!socket->bind(net::SocketAddress(config_.bind_addr, config_.listen_port))) {
        report(events_.get(), LogLevel::ERROR, "Discovery", "Bind to {}:{} failed: {}",
               config_.bind_addr, config_.listen_port,
               utils::describeError(socket->getLastError()));
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(socketMutex_);
        socket_ = socket;
    }

    running_.store(true);

    // Start threads
    senderThread_ = std::thread(&DiscoveryListener::senderLoop, this);
    receiverThread_ = std::thread(&DiscoveryListener::receiverLoop, this);

    report(events_.get(), LogLevel::INFO, "Discovery",
           "Listening on UDP {}:{} (broadcast enabled)",
           config_.bind_addr, socket->getLocalPort());
    return true;
}

void DiscoveryListener::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);

    running_.store(false);

    std::shared_ptr<net::UdpSocket> socket;
    {
        std::lock_guard<std::mutex> lock(socketMutex_);
        socket.swap(socket_);
    }
    if (socket) {
        // Wake the receiver; the descriptor closes with the last reference
        socket->shutdown();
    }

    bool joined = false;
    if (senderThread_.joinable()) {
        senderThread_.join();
        joined = true;
    }
    if (receiverThread_.joinable()) {
        receiverThread_.join();
        joined = true;
    }

    if (joined) {
        LOG_INFO("Discovery", "Listener stopped");
    }
}

uint16_t DiscoveryListener::getLocalPort() const {
    auto socket = currentSocket();
    return socket ? socket->getLocalPort() : 0;
}

std::shared_ptr<net::UdpSocket> DiscoveryListener::currentSocket() const {
    std::lock_guard<std::mutex> lock(socketMutex_);
    return socket_;
}

void DiscoveryListener::senderLoop() {
    LOG_DEBUG("Discovery", "Sender thread started");

    std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<long long> jitter(
        -config_.discover_jitter.count(), config_.discover_jitter.count());

    sendProbe();

    while (running_.load()) {
        auto delay = std::max(config_.min_interval,
                              config_.discover_interval + std::chrono::milliseconds(jitter(rng)));
        sleepInterruptible(delay);
        if (!running_.load()) {
            break;
        }
        sendProbe();
    }

    LOG_DEBUG("Discovery", "Sender thread stopped");
}

void DiscoveryListener::receiverLoop() {
    LOG_DEBUG("Discovery", "Receiver thread started");

    std::string datagram;

    while (running_.load()) {
        auto socket = currentSocket();
        if (!socket) {
            break;
        }

        net::SocketAddress sender;
        switch (socket->receive(datagram, sender, config_.receive_timeout)) {
            case net::ReceiveStatus::DATAGRAM:
                // Zero-length reads also signal a shutdown socket
                if (!datagram.empty() && running_.load()) {
                    LOG_TRACE("Discovery", "Datagram from {} ({} bytes)",
                              sender.toString(), datagram.size());
                    processDatagram(datagram, sender);
                }
                break;
            case net::ReceiveStatus::TIMEOUT:
            case net::ReceiveStatus::TRANSIENT:
                break;
            case net::ReceiveStatus::FAILED:
                if (!running_.load()) {
                    break;
                }
                report(events_.get(), LogLevel::WARN, "Discovery", "Receive failed: {}",
                       utils::describeError(socket->getLastError()));
                sleepInterruptible(std::chrono::milliseconds(100));
                break;
        }
    }

    LOG_DEBUG("Discovery", "Receiver thread stopped");
}

bool DiscoveryListener::sendProbe() {
    auto socket = currentSocket();
    if (!socket || probePayload_.empty()) {
        return false;
    }

    net::SocketAddress dest(config_.probe_addr, config_.probe_port);
    probesSent_.fetch_add(1);
    if (!socket->sendTo(dest, probePayload_)) {
        probesSent_.fetch_sub(1);
        report(events_.get(), LogLevel::WARN, "Discovery", "Probe send to {} failed: {}",
               dest.toString(), utils::describeError(socket->getLastError()));
        return false;
    }

    report(events_.get(), LogLevel::DEBUG, "Discovery", "Discover probe sent ({} bytes)", probePayload_.size());
    return true;
}

bool DiscoveryListener::processDatagram(const std::string& datagram,
                                        const net::SocketAddress& sender) {
    AnnounceResult result = parseAnnounce(datagram, sender.ip, config_.service_name);

    switch (result.status) {
        case AnnounceStatus::PROBE:
            return false;

        case AnnounceStatus::REJECTED:
            report(events_.get(), LogLevel::DEBUG, "Discovery", "Dropped datagram from {}: {}",
                   sender.ip, result.reason);
            return false;

        case AnnounceStatus::ACCEPTED:
            break;
    }

    const Target& candidate = result.candidate;
    if (!forced_.admits(candidate)) {
        report(events_.get(), LogLevel::DEBUG, "Discovery",
               "Dropped {} at {}:{}: does not match forced name/ip",
               candidate.name.value_or("<unnamed>"), candidate.ip, candidate.ws_port);
        return false;
    }

    // Counted before the candidate becomes visible to consumers
    candidatesPublished_.fetch_add(1);
    if (candidates_) {
        EnqueueResult queued = candidates_->enqueue(candidate);
        if (queued == EnqueueResult::CLOSED) {
            candidatesPublished_.fetch_sub(1);
            return false;
        }
        if (queued == EnqueueResult::DROPPED_OLDEST) {
            LOG_DEBUG("Discovery", "Candidate queue full, oldest candidate dropped");
        }
    }

    report(events_.get(), LogLevel::INFO, "Discovery", "Candidate selected -> {} ({}:{})",
           candidate.label(), candidate.ip, candidate.ws_port);
    return true;
}

void DiscoveryListener::sleepInterruptible(std::chrono::milliseconds duration) {
    auto remaining = duration;
    while (remaining.count() > 0 && running_.load()) {
        auto slice = std::min(remaining, config_.sleep_slice);
        std::this_thread::sleep_for(slice);
        remaining -= slice;
    }
}

}  // namespace core
}  // namespace airvol
