/**
 * @file discovery_listener.hpp
 * @brief UDP broadcast discovery of AirVol devices.
 *
 * The DiscoveryListener handles:
 * - Broadcasting discover probes every ~7s (with jitter)
 * - Receiving announce/response datagrams from devices
 * - Filtering by service name and forced name/ip
 * - Publishing accepted candidates to a bounded queue
 *
 * @copyright Copyright (c) 2025 AirVol Contributors
 * @license MIT License
 */

#pragma once

#include "airvol/core/bounded_queue.hpp"
#include "airvol/core/connection_state.hpp"
#include "airvol/core/export.hpp"
#include "airvol/core/target.hpp"
#include "airvol/net/udp_socket.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace airvol {
namespace core {

using CandidateQueue = BoundedQueue<Target>;

/**
 * @struct DiscoveryConfig
 * @brief Configuration for the discovery listener.
 */
struct AIRVOL_CORE_API DiscoveryConfig {
    std::string service_name;                   ///< Expected "service" field
    std::string bind_addr;                      ///< Local address to bind
    uint16_t listen_port;                       ///< Port to bind (0 = ephemeral)
    std::string probe_addr;                     ///< Probe destination (broadcast)
    uint16_t probe_port;                        ///< Probe destination port
    std::chrono::milliseconds discover_interval;
    std::chrono::milliseconds discover_jitter;  ///< Symmetric: +/- this much
    std::chrono::milliseconds min_interval;     ///< Floor after jitter
    std::chrono::milliseconds receive_timeout;  ///< Receive poll granularity
    std::chrono::milliseconds sleep_slice;      ///< Sender stop granularity
    size_t max_datagram;

    DiscoveryConfig()
        : service_name("airvol")
        , bind_addr("0.0.0.0")
        , listen_port(4210)
        , probe_addr("255.255.255.255")
        , probe_port(4210)
        , discover_interval(7000)
        , discover_jitter(300)
        , min_interval(1000)
        , receive_timeout(500)
        , sleep_slice(200)
        , max_datagram(4096)
    {}
};

/**
 * @class DiscoveryListener
 * @brief Finds devices announcing the AirVol service.
 *
 * Runs two background threads:
 * - Sender: broadcasts a probe at start, then every interval +/- jitter
 * - Receiver: decodes announces and publishes accepted candidates
 *
 * Both threads reach the socket through a mutex-guarded shared handle;
 * stop() detaches the handle and shuts it down, and the descriptor is closed
 * when the last in-flight call releases it.
 *
 * Usage:
 * @code
 * auto queue = std::make_shared<CandidateQueue>();
 * DiscoveryListener listener(DiscoveryConfig{}, ForcedConfig{}, queue);
 * listener.start();
 * // ... TargetSelector drains the queue ...
 * listener.stop();
 * @endcode
 */
class AIRVOL_CORE_API DiscoveryListener {
public:
    DiscoveryListener(const DiscoveryConfig& config,
                      const ForcedConfig& forced,
                      std::shared_ptr<CandidateQueue> candidates,
                      std::shared_ptr<EventSink> events = nullptr);

    /**
     * @brief Destructor - stops the listener if running.
     */
    ~DiscoveryListener();

    // Non-copyable
    DiscoveryListener(const DiscoveryListener&) = delete;
    DiscoveryListener& operator=(const DiscoveryListener&) = delete;

    /**
     * @brief Open and bind the socket, then launch both loops.
     * @return False if already running or the socket could not be set up.
     */
    bool start();

    /**
     * @brief Stop both loops and release the socket.
     *
     * Idempotent; returns within about one receive timeout.
     */
    void stop();

    bool isRunning() const { return running_.load(); }

    /**
     * @brief Port the socket is bound to, 0 when not running.
     */
    uint16_t getLocalPort() const;

    uint64_t probesSent() const { return probesSent_.load(); }
    uint64_t candidatesPublished() const { return candidatesPublished_.load(); }

    /**
     * @brief Handle one datagram as the receive loop does.
     * @return True if a candidate was published.
     */
    bool processDatagram(const std::string& datagram, const net::SocketAddress& sender);

private:
    DiscoveryConfig config_;
    ForcedConfig forced_;
    std::shared_ptr<CandidateQueue> candidates_;
    std::shared_ptr<EventSink> events_;

    mutable std::mutex socketMutex_;
    std::shared_ptr<net::UdpSocket> socket_;

    std::mutex lifecycleMutex_;
    std::atomic<bool> running_{false};
    std::thread senderThread_;
    std::thread receiverThread_;

    std::string probePayload_;
    std::atomic<uint64_t> probesSent_{0};
    std::atomic<uint64_t> candidatesPublished_{0};

    std::shared_ptr<net::UdpSocket> currentSocket() const;

    // Thread functions
    void senderLoop();
    void receiverLoop();

    bool sendProbe();
    void sleepInterruptible(std::chrono::milliseconds duration);
};

}  // namespace core
}  // namespace airvol
