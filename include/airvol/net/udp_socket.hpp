/**
 * @file udp_socket.hpp
 * @brief IPv4 UDP datagram socket used for discovery.
 *
 * @copyright Copyright (c) 2025 AirVol Contributors
 * @license MIT License
 */

#pragma once

#include "airvol/net/export.hpp"
#include "airvol/net/platform.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace airvol {
namespace net {

/**
 * @struct SocketAddress
 * @brief IPv4 address and port. The default is the wildcard 0.0.0.0:0.
 */
struct AIRVOL_NET_API SocketAddress {
    std::string ip;
    uint16_t port;

    SocketAddress() : ip("0.0.0.0"), port(0) {}
    SocketAddress(const std::string& ip_, uint16_t port_) : ip(ip_), port(port_) {}

    std::string toString() const { return ip + ":" + std::to_string(port); }

    bool operator==(const SocketAddress& other) const {
        return ip == other.ip && port == other.port;
    }
};

/**
 * @enum ReceiveStatus
 * @brief Outcome of UdpSocket::receive().
 */
enum class ReceiveStatus {
    DATAGRAM,   ///< A datagram was stored (it may be empty)
    TIMEOUT,    ///< Nothing arrived in time
    TRANSIENT,  ///< Interrupted or a stale ICMP error; retry
    FAILED      ///< Socket unusable; see getLastError()
};

/**
 * @class UdpSocket
 * @brief RAII UDP socket with broadcast, address reuse and timed receive.
 *
 * The socket may be shared between a sending and a receiving thread.
 * shutdown() wakes a blocked receive without releasing the descriptor;
 * close() and the destructor release it and must only run once no other
 * thread uses the socket. Only one thread may call receive() at a time.
 *
 * @code
 * UdpSocket sock;
 * sock.enableBroadcast();
 * sock.bind(SocketAddress("0.0.0.0", 4210));
 * sock.sendTo(SocketAddress("255.255.255.255", 4210), probe);
 *
 * std::string datagram;
 * SocketAddress sender;
 * if (sock.receive(datagram, sender, std::chrono::milliseconds(500))
 *         == ReceiveStatus::DATAGRAM) { ... }
 * @endcode
 */
class AIRVOL_NET_API UdpSocket {
public:
    static constexpr size_t kDefaultMaxDatagram = 2048;

    /**
     * @param maxDatagram Longer datagrams are truncated on receive.
     */
    explicit UdpSocket(size_t maxDatagram = kDefaultMaxDatagram);
    ~UdpSocket();

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;
    UdpSocket(UdpSocket&& other) noexcept;
    UdpSocket& operator=(UdpSocket&& other) noexcept;

    bool isValid() const { return socket_ != INVALID_SOCKET_HANDLE; }
    SocketHandle handle() const { return socket_; }

    /**
     * @brief Bind to a local address. Port 0 picks an ephemeral port.
     */
    bool bind(const SocketAddress& local);

    /**
     * @brief Port the socket is bound to, or 0.
     */
    uint16_t getLocalPort() const;

    /**
     * @brief SO_REUSEADDR, plus SO_REUSEPORT where the platform has it.
     * Call before bind().
     */
    bool enableAddressReuse();

    bool enableBroadcast();

    /**
     * @brief Send one datagram. True only if all of it was handed to the stack.
     */
    bool sendTo(const SocketAddress& dest, const std::string& datagram);

    /**
     * @brief Wait up to @p timeout for one datagram.
     *
     * A negative timeout waits indefinitely.
     */
    ReceiveStatus receive(std::string& datagram, SocketAddress& sender,
                          std::chrono::milliseconds timeout);

    void shutdown();
    void close();

    /**
     * @brief Platform error code of the last failed call.
     */
    int getLastError() const { return lastError_.load(); }

private:
    bool fail();

    SocketHandle socket_;
    std::atomic<int> lastError_;
    std::vector<char> buffer_;
};

}  // namespace net
}  // namespace airvol
