/**
 * @file udp_socket.cpp
 * @brief UDP socket implementation over BSD sockets and Winsock.
 *
 * @copyright Copyright (c) 2025 AirVol Contributors
 * @license MIT License
 */

#include "airvol/net/udp_socket.hpp"
#include "airvol/utils/logger.hpp"

#include <utility>

namespace airvol {
namespace net {

namespace {

bool toSockaddr(const SocketAddress& address, sockaddr_in& out) {
    out = sockaddr_in{};
    out.sin_family = AF_INET;
    out.sin_port = htons(address.port);
    if (address.ip.empty() || address.ip == "0.0.0.0") {
        out.sin_addr.s_addr = htonl(INADDR_ANY);
        return true;
    }
    return inet_pton(AF_INET, address.ip.c_str(), &out.sin_addr) == 1;
}

SocketAddress fromSockaddr(const sockaddr_in& addr) {
    char text[INET_ADDRSTRLEN] = {0};
    SocketAddress result;
    result.ip = inet_ntop(AF_INET, &addr.sin_addr, text, sizeof(text)) ? text : "";
    result.port = ntohs(addr.sin_port);
    return result;
}

}  // namespace

UdpSocket::UdpSocket(size_t maxDatagram)
    : socket_(INVALID_SOCKET_HANDLE)
    , lastError_(0)
    , buffer_(maxDatagram > 0 ? maxDatagram : kDefaultMaxDatagram)
{
    if (!ensureSocketsInitialized()) {
        fail();
        LOG_ERROR("UdpSocket", "Socket subsystem unavailable: {}",
                  utils::describeError(lastError_.load()));
        return;
    }

    socket_ = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (!isValid()) {
        fail();
        LOG_ERROR("UdpSocket", "Failed to create socket: {}",
                  utils::describeError(lastError_.load()));
    }
}

UdpSocket::~UdpSocket() {
    close();
}

UdpSocket::UdpSocket(UdpSocket&& other) noexcept
    : socket_(std::exchange(other.socket_, INVALID_SOCKET_HANDLE))
    , lastError_(other.lastError_.load())
    , buffer_(std::move(other.buffer_))
{}

UdpSocket& UdpSocket::operator=(UdpSocket&& other) noexcept {
    if (this != &other) {
        close();
        socket_ = std::exchange(other.socket_, INVALID_SOCKET_HANDLE);
        lastError_.store(other.lastError_.load());
        buffer_ = std::move(other.buffer_);
    }
    return *this;
}

bool UdpSocket::fail() {
    lastError_.store(getLastSocketError());
    return false;
}

bool UdpSocket::bind(const SocketAddress& local) {
    if (!isValid()) {
        return false;
    }

    sockaddr_in addr;
    if (!toSockaddr(local, addr)) {
        LOG_ERROR("UdpSocket", "Invalid bind address: {}", local.ip);
        return false;
    }

    if (::bind(socket_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        fail();
        LOG_ERROR("UdpSocket", "Failed to bind to {}: {}",
                  local.toString(), utils::describeError(lastError_.load()));
        return false;
    }

    LOG_DEBUG("UdpSocket", "Bound to {}:{}", local.ip, getLocalPort());
    return true;
}

uint16_t UdpSocket::getLocalPort() const {
    if (!isValid()) {
        return 0;
    }

    sockaddr_in addr{};
    SocketLength length = sizeof(addr);
    if (::getsockname(socket_, reinterpret_cast<sockaddr*>(&addr), &length) != 0) {
        return 0;
    }
    return ntohs(addr.sin_port);
}

bool UdpSocket::enableAddressReuse() {
    if (!isValid()) {
        return false;
    }
    if (!setSocketFlag(socket_, SO_REUSEADDR, true)) {
        return fail();
    }
#ifdef SO_REUSEPORT
    if (!setSocketFlag(socket_, SO_REUSEPORT, true)) {
        LOG_DEBUG("UdpSocket", "SO_REUSEPORT unavailable: {}",
                  utils::describeError(getLastSocketError()));
    }
#endif
    return true;
}

bool UdpSocket::enableBroadcast() {
    if (!isValid()) {
        return false;
    }
    return setSocketFlag(socket_, SO_BROADCAST, true) || fail();
}

bool UdpSocket::sendTo(const SocketAddress& dest, const std::string& datagram) {
    if (!isValid()) {
        return false;
    }

    sockaddr_in addr;
    if (!toSockaddr(dest, addr)) {
        LOG_ERROR("UdpSocket", "Invalid destination address: {}", dest.ip);
        return false;
    }

#ifdef _WIN32
    int sent = ::sendto(socket_, datagram.data(), static_cast<int>(datagram.size()), 0,
                        reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
#else
    ssize_t sent = ::sendto(socket_, datagram.data(), datagram.size(), 0,
                            reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
#endif
    if (sent < 0) {
        return fail();
    }
    return static_cast<size_t>(sent) == datagram.size();
}

ReceiveStatus UdpSocket::receive(std::string& datagram, SocketAddress& sender,
                                 std::chrono::milliseconds timeout) {
    if (!isValid()) {
        return ReceiveStatus::FAILED;
    }

    if (timeout.count() >= 0) {
        fd_set readSet;
        FD_ZERO(&readSet);
        FD_SET(socket_, &readSet);

        timeval tv;
        tv.tv_sec = static_cast<long>(timeout.count() / 1000);
        tv.tv_usec = static_cast<long>((timeout.count() % 1000) * 1000);

        int ready = ::select(selectWidth(socket_), &readSet, nullptr, nullptr, &tv);
        if (ready == 0) {
            return ReceiveStatus::TIMEOUT;
        }
        if (ready < 0) {
            fail();
            return isTransientSocketError(lastError_.load())
                ? ReceiveStatus::TRANSIENT : ReceiveStatus::FAILED;
        }
    }

    sockaddr_in addr{};
    SocketLength length = sizeof(addr);
#ifdef _WIN32
    int received = ::recvfrom(socket_, buffer_.data(), static_cast<int>(buffer_.size()), 0,
                              reinterpret_cast<sockaddr*>(&addr), &length);
#else
    ssize_t received = ::recvfrom(socket_, buffer_.data(), buffer_.size(), 0,
                                  reinterpret_cast<sockaddr*>(&addr), &length);
#endif
    if (received < 0) {
        fail();
        return isTransientSocketError(lastError_.load())
            ? ReceiveStatus::TRANSIENT : ReceiveStatus::FAILED;
    }

    datagram.assign(buffer_.data(), static_cast<size_t>(received));
    sender = fromSockaddr(addr);
    return ReceiveStatus::DATAGRAM;
}

void UdpSocket::shutdown() {
    if (isValid()) {
        // Unconnected UDP sockets report ENOTCONN here but still wake readers
        shutdownSocket(socket_);
    }
}

void UdpSocket::close() {
    if (isValid()) {
        closeSocket(socket_);
        socket_ = INVALID_SOCKET_HANDLE;
    }
}

}  // namespace net
}  // namespace airvol
