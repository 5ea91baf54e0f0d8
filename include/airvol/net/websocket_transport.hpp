/**
 * @file websocket_transport.hpp
 * @brief WebSocket client transport built on Boost.Beast.
 *
 * @copyright Copyright (c) 2025 AirVol Contributors
 * @license MIT License
 */

#pragma once

#include "airvol/net/export.hpp"
#include "airvol/net/stream_transport.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace airvol {
namespace net {

/**
 * @struct WebSocketUrl
 * @brief Parts of a "ws://host[:port][/path]" URL.
 */
struct AIRVOL_NET_API WebSocketUrl {
    std::string host;
    uint16_t port = 80;
    std::string path = "/";

    /// Value for the Host header.
    std::string hostHeader() const { return host + ":" + std::to_string(port); }
};

/**
 * @brief Split a ws:// URL.
 *
 * Only plain "ws" is supported; the devices do not speak TLS.
 * @return False with @p error set if @p url is malformed.
 */
AIRVOL_NET_API bool parseWebSocketUrl(const std::string& url,
                                      WebSocketUrl& out,
                                      std::string& error);

/**
 * @struct WebSocketOptions
 * @brief Handshake details sent to the device.
 */
struct AIRVOL_NET_API WebSocketOptions {
    std::string origin = "http://airvol.local";
    std::string user_agent = "airvold";
    bool permessage_deflate = true;
};

/**
 * @class WebSocketTransport
 * @brief StreamTransport over a Beast websocket stream.
 *
 * Every transport owns an io_context driven by its own thread. The
 * blocking calls post the matching async operation onto that thread and
 * wait for its completion, which keeps one read and one write in flight
 * at a time as the websocket stream requires. close() cancels everything
 * by closing the TCP socket.
 *
 * Usage:
 * @code
 * WebSocketTransport ws;
 * std::string error;
 * if (ws.open("ws://192.168.1.20:81/ws", std::chrono::seconds(15), error)) {
 *     Frame frame;
 *     while (ws.read(frame, error)) {
 *         // handle frame.data
 *     }
 * }
 * @endcode
 */
class AIRVOL_NET_API WebSocketTransport : public StreamTransport {
public:
    explicit WebSocketTransport(const WebSocketOptions& options = WebSocketOptions());
    ~WebSocketTransport() override;

    // Non-copyable
    WebSocketTransport(const WebSocketTransport&) = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;

    bool open(const std::string& url,
              std::chrono::milliseconds timeout,
              std::string& error) override;

    bool read(Frame& frame, std::string& error) override;

    bool send(const std::string& text, std::string& error) override;

    void close() override;

    /**
     * @brief Factory producing WebSocketTransports with @p options.
     */
    static TransportFactory factory(const WebSocketOptions& options = WebSocketOptions());

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;

    std::mutex readMutex_;
    std::mutex sendMutex_;
};

}  // namespace net
}  // namespace airvol
