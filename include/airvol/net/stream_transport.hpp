/**
 * @file stream_transport.hpp
 * @brief Message-oriented bidirectional transport used by a session.
 *
 * @copyright Copyright (c) 2025 AirVol Contributors
 * @license MIT License
 */

#pragma once

#include "airvol/net/export.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace airvol {
namespace net {

/**
 * @struct Frame
 * @brief One inbound message.
 */
struct AIRVOL_NET_API Frame {
    std::string data;
    bool binary = false;
};

/**
 * @class StreamTransport
 * @brief A single connection attempt and, if it opens, its session.
 *
 * read() and send() may be called concurrently from different threads.
 * close() may be called from any thread at any time, including while
 * open() or read() are blocked, and makes them return false promptly.
 * A transport is not reopened after close().
 */
class AIRVOL_NET_API StreamTransport {
public:
    virtual ~StreamTransport() = default;

    /**
     * @brief Connect and complete the handshake.
     * @param url Endpoint such as "ws://192.168.1.20:81/ws".
     * @param timeout Upper bound for connect and handshake.
     * @param error Output: description of the failure.
     */
    virtual bool open(const std::string& url,
                      std::chrono::milliseconds timeout,
                      std::string& error) = 0;

    /**
     * @brief Block until the next frame arrives.
     * @return False when the session ended; @p error says why.
     */
    virtual bool read(Frame& frame, std::string& error) = 0;

    /**
     * @brief Send a text frame.
     */
    virtual bool send(const std::string& text, std::string& error) = 0;

    /**
     * @brief Tear the connection down. Idempotent.
     */
    virtual void close() = 0;
};

/// Creates a fresh transport for every connection attempt.
using TransportFactory = std::function<std::unique_ptr<StreamTransport>()>;

}  // namespace net
}  // namespace airvol
