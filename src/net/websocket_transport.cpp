/**
 * @file websocket_transport.cpp
 * @brief WebSocketTransport implementation.
 *
 * @copyright Copyright (c) 2025 AirVol Contributors
 * @license MIT License
 */

#include "airvol/net/websocket_transport.hpp"
#include "airvol/utils/logger.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <cctype>
#include <future>
#include <thread>

namespace airvol {
namespace net {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

constexpr size_t kMaxMessageSize = 1024 * 1024;

bool parsePortNumber(const std::string& text, uint16_t& port) {
    if (text.empty() || text.size() > 5) {
        return false;
    }
    unsigned long value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 10 + static_cast<unsigned long>(c - '0');
    }
    if (value == 0 || value > 65535) {
        return false;
    }
    port = static_cast<uint16_t>(value);
    return true;
}

}  // namespace

bool parseWebSocketUrl(const std::string& url, WebSocketUrl& out, std::string& error) {
    static const std::string kScheme = "ws://";

    if (url.compare(0, 6, "wss://") == 0) {
        error = "wss:// is not supported: " + url;
        return false;
    }
    if (url.compare(0, kScheme.size(), kScheme) != 0) {
        error = "not a ws:// URL: " + url;
        return false;
    }

    std::string rest = url.substr(kScheme.size());
    size_t slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    WebSocketUrl parsed;
    parsed.path = (slash == std::string::npos) ? "/" : rest.substr(slash);

    std::string portText;
    if (!authority.empty() && authority.front() == '[') {
        size_t close = authority.find(']');
        if (close == std::string::npos) {
            error = "unterminated IPv6 literal in " + url;
            return false;
        }
        parsed.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                error = "garbage after IPv6 literal in " + url;
                return false;
            }
            portText = authority.substr(close + 2);
            if (portText.empty()) {
                error = "empty port in " + url;
                return false;
            }
        }
    } else {
        size_t colon = authority.rfind(':');
        parsed.host = authority.substr(0, colon);
        if (colon != std::string::npos) {
            portText = authority.substr(colon + 1);
            if (portText.empty()) {
                error = "empty port in " + url;
                return false;
            }
        }
    }

    if (parsed.host.empty()) {
        error = "missing host in " + url;
        return false;
    }
    if (!portText.empty() && !parsePortNumber(portText, parsed.port)) {
        error = "invalid port '" + portText + "' in " + url;
        return false;
    }

    out = parsed;
    return true;
}

// =============================================================================
// Impl
// =============================================================================

struct WebSocketTransport::Impl {
    explicit Impl(const WebSocketOptions& opts)
        : options(opts)
        , work(asio::make_work_guard(ioc))
        , resolver(ioc)
        , ws(ioc)
    {
        WebSocketOptions decorate = options;
        ws.set_option(websocket::stream_base::decorator(
            [decorate](websocket::request_type& req) {
                req.set(http::field::user_agent, decorate.user_agent);
                if (!decorate.origin.empty()) {
                    req.set(http::field::origin, decorate.origin);
                }
            }));

        if (options.permessage_deflate) {
            websocket::permessage_deflate pmd;
            pmd.client_enable = true;
            ws.set_option(pmd);
        }
        ws.read_message_max(kMaxMessageSize);

        ioThread = std::thread([this] { run(); });
    }

    void run() {
        try {
            ioc.run();
        } catch (const std::exception& e) {
            LOG_ERROR("WebSocket", "I/O thread terminated: {}", e.what());
        }
    }

    /// Text for a failed operation; local close wins over whatever Beast reported.
    std::string describe(const beast::error_code& ec) const {
        if (closed.load()) {
            return "connection closed locally";
        }
        if (ec == beast::error::timeout) {
            return "timed out";
        }
        return ec.message();
    }

    WebSocketOptions options;
    asio::io_context ioc;
    asio::executor_work_guard<asio::io_context::executor_type> work;
    tcp::resolver resolver;
    websocket::stream<beast::tcp_stream> ws;
    beast::flat_buffer buffer;
    std::thread ioThread;
    std::atomic<bool> closed{false};
    std::atomic<bool> opened{false};
};

// =============================================================================
// WebSocketTransport
// =============================================================================

WebSocketTransport::WebSocketTransport(const WebSocketOptions& options)
    : impl_(std::make_unique<Impl>(options))
{}

WebSocketTransport::~WebSocketTransport() {
    close();
    impl_->work.reset();
    if (impl_->ioThread.joinable()) {
        impl_->ioThread.join();
    }
}

bool WebSocketTransport::open(const std::string& url,
                              std::chrono::milliseconds timeout,
                              std::string& error) {
    WebSocketUrl target;
    if (!parseWebSocketUrl(url, target, error)) {
        return false;
    }

    Impl& impl = *impl_;
    if (impl.opened.load()) {
        error = "transport already opened";
        return false;
    }

    std::promise<beast::error_code> done;
    auto future = done.get_future();
    const std::string port = std::to_string(target.port);

    LOG_DEBUG("WebSocket", "Connecting to {}", url);

    asio::post(impl.ioc, [&]() {
        if (impl.closed.load()) {
            done.set_value(asio::error::operation_aborted);
            return;
        }
        impl.resolver.async_resolve(target.host, port,
            [&](beast::error_code resolveEc, tcp::resolver::results_type results) {
                if (resolveEc || impl.closed.load()) {
                    done.set_value(resolveEc ? resolveEc : beast::error_code(asio::error::operation_aborted));
                    return;
                }
                // Covers the TCP connect and the upgrade request
                beast::get_lowest_layer(impl.ws).expires_after(timeout);
                beast::get_lowest_layer(impl.ws).async_connect(results,
                    [&](beast::error_code connectEc, tcp::resolver::results_type::endpoint_type) {
                        if (connectEc || impl.closed.load()) {
                            done.set_value(connectEc ? connectEc : beast::error_code(asio::error::operation_aborted));
                            return;
                        }
                        impl.ws.async_handshake(target.hostHeader(), target.path,
                            [&](beast::error_code handshakeEc) {
                                if (!handshakeEc) {
                                    beast::get_lowest_layer(impl.ws).expires_never();
                                    impl.ws.set_option(websocket::stream_base::timeout::suggested(
                                        beast::role_type::client));
                                }
                                done.set_value(handshakeEc);
                            });
                    });
            });
    });

    beast::error_code ec = future.get();
    if (ec) {
        error = impl.describe(ec);
        LOG_DEBUG("WebSocket", "Connect to {} failed: {}", url, error);
        return false;
    }

    impl.opened.store(true);
    LOG_DEBUG("WebSocket", "Handshake with {} complete", url);
    return true;
}

bool WebSocketTransport::read(Frame& frame, std::string& error) {
    std::lock_guard<std::mutex> lock(readMutex_);

    Impl& impl = *impl_;
    if (!impl.opened.load()) {
        error = "transport not open";
        return false;
    }

    std::promise<beast::error_code> done;
    auto future = done.get_future();
    Frame received;
    std::string peerClose;

    asio::post(impl.ioc, [&]() {
        if (impl.closed.load()) {
            done.set_value(asio::error::operation_aborted);
            return;
        }
        impl.ws.async_read(impl.buffer, [&](beast::error_code readEc, std::size_t) {
            if (!readEc) {
                received.data = beast::buffers_to_string(impl.buffer.data());
                received.binary = impl.ws.got_binary();
                impl.buffer.consume(impl.buffer.size());
            } else if (readEc == websocket::error::closed) {
                const websocket::close_reason& reason = impl.ws.reason();
                peerClose = "closed by peer (code " + std::to_string(reason.code);
                if (!reason.reason.empty()) {
                    peerClose += ", " + std::string(reason.reason.data(), reason.reason.size());
                }
                peerClose += ")";
            }
            done.set_value(readEc);
        });
    });

    beast::error_code ec = future.get();
    if (ec) {
        error = peerClose.empty() ? impl.describe(ec) : peerClose;
        return false;
    }

    frame = std::move(received);
    return true;
}

bool WebSocketTransport::send(const std::string& text, std::string& error) {
    std::lock_guard<std::mutex> lock(sendMutex_);

    Impl& impl = *impl_;
    if (!impl.opened.load()) {
        error = "transport not open";
        return false;
    }

    std::promise<beast::error_code> done;
    auto future = done.get_future();

    asio::post(impl.ioc, [&]() {
        if (impl.closed.load()) {
            done.set_value(asio::error::operation_aborted);
            return;
        }
        impl.ws.text(true);
        impl.ws.async_write(asio::buffer(text), [&](beast::error_code writeEc, std::size_t) {
            done.set_value(writeEc);
        });
    });

    beast::error_code ec = future.get();
    if (ec) {
        error = impl.describe(ec);
        return false;
    }
    return true;
}

void WebSocketTransport::close() {
    Impl& impl = *impl_;
    if (impl.closed.exchange(true)) {
        return;
    }

    asio::post(impl.ioc, [&impl]() {
        impl.resolver.cancel();
        // Aborts the pending connect, handshake, read and write
        beast::get_lowest_layer(impl.ws).close();
    });
}

TransportFactory WebSocketTransport::factory(const WebSocketOptions& options) {
    return [options]() -> std::unique_ptr<StreamTransport> {
        return std::make_unique<WebSocketTransport>(options);
    };
}

}  // namespace net
}  // namespace airvol
