#pragma once

#include <atomic>
#include <deque>
#include <memory>
#include <string>
#include <string_view>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/beast/websocket/stream.hpp>

#include "remauth/core/transport/error.hpp"
#include "remauth/core/transport/websocket/config.hpp"
#include "remauth/core/transport/websocket/events.hpp"
#include "remauth/core/transport/websocket_concept.hpp"
#include "lcr/lockfree/spsc_ring.hpp"

/*
================================================================================
WebSocket Transport (Boost.Beast over OpenSSL)
================================================================================

Single-connection transport primitive: no retries, no reconnection logic.
Recovery belongs to the remote-auth Session, which discards the transport and
builds a fresh one (with a fresh keypair) for every attempt.

Threading:
  • connect() runs on the caller thread and completes the TCP connect, TLS
    handshake (SNI + host name verification) and WebSocket upgrade.
  • A single IO thread then runs the io_context. It owns every stream
    operation: reads, queued writes and the closing handshake.
  • send() hands the frame to the IO thread via asio::post.
  • Inbound text frames and control events are handed back to the poll thread
    through SPSC rings.

Failure signaling:
  • Error is pushed before Close; Close is pushed exactly once.
  • A full frame ring is reported as Error(Backpressure) and closes the socket.
================================================================================
*/

namespace remauth::core::transport::beast {

class WebSocket {
    static constexpr std::size_t FRAME_RING_CAPACITY = 64;
    static constexpr std::size_t EVENT_RING_CAPACITY = 8;

    using tcp_stream = boost::beast::tcp_stream;
    using tls_stream = boost::beast::ssl_stream<tcp_stream>;
    using ws_stream  = boost::beast::websocket::stream<tls_stream>;

public:
    explicit WebSocket(const websocket::Config& cfg = {});
    ~WebSocket();

    WebSocket(const WebSocket&) = delete;
    WebSocket& operator=(const WebSocket&) = delete;

    [[nodiscard]]
    Error connect(const std::string& host, const std::string& port, const std::string& path) noexcept;

    [[nodiscard]]
    bool send(std::string_view msg) noexcept;

    void close() noexcept;

    [[nodiscard]]
    inline bool poll_message(std::string& out) noexcept {
        return frames_.pop(out);
    }

    [[nodiscard]]
    inline bool poll_event(websocket::Event& out) noexcept {
        return events_.pop(out);
    }

    [[nodiscard]]
    inline bool is_open() const noexcept {
        return open_.load(std::memory_order_acquire);
    }

private:
    // IO-thread handlers
    void do_read_();
    void on_read_(const boost::system::error_code& ec, std::size_t bytes);
    void do_write_();
    void on_write_(const boost::system::error_code& ec, std::size_t bytes);
    void do_close_();

    // Error classification (boost / OpenSSL -> transport::Error)
    [[nodiscard]]
    static Error classify_(const boost::system::error_code& ec) noexcept;

    void fail_(Error error) noexcept;
    void signal_close_() noexcept;

private:
    websocket::Config cfg_;

    boost::asio::io_context io_;
    boost::asio::ssl::context tls_ctx_;
    std::unique_ptr<ws_stream> ws_;
    boost::beast::flat_buffer rx_buffer_;

    // Owned by the IO thread after connect()
    std::deque<std::string> tx_queue_;

    std::thread io_thread_;
    std::atomic<bool> open_{false};
    std::atomic<bool> closing_{false};
    std::atomic<bool> closed_{false};

    lcr::lockfree::spsc_ring<std::string, FRAME_RING_CAPACITY> frames_;
    lcr::lockfree::spsc_ring<websocket::Event, EVENT_RING_CAPACITY> events_;
};

static_assert(WebSocketConcept<WebSocket>);

} // namespace remauth::core::transport::beast
