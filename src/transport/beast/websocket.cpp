#include "remauth/core/transport/beast/websocket.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/ssl.h>

#include "lcr/log/logger.hpp"


namespace remauth::core::transport::beast {

namespace asio = boost::asio;
namespace ssl  = boost::asio::ssl;
namespace bws  = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;
using boost::system::error_code;


WebSocket::WebSocket(const websocket::Config& cfg)
    : cfg_(cfg)
    , tls_ctx_(ssl::context::tls_client)
{
    error_code ec;
    if (cfg_.verify_peer) {
        tls_ctx_.set_default_verify_paths(ec);
        if (ec) {
            RA_WARN("[WS] Unable to load system CA certificates: " << ec.message());
        }
        tls_ctx_.set_verify_mode(ssl::verify_peer, ec);
    } else {
        RA_WARN("[WS] Peer verification disabled");
        tls_ctx_.set_verify_mode(ssl::verify_none, ec);
    }
}

WebSocket::~WebSocket() {
    close();
}


Error WebSocket::connect(const std::string& host, const std::string& port, const std::string& path) noexcept {
    if (ws_) {
        RA_WARN("[WS] connect() called on a transport that is already in use");
        return Error::InvalidState;
    }
    try {
        ws_ = std::make_unique<ws_stream>(io_, tls_ctx_);
    } catch (const std::exception& e) {
        RA_ERROR("[WS] Failed to create TLS stream: " << e.what());
        return Error::TransportFailure;
    }
    // SNI (required by most TLS front-ends)
    if (!SSL_set_tlsext_host_name(ws_->next_layer().native_handle(), host.c_str())) {
        RA_ERROR("[WS] Failed to set SNI host name '" << host << "'");
        ws_.reset();
        return Error::HandshakeFailed;
    }
    if (cfg_.verify_peer) {
        error_code ec;
        ws_->next_layer().set_verify_callback(ssl::host_name_verification(host), ec);
        if (ec) {
            RA_ERROR("[WS] Failed to install host name verification: " << ec.message());
            ws_.reset();
            return Error::HandshakeFailed;
        }
    }

    const std::string authority = (port == "443") ? host : host + ":" + port;
    auto& tcp_layer = boost::beast::get_lowest_layer(*ws_);
    tcp::resolver resolver(io_);

    Error result = Error::None;
    bool done = false;
    auto finish = [&](Error e, std::string_view stage, const error_code& ec) {
        if (e != Error::None) {
            RA_ERROR("[WS] " << stage << " failed for " << authority << ": " << ec.message());
        }
        result = e;
        done = true;
    };

    RA_DEBUG("[WS] Connecting to " << authority << path);

    // Resolve -> TCP connect -> TLS handshake -> WebSocket upgrade.
    // Runs on this thread; the IO thread is only started on success.
    resolver.async_resolve(host, port, [&](const error_code& ec, tcp::resolver::results_type endpoints) {
        if (ec) {
            return finish(Error::ConnectionFailed, "Resolve", ec);
        }
        tcp_layer.expires_after(cfg_.connect_timeout);
        tcp_layer.async_connect(endpoints, [&](const error_code& ec, const tcp::endpoint&) {
            if (ec) {
                return finish(ec == boost::beast::error::timeout ? Error::Timeout : Error::ConnectionFailed, "TCP connect", ec);
            }
            tcp_layer.expires_after(cfg_.connect_timeout);
            ws_->next_layer().async_handshake(ssl::stream_base::client, [&](const error_code& ec) {
                if (ec) {
                    return finish(ec == boost::beast::error::timeout ? Error::Timeout : Error::HandshakeFailed, "TLS handshake", ec);
                }
                // The websocket stream manages its own timeouts from here on
                tcp_layer.expires_never();
                // handshake_timeout also bounds the closing handshake
                const auto handshake_timeout = std::max(cfg_.connect_timeout, cfg_.close_timeout);
                bws::stream_base::timeout opt{
                    std::chrono::duration_cast<bws::stream_base::duration>(handshake_timeout),
                    bws::stream_base::none(),
                    false
                };
                ws_->set_option(opt);
                ws_->set_option(bws::stream_base::decorator(
                    [origin = cfg_.origin, agent = cfg_.user_agent](bws::request_type& req) {
                        req.set(boost::beast::http::field::origin, origin);
                        req.set(boost::beast::http::field::user_agent, agent);
                    }));
                ws_->text(true);
                ws_->async_handshake(authority, path, [&](const error_code& ec) {
                    if (ec) {
                        return finish(ec == boost::beast::error::timeout ? Error::Timeout : Error::HandshakeFailed, "WebSocket upgrade", ec);
                    }
                    finish(Error::None, "connect", ec);
                });
            });
        });
    });

    try {
        io_.restart();
        io_.run_for(cfg_.connect_timeout);
        if (!done) {
            // Deadline hit while resolving or handshaking: abort and drain
            resolver.cancel();
            error_code ignored;
            tcp_layer.socket().cancel(ignored);
            tcp_layer.socket().close(ignored);
            io_.restart();
            io_.run();
            RA_ERROR("[WS] Connect to " << authority << " timed out after " << cfg_.connect_timeout.count() << " ms");
            result = Error::Timeout;
        }
    } catch (const std::exception& e) {
        RA_ERROR("[WS] Unexpected exception while connecting: " << e.what());
        result = Error::TransportFailure;
    }

    if (result != Error::None) {
        ws_.reset();
        return result;
    }

    // Connected: hand the stream over to the IO thread
    open_.store(true, std::memory_order_release);
    closing_.store(false, std::memory_order_release);
    closed_.store(false, std::memory_order_release);
    io_.restart();
    asio::post(io_, [this] { do_read_(); });
    io_thread_ = std::thread([this] {
        try {
            io_.run();
        } catch (const std::exception& e) {
            RA_ERROR("[WS] IO thread terminated by exception: " << e.what());
            fail_(Error::TransportFailure);
            signal_close_();
        }
        open_.store(false, std::memory_order_release);
    });

    RA_INFO("[WS] Connected to " << authority << path);
    return Error::None;
}


bool WebSocket::send(std::string_view msg) noexcept {
    if (!open_.load(std::memory_order_acquire) || closing_.load(std::memory_order_acquire)) {
        RA_WARN("[WS] send() called on a closed WebSocket");
        return false;
    }
    RA_TRACE("[WS] Sending message (size " << msg.size() << ")");
    try {
        asio::post(io_, [this, frame = std::string(msg)]() mutable {
            tx_queue_.push_back(std::move(frame));
            if (tx_queue_.size() == 1) {
                do_write_();
            }
        });
    } catch (const std::exception& e) {
        RA_ERROR("[WS] Failed to queue outbound frame: " << e.what());
        return false;
    }
    return true;
}


void WebSocket::close() noexcept {
    if (!ws_) {
        signal_close_();
        return;
    }
    if (io_thread_.joinable()) {
        if (!closing_.exchange(true)) {
            RA_TRACE("[WS] Closing WebSocket ...");
            asio::post(io_, [this] { do_close_(); });
        }
        // Give the closing handshake a bounded amount of time
        const auto deadline = std::chrono::steady_clock::now() + cfg_.close_timeout;
        while (open_.load(std::memory_order_acquire) && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        if (open_.load(std::memory_order_acquire)) {
            RA_WARN("[WS] Closing handshake timed out, tearing down socket");
            io_.stop();
        }
        io_thread_.join();
    }
    open_.store(false, std::memory_order_release);
    signal_close_();
    ws_.reset();
    tx_queue_.clear();
    rx_buffer_.clear();
    RA_TRACE("[WS] WebSocket closed.");
}


// -----------------------------------------------------------------------------
// IO thread
// -----------------------------------------------------------------------------

void WebSocket::do_read_() {
    ws_->async_read(rx_buffer_, [this](const error_code& ec, std::size_t bytes) {
        on_read_(ec, bytes);
    });
}

void WebSocket::on_read_(const error_code& ec, std::size_t bytes) {
    if (ec) {
        const Error error = closing_.load(std::memory_order_acquire) ? Error::LocalShutdown : classify_(ec);
        if (error == Error::LocalShutdown) {
            RA_TRACE("[WS] Read loop stopped (local shutdown)");
        } else {
            if (error == Error::RemoteClosed) {
                RA_INFO("[WS] Connection closed by peer (" << ec.message() << ")");
            } else {
                RA_WARN("[WS] Receive failed: " << ec.message());
            }
            fail_(error);
        }
        signal_close_();
        return;
    }
    std::string frame = boost::beast::buffers_to_string(rx_buffer_.data());
    rx_buffer_.consume(bytes);
    RA_TRACE("[WS] Received message (size " << frame.size() << ")");
    if (!frames_.push(std::move(frame))) {
        RA_ERROR("[WS] Frame ring full (" << frames_.capacity() - 1 << " pending) - consumer is not polling");
        fail_(Error::Backpressure);
        closing_.store(true, std::memory_order_release);
        do_close_();
        return;
    }
    do_read_();
}

void WebSocket::do_write_() {
    ws_->async_write(asio::buffer(tx_queue_.front()), [this](const error_code& ec, std::size_t bytes) {
        on_write_(ec, bytes);
    });
}

void WebSocket::on_write_(const error_code& ec, std::size_t bytes) {
    if (ec) {
        if (!closing_.load(std::memory_order_acquire)) {
            RA_ERROR("[WS] Send failed: " << ec.message());
            fail_(classify_(ec));
        }
        tx_queue_.clear();
        return;
    }
    RA_TRACE("[WS] Sent " << bytes << " bytes");
    tx_queue_.pop_front();
    if (!tx_queue_.empty()) {
        do_write_();
    }
}

void WebSocket::do_close_() {
    if (!ws_->is_open()) {
        return;
    }
    ws_->async_close(bws::close_code::normal, [](const error_code& ec) {
        if (ec) {
            RA_DEBUG("[WS] Closing handshake ended with: " << ec.message());
        }
    });
}


Error WebSocket::classify_(const error_code& ec) noexcept {
    if (ec == asio::error::operation_aborted) {
        return Error::LocalShutdown;
    }
    if (ec == bws::error::closed ||
        ec == asio::error::eof ||
        ec == asio::error::connection_reset ||
        ec == ssl::error::stream_truncated) {
        return Error::RemoteClosed;
    }
    if (ec == boost::beast::error::timeout || ec == asio::error::timed_out) {
        return Error::Timeout;
    }
    if (ec.category() == bws::make_error_code(bws::error::closed).category()) {
        return Error::ProtocolError;
    }
    return Error::TransportFailure;
}

void WebSocket::fail_(Error error) noexcept {
    if (!events_.push(websocket::Event::make_error(error))) {
        RA_FATAL("[WS] Control event ring full - dropping error '" << to_string(error) << "'");
    }
}

void WebSocket::signal_close_() noexcept {
    if (closed_.exchange(true)) {
        return;
    }
    if (!events_.push(websocket::Event::make_close())) {
        RA_FATAL("[WS] Control event ring full - dropping close event");
    }
}

} // namespace remauth::core::transport::beast
