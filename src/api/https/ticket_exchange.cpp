#include "remauth/core/api/https/ticket_exchange.hpp"

#include <exception>
#include <string_view>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/ssl.h>

#include "remauth/core/api/parser/remote_auth_login.hpp"
#include "remauth/core/config/gateway.hpp"
#include "lcr/log/logger.hpp"


namespace remauth::core::api::https {

namespace asio = boost::asio;
namespace ssl  = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;
using boost::system::error_code;


TicketExchange::TicketExchange(const Config& cfg)
    : cfg_(cfg)
    , tls_ctx_(ssl::context::tls_client)
{
    error_code ec;
    if (cfg_.verify_peer) {
        tls_ctx_.set_default_verify_paths(ec);
        if (ec) {
            RA_WARN("[API] Unable to load system CA certificates: " << ec.message());
        }
        tls_ctx_.set_verify_mode(ssl::verify_peer, ec);
    } else {
        RA_WARN("[API] Peer verification disabled");
        tls_ctx_.set_verify_mode(ssl::verify_none, ec);
    }
}


Error TicketExchange::exchange(const std::string& ticket, schema::LoginResponse& out) noexcept {
    last_status_ = 0;
    last_api_error_.reset();

    transport::ParsedUrl url;
    if (transport::parse_url(cfg_.base_url, url) != transport::Error::None || url.scheme != transport::Scheme::Https) {
        RA_ERROR("[API] Invalid API base URL: " << cfg_.base_url << " (expected https://host[:port]/prefix)");
        return Error::InvalidUrl;
    }

    std::string target;
    std::string body;
    try {
        target = url.path;
        if (!target.empty() && target.back() == '/') {
            target.pop_back();
        }
        target += config::api::REMOTE_AUTH_LOGIN;
        body = schema::LoginRequest{ticket}.to_json();
    } catch (const std::exception& e) {
        RA_ERROR("[API] Failed to build ticket exchange request: " << e.what());
        return Error::Transport;
    }

    RA_DEBUG("[API] POST " << url.authority() << target);

    unsigned status = 0;
    std::string response;
    const Error err = post_(url, target, body, status, response);
    if (err != Error::None) {
        return err;
    }
    last_status_ = status;

    const Error result = parser::classify_login_response(json_, status, response, out, last_api_error_);
    switch (result) {
        case Error::None:
            RA_INFO("[API] Ticket exchanged (HTTP " << status << ")");
            break;
        case Error::Rejected:
            RA_ERROR("[API] Ticket exchange rejected (HTTP " << status << "): " << last_api_error_);
            break;
        case Error::InvalidResponse:
            RA_ERROR("[API] Ticket exchange returned HTTP " << status << " with an unexpected body");
            break;
        default:
            RA_ERROR("[API] Ticket exchange failed with HTTP " << status);
            break;
    }
    return result;
}


Error TicketExchange::post_(const transport::ParsedUrl& url, const std::string& target, const std::string& body, unsigned& status, std::string& response) noexcept {
    try {
        boost::beast::ssl_stream<boost::beast::tcp_stream> stream(io_, tls_ctx_);
        // SNI (required by most TLS front-ends)
        if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
            RA_ERROR("[API] Failed to set SNI host name '" << url.host << "'");
            return Error::Transport;
        }
        if (cfg_.verify_peer) {
            stream.set_verify_callback(ssl::host_name_verification(url.host));
        }

        http::request<http::string_body> req{http::verb::post, target, 11};
        req.set(http::field::host, url.authority());
        req.set(http::field::user_agent, cfg_.user_agent);
        req.set(http::field::origin, cfg_.origin);
        req.set(http::field::content_type, "application/json");
        req.set(http::field::accept, "application/json");
        req.body() = body;
        req.prepare_payload();

        boost::beast::flat_buffer buffer;
        http::response_parser<http::string_body> parser;
        parser.body_limit(config::api::MAX_BODY_SIZE);

        auto& tcp_layer = boost::beast::get_lowest_layer(stream);
        tcp::resolver resolver(io_);

        Error result = Error::None;
        bool done = false;
        auto finish = [&](Error e, std::string_view stage, const error_code& ec) {
            if (e != Error::None) {
                RA_ERROR("[API] " << stage << " failed for " << url.authority() << ": " << ec.message());
            }
            result = e;
            done = true;
        };

        // Resolve -> TCP connect -> TLS handshake -> write request -> read response
        resolver.async_resolve(url.host, url.port, [&](const error_code& ec, tcp::resolver::results_type endpoints) {
            if (ec) {
                return finish(Error::Transport, "Resolve", ec);
            }
            // Bounds every following stream operation
            tcp_layer.expires_after(cfg_.request_timeout);
            tcp_layer.async_connect(endpoints, [&](const error_code& ec, const tcp::endpoint&) {
                if (ec) {
                    return finish(Error::Transport, "TCP connect", ec);
                }
                stream.async_handshake(ssl::stream_base::client, [&](const error_code& ec) {
                    if (ec) {
                        return finish(Error::Transport, "TLS handshake", ec);
                    }
                    http::async_write(stream, req, [&](const error_code& ec, std::size_t) {
                        if (ec) {
                            return finish(Error::Transport, "Request write", ec);
                        }
                        http::async_read(stream, buffer, parser, [&](const error_code& ec, std::size_t) {
                            if (ec) {
                                return finish(Error::Transport, "Response read", ec);
                            }
                            finish(Error::None, "request", ec);
                        });
                    });
                });
            });
        });

        io_.restart();
        io_.run_for(cfg_.request_timeout);
        if (!done) {
            // Deadline hit: abort and drain the pending handlers
            resolver.cancel();
            tcp_layer.cancel();
            tcp_layer.close();
            io_.restart();
            io_.run();
            RA_ERROR("[API] Request to " << url.authority() << " timed out after " << cfg_.request_timeout.count() << " ms");
            return Error::Transport;
        }
        if (result != Error::None) {
            return result;
        }

        status = parser.get().result_int();
        response = std::move(parser.get().body());

        // The response is complete; skip the TLS close_notify exchange
        error_code ignored;
        tcp_layer.socket().shutdown(tcp::socket::shutdown_both, ignored);
        tcp_layer.close();
        return Error::None;
    } catch (const std::exception& e) {
        RA_ERROR("[API] Unexpected exception during ticket exchange: " << e.what());
        return Error::Transport;
    }
}

} // namespace remauth::core::api::https
