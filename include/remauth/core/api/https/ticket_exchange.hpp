#pragma once

#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

#include "remauth/core/api/config.hpp"
#include "remauth/core/api/error.hpp"
#include "remauth/core/api/schema/remote_auth_login.hpp"
#include "remauth/core/api/ticket_exchange_concept.hpp"
#include "remauth/core/transport/parse_url.hpp"

#include "simdjson.h"

/*
================================================================================
HTTPS Ticket Exchange (Boost.Beast over OpenSSL)
================================================================================

One-shot REST client for:

    POST {base_url}/users/@me/remote-auth/login
    Origin: {origin}
    Content-Type: application/json

    {"ticket":"..."}

Each exchange() opens a fresh TLS connection, sends a single request, reads a
single response and shuts the connection down. There is no retry: a failed
exchange is terminal for the login attempt.

The whole round trip is bounded by Config::request_timeout. The calling thread
runs the io_context; no background thread is created.

Non-2xx responses are parsed as application error objects and kept in
last_api_error() for diagnostics.
================================================================================
*/

namespace remauth::core::api::https {

class TicketExchange {
public:
    explicit TicketExchange(const Config& cfg = {});

    TicketExchange(const TicketExchange&) = delete;
    TicketExchange& operator=(const TicketExchange&) = delete;

    [[nodiscard]]
    Error exchange(const std::string& ticket, schema::LoginResponse& out) noexcept;

    // HTTP status of the last completed request (0 if none)
    [[nodiscard]]
    inline unsigned last_status() const noexcept { return last_status_; }

    // Application error object of the last rejected request
    [[nodiscard]]
    inline const schema::ApiError& last_api_error() const noexcept { return last_api_error_; }

private:
    // Performs the POST; fills status and body on success
    [[nodiscard]]
    Error post_(const transport::ParsedUrl& url, const std::string& target, const std::string& body, unsigned& status, std::string& response) noexcept;

private:
    Config cfg_;

    boost::asio::io_context io_;
    boost::asio::ssl::context tls_ctx_;
    simdjson::dom::parser json_;

    unsigned last_status_{0};
    schema::ApiError last_api_error_;
};

static_assert(TicketExchangeConcept<TicketExchange>);

} // namespace remauth::core::api::https
