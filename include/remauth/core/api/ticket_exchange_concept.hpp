/*
===============================================================================
TicketExchangeConcept
===============================================================================

Contract of the single REST call the remote-auth flow makes: converting the
companion-approved ticket into an encrypted session token.

  • exchange() performs exactly one POST per call, no internal retry
  • on success `out.encrypted_token` holds the base64 OAEP ciphertext
  • the request is unauthenticated (no Authorization header)

Implementations: api::https::TicketExchange (Boost.Beast over OpenSSL) and
test doubles.
===============================================================================
*/
#pragma once

#include <concepts>
#include <string>

#include "remauth/core/api/error.hpp"
#include "remauth/core/api/schema/remote_auth_login.hpp"


namespace remauth::core::api {

template<class TX>
concept TicketExchangeConcept =
    requires(TX tx, const std::string& ticket, schema::LoginResponse& out)
{
    { tx.exchange(ticket, out) } noexcept -> std::same_as<Error>;
};

} // namespace remauth::core::api
