#pragma once

#include <string>

namespace remauth::lite {

/*
===============================================================================
Lite Error Model (v1 - STABLE)
===============================================================================

Lite errors represent *semantic failures* observable by SDK users. They hide
the Core taxonomy (transport, crypto, protocol and REST details).

[transport] the gateway or the API could not be reached. Reported by start()
for an unusable configuration, and when the retry budget is exhausted.

[protocol] the server sent data the client could not verify or decrypt at the
final step (the session token). Earlier protocol faults are retried silently.

[rejected] the ticket exchange was refused by the API. The login cannot
proceed; a new one must be started.

[cancelled] the login was cancelled by the caller.

Error codes may be extended in future versions, but existing values will
never change meaning.
===============================================================================
*/

enum class error_code {
    transport,   // Gateway / API unreachable, retry budget exhausted
    protocol,    // Unverifiable or undecryptable server data at the final step
    rejected,    // Ticket exchange refused
    cancelled    // Cancelled by the caller
};

struct error {
    error_code code;
    std::string message; // Human-readable explanation
};

const char* to_string(error_code code) noexcept;

} // namespace remauth::lite
