#pragma once

/*
===============================================================================
remauth Lite - Public API Contract (v1)
===============================================================================

This header defines the complete public surface of the remauth Lite API.

Lite is a user-facing API for QR-code login with a companion device. It hides
the gateway protocol, the key material and the ticket exchange behind a
poll-driven client with three callbacks.

Design guarantees:
  - Stable public domain type layouts
  - Stable callback signatures
  - No protocol or Core internals exposed
  - No breaking changes without a major version bump

Include this header to use remauth Lite.
===============================================================================
*/

#include <remauth/lite/client.hpp>
#include <remauth/lite/error.hpp>
#include <remauth/lite/version.hpp>

// Domain value types (internal grouping, public re-export)
#include <remauth/lite/domain/account.hpp>
#include <remauth/lite/domain/phase.hpp>

namespace remauth::lite {

    // ---------------------------------------------------------------------
    // Domain Value Types (Stable)
    // ---------------------------------------------------------------------

    using Account   = remauth::lite::domain::Account;
    using Phase     = remauth::lite::domain::Phase;
    using PhaseKind = remauth::lite::domain::PhaseKind;

} // namespace remauth::lite
