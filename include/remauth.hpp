#pragma once

/*
===============================================================================
remauth - Public API Entry Point
===============================================================================

This is the primary public entry point for remauth.

remauth exposes a stable, user-facing API via remauth Lite, built on top of
remauth Core. Only symbols declared in the remauth::lite namespace are part
of the public API contract; Core (remauth/core/...) may change between minor
versions.
===============================================================================
*/

#include <remauth/lite.hpp>
