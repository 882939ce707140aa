#pragma once

#include <string>
#include <string_view>
#include <cstdlib>
#include <cstddef>

#include "remauth/core/transport/error.hpp"


namespace remauth::core::transport {

    enum class Scheme {
        Ws,
        Wss,
        Http,
        Https
    };

    // Contains parsed URL components
    struct ParsedUrl {
        Scheme scheme{Scheme::Wss};
        bool secure{true};    // wss:// or https://
        std::string host;
        std::string port;
        std::string path;     // path + query, always starts with '/'

        [[nodiscard]]
        inline bool is_websocket() const noexcept {
            return scheme == Scheme::Ws || scheme == Scheme::Wss;
        }

        // Host header value: the port is omitted when it is the scheme default
        [[nodiscard]]
        inline std::string authority() const {
            const bool default_port = (secure && port == "443") || (!secure && port == "80");
            return default_port ? host : host + ":" + port;
        }
    };


    // ---------------------------------------------------------------------
    // Minimal URL parser supporting ws://, wss://, http:// and https://.
    // Rejects malformed inputs without attempting full RFC compliance.
    // A query that directly follows the authority is kept with a leading '/'.
    //
    // Example inputs:
    //   wss://remote-auth-gateway.discord.gg/?v=2
    //   wss://remote-auth-gateway.discord.gg?v=2      (path -> "/?v=2")
    //   https://discord.com/api/v9
    //   ws://localhost:8080/gateway
    // ---------------------------------------------------------------------
    [[nodiscard]]
    inline Error parse_url(std::string_view url, ParsedUrl& out) noexcept {
        out = ParsedUrl{};
        // 1) Extract scheme
        struct SchemeEntry { std::string_view prefix; Scheme scheme; bool secure; };
        constexpr SchemeEntry schemes[] = {
            {"ws://",    Scheme::Ws,    false},
            {"wss://",   Scheme::Wss,   true},
            {"http://",  Scheme::Http,  false},
            {"https://", Scheme::Https, true},
        };
        std::size_t pos = std::string_view::npos;
        for (const auto& s : schemes) {
            if (url.substr(0, s.prefix.size()) == s.prefix) {
                out.scheme = s.scheme;
                out.secure = s.secure;
                pos = s.prefix.size();
                break;
            }
        }
        if (pos == std::string_view::npos) {
            return Error::InvalidUrl;
        }
        // 2) Extract host[:port]
        const std::size_t end = url.find_first_of("/?#", pos);
        const std::string_view hostport = (end == std::string_view::npos) ? url.substr(pos) : url.substr(pos, end - pos);
        if (hostport.empty()) {
            return Error::InvalidUrl;
        }
        // 3) Split host and port
        const std::size_t colon = hostport.find(':');
        if (colon != std::string_view::npos) {
            out.host = std::string(hostport.substr(0, colon));
            out.port = std::string(hostport.substr(colon + 1));
        } else {
            out.host = std::string(hostport);
            out.port = out.secure ? "443" : "80";
        }
        // 4) Path (default "/" if missing). Fragments are never sent.
        std::string_view rest = (end == std::string_view::npos) ? std::string_view{} : url.substr(end);
        const std::size_t hash = rest.find('#');
        if (hash != std::string_view::npos) {
            rest = rest.substr(0, hash);
        }
        if (rest.empty()) {
            out.path = "/";
        } else if (rest.front() == '?') {
            out.path = "/" + std::string(rest);
        } else {
            out.path = std::string(rest);
        }

        // Invariants check --------------------------------

        if (out.host.empty() || out.port.empty()) {
            return Error::InvalidUrl;
        }
        for (char c : out.host) {
            if (c == ' ' || c == '@') {
                return Error::InvalidUrl;
            }
        }
        // Port must be numeric and in range
        if (out.port.size() > 5) {
            return Error::InvalidUrl;
        }
        for (char c : out.port) {
            if (c < '0' || c > '9') {
                return Error::InvalidUrl;
            }
        }
        const unsigned long p = std::strtoul(out.port.c_str(), nullptr, 10);
        if (p == 0 || p > 65535) {
            return Error::InvalidUrl;
        }
        if (out.path.empty() || out.path[0] != '/') {
            return Error::InvalidUrl;
        }
        // ---------------------------------------------------

        return Error::None;
    }

} // namespace remauth::core::transport
