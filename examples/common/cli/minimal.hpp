#pragma once

#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "common/cli/validators.hpp"
#include "common/logger.hpp"

namespace remauth::examples::cli::minimal {

struct Params {
    std::string gateway_url   = "wss://remote-auth-gateway.discord.gg/?v=2";
    std::string api_base      = "https://discord.com/api/v9";
    std::string origin        = "https://discord.com";
    int max_connect_attempts  = 5;
    std::string log_level     = "info";

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n"
           << "  Gateway   : " << gateway_url << "\n"
           << "  API base  : " << api_base << "\n"
           << "  Origin    : " << origin << "\n"
           << "  Attempts  : " << max_connect_attempts << (max_connect_attempts == 0 ? " (unlimited)" : "") << "\n"
           << "  Log Level : " << log_level << "\n";
    }
};

[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    Params params{};

    app.add_option("-g,--gateway", params.gateway_url, "Remote-auth gateway endpoint")->check(wss_url_validator)->default_val(params.gateway_url);
    app.add_option("-a,--api-base", params.api_base, "REST API base used for the ticket exchange")->check(https_url_validator)->default_val(params.api_base);
    app.add_option("-o,--origin", params.origin, "Origin header sent to gateway and API")->default_val(params.origin);
    app.add_option("-m,--max-attempts", params.max_connect_attempts, "Consecutive failed connects before giving up (0 = unlimited)")->check(CLI::NonNegativeNumber)->default_val(params.max_connect_attempts);
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->check(log_level_validator)->default_val(params.log_level);

    app.footer(
        "Scan the printed QR payload with a logged-in mobile client.\n"
        "Press Ctrl+C to cancel the login."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e, std::cout, std::cerr));
    }

    set_log_level(params.log_level);
    return params;
}

} // namespace remauth::examples::cli::minimal
