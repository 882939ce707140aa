#pragma once

#include <iostream>
#include <string_view>

#include "lcr/log/logger.hpp"


namespace remauth::examples {

    inline void set_log_level(std::string_view log_level) {
        using namespace lcr::log;
        Level level = Level::Info;
        if (!parse_level(log_level, level)) {
            std::cerr << "Unknown log level '" << log_level << "', using info\n";
        }
        Logger::instance().set_level(level);
    }

} // namespace remauth::examples
