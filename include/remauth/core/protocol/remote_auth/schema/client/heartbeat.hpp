#pragma once

#include <cstddef>
#include <cstring>
#include <string>

#include "remauth/core/protocol/concept/json_writable.hpp"

namespace remauth::core::protocol::remote_auth::schema::client {

// {"op":"heartbeat"}
struct Heartbeat {

    [[nodiscard]]
    static constexpr std::size_t max_json_size() noexcept {
        return sizeof(JSON) - 1;
    }

    [[nodiscard]]
    inline std::size_t write_json(char* buffer) const noexcept {
        std::memcpy(buffer, JSON, sizeof(JSON) - 1);
        return sizeof(JSON) - 1;
    }

    std::string to_json() const {
        return std::string(JSON, sizeof(JSON) - 1);
    }

private:
    static constexpr char JSON[] = "{\"op\":\"heartbeat\"}";
};

static_assert(StaticJsonWritable<Heartbeat>);

} // namespace remauth::core::protocol::remote_auth::schema::client
