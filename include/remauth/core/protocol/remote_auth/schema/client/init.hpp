#pragma once

#include <cstddef>
#include <cstring>
#include <string>

#include "remauth/core/protocol/concept/json_writable.hpp"

namespace remauth::core::protocol::remote_auth::schema::client {

// Sent once the gateway greeting arrives:
//   {"op":"init","encoded_public_key":"<base64 DER SubjectPublicKeyInfo>"}
//
// PRECONDITION: encoded_public_key is standard base64 (no characters that
// would need JSON escaping).
struct Init {
    std::string encoded_public_key;

    [[nodiscard]]
    inline std::size_t max_json_size() const noexcept {
        return sizeof(PREFIX) - 1 + encoded_public_key.size() + sizeof(SUFFIX) - 1;
    }

    [[nodiscard]]
    inline std::size_t write_json(char* buffer) const noexcept {
        std::size_t pos = 0;
        std::memcpy(buffer + pos, PREFIX, sizeof(PREFIX) - 1);
        pos += sizeof(PREFIX) - 1;
        std::memcpy(buffer + pos, encoded_public_key.data(), encoded_public_key.size());
        pos += encoded_public_key.size();
        std::memcpy(buffer + pos, SUFFIX, sizeof(SUFFIX) - 1);
        pos += sizeof(SUFFIX) - 1;
        return pos;
    }

    std::string to_json() const {
        std::string out(max_json_size(), '\0');
        out.resize(write_json(out.data()));
        return out;
    }

private:
    static constexpr char PREFIX[] = "{\"op\":\"init\",\"encoded_public_key\":\"";
    static constexpr char SUFFIX[] = "\"}";
};

static_assert(DynamicJsonWritable<Init>);

} // namespace remauth::core::protocol::remote_auth::schema::client
