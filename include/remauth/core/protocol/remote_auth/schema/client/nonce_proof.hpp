#pragma once

#include <cstddef>
#include <cstring>
#include <string>

#include "remauth/core/protocol/concept/json_writable.hpp"

namespace remauth::core::protocol::remote_auth::schema::client {

// Proof of private key possession:
//   {"op":"nonce_proof","nonce":"<base64url, no padding, of the decrypted nonce>"}
struct NonceProof {
    std::string nonce;

    [[nodiscard]]
    inline std::size_t max_json_size() const noexcept {
        return sizeof(PREFIX) - 1 + nonce.size() + sizeof(SUFFIX) - 1;
    }

    [[nodiscard]]
    inline std::size_t write_json(char* buffer) const noexcept {
        std::size_t pos = 0;
        std::memcpy(buffer + pos, PREFIX, sizeof(PREFIX) - 1);
        pos += sizeof(PREFIX) - 1;
        std::memcpy(buffer + pos, nonce.data(), nonce.size());
        pos += nonce.size();
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
    static constexpr char PREFIX[] = "{\"op\":\"nonce_proof\",\"nonce\":\"";
    static constexpr char SUFFIX[] = "\"}";
};

static_assert(DynamicJsonWritable<NonceProof>);

} // namespace remauth::core::protocol::remote_auth::schema::client
