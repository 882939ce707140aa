#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// Base64 codecs used on the remote-auth wire (RFC 4648).
//
//   standard     : '+' '/' alphabet, '=' padded   (public key, ciphertexts)
//   url, no pad  : '-' '_' alphabet, no padding   (nonce proof, fingerprint)
//
// Decoders are strict: characters outside the alphabet, whitespace, misplaced
// padding and impossible lengths are rejected. On failure `out` is untouched.

namespace remauth::core::crypto::base64 {

[[nodiscard]] std::string encode_standard(std::span<const std::uint8_t> data);
[[nodiscard]] bool decode_standard(std::string_view text, std::vector<std::uint8_t>& out);

[[nodiscard]] std::string encode_url_no_pad(std::span<const std::uint8_t> data);
[[nodiscard]] bool decode_url_no_pad(std::string_view text, std::vector<std::uint8_t>& out);

// Convenience overloads for textual payloads
[[nodiscard]]
inline std::string encode_standard(std::string_view text) {
    return encode_standard(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
}

[[nodiscard]]
inline std::string encode_url_no_pad(std::string_view text) {
    return encode_url_no_pad(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
}

} // namespace remauth::core::crypto::base64
