#pragma once

#include <string_view>

namespace remauth::core::crypto {

enum class Error {
    None = 0,
    KeyGeneration,   // RSA keypair could not be generated or exported
    InvalidKey,      // DER public key could not be parsed, or no key loaded
    Decrypt,         // Ciphertext length mismatch or OAEP padding check failed
    Encrypt,         // Plaintext too large for OAEP or EVP failure
    Digest,          // SHA-256 computation failed
    Encoding,        // Base64 input is not valid for the expected alphabet
};

inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:          return "None";
    case Error::KeyGeneration: return "KeyGeneration";
    case Error::InvalidKey:    return "InvalidKey";
    case Error::Decrypt:       return "Decrypt";
    case Error::Encrypt:       return "Encrypt";
    case Error::Digest:        return "Digest";
    case Error::Encoding:      return "Encoding";
    default:                   return "Unknown";
    }
}

} // namespace remauth::core::crypto
