#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <openssl/evp.h>

#include "remauth/core/crypto/error.hpp"
#include "remauth/core/config/gateway.hpp"

/*
===============================================================================
 KeyMaterial
===============================================================================

Ephemeral RSA keypair owned by exactly one remote-auth connection attempt.

  • generate()     fresh RSA-2048 keypair (e = 65537), exports the DER
                   SubjectPublicKeyInfo and its SHA-256 fingerprint
  • decrypt()      RSA-OAEP with SHA-256 (OAEP digest and MGF1 digest)
  • fingerprint()  base64url (no padding) SHA-256 of the DER public key

The private key never leaves this object and is freed on destruction.
Move-only: a keypair is never shared between attempts.
===============================================================================
*/

namespace remauth::core::crypto {

using Bytes = std::vector<std::uint8_t>;

inline constexpr std::size_t SHA256_SIZE = 32;
using Digest = std::array<std::uint8_t, SHA256_SIZE>;

class KeyMaterial {
public:
    KeyMaterial() noexcept = default;
    ~KeyMaterial();

    KeyMaterial(KeyMaterial&& other) noexcept;
    KeyMaterial& operator=(KeyMaterial&& other) noexcept;

    KeyMaterial(const KeyMaterial&) = delete;
    KeyMaterial& operator=(const KeyMaterial&) = delete;

    // Replaces any previously held keypair
    [[nodiscard]]
    Error generate(int bits = config::crypto::RSA_KEY_BITS) noexcept;

    [[nodiscard]]
    inline bool valid() const noexcept { return pkey_ != nullptr; }

    // DER encoded SubjectPublicKeyInfo
    [[nodiscard]]
    inline const Bytes& public_key_der() const noexcept { return public_der_; }

    // Standard base64 of public_key_der(), as sent in the init opcode
    [[nodiscard]]
    std::string encoded_public_key() const;

    // base64url (no padding) of SHA-256(public_key_der())
    [[nodiscard]]
    inline const std::string& fingerprint() const noexcept { return fingerprint_; }

    // RSA-OAEP/SHA-256 decryption with the private key
    [[nodiscard]]
    Error decrypt(std::span<const std::uint8_t> ciphertext, Bytes& out) const noexcept;

    // RSA modulus size in bytes (ciphertext length), 0 when no key is loaded
    [[nodiscard]]
    std::size_t modulus_size() const noexcept;

    // Largest plaintext OAEP/SHA-256 accepts: k - 2*hLen - 2
    [[nodiscard]]
    std::size_t max_plaintext_size() const noexcept;

    // Drops the keypair
    void reset() noexcept;

private:
    EVP_PKEY* pkey_{nullptr};
    Bytes public_der_;
    std::string fingerprint_;
};


// SHA-256 of arbitrary bytes (the DER public key for fingerprints)
[[nodiscard]]
Error fingerprint_of(std::span<const std::uint8_t> public_key_der, Digest& out) noexcept;

// Companion-side operation: RSA-OAEP/SHA-256 encryption against a DER
// SubjectPublicKeyInfo. This is what the server and the mobile app do with the
// key received in the init opcode.
[[nodiscard]]
Error seal(std::span<const std::uint8_t> public_key_der, std::span<const std::uint8_t> plaintext, Bytes& out) noexcept;

// Text helpers
[[nodiscard]]
inline std::span<const std::uint8_t> as_bytes(std::string_view text) noexcept {
    return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
}

[[nodiscard]]
inline std::string to_text(const Bytes& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

} // namespace remauth::core::crypto
