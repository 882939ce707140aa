#include "remauth/core/crypto/key_material.hpp"

#include <memory>
#include <utility>

#include <openssl/bn.h>
#include <openssl/err.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>

#include "remauth/core/crypto/base64.hpp"
#include "lcr/log/logger.hpp"


namespace remauth::core::crypto {

namespace {

struct PkeyCtxDeleter { void operator()(EVP_PKEY_CTX* p) const noexcept { EVP_PKEY_CTX_free(p); } };
struct PkeyDeleter    { void operator()(EVP_PKEY* p) const noexcept { EVP_PKEY_free(p); } };
struct BnDeleter      { void operator()(BIGNUM* p) const noexcept { BN_free(p); } };

using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;
using PkeyPtr    = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using BnPtr      = std::unique_ptr<BIGNUM, BnDeleter>;

// Oldest queued OpenSSL error, for diagnostics. Clears the queue.
std::string last_openssl_error_() {
    const unsigned long code = ERR_get_error();
    ERR_clear_error();
    if (code == 0) {
        return "no OpenSSL error queued";
    }
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}

// OAEP with SHA-256 for both the label hash and MGF1
[[nodiscard]]
bool configure_oaep_(EVP_PKEY_CTX* ctx) noexcept {
    return EVP_PKEY_CTX_set_rsa_padding(ctx, RSA_PKCS1_OAEP_PADDING) > 0 &&
           EVP_PKEY_CTX_set_rsa_oaep_md(ctx, EVP_sha256()) > 0 &&
           EVP_PKEY_CTX_set_rsa_mgf1_md(ctx, EVP_sha256()) > 0;
}

} // namespace


KeyMaterial::~KeyMaterial() {
    reset();
}

KeyMaterial::KeyMaterial(KeyMaterial&& other) noexcept
    : pkey_(std::exchange(other.pkey_, nullptr))
    , public_der_(std::move(other.public_der_))
    , fingerprint_(std::move(other.fingerprint_))
{
}

KeyMaterial& KeyMaterial::operator=(KeyMaterial&& other) noexcept {
    if (this != &other) {
        reset();
        pkey_ = std::exchange(other.pkey_, nullptr);
        public_der_ = std::move(other.public_der_);
        fingerprint_ = std::move(other.fingerprint_);
    }
    return *this;
}

void KeyMaterial::reset() noexcept {
    if (pkey_) {
        EVP_PKEY_free(pkey_);
        pkey_ = nullptr;
    }
    public_der_.clear();
    fingerprint_.clear();
}


Error KeyMaterial::generate(int bits) noexcept {
    reset();

    PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
    BnPtr exponent(BN_new());
    if (!ctx || !exponent || BN_set_word(exponent.get(), config::crypto::RSA_PUBLIC_EXPONENT) != 1) {
        RA_ERROR("[CRYPTO] Unable to allocate RSA key generation context: " << last_openssl_error_());
        return Error::KeyGeneration;
    }
    if (EVP_PKEY_keygen_init(ctx.get()) <= 0 ||
        EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), bits) <= 0 ||
        EVP_PKEY_CTX_set1_rsa_keygen_pubexp(ctx.get(), exponent.get()) <= 0) {
        RA_ERROR("[CRYPTO] Unable to configure RSA-" << bits << " key generation: " << last_openssl_error_());
        return Error::KeyGeneration;
    }
    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) <= 0 || raw == nullptr) {
        RA_ERROR("[CRYPTO] RSA-" << bits << " key generation failed: " << last_openssl_error_());
        return Error::KeyGeneration;
    }
    PkeyPtr key(raw);

    // Export SubjectPublicKeyInfo (DER)
    const int der_len = i2d_PUBKEY(key.get(), nullptr);
    if (der_len <= 0) {
        RA_ERROR("[CRYPTO] Unable to size DER public key: " << last_openssl_error_());
        return Error::KeyGeneration;
    }
    Bytes der(static_cast<std::size_t>(der_len));
    unsigned char* cursor = der.data();
    if (i2d_PUBKEY(key.get(), &cursor) != der_len) {
        RA_ERROR("[CRYPTO] Unable to export DER public key: " << last_openssl_error_());
        return Error::KeyGeneration;
    }

    Digest digest{};
    if (fingerprint_of(der, digest) != Error::None) {
        return Error::KeyGeneration;
    }

    pkey_ = key.release();
    public_der_ = std::move(der);
    fingerprint_ = base64::encode_url_no_pad(digest);
    RA_DEBUG("[CRYPTO] Generated RSA-" << bits << " keypair (fingerprint " << fingerprint_ << ")");
    return Error::None;
}


std::string KeyMaterial::encoded_public_key() const {
    return base64::encode_standard(public_der_);
}


std::size_t KeyMaterial::modulus_size() const noexcept {
    if (!pkey_) {
        return 0;
    }
    const int size = EVP_PKEY_get_size(pkey_);
    return size > 0 ? static_cast<std::size_t>(size) : 0;
}

std::size_t KeyMaterial::max_plaintext_size() const noexcept {
    const std::size_t k = modulus_size();
    constexpr std::size_t overhead = 2 * SHA256_SIZE + 2;
    return k > overhead ? k - overhead : 0;
}


Error KeyMaterial::decrypt(std::span<const std::uint8_t> ciphertext, Bytes& out) const noexcept {
    if (!pkey_) {
        RA_ERROR("[CRYPTO] decrypt() called without a keypair");
        return Error::InvalidKey;
    }
    // OAEP ciphertext is always exactly one modulus long
    if (ciphertext.size() != modulus_size()) {
        RA_WARN("[CRYPTO] Ciphertext length " << ciphertext.size() << " does not match modulus size " << modulus_size());
        return Error::Decrypt;
    }
    PkeyCtxPtr ctx(EVP_PKEY_CTX_new(pkey_, nullptr));
    if (!ctx || EVP_PKEY_decrypt_init(ctx.get()) <= 0 || !configure_oaep_(ctx.get())) {
        RA_ERROR("[CRYPTO] Unable to initialise OAEP decryption: " << last_openssl_error_());
        return Error::Decrypt;
    }
    std::size_t len = 0;
    if (EVP_PKEY_decrypt(ctx.get(), nullptr, &len, ciphertext.data(), ciphertext.size()) <= 0) {
        RA_WARN("[CRYPTO] Unable to size OAEP plaintext: " << last_openssl_error_());
        return Error::Decrypt;
    }
    Bytes plain(len);
    if (EVP_PKEY_decrypt(ctx.get(), plain.data(), &len, ciphertext.data(), ciphertext.size()) <= 0) {
        RA_WARN("[CRYPTO] OAEP decryption failed: " << last_openssl_error_());
        return Error::Decrypt;
    }
    plain.resize(len);
    out = std::move(plain);
    return Error::None;
}


Error fingerprint_of(std::span<const std::uint8_t> public_key_der, Digest& out) noexcept {
    unsigned int len = 0;
    if (EVP_Digest(public_key_der.data(), public_key_der.size(), out.data(), &len, EVP_sha256(), nullptr) != 1 ||
        len != SHA256_SIZE) {
        RA_ERROR("[CRYPTO] SHA-256 digest failed: " << last_openssl_error_());
        return Error::Digest;
    }
    return Error::None;
}


Error seal(std::span<const std::uint8_t> public_key_der, std::span<const std::uint8_t> plaintext, Bytes& out) noexcept {
    const unsigned char* cursor = public_key_der.data();
    PkeyPtr key(d2i_PUBKEY(nullptr, &cursor, static_cast<long>(public_key_der.size())));
    if (!key) {
        RA_WARN("[CRYPTO] Unable to parse DER public key: " << last_openssl_error_());
        return Error::InvalidKey;
    }
    PkeyCtxPtr ctx(EVP_PKEY_CTX_new(key.get(), nullptr));
    if (!ctx || EVP_PKEY_encrypt_init(ctx.get()) <= 0 || !configure_oaep_(ctx.get())) {
        RA_ERROR("[CRYPTO] Unable to initialise OAEP encryption: " << last_openssl_error_());
        return Error::Encrypt;
    }
    std::size_t len = 0;
    if (EVP_PKEY_encrypt(ctx.get(), nullptr, &len, plaintext.data(), plaintext.size()) <= 0) {
        RA_WARN("[CRYPTO] Unable to size OAEP ciphertext: " << last_openssl_error_());
        return Error::Encrypt;
    }
    Bytes sealed(len);
    if (EVP_PKEY_encrypt(ctx.get(), sealed.data(), &len, plaintext.data(), plaintext.size()) <= 0) {
        RA_WARN("[CRYPTO] OAEP encryption failed (plaintext " << plaintext.size() << " bytes): " << last_openssl_error_());
        return Error::Encrypt;
    }
    sealed.resize(len);
    out = std::move(sealed);
    return Error::None;
}

} // namespace remauth::core::crypto
