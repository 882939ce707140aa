#include "remauth/core/crypto/base64.hpp"

#include <openssl/evp.h>


namespace remauth::core::crypto::base64 {

namespace {

[[nodiscard]]
inline bool is_standard_char(char c) noexcept {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '+' || c == '/';
}

[[nodiscard]]
inline bool is_url_char(char c) noexcept {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_';
}

// Decodes a padded, already validated standard-alphabet string
[[nodiscard]]
bool decode_block_(std::string_view text, std::size_t padding, std::vector<std::uint8_t>& out) {
    std::vector<std::uint8_t> buffer(text.size() / 4 * 3);
    const int n = EVP_DecodeBlock(buffer.data(), reinterpret_cast<const unsigned char*>(text.data()), static_cast<int>(text.size()));
    if (n < 0 || static_cast<std::size_t>(n) < padding) {
        return false;
    }
    buffer.resize(static_cast<std::size_t>(n) - padding);
    out = std::move(buffer);
    return true;
}

} // namespace


std::string encode_standard(std::span<const std::uint8_t> data) {
    if (data.empty()) {
        return {};
    }
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), data.data(), static_cast<int>(data.size()));
    out.resize(static_cast<std::size_t>(n));
    return out;
}

bool decode_standard(std::string_view text, std::vector<std::uint8_t>& out) {
    if (text.empty()) {
        out.clear();
        return true;
    }
    if (text.size() % 4 != 0) {
        return false;
    }
    std::size_t padding = 0;
    if (text.back() == '=') {
        ++padding;
        if (text[text.size() - 2] == '=') {
            ++padding;
        }
    }
    for (std::size_t i = 0; i < text.size() - padding; ++i) {
        if (!is_standard_char(text[i])) {
            return false;
        }
    }
    return decode_block_(text, padding, out);
}

std::string encode_url_no_pad(std::span<const std::uint8_t> data) {
    std::string out = encode_standard(data);
    while (!out.empty() && out.back() == '=') {
        out.pop_back();
    }
    for (char& c : out) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    return out;
}

bool decode_url_no_pad(std::string_view text, std::vector<std::uint8_t>& out) {
    if (text.empty()) {
        out.clear();
        return true;
    }
    // A single trailing sextet cannot encode a whole byte
    if (text.size() % 4 == 1) {
        return false;
    }
    std::string padded;
    padded.reserve(text.size() + 3);
    for (char c : text) {
        if (!is_url_char(c)) {
            return false;
        }
        padded += (c == '-') ? '+' : (c == '_') ? '/' : c;
    }
    const std::size_t padding = (4 - text.size() % 4) % 4;
    padded.append(padding, '=');
    return decode_block_(padded, padding, out);
}

} // namespace remauth::core::crypto::base64
