#pragma once

/// @file crypto_utils.hpp
/// @brief Internal HMAC and comparison helpers over OpenSSL.

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace pgw::service::detail {

/// Lower-case hex encoding.
[[nodiscard]] inline std::string toHex(const unsigned char* data, std::size_t length) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(length * 2);
    for (std::size_t i = 0; i < length; ++i) {
        out += kDigits[(data[i] >> 4) & 0x0F];
        out += kDigits[data[i] & 0x0F];
    }
    return out;
}

/// HMAC-SHA256 of @p message under @p key, hex encoded (64 chars).
/// Returns an empty string if OpenSSL fails.
[[nodiscard]] inline std::string hmacSha256Hex(std::string_view key, std::string_view message) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digestLen = 0;
    auto* result = HMAC(EVP_sha256(),
                        key.data(), static_cast<int>(key.size()),
                        reinterpret_cast<const unsigned char*>(message.data()),  // NOLINT
                        message.size(),
                        digest.data(), &digestLen);
    if (result == nullptr) {
        return {};
    }
    return toHex(digest.data(), digestLen);
}

/// Comparison whose running time does not depend on where the inputs differ.
[[nodiscard]] inline bool constantTimeEqual(std::string_view a, std::string_view b) {
    if (a.size() != b.size() || a.empty()) {
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

}  // namespace pgw::service::detail
