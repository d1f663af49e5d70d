/// @file signed_url_codec.cpp
/// @brief HMAC-SHA256 signing and verification of media URLs.

#include "pgw/service/signed_url_codec.hpp"

#include "crypto_utils.hpp"
#include "pgw/foundation/gateway_logger.hpp"
#include "pgw/service/http_types.hpp"

#include <charconv>

namespace pgw::service {

using foundation::LogCategory;

namespace {

std::optional<int64_t> parseExp(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

std::optional<MediaSize> parseMediaSize(std::string_view text) {
    if (text == "thumbnail") { return MediaSize::Thumbnail; }
    if (text == "medium")    { return MediaSize::Medium; }
    if (text == "full")      { return MediaSize::Full; }
    return std::nullopt;
}

SignedUrlCodec::SignedUrlCodec(SigningConfig config, foundation::ClockFn clock)
    : config_(std::move(config)), clock_(std::move(clock)) {}

std::string SignedUrlCodec::canonicalString(std::string_view resourceId,
                                            std::string_view variantRef,
                                            MediaSize size,
                                            int64_t exp) {
    std::string out = percentEncode(resourceId);
    out += ':';
    out += percentEncode(variantRef);
    out += ':';
    out += toString(size);
    out += ':';
    out += std::to_string(exp);
    return out;
}

std::string SignedUrlCodec::sign(std::string_view resourceId,
                                 std::string_view variantRef,
                                 MediaSize size,
                                 int64_t exp) const {
    return detail::hmacSha256Hex(config_.primarySecret,
                                 canonicalString(resourceId, variantRef, size, exp));
}

VerifyOutcome SignedUrlCodec::verify(std::string_view resourceId,
                                     std::string_view variantRef,
                                     MediaSize size,
                                     std::string_view exp,
                                     std::string_view sig) const {
    auto parsed = parseExp(exp);
    if (!parsed) {
        return VerifyOutcome::Invalid;
    }
    return verify(resourceId, variantRef, size, *parsed, sig);
}

VerifyOutcome SignedUrlCodec::verify(std::string_view resourceId,
                                     std::string_view variantRef,
                                     MediaSize size,
                                     int64_t exp,
                                     std::string_view sig) const {
    if (foundation::toUnixSeconds(clock_()) > exp) {
        return VerifyOutcome::Expired;
    }

    auto canonical = canonicalString(resourceId, variantRef, size, exp);
    if (detail::constantTimeEqual(detail::hmacSha256Hex(config_.primarySecret, canonical), sig)) {
        return VerifyOutcome::Valid;
    }
    for (const auto& secret : config_.previousSecrets) {
        if (detail::constantTimeEqual(detail::hmacSha256Hex(secret, canonical), sig)) {
            PGW_LOG_DEBUG(LogCategory::Signing, "signature accepted under a previous secret");
            return VerifyOutcome::Valid;
        }
    }
    return VerifyOutcome::Invalid;
}

std::string SignedUrlCodec::buildSignedPath(std::string_view resourceId,
                                            std::string_view variantRef,
                                            MediaSize size,
                                            std::optional<std::chrono::seconds> ttl) const {
    auto exp = foundation::toUnixSeconds(clock_()) + ttl.value_or(config_.defaultTtl).count();
    std::string path = "/media/";
    path += percentEncode(resourceId);
    path += '/';
    path += percentEncode(variantRef);
    path += "?size=";
    path += toString(size);
    path += "&exp=";
    path += std::to_string(exp);
    path += "&sig=";
    path += sign(resourceId, variantRef, size, exp);
    return path;
}

}  // namespace pgw::service
