#pragma once

/// @file signed_url_codec.hpp
/// @brief Issue and verify time-bounded signatures for media requests.

#include "pgw/foundation/clock.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pgw::service {

enum class MediaSize : uint8_t {
    Thumbnail,
    Medium,
    Full
};

[[nodiscard]] constexpr std::string_view toString(MediaSize size) {
    switch (size) {
        case MediaSize::Thumbnail: return "thumbnail";
        case MediaSize::Medium:    return "medium";
        case MediaSize::Full:      return "full";
    }
    return "medium";
}

[[nodiscard]] std::optional<MediaSize> parseMediaSize(std::string_view text);

/// Maximum pixel height requested from the provider for each size.
[[nodiscard]] constexpr int maxHeightPx(MediaSize size) {
    switch (size) {
        case MediaSize::Thumbnail: return 100;
        case MediaSize::Medium:    return 400;
        case MediaSize::Full:      return 1000;
    }
    return 400;
}

/// A media request reconstructed from the path and query string.
/// exp and sig are kept raw so that verification can classify them.
struct SignedMediaRequest {
    std::string resourceId;
    std::string variantRef;
    MediaSize size{MediaSize::Medium};
    std::optional<std::string> exp;
    std::optional<std::string> sig;
};

enum class VerifyOutcome : uint8_t {
    Valid,
    Expired,
    Invalid
};

[[nodiscard]] constexpr std::string_view toString(VerifyOutcome outcome) {
    switch (outcome) {
        case VerifyOutcome::Valid:   return "valid";
        case VerifyOutcome::Expired: return "expired";
        case VerifyOutcome::Invalid: return "invalid";
    }
    return "invalid";
}

struct SigningConfig {
    /// Signs every new URL.
    std::string primarySecret;

    /// Still accepted during rotation, never used to sign.
    std::vector<std::string> previousSecrets;

    std::chrono::seconds defaultTtl{900};
};

/// HMAC-SHA256 codec binding a signature to exactly one
/// (resourceId, variantRef, size, exp) tuple.
///
/// The canonical string is the four percent-encoded components joined with
/// ':' so that no component can spill into its neighbour. Signatures are
/// 64 lower-case hex characters.
class SignedUrlCodec {
public:
    explicit SignedUrlCodec(SigningConfig config,
                            foundation::ClockFn clock = foundation::systemClock());

    [[nodiscard]] static std::string canonicalString(std::string_view resourceId,
                                                     std::string_view variantRef,
                                                     MediaSize size,
                                                     int64_t exp);

    /// Signature under the primary secret.
    [[nodiscard]] std::string sign(std::string_view resourceId,
                                   std::string_view variantRef,
                                   MediaSize size,
                                   int64_t exp) const;

    /// Expired when now > exp; otherwise Valid only if @p sig matches the
    /// primary or a previous secret. A non-numeric @p exp is Invalid.
    [[nodiscard]] VerifyOutcome verify(std::string_view resourceId,
                                       std::string_view variantRef,
                                       MediaSize size,
                                       std::string_view exp,
                                       std::string_view sig) const;

    [[nodiscard]] VerifyOutcome verify(std::string_view resourceId,
                                       std::string_view variantRef,
                                       MediaSize size,
                                       int64_t exp,
                                       std::string_view sig) const;

    /// "/media/{id}/{ref}?size=..&exp=..&sig=.." expiring after @p ttl
    /// (default TTL when absent).
    [[nodiscard]] std::string buildSignedPath(std::string_view resourceId,
                                              std::string_view variantRef,
                                              MediaSize size,
                                              std::optional<std::chrono::seconds> ttl = std::nullopt) const;

    [[nodiscard]] std::size_t secretCount() const noexcept {
        return 1 + config_.previousSecrets.size();
    }

private:
    SigningConfig config_;
    foundation::ClockFn clock_;
};

}  // namespace pgw::service
