#pragma once

/// @file http_types.hpp
/// @brief Minimal HTTP/1.1 request/response model for the media server.

#include "pgw/foundation/gateway_result.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pgw::service {

/// Header names are stored lower-case.
using HeaderMap = std::map<std::string, std::string>;

struct HttpRequest {
    std::string method;
    /// Raw path without the query string, still percent-encoded.
    std::string path;
    std::string query;
    HeaderMap headers;

    [[nodiscard]] std::optional<std::string> header(std::string_view name) const;
};

struct HttpResponse {
    int status{200};
    /// Emitted in insertion order.
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    HttpResponse& setHeader(std::string name, std::string value);

    [[nodiscard]] std::optional<std::string> header(std::string_view name) const;
};

/// Parse the request line and headers of @p raw (body ignored).
/// @return ValidationFailed for a malformed request line.
[[nodiscard]] foundation::GatewayResult<HttpRequest> parseHttpRequest(std::string_view raw);

/// Serialize with Content-Length and Connection: close.
[[nodiscard]] std::string serializeHttpResponse(const HttpResponse& response);

[[nodiscard]] std::string_view statusText(int status);

/// RFC 3986 percent-encoding of everything but unreserved characters.
[[nodiscard]] std::string percentEncode(std::string_view text);

/// Decode %XX escapes, and '+' as space when \p plusAsSpace is set (form
/// encoding, query strings only). Malformed escapes are kept verbatim.
[[nodiscard]] std::string percentDecode(std::string_view text, bool plusAsSpace = false);

/// Decoded query parameters; on duplicate keys the first wins.
[[nodiscard]] std::map<std::string, std::string> parseQueryString(std::string_view query);

/// Split "/a/b/c" into decoded segments {"a","b","c"}; empty segments dropped.
/// A '+' in a path segment is a literal plus.
[[nodiscard]] std::vector<std::string> splitPath(std::string_view path);

}  // namespace pgw::service
