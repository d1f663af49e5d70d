/// @file http_types.cpp
/// @brief HTTP parsing and serialization helpers.

#include "pgw/service/http_types.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace pgw::service {

using foundation::ErrorCode;
using foundation::GatewayError;
using foundation::GatewayResult;

namespace {

std::string toLower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\r')) {
        text.remove_suffix(1);
    }
    return text;
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') { return c - '0'; }
    if (c >= 'a' && c <= 'f') { return c - 'a' + 10; }
    if (c >= 'A' && c <= 'F') { return c - 'A' + 10; }
    return -1;
}

}  // namespace

std::optional<std::string> HttpRequest::header(std::string_view name) const {
    auto it = headers.find(toLower(name));
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

HttpResponse& HttpResponse::setHeader(std::string name, std::string value) {
    auto lowered = toLower(name);
    for (auto& [key, existing] : headers) {
        if (toLower(key) == lowered) {
            existing = std::move(value);
            return *this;
        }
    }
    headers.emplace_back(std::move(name), std::move(value));
    return *this;
}

std::optional<std::string> HttpResponse::header(std::string_view name) const {
    auto lowered = toLower(name);
    for (const auto& [key, value] : headers) {
        if (toLower(key) == lowered) {
            return value;
        }
    }
    return std::nullopt;
}

GatewayResult<HttpRequest> parseHttpRequest(std::string_view raw) {
    auto lineEnd = raw.find("\r\n");
    if (lineEnd == std::string_view::npos) {
        return GatewayResult<HttpRequest>::err(
            GatewayError(ErrorCode::ValidationFailed, "incomplete request line"));
    }
    auto requestLine = raw.substr(0, lineEnd);

    auto methodEnd = requestLine.find(' ');
    if (methodEnd == std::string_view::npos) {
        return GatewayResult<HttpRequest>::err(
            GatewayError(ErrorCode::ValidationFailed, "malformed request line"));
    }
    auto targetEnd = requestLine.find(' ', methodEnd + 1);
    if (targetEnd == std::string_view::npos || targetEnd == methodEnd + 1) {
        return GatewayResult<HttpRequest>::err(
            GatewayError(ErrorCode::ValidationFailed, "malformed request target"));
    }

    HttpRequest request;
    request.method = std::string(requestLine.substr(0, methodEnd));
    auto target = requestLine.substr(methodEnd + 1, targetEnd - methodEnd - 1);
    if (target.front() != '/') {
        return GatewayResult<HttpRequest>::err(
            GatewayError(ErrorCode::ValidationFailed, "request target must be a path"));
    }
    auto queryStart = target.find('?');
    request.path = std::string(target.substr(0, queryStart));
    if (queryStart != std::string_view::npos) {
        request.query = std::string(target.substr(queryStart + 1));
    }

    auto pos = lineEnd + 2;
    while (pos < raw.size()) {
        auto end = raw.find("\r\n", pos);
        if (end == std::string_view::npos) {
            end = raw.size();
        }
        auto line = raw.substr(pos, end - pos);
        pos = end + 2;
        if (line.empty()) {
            break;
        }
        auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            continue;
        }
        request.headers.emplace(toLower(trim(line.substr(0, colon))),
                                std::string(trim(line.substr(colon + 1))));
    }
    return GatewayResult<HttpRequest>::ok(std::move(request));
}

std::string_view statusText(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default:  return "Unknown";
    }
}

std::string serializeHttpResponse(const HttpResponse& response) {
    std::ostringstream out;
    out << "HTTP/1.1 " << response.status << ' ' << statusText(response.status) << "\r\n";
    for (const auto& [name, value] : response.headers) {
        out << name << ": " << value << "\r\n";
    }
    out << "Content-Length: " << response.body.size() << "\r\n"
        << "Connection: close\r\n\r\n"
        << response.body;
    return out.str();
}

std::string percentEncode(std::string_view text) {
    static constexpr char kDigits[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += kDigits[c >> 4];
            out += kDigits[c & 0x0F];
        }
    }
    return out;
}

std::string percentDecode(std::string_view text, bool plusAsSpace) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            int hi = hexValue(text[i + 1]);
            int lo = hexValue(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        } else if (plusAsSpace && text[i] == '+') {
            out += ' ';
            continue;
        }
        out += text[i];
    }
    return out;
}

std::map<std::string, std::string> parseQueryString(std::string_view query) {
    std::map<std::string, std::string> params;
    while (!query.empty()) {
        auto amp = query.find('&');
        auto pair = query.substr(0, amp);
        query = (amp == std::string_view::npos) ? std::string_view{} : query.substr(amp + 1);
        if (pair.empty()) {
            continue;
        }
        auto eq = pair.find('=');
        auto key = percentDecode(pair.substr(0, eq), true);
        auto value = (eq == std::string_view::npos) ? std::string()
                                                    : percentDecode(pair.substr(eq + 1), true);
        params.emplace(std::move(key), std::move(value));
    }
    return params;
}

std::vector<std::string> splitPath(std::string_view path) {
    std::vector<std::string> segments;
    while (!path.empty()) {
        auto slash = path.find('/');
        auto segment = path.substr(0, slash);
        if (!segment.empty()) {
            segments.push_back(percentDecode(segment));
        }
        if (slash == std::string_view::npos) {
            break;
        }
        path.remove_prefix(slash + 1);
    }
    return segments;
}

}  // namespace pgw::service
