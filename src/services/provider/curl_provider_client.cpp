/// @file curl_provider_client.cpp
/// @brief libcurl transport for the two provider hops.

#include "pgw/service/curl_provider_client.hpp"

#include "pgw/foundation/gateway_logger.hpp"
#include "pgw/service/http_types.hpp"

#include <curl/curl.h>
#include <yaml-cpp/yaml.h>

#include <memory>
#include <mutex>

namespace pgw::service {

using foundation::ErrorCode;
using foundation::GatewayError;
using foundation::GatewayResult;
using foundation::LogCategory;

namespace {

struct TransferState {
    std::string body;
    std::size_t maxBytes{0};
    bool overflow{false};
    foundation::CancellationToken cancel;
};

std::size_t writeBody(char* data, std::size_t size, std::size_t count, void* userdata) {
    auto* state = static_cast<TransferState*>(userdata);
    const std::size_t bytes = size * count;
    if (state->body.size() + bytes > state->maxBytes) {
        state->overflow = true;
        return 0;
    }
    state->body.append(data, bytes);
    return bytes;
}

int onProgress(void* userdata, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
               curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    auto* state = static_cast<TransferState*>(userdata);
    return state->cancel.isCancelled() ? 1 : 0;
}

void ensureGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct EasyDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

}  // namespace

CurlProviderClient::CurlProviderClient(CurlProviderConfig config)
    : config_(std::move(config)) {
    ensureGlobalInit();
}

std::string CurlProviderClient::resolveUrl(const MediaLookup& lookup) const {
    std::string url = config_.baseUrl;
    url += "/places/";
    url += percentEncode(lookup.resourceId);
    url += "/photos/";
    url += percentEncode(lookup.variantRef);
    url += "/media?maxHeightPx=";
    url += std::to_string(lookup.maxHeightPx);
    url += "&skipHttpRedirect=true";
    return url;
}

GatewayResult<std::string> CurlProviderClient::parseResolveResponse(std::string_view body) {
    try {
        YAML::Node root = YAML::Load(std::string(body));
        if (!root.IsMap()) {
            return GatewayResult<std::string>::err(
                GatewayError(ErrorCode::UpstreamMalformed, "resolution response is not an object"));
        }
        const YAML::Node& doc = root;
        const YAML::Node uri = doc["photoUri"];
        if (!uri || !uri.IsScalar() || uri.Scalar().empty()) {
            return GatewayResult<std::string>::err(
                GatewayError(ErrorCode::UpstreamMalformed, "resolution response lacks photoUri"));
        }
        return GatewayResult<std::string>::ok(uri.Scalar());
    } catch (const YAML::Exception& e) {
        return GatewayResult<std::string>::err(
            GatewayError(ErrorCode::UpstreamMalformed,
                         std::string("unparseable resolution response: ") + e.what()));
    }
}

GatewayResult<CurlProviderClient::Response>
CurlProviderClient::perform(const std::string& url,
                            bool withCredential,
                            std::chrono::milliseconds deadline,
                            const foundation::CancellationToken& cancel) const {
    using Result = GatewayResult<Response>;

    if (cancel.isCancelled()) {
        return Result::err(GatewayError(ErrorCode::RequestCancelled, "cancelled before transfer"));
    }

    std::unique_ptr<CURL, EasyDeleter> handle(curl_easy_init());
    if (!handle) {
        return Result::err(GatewayError(ErrorCode::UpstreamTransport, "curl_easy_init failed"));
    }

    TransferState state;
    state.maxBytes = config_.maxPayloadBytes;
    state.cancel = cancel;

    std::unique_ptr<curl_slist, SlistDeleter> headers;
    if (withCredential) {
        std::string keyHeader = "X-Goog-Api-Key: " + config_.apiKey;
        headers.reset(curl_slist_append(nullptr, keyHeader.c_str()));
    }

    CURL* curl = handle.get();
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    // The credential header must never follow a redirect to another host.
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, withCredential ? 0L : 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 3L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.userAgent.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(deadline.count()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeBody);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, onProgress);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &state);
    if (headers) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
    }

    CURLcode code = curl_easy_perform(curl);
    switch (code) {
        case CURLE_OK:
            break;
        case CURLE_OPERATION_TIMEDOUT:
            return Result::err(GatewayError(ErrorCode::UpstreamTimeout,
                                            "upstream call exceeded " +
                                                std::to_string(deadline.count()) + "ms"));
        case CURLE_ABORTED_BY_CALLBACK:
            return Result::err(GatewayError(ErrorCode::RequestCancelled, "transfer cancelled"));
        case CURLE_WRITE_ERROR:
            if (state.overflow) {
                return Result::err(GatewayError(ErrorCode::PayloadTooLarge,
                                                "upstream body exceeded " +
                                                    std::to_string(state.maxBytes) + " bytes"));
            }
            [[fallthrough]];
        default:
            return Result::err(GatewayError(ErrorCode::UpstreamTransport,
                                            std::string("transport error: ") +
                                                curl_easy_strerror(code)));
    }

    Response response;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    char* contentType = nullptr;
    if (curl_easy_getinfo(curl, CURLINFO_CONTENT_TYPE, &contentType) == CURLE_OK &&
        contentType != nullptr) {
        response.contentType = contentType;
    }
    response.body = std::move(state.body);
    return Result::ok(std::move(response));
}

GatewayResult<std::string>
CurlProviderClient::resolveMedia(const MediaLookup& lookup,
                                 std::chrono::milliseconds deadline,
                                 const foundation::CancellationToken& cancel) {
    auto response = perform(resolveUrl(lookup), true, deadline, cancel);
    if (!response) {
        return GatewayResult<std::string>::err(response.error());
    }
    const auto status = static_cast<int>(response.value().status);
    if (status < 200 || status >= 300) {
        PGW_LOG_DEBUG(LogCategory::Provider,
                      "resolution returned status " + std::to_string(status));
        return GatewayResult<std::string>::err(
            GatewayError(ErrorCode::UpstreamStatus,
                         "resolution returned status " + std::to_string(status), status));
    }
    return parseResolveResponse(response.value().body);
}

GatewayResult<BinaryPayload>
CurlProviderClient::fetchBinary(const std::string& uri,
                                std::chrono::milliseconds deadline,
                                const foundation::CancellationToken& cancel) {
    auto response = perform(uri, false, deadline, cancel);
    if (!response) {
        return GatewayResult<BinaryPayload>::err(response.error());
    }
    auto& value = response.value();
    const auto status = static_cast<int>(value.status);
    if (status < 200 || status >= 300) {
        return GatewayResult<BinaryPayload>::err(
            GatewayError(ErrorCode::UpstreamStatus,
                         "binary fetch returned status " + std::to_string(status), status));
    }
    return GatewayResult<BinaryPayload>::ok(
        BinaryPayload{std::move(value.contentType), std::move(value.body)});
}

}  // namespace pgw::service
