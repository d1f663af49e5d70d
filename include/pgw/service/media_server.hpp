#pragma once

/// @file media_server.hpp
/// @brief HTTP front door for media, health, metrics and service mode.

#include "pgw/foundation/cancellation.hpp"
#include "pgw/foundation/gateway_result.hpp"
#include "pgw/service/http_types.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace pgw::foundation {
class GatewayMetrics;
}

namespace pgw::service {

class PhotoProxyHandler;
class ServiceModeController;
struct ServiceModeState;

struct MediaServerConfig {
    /// 0 picks an ephemeral port (see boundPort()).
    uint16_t port = 8080;

    std::string serviceName = "pgw-gateway";

    /// Request handling threads.
    std::size_t workers = 8;

    /// Requests whose head exceeds this are answered with 400.
    std::size_t maxRequestBytes = 16 * 1024;

    /// Time allowed for a client to send its request head.
    int readTimeoutMs = 5000;
};

/// Serialize a mode state for GET /service-mode.
[[nodiscard]] std::string serviceModeJson(const ServiceModeState& state, bool overridden);

/// Poll-based HTTP/1.1 server. The accept loop runs on its own thread and
/// hands each connection to a worker pool.
///
/// Routes:
///   - GET /media/{resourceId}/{variantRef} → PhotoProxyHandler
///   - GET /healthz      → 200 while the process is alive
///   - GET /readyz       → 503 until setReady(true), and while mode is OUTAGE
///   - GET /metrics      → Prometheus text exposition
///   - GET /service-mode → current ServiceModeState as JSON
///
/// stop() cancels every in-flight media request through a shared
/// cancellation source before joining the workers.
class MediaServer {
public:
    MediaServer(MediaServerConfig config,
                std::shared_ptr<PhotoProxyHandler> proxy,
                std::shared_ptr<ServiceModeController> mode,
                foundation::GatewayMetrics& metrics);
    ~MediaServer();

    MediaServer(const MediaServer&) = delete;
    MediaServer& operator=(const MediaServer&) = delete;

    [[nodiscard]] foundation::GatewayResult<void> start();

    void stop();

    void setReady(bool ready);

    [[nodiscard]] bool isRunning() const;

    /// Actual listening port once started.
    [[nodiscard]] uint16_t boundPort() const;

    /// Dispatch one parsed request. Used by the connection workers.
    [[nodiscard]] HttpResponse route(const HttpRequest& request,
                                     const foundation::CancellationToken& cancel);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace pgw::service
