/// @file media_server.cpp
/// @brief POSIX socket server dispatching to the media proxy.

#include "pgw/service/media_server.hpp"

#include "pgw/foundation/gateway_logger.hpp"
#include "pgw/foundation/gateway_metrics.hpp"
#include "pgw/foundation/json_log_formatter.hpp"
#include "pgw/foundation/worker_pool.hpp"
#include "pgw/service/photo_proxy.hpp"
#include "pgw/service/service_mode.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <optional>
#include <sstream>
#include <thread>

#include <arpa/inet.h>
#include <cerrno>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace pgw::service {

using foundation::ErrorCode;
using foundation::GatewayError;
using foundation::GatewayResult;
using foundation::LogCategory;

namespace {

HttpResponse jsonResponse(int status, std::string body) {
    HttpResponse response;
    response.status = status;
    response.setHeader("Content-Type", "application/json");
    response.setHeader("Cache-Control", "no-store");
    response.body = std::move(body);
    return response;
}

std::string triggersJson(const ServiceTriggers& t) {
    auto flag = [](bool v) { return v ? "true" : "false"; };
    std::ostringstream out;
    out << R"({"providerHealthy":)" << flag(t.providerHealthy)
        << R"(,"budgetOk":)" << flag(t.budgetOk)
        << R"(,"latencyOk":)" << flag(t.latencyOk)
        << R"(,"circuitBreakerClosed":)" << flag(t.circuitBreakerClosed) << "}";
    return out.str();
}

/// Read until the end of the request head, the size cap, or the timeout.
std::optional<std::string> readRequestHead(int fd, std::size_t maxBytes, int timeoutMs) {
    std::string data;
    std::array<char, 4096> buf{};
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);

    while (data.find("\r\n\r\n") == std::string::npos) {
        if (data.size() > maxBytes) {
            return std::nullopt;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return std::nullopt;
        }
        struct pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;
        if (poll(&pfd, 1, static_cast<int>(remaining.count())) <= 0) {
            return std::nullopt;
        }
        auto n = read(fd, buf.data(), buf.size());
        if (n <= 0) {
            return std::nullopt;
        }
        data.append(buf.data(), static_cast<std::size_t>(n));
    }
    return data;
}

bool writeAll(int fd, std::string_view data) {
    while (!data.empty()) {
        auto n = send(fd, data.data(), data.size(), MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        data.remove_prefix(static_cast<std::size_t>(n));
    }
    return true;
}

}  // namespace

std::string serviceModeJson(const ServiceModeState& state, bool overridden) {
    std::ostringstream out;
    out << R"({"currentMode":)" << foundation::jsonQuote(toString(state.currentMode))
        << R"(,"reason":)" << foundation::jsonQuote(state.reason)
        << R"(,"enteredAt":)" << foundation::toUnixMillis(state.enteredAt)
        << R"(,"overridden":)" << (overridden ? "true" : "false")
        << R"(,"triggers":)" << triggersJson(state.triggers) << "}";
    return out.str();
}

// ── Impl ────────────────────────────────────────────────────────────────────

struct MediaServer::Impl {
    MediaServerConfig config;
    std::shared_ptr<PhotoProxyHandler> proxy;
    std::shared_ptr<ServiceModeController> mode;
    foundation::GatewayMetrics& metrics;

    std::atomic<bool> running{false};
    std::atomic<bool> ready{false};
    std::atomic<uint16_t> boundPort{0};
    std::thread acceptThread;
    std::unique_ptr<foundation::WorkerPool> pool;
    foundation::CancellationSource cancel;
    int listenFd{-1};
    std::chrono::steady_clock::time_point startTime{};

    Impl(MediaServerConfig cfg, std::shared_ptr<PhotoProxyHandler> p,
         std::shared_ptr<ServiceModeController> m, foundation::GatewayMetrics& metricsRef)
        : config(std::move(cfg)), proxy(std::move(p)), mode(std::move(m)), metrics(metricsRef) {}

    void acceptLoop(MediaServer& owner) {
        while (running.load(std::memory_order_relaxed)) {
            struct pollfd pfd{};
            pfd.fd = listenFd;
            pfd.events = POLLIN;

            // Short timeout keeps shutdown responsive.
            int ret = poll(&pfd, 1, 250);
            if (ret <= 0 || (pfd.revents & POLLIN) == 0) {
                continue;
            }

            int clientFd = accept(listenFd, nullptr, nullptr);
            if (clientFd < 0) {
                continue;
            }

            auto token = cancel.token();
            auto submitted = pool->submit([this, &owner, clientFd, token] {
                serveConnection(owner, clientFd, token);
            });
            if (!submitted) {
                PGW_LOG_WARN(LogCategory::Gateway, "connection rejected: " +
                                                   std::string(submitted.error().message()));
                auto busy = errorResponse(503, "server busy", "overloaded", 1);
                if (!writeAll(clientFd, serializeHttpResponse(busy))) {
                    PGW_LOG_DEBUG(LogCategory::Gateway, "failed to write busy response");
                }
                close(clientFd);
            }
        }
    }

    void serveConnection(MediaServer& owner, int clientFd,
                         const foundation::CancellationToken& token) {
        HttpResponse response;
        auto head = readRequestHead(clientFd, config.maxRequestBytes, config.readTimeoutMs);
        if (!head) {
            response = errorResponse(400, "bad request", "malformed_request");
        } else {
            auto request = parseHttpRequest(*head);
            response = request ? owner.route(request.value(), token)
                               : errorResponse(400, "bad request", "malformed_request");
        }
        if (!writeAll(clientFd, serializeHttpResponse(response))) {
            PGW_LOG_DEBUG(LogCategory::Gateway, "client went away before the response");
        }
        close(clientFd);
    }

    HttpResponse health(bool readiness) const {
        auto state = mode->current();
        auto check = metrics.healthCheck();
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - startTime);

        bool isReady = ready.load(std::memory_order_relaxed) &&
                       state.currentMode != ServiceMode::Outage;
        std::string status = readiness ? (isReady ? "ready" : "not_ready")
                                       : std::string(foundation::healthStatusName(check.status));

        std::ostringstream out;
        out << R"({"status":)" << foundation::jsonQuote(status)
            << R"(,"service":)" << foundation::jsonQuote(config.serviceName)
            << R"(,"uptime_seconds":)" << uptime.count()
            << R"(,"mode":)" << foundation::jsonQuote(toString(state.currentMode)) << "}";
        return jsonResponse(readiness && !isReady ? 503 : 200, out.str());
    }
};

// ── Public API ──────────────────────────────────────────────────────────────

MediaServer::MediaServer(MediaServerConfig config,
                         std::shared_ptr<PhotoProxyHandler> proxy,
                         std::shared_ptr<ServiceModeController> mode,
                         foundation::GatewayMetrics& metrics)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(proxy), std::move(mode),
                                   metrics)) {
    impl_->startTime = std::chrono::steady_clock::now();
}

MediaServer::~MediaServer() {
    stop();
}

GatewayResult<void> MediaServer::start() {
    if (impl_->running.load()) {
        return GatewayResult<void>::ok();
    }

    impl_->listenFd = socket(AF_INET, SOCK_STREAM, 0);
    if (impl_->listenFd < 0) {
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::NetworkError, "failed to create media server socket"));
    }

    int optval = 1;
    if (setsockopt(impl_->listenFd, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval)) < 0) {
        PGW_LOG_WARN(LogCategory::Gateway, "SO_REUSEADDR not applied");
    }

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(impl_->config.port);

    if (bind(impl_->listenFd,
             reinterpret_cast<struct sockaddr*>(&addr),  // NOLINT
             sizeof(addr)) < 0) {
        close(impl_->listenFd);
        impl_->listenFd = -1;
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::ListenFailed,
                         "failed to bind media server on port " +
                             std::to_string(impl_->config.port)));
    }

    if (listen(impl_->listenFd, 128) < 0) {
        close(impl_->listenFd);
        impl_->listenFd = -1;
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::ListenFailed, "failed to listen on media server socket"));
    }

    struct sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (getsockname(impl_->listenFd,
                    reinterpret_cast<struct sockaddr*>(&bound),  // NOLINT
                    &len) == 0) {
        impl_->boundPort.store(ntohs(bound.sin_port));
    } else {
        impl_->boundPort.store(impl_->config.port);
    }

    impl_->pool = std::make_unique<foundation::WorkerPool>(impl_->config.serviceName,
                                                           impl_->config.workers);
    impl_->running.store(true, std::memory_order_relaxed);
    impl_->acceptThread = std::thread([this]() { impl_->acceptLoop(*this); });

    PGW_LOG_INFO(LogCategory::Gateway,
                 "media server listening on port " + std::to_string(boundPort()));
    return GatewayResult<void>::ok();
}

void MediaServer::stop() {
    if (!impl_->running.exchange(false, std::memory_order_relaxed)) {
        return;
    }

    impl_->cancel.cancel();

    if (impl_->acceptThread.joinable()) {
        impl_->acceptThread.join();
    }
    if (impl_->listenFd >= 0) {
        close(impl_->listenFd);
        impl_->listenFd = -1;
    }
    if (impl_->pool) {
        impl_->pool->shutdown();
    }
    PGW_LOG_INFO(LogCategory::Gateway, "media server stopped");
}

void MediaServer::setReady(bool ready) {
    impl_->ready.store(ready, std::memory_order_relaxed);
    impl_->metrics.setGauge("pgw_ready", ready ? 1.0 : 0.0);
}

bool MediaServer::isRunning() const {
    return impl_->running.load(std::memory_order_relaxed);
}

uint16_t MediaServer::boundPort() const {
    return impl_->boundPort.load();
}

HttpResponse MediaServer::route(const HttpRequest& request,
                                const foundation::CancellationToken& cancel) {
    if (request.method != "GET") {
        auto response = errorResponse(405, "method not allowed", "method_not_allowed");
        response.setHeader("Allow", "GET");
        return response;
    }

    if (request.path.rfind("/media/", 0) == 0) {
        return impl_->proxy->handle(request, cancel);
    }
    if (request.path == "/healthz") {
        return impl_->health(false);
    }
    if (request.path == "/readyz") {
        return impl_->health(true);
    }
    if (request.path == "/metrics") {
        HttpResponse response;
        response.setHeader("Content-Type", "text/plain; version=0.0.4; charset=utf-8");
        response.body = impl_->metrics.scrape();
        return response;
    }
    if (request.path == "/service-mode") {
        return jsonResponse(200, serviceModeJson(impl_->mode->current(),
                                                 impl_->mode->isOverridden()));
    }
    return errorResponse(404, "not found", "unknown_route");
}

}  // namespace pgw::service
