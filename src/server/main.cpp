/**
 * @file main.cpp
 * @brief vidup_server: chunked video upload service
 *
 * Run with:
 *   ./build/vidup_server -p 8080 -o ./uploads -s ./temp_uploads
 *
 * Test with:
 *   curl -F upload_id=up_abc -F chunk_index=0 -F total_chunks=1 \
 *        -F filename=clip.mp4 -F total_size=5 -F chunk=@part0 \
 *        http://localhost:8080/upload_chunk
 *   curl http://localhost:8080/healthz
 */

#include "vidup/core/cancellation.hpp"
#include "vidup/core/config.hpp"
#include "vidup/events/components.hpp"
#include "vidup/events/event_bus.hpp"
#include "vidup/events/events.hpp"
#include "vidup/network/http_router.hpp"
#include "vidup/network/http_server_asio.hpp"
#include "vidup/server/upload_routes.hpp"
#include "vidup/upload/service.hpp"

#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <memory>
#include <thread>
#include <vector>

namespace asio = boost::asio;

using vidup::network::HttpRouter;
using vidup::network::HttpServerAsio;
using vidup::network::ServerLimits;

namespace {

constexpr auto kMaxSweepInterval = std::chrono::seconds(60);
constexpr auto kDrainPollInterval = std::chrono::milliseconds(100);
constexpr auto kCancelGrace = std::chrono::seconds(1);

void schedule_sweep(asio::steady_timer& timer,
                    std::chrono::seconds interval,
                    vidup::upload::UploadService& service) {
    timer.expires_after(interval);
    timer.async_wait([&timer, interval, &service](boost::system::error_code ec) {
        if (ec) {
            return;
        }
        const auto expired = service.expire_idle_sessions();
        if (expired > 0) {
            spdlog::info("Expired {} idle upload sessions", expired);
        }
        schedule_sweep(timer, interval, service);
    });
}

// Waits for open connections to finish. Past the deadline the remaining
// requests are cancelled and get kCancelGrace to send their 503 before the
// loop stops.
void drain_connections(asio::steady_timer& timer,
                       HttpServerAsio& server,
                       vidup::CancellationToken& shutdown,
                       asio::io_context& io_context,
                       std::chrono::steady_clock::time_point deadline) {
    if (server.active_connections() == 0) {
        spdlog::info("All connections closed");
        io_context.stop();
        return;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
        if (shutdown.is_cancelled()) {
            spdlog::warn("Stopping with {} open connections", server.active_connections());
            io_context.stop();
            return;
        }
        spdlog::warn("Shutdown grace period expired with {} open connections, cancelling",
                     server.active_connections());
        shutdown.cancel();
        deadline = std::chrono::steady_clock::now() + kCancelGrace;
    }

    timer.expires_after(kDrainPollInterval);
    timer.async_wait([&timer, &server, &shutdown, &io_context, deadline](boost::system::error_code ec) {
        if (!ec) {
            drain_connections(timer, server, shutdown, io_context, deadline);
        }
    });
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    vidup::Config config = vidup::load_config_from_env();
    if (auto res = vidup::apply_command_line(config, argc, argv); res.is_error()) {
        spdlog::error("{}", res.error());
        spdlog::info("Usage: {} [-p|--port PORT] [-o|--output DIR] [-s|--staging DIR]", argv[0]);
        return 1;
    }
    spdlog::set_level(config.log_level);

    spdlog::info("Upload directory: {}", config.upload_dir.string());
    spdlog::info("Staging directory: {}", config.staging_dir.string());
    spdlog::info("Max upload size: {} MiB, max request body: {} MiB",
                 config.max_upload_size >> 20, config.max_memory >> 20);

    vidup::events::EventBus event_bus;
    vidup::events::LoggerComponent logger(event_bus);
    vidup::events::MetricsComponent metrics(event_bus);

    vidup::upload::UploadService service(config, event_bus);
    if (auto res = service.recover_on_startup(); res.is_error()) {
        spdlog::critical("Startup recovery failed: {}", vidup::describe(res.error()));
        return 1;
    }

    HttpRouter router;
    vidup::server::register_upload_routes(router, service, &metrics);
    for (const auto& route : router.list_routes()) {
        spdlog::info("Route: {}", route);
    }

    asio::io_context io_context;
    auto shutdown = std::make_shared<vidup::CancellationToken>();

    ServerLimits limits;
    limits.max_body_size = static_cast<size_t>(config.max_memory);
    limits.request_timeout = config.request_timeout;

    std::unique_ptr<HttpServerAsio> server;
    try {
        server = std::make_unique<HttpServerAsio>(io_context, config.port, limits, shutdown);
    } catch (const boost::system::system_error& e) {
        spdlog::critical("Cannot listen on port {}: {}", config.port, e.what());
        return 1;
    }
    server->set_handler([&router](const vidup::network::HttpRequest& request) {
        return router.handle_request(request);
    });
    event_bus.emit(vidup::events::ServerStartedEvent(server->get_port()));

    asio::steady_timer sweep_timer(io_context);
    schedule_sweep(sweep_timer, std::min(config.session_ttl, std::chrono::seconds(kMaxSweepInterval)), service);

    asio::steady_timer drain_timer(io_context);
    asio::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait([&](boost::system::error_code ec, int signal_number) {
        if (ec) {
            return;
        }
        event_bus.emit(vidup::events::ServerShuttingDownEvent(
            signal_number == SIGINT ? "SIGINT" : "SIGTERM"));
        server->stop();
        sweep_timer.cancel();
        drain_connections(drain_timer, *server, *shutdown, io_context,
                          std::chrono::steady_clock::now() + config.shutdown_grace);
    });

    spdlog::info("Serving on {} worker threads", config.worker_threads);
    std::vector<std::thread> workers;
    workers.reserve(config.worker_threads - 1);
    for (size_t i = 1; i < config.worker_threads; ++i) {
        workers.emplace_back([&io_context]() { io_context.run(); });
    }
    io_context.run();
    for (auto& worker : workers) {
        worker.join();
    }

    metrics.print_stats();
    spdlog::info("Server stopped");
    return 0;
}
