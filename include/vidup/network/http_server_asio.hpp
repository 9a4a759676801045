#pragma once

#include "vidup/core/cancellation.hpp"
#include "vidup/network/http_parser.hpp"
#include "vidup/network/http_types.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <functional>
#include <limits>
#include <memory>

namespace vidup {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

using HttpRequestHandler = std::function<HttpResponse(const HttpRequest&)>;

/**
 * @brief Per-connection bounds
 *
 * max_body_size caps the buffered request body (413 above it).
 * request_timeout covers the whole exchange: reading the request and the
 * handler's own work, which observes it through HttpRequest::cancellation.
 */
struct ServerLimits {
    size_t max_body_size = std::numeric_limits<size_t>::max();
    std::chrono::seconds request_timeout{600};
};

/**
 * @brief One accepted connection serving a single request
 *
 * Keeps itself alive through shared_from_this while I/O is pending. All
 * completion handlers run on the socket's strand. The handler is invoked
 * inline on an io_context thread, so run the io_context on as many threads
 * as requests should be processed concurrently.
 */
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    HttpConnection(tcp::socket socket,
                   HttpRequestHandler handler,
                   const ServerLimits& limits,
                   std::shared_ptr<const CancellationToken> shutdown,
                   std::shared_ptr<std::atomic<size_t>> active_connections);
    ~HttpConnection();

    void start();

private:
    void do_read();
    void handle_request(HttpRequest request);
    void do_write(const HttpResponse& response);
    void handle_error(HttpStatus status, const std::string& message);
    void close();

    tcp::socket socket_;
    asio::steady_timer deadline_;
    HttpRequestHandler handler_;
    HttpParser parser_;
    std::chrono::seconds request_timeout_;
    std::shared_ptr<CancellationToken> cancellation_;
    std::shared_ptr<std::atomic<size_t>> active_connections_;
    std::array<char, 64 * 1024> buffer_;
};

/**
 * @brief Event-driven HTTP/1.x server on Boost.Asio
 *
 * Accepts on a strand per connection and hands each complete request to
 * the handler. Every response closes the connection.
 *
 * Shutdown: stop() closes the acceptor so no new connection is taken;
 * in-flight requests continue until they finish or their token (a child of
 * `shutdown`) is cancelled. active_connections() lets the caller wait for
 * them to drain.
 *
 * ```cpp
 * asio::io_context io_context;
 * auto shutdown = std::make_shared<CancellationToken>();
 * HttpServerAsio server(io_context, 8080, ServerLimits{}, shutdown);
 * server.set_handler([&](const HttpRequest& req) { return router.handle_request(req); });
 * io_context.run();
 * ```
 */
class HttpServerAsio {
public:
    /**
     * @param port Port to listen on, 0 for an ephemeral port
     * @throws boost::system::system_error when the port cannot be bound
     */
    HttpServerAsio(asio::io_context& io_context,
                   uint16_t port,
                   ServerLimits limits = ServerLimits{},
                   std::shared_ptr<const CancellationToken> shutdown = nullptr);

    void set_handler(HttpRequestHandler handler);

    /// Stop accepting; open connections are left to finish
    void stop();

    /// Bound port (differs from the requested one when 0 was passed)
    uint16_t get_port() const { return port_; }

    size_t active_connections() const { return active_connections_->load(); }

private:
    void do_accept();

    asio::io_context& io_context_;
    tcp::acceptor acceptor_;
    HttpRequestHandler handler_;
    ServerLimits limits_;
    std::shared_ptr<const CancellationToken> shutdown_;
    std::shared_ptr<std::atomic<size_t>> active_connections_;
    std::atomic<bool> stopped_{false};
    uint16_t port_;
};

} // namespace network
} // namespace vidup
