#include "vidup/network/http_server_asio.hpp"

#include "vidup/network/http_router.hpp"

#include <spdlog/spdlog.h>

namespace vidup {
namespace network {

// ──────────────────────────────────────────────────────────
// HttpConnection
// ──────────────────────────────────────────────────────────

HttpConnection::HttpConnection(tcp::socket socket,
                               HttpRequestHandler handler,
                               const ServerLimits& limits,
                               std::shared_ptr<const CancellationToken> shutdown,
                               std::shared_ptr<std::atomic<size_t>> active_connections)
    : socket_(std::move(socket))
    , deadline_(socket_.get_executor())
    , handler_(std::move(handler))
    , parser_(limits.max_body_size)
    , request_timeout_(limits.request_timeout)
    , cancellation_(CancellationToken::with_timeout(std::move(shutdown), limits.request_timeout))
    , active_connections_(std::move(active_connections)) {
    ++*active_connections_;
}

HttpConnection::~HttpConnection() {
    --*active_connections_;
}

void HttpConnection::start() {
    auto self = shared_from_this();

    // Bounds the read phase; slow or stalled clients are dropped
    deadline_.expires_after(request_timeout_);
    deadline_.async_wait([this, self](boost::system::error_code ec) {
        if (!ec) {
            spdlog::warn("Request not received within {}s, closing connection", request_timeout_.count());
            close();
        }
    });

    do_read();
}

void HttpConnection::do_read() {
    auto self = shared_from_this();

    socket_.async_read_some(
        asio::buffer(buffer_),
        [this, self](boost::system::error_code ec, size_t bytes_transferred) {
            if (ec) {
                if (ec != asio::error::operation_aborted && ec != asio::error::eof) {
                    spdlog::debug("Read error: {}", ec.message());
                }
                deadline_.cancel();
                return;
            }

            auto parse_result = parser_.parse(buffer_.data(), bytes_transferred);
            if (parse_result.is_error()) {
                deadline_.cancel();
                handle_error(parser_.body_too_large() ? HttpStatus::PAYLOAD_TOO_LARGE
                                                      : HttpStatus::BAD_REQUEST,
                             parse_result.error());
                return;
            }

            if (!parse_result.value()) {
                do_read();
                return;
            }

            deadline_.cancel();
            handle_request(parser_.take_request());
        }
    );
}

void HttpConnection::handle_request(HttpRequest request) {
    spdlog::info("{} {} HTTP/{} ({} bytes)",
        HttpMethodUtils::to_string(request.method),
        request.url,
        request.version == HttpVersion::HTTP_1_1 ? "1.1" : "1.0",
        request.body.size());

    request.cancellation = cancellation_;

    HttpResponse response;
    try {
        response = handler_(request);
    } catch (const std::exception& e) {
        spdlog::error("Handler threw exception: {}", e.what());
        response = make_error_response(HttpStatus::INTERNAL_SERVER_ERROR, "Internal server error");
    }

    do_write(response);
}

void HttpConnection::do_write(const HttpResponse& response) {
    auto self = shared_from_this();

    // Connection: close on every response; one request per connection
    auto data_ptr = std::make_shared<std::vector<uint8_t>>();
    {
        HttpResponse closing = response;
        closing.set_header("Connection", "close");
        *data_ptr = closing.serialize();
    }

    asio::async_write(
        socket_,
        asio::buffer(*data_ptr),
        [this, self, data_ptr](boost::system::error_code ec, size_t bytes_transferred) {
            if (!ec) {
                spdlog::debug("Sent {} bytes", bytes_transferred);
            } else if (ec != asio::error::operation_aborted) {
                spdlog::debug("Write error: {}", ec.message());
            }
            close();
        }
    );
}

void HttpConnection::handle_error(HttpStatus status, const std::string& message) {
    spdlog::warn("Rejected request: {}", message);
    do_write(make_error_response(status, message));
}

void HttpConnection::close() {
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}

// ──────────────────────────────────────────────────────────
// HttpServerAsio
// ──────────────────────────────────────────────────────────

HttpServerAsio::HttpServerAsio(asio::io_context& io_context,
                               uint16_t port,
                               ServerLimits limits,
                               std::shared_ptr<const CancellationToken> shutdown)
    : io_context_(io_context)
    , acceptor_(asio::make_strand(io_context), tcp::endpoint(tcp::v4(), port))
    , limits_(limits)
    , shutdown_(std::move(shutdown))
    , active_connections_(std::make_shared<std::atomic<size_t>>(0))
    , port_(acceptor_.local_endpoint().port()) {

    spdlog::info("HTTP server (Asio event-driven) listening on port {}", port_);
    do_accept();
}

void HttpServerAsio::set_handler(HttpRequestHandler handler) {
    handler_ = std::move(handler);
}

void HttpServerAsio::stop() {
    if (stopped_.exchange(true)) {
        return;
    }
    asio::post(acceptor_.get_executor(), [this]() {
        boost::system::error_code ec;
        acceptor_.close(ec);
        if (ec) {
            spdlog::warn("Closing acceptor: {}", ec.message());
        }
    });
}

void HttpServerAsio::do_accept() {
    acceptor_.async_accept(
        asio::make_strand(io_context_),
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (stopped_) {
                return;
            }
            if (!ec) {
                boost::system::error_code endpoint_ec;
                const auto remote = socket.remote_endpoint(endpoint_ec);
                if (!endpoint_ec) {
                    spdlog::debug("Accepted connection from {}", remote.address().to_string());
                }
                std::make_shared<HttpConnection>(
                    std::move(socket),
                    handler_,
                    limits_,
                    shutdown_,
                    active_connections_
                )->start();
            } else {
                spdlog::error("Accept error: {}", ec.message());
            }

            do_accept();
        }
    );
}

} // namespace network
} // namespace vidup
