#include "vidup/network/http_server_asio.hpp"

#include <gtest/gtest.h>

#include <boost/asio/connect.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>

#include <string>
#include <thread>

using namespace vidup::network;

namespace {

class HttpServerAsioTest : public ::testing::Test {
protected:
    void start(ServerLimits limits) {
        server_ = std::make_unique<HttpServerAsio>(io_context_, 0, limits);
        server_->set_handler([](const HttpRequest& request) {
            HttpResponse response(HttpStatus::OK);
            response.set_body(request.path() + ":" + std::to_string(request.body.size()));
            return response;
        });
        thread_ = std::thread([this]() { io_context_.run(); });
    }

    void TearDown() override {
        if (server_) {
            server_->stop();
        }
        io_context_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    // Sends raw bytes and reads until the server closes the connection
    std::string exchange(const std::string& raw) {
        asio::io_context client_io;
        tcp::socket socket(client_io);
        socket.connect(tcp::endpoint(asio::ip::make_address("127.0.0.1"), server_->get_port()));
        asio::write(socket, asio::buffer(raw));

        std::string response;
        boost::system::error_code ec;
        asio::read(socket, asio::dynamic_buffer(response), ec);
        return response;
    }

    asio::io_context io_context_;
    std::unique_ptr<HttpServerAsio> server_;
    std::thread thread_;
};

} // namespace

TEST_F(HttpServerAsioTest, BindsEphemeralPort) {
    start(ServerLimits{});
    EXPECT_NE(server_->get_port(), 0);
}

TEST_F(HttpServerAsioTest, ServesRequestAndCloses) {
    start(ServerLimits{});

    const auto response = exchange("POST /upload_chunk HTTP/1.1\r\nContent-Length: 4\r\n\r\nabcd");

    EXPECT_EQ(response.rfind("HTTP/1.1 200 OK\r\n", 0), 0u) << response;
    EXPECT_NE(response.find("Connection: close"), std::string::npos);
    EXPECT_NE(response.find("/upload_chunk:4"), std::string::npos);
}

TEST_F(HttpServerAsioTest, OversizedBodyGets413) {
    ServerLimits limits;
    limits.max_body_size = 16;
    start(limits);

    const auto response = exchange("POST /upload_chunk HTTP/1.1\r\nContent-Length: 1000\r\n\r\n");

    EXPECT_EQ(response.rfind("HTTP/1.1 413", 0), 0u) << response;
}

TEST_F(HttpServerAsioTest, MalformedRequestGets400) {
    start(ServerLimits{});

    const auto response = exchange("BROKEN\r\n\r\n");

    EXPECT_EQ(response.rfind("HTTP/1.1 400", 0), 0u) << response;
}
