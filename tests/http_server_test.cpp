#include <gtest/gtest.h>

#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>

#include "auxon/http_server.h"

using namespace auxon;

namespace asio = boost::asio;
namespace beast = boost::beast;
using tcp = asio::ip::tcp;

namespace {

class HttpServerTest : public ::testing::Test {
protected:
    HttpServerTest()
        : adapter_(ModemAdapterOptions{}),
          gateway_(adapter_, PipelineLimits{}, GatewayOptions{}),
          server_(gateway_, "127.0.0.1", 0, 2) {}

    void connect(tcp::socket& socket) {
        socket.connect(tcp::endpoint(asio::ip::make_address("127.0.0.1"), server_.port()));
    }

    static Response roundTrip(tcp::socket& socket, beast::flat_buffer& buffer, const std::string& target) {
        Request request{http::verb::get, target, 11};
        request.set(http::field::host, "localhost");
        request.keep_alive(true);
        http::write(socket, request);

        Response response;
        http::read(socket, buffer, response);
        return response;
    }

    ModemAdapter adapter_;
    Gateway gateway_;
    HttpServer server_;
};

} // namespace

TEST_F(HttpServerTest, ServesKeepAliveRequests) {
    std::thread serving([this] { server_.run(); });

    asio::io_context ioc;
    tcp::socket socket(ioc);
    connect(socket);
    beast::flat_buffer buffer;

    Response first = roundTrip(socket, buffer, "/health");
    EXPECT_EQ(first.result(), http::status::ok);
    EXPECT_TRUE(first.keep_alive());

    Response second = roundTrip(socket, buffer, "/missing");
    EXPECT_EQ(second.result(), http::status::not_found);

    server_.stop();
    serving.join();
}

TEST_F(HttpServerTest, StopClosesIdleKeepAliveConnection) {
    std::thread serving([this] { server_.run(); });

    asio::io_context ioc;
    tcp::socket socket(ioc);
    connect(socket);
    beast::flat_buffer buffer;

    Response response = roundTrip(socket, buffer, "/health");
    EXPECT_EQ(response.result(), http::status::ok);
    EXPECT_TRUE(response.keep_alive());

    // run() only returns once the open connection is gone
    server_.stop();
    serving.join();

    beast::error_code ec;
    Response after;
    http::read(socket, buffer, after, ec);
    EXPECT_EQ(ec, http::error::end_of_stream);
}
