#ifndef AUXON_HTTP_SERVER_H
#define AUXON_HTTP_SERVER_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/thread_pool.hpp>

#include "auxon/gateway.h"

namespace auxon {

class HttpSession;

// Reads and writes that stall longer than this close the connection.
constexpr std::chrono::seconds kIdleTimeout{30};

// HTTP/1.1 front end. Connections are accepted on the calling thread's
// io_context and served on a fixed thread pool, each on its own strand.
class HttpServer {
public:
    // Binds immediately; throws boost::system::system_error if it cannot.
    HttpServer(const Gateway& gateway, const std::string& address, std::uint16_t port, unsigned threads);

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Serves until SIGINT, SIGTERM or stop(), then waits for open
    // connections to finish.
    void run();

    // Stops accepting. Idle keep-alive connections are closed; a connection
    // with a request in flight is closed once its response is written.
    void stop();

    std::uint16_t port() const;

private:
    void doAccept();

    const Gateway& gateway_;
    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::signal_set signals_;
    boost::asio::thread_pool workers_;
    std::atomic<bool> stopping_{false};
    std::vector<std::weak_ptr<HttpSession>> sessions_; // touched only on ioc_
};

} // namespace auxon

#endif // AUXON_HTTP_SERVER_H
