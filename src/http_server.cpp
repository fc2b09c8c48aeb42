#include "auxon/http_server.h"

#include <csignal>
#include <algorithm>
#include <atomic>
#include <exception>
#include <memory>
#include <optional>
#include <utility>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core/bind_handler.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>

#include "auxon/log.h"

namespace auxon {

namespace asio = boost::asio;
namespace beast = boost::beast;
using tcp = asio::ip::tcp;

namespace {

constexpr std::uint32_t kHeaderLimit = 16 * 1024;

} // namespace

// ----------------------------------
// CONNECTION
// ----------------------------------
// One keep-alive connection. The headers are read first so an oversized
// Content-Length is refused before any of the body is buffered.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket&& socket, const Gateway& gateway, const std::atomic<bool>& stopping)
        : stream_(std::move(socket)), gateway_(gateway), stopping_(stopping) {}

    void run() {
        asio::dispatch(stream_.get_executor(),
                       beast::bind_front_handler(&HttpSession::readHeader, shared_from_this()));
    }

    // Closes the connection if it is waiting for the next request. Otherwise
    // onWrite() closes it after the current response.
    void shutdown() {
        asio::post(stream_.get_executor(), [self = shared_from_this()] {
            if (!self->idle_) return;
            self->close();
            self->stream_.cancel();
        });
    }

private:
    void readHeader() {
        if (stopping_) return close();

        idle_ = true;
        parser_.emplace();
        parser_->header_limit(kHeaderLimit);

        stream_.expires_after(kIdleTimeout);
        http::async_read_header(stream_, buffer_, *parser_,
                                beast::bind_front_handler(&HttpSession::onHeader, shared_from_this()));
    }

    void onHeader(beast::error_code ec, std::size_t) {
        idle_ = false;
        if (ec == http::error::end_of_stream) return close();
        if (ec) {
            logDebug("connection closed while reading headers: {}", ec.message());
            return;
        }

        limit_ = gateway_.bodyLimit(parser_->get().target());
        const auto length = parser_->content_length();
        if (length && *length > limit_) return reject();

        if (beast::iequals(parser_->get()[http::field::expect], "100-continue")) {
            continue_ = std::make_shared<http::response<http::empty_body>>(http::status::continue_,
                                                                          parser_->get().version());
            http::async_write(stream_, *continue_,
                              beast::bind_front_handler(&HttpSession::onContinue, shared_from_this()));
            return;
        }
        readBody();
    }

    void onContinue(beast::error_code ec, std::size_t) {
        continue_.reset();
        if (ec) {
            logDebug("write failed: {}", ec.message());
            return;
        }
        readBody();
    }

    void readBody() {
        parser_->body_limit(limit_);
        stream_.expires_after(kIdleTimeout);
        http::async_read(stream_, buffer_, *parser_,
                         beast::bind_front_handler(&HttpSession::onBody, shared_from_this()));
    }

    void onBody(beast::error_code ec, std::size_t) {
        if (ec == http::error::body_limit) return reject();
        if (ec) {
            logDebug("connection closed while reading body: {}", ec.message());
            return;
        }

        try {
            response_ = gateway_.handle(parser_->get());
        } catch (const std::exception& ex) {
            logError("connection aborted: {}", ex.what());
            return;
        }
        write();
    }

    void reject() {
        response_ = gateway_.rejectOversized(parser_->get());
        response_.keep_alive(false);
        write();
    }

    void write() {
        stream_.expires_after(kIdleTimeout);
        http::async_write(stream_, response_,
                          beast::bind_front_handler(&HttpSession::onWrite, shared_from_this(),
                                                    !response_.keep_alive()));
    }

    void onWrite(bool closeAfter, beast::error_code ec, std::size_t) {
        if (ec) {
            logDebug("write failed: {}", ec.message());
            return;
        }
        if (closeAfter || stopping_) return close();

        response_ = Response{};
        readHeader();
    }

    void close() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    const Gateway& gateway_;
    const std::atomic<bool>& stopping_;
    bool idle_ = false;
    std::optional<http::request_parser<http::string_body>> parser_;
    std::shared_ptr<http::response<http::empty_body>> continue_;
    Response response_;
    std::uint64_t limit_ = 0;
};

HttpServer::HttpServer(const Gateway& gateway, const std::string& address, std::uint16_t port,
                       unsigned threads)
    : gateway_(gateway),
      acceptor_(ioc_, tcp::endpoint(asio::ip::make_address(address), port)),
      signals_(ioc_, SIGINT, SIGTERM),
      workers_(threads) {}

std::uint16_t HttpServer::port() const {
    return acceptor_.local_endpoint().port();
}

void HttpServer::run() {
    signals_.async_wait([this](const beast::error_code& ec, int signal) {
        if (ec) return;
        logInfo("received signal {}, shutting down", signal);
        stop();
    });

    doAccept();
    ioc_.run();

    workers_.join();
    logInfo("server stopped");
}

void HttpServer::stop() {
    stopping_ = true;
    asio::post(ioc_, [this] {
        beast::error_code ec;
        acceptor_.close(ec);
        signals_.cancel(ec);

        for (const auto& weak : sessions_) {
            if (auto session = weak.lock()) {
                session->shutdown();
            }
        }
        sessions_.clear();
    });
}

void HttpServer::doAccept() {
    acceptor_.async_accept(asio::make_strand(workers_), [this](const beast::error_code& ec, tcp::socket socket) {
        if (ec) {
            if (ec != asio::error::operation_aborted) {
                logWarn("accept failed: {}", ec.message());
            }
        } else {
            sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                           [](const std::weak_ptr<HttpSession>& s) { return s.expired(); }),
                            sessions_.end());

            auto session = std::make_shared<HttpSession>(std::move(socket), gateway_, stopping_);
            sessions_.push_back(session);
            session->run();
        }

        if (acceptor_.is_open()) {
            doAccept();
        }
    });
}

} // namespace auxon
