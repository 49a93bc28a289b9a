#pragma once

#include "labsync/network/http_parser.hpp"
#include "labsync/network/http_types.hpp"

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace labsync::test_support {

namespace asio = boost::asio;
using asio::ip::tcp;

using RequestHandler = std::function<network::HttpResponse(const network::HttpRequest&)>;

/**
 * @brief One accepted connection: read a request, answer, close
 */
class LoopbackConnection : public std::enable_shared_from_this<LoopbackConnection> {
public:
    LoopbackConnection(tcp::socket socket, RequestHandler handler)
        : socket_(std::move(socket)), handler_(std::move(handler)) {}

    void start() { do_read(); }

private:
    void do_read() {
        auto self = shared_from_this();
        socket_.async_read_some(asio::buffer(buffer_),
            [this, self](boost::system::error_code ec, std::size_t bytes) {
                if (ec) {
                    return;
                }
                auto parsed = parser_.parse(buffer_.data(), bytes);
                if (parsed.is_error()) {
                    network::HttpResponse bad(network::HttpStatus::BAD_REQUEST);
                    bad.set_body(parsed.error().message);
                    do_write(bad);
                    return;
                }
                if (!parsed.value()) {
                    do_read();
                    return;
                }
                network::HttpResponse response;
                try {
                    response = handler_(parser_.request());
                } catch (const std::exception& e) {
                    response = network::HttpResponse(network::HttpStatus::INTERNAL_SERVER_ERROR);
                    response.set_body(e.what());
                }
                do_write(response);
            });
    }

    void do_write(const network::HttpResponse& response) {
        auto self = shared_from_this();
        auto data = std::make_shared<std::vector<uint8_t>>(response.serialize());
        asio::async_write(socket_, asio::buffer(*data),
            [this, self, data](boost::system::error_code ec, std::size_t) {
                if (!ec) {
                    boost::system::error_code ignored;
                    socket_.shutdown(tcp::socket::shutdown_both, ignored);
                }
            });
    }

    tcp::socket socket_;
    RequestHandler handler_;
    network::HttpParser parser_{network::MessageKind::Request};
    std::array<char, 8192> buffer_{};
};

/**
 * @brief HTTP server on 127.0.0.1 with an ephemeral port, for client tests
 *
 * Runs its own io_context thread. Every request is recorded before the
 * handler sees it.
 */
class LoopbackServer {
public:
    explicit LoopbackServer(RequestHandler handler)
        : acceptor_(io_, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)),
          handler_(std::move(handler)) {
        do_accept();
        thread_ = std::thread([this]() { io_.run(); });
    }

    ~LoopbackServer() {
        io_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    std::uint16_t port() const { return acceptor_.local_endpoint().port(); }

    std::string base_url() const { return "http://127.0.0.1:" + std::to_string(port()); }

    std::vector<network::HttpRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    void do_accept() {
        acceptor_.async_accept([this](boost::system::error_code ec, tcp::socket socket) {
            if (!ec) {
                std::make_shared<LoopbackConnection>(std::move(socket),
                    [this](const network::HttpRequest& request) {
                        {
                            std::lock_guard<std::mutex> lock(mutex_);
                            requests_.push_back(request);
                        }
                        return handler_(request);
                    })->start();
            }
            if (acceptor_.is_open()) {
                do_accept();
            }
        });
    }

    asio::io_context io_;
    tcp::acceptor acceptor_;
    RequestHandler handler_;
    std::thread thread_;
    mutable std::mutex mutex_;
    std::vector<network::HttpRequest> requests_;
};

} // namespace labsync::test_support
