#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/io_context.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

/**
 * Minimal HTTP/1.1 server on Boost.Beast
 *
 * One request per connection (Connection: close), served on a single
 * io_context thread owned by the server. The handler fills the response;
 * an exception thrown by the handler becomes a 500.
 */
class HttpServer {
public:
    using Request = http::request<http::string_body>;
    using Response = http::response<http::string_body>;
    using HandlerFn = std::function<void(const Request&, Response&)>;

    HttpServer(const std::string& bind_address, unsigned short port, HandlerFn handler);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Binds, listens and starts the io thread; false if the endpoint is unusable
    bool start();
    void stop();
    bool is_running() const { return running_.load(); }

    // Actual bound port (useful when constructed with port 0)
    unsigned short get_port() const { return bound_port_.load(); }
    uint64_t get_requests_served() const { return requests_served_.load(); }

private:
    struct Session;

    void do_accept();

    std::string bind_address_;
    unsigned short port_;
    HandlerFn handler_;

    boost::asio::io_context ioc_{1};
    std::unique_ptr<tcp::acceptor> acceptor_;
    std::thread io_thread_;

    std::atomic<bool> running_{false};
    std::atomic<unsigned short> bound_port_{0};
    std::atomic<uint64_t> requests_served_{0};
};
