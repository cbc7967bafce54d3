#include "http_server.hpp"
#include "../logging/log_helper.hpp"
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <chrono>

struct HttpServer::Session : public std::enable_shared_from_this<HttpServer::Session> {
    boost::beast::tcp_stream stream_;
    boost::beast::flat_buffer buffer_;
    HttpServer& server_;
    Request req_;

    Session(tcp::socket socket, HttpServer& server)
        : stream_(std::move(socket)), server_(server) {}

    void run() {
        boost::asio::dispatch(stream_.get_executor(),
            [self = shared_from_this()]() { self->do_read(); });
    }

    void do_read() {
        req_ = {};
        stream_.expires_after(std::chrono::seconds(10));
        auto self = shared_from_this();
        http::async_read(stream_, buffer_, req_,
            [self](boost::beast::error_code ec, std::size_t) {
                if (ec == http::error::end_of_stream) return self->do_close();
                if (ec) return;
                self->handle();
            });
    }

    void handle() {
        auto res = std::make_shared<Response>();
        res->version(req_.version());
        res->keep_alive(false);
        res->set(http::field::server, "trade-ingest/1.0");

        try {
            server_.handler_(req_, *res);
        } catch (const std::exception& e) {
            LOG_ERROR_COMP("HTTP_SERVER", "Handler failed for " + std::string(req_.target()) + ": " + e.what());
            res->result(http::status::internal_server_error);
            res->set(http::field::content_type, "application/json");
            res->body() = R"({"error":"internal error"})";
        }
        res->prepare_payload();
        server_.requests_served_.fetch_add(1);

        auto self = shared_from_this();
        http::async_write(stream_, *res,
            [self, res](boost::beast::error_code, std::size_t) {
                self->do_close();
            });
    }

    void do_close() {
        boost::beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }
};

HttpServer::HttpServer(const std::string& bind_address, unsigned short port, HandlerFn handler)
    : bind_address_(bind_address), port_(port), handler_(std::move(handler)) {
}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start() {
    if (running_.load()) {
        return true;
    }

    boost::beast::error_code ec;
    auto address = boost::asio::ip::make_address(bind_address_, ec);
    if (ec) {
        LOG_ERROR_COMP("HTTP_SERVER", "Invalid bind address " + bind_address_ + ": " + ec.message());
        return false;
    }
    tcp::endpoint endpoint(address, port_);

    acceptor_ = std::make_unique<tcp::acceptor>(ioc_);
    acceptor_->open(endpoint.protocol(), ec);
    if (!ec) acceptor_->set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (!ec) acceptor_->bind(endpoint, ec);
    if (!ec) acceptor_->listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
        LOG_ERROR_COMP("HTTP_SERVER", "Failed to listen on " + bind_address_ + ":" +
                       std::to_string(port_) + ": " + ec.message());
        acceptor_.reset();
        return false;
    }

    bound_port_.store(acceptor_->local_endpoint().port());
    running_.store(true);
    do_accept();

    ioc_.restart();
    io_thread_ = std::thread([this]() {
        ioc_.run();
    });

    LOG_INFO_COMP("HTTP_SERVER", "Listening on " + bind_address_ + ":" + std::to_string(bound_port_.load()));
    return true;
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    boost::asio::post(ioc_, [this]() {
        boost::beast::error_code ec;
        if (acceptor_) {
            acceptor_->close(ec);
        }
    });
    ioc_.stop();

    if (io_thread_.joinable()) {
        io_thread_.join();
    }
    acceptor_.reset();

    LOG_INFO_COMP("HTTP_SERVER", "Stopped after " + std::to_string(requests_served_.load()) + " requests");
}

void HttpServer::do_accept() {
    acceptor_->async_accept(
        boost::asio::make_strand(ioc_),
        [this](boost::beast::error_code ec, tcp::socket socket) {
            if (!running_.load()) {
                return;
            }
            if (!ec) {
                std::make_shared<Session>(std::move(socket), *this)->run();
            }
            do_accept();
        });
}
