#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/strand.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "util/log.hpp"

namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

// JSON API listener. Connections are kept alive between requests; the handler runs on
// the connection's strand and may block (sync job submission), so run the io_context
// on more than one thread.
class HttpServer {
public:
    using Request = http::request<http::string_body>;
    using Response = http::response<http::string_body>;
    using HandlerFn = std::function<void(const Request&, Response&)>;

    static constexpr std::uint64_t kBodyLimit = 1 << 20;
    static constexpr std::chrono::seconds kIdleTimeout{30};

    HttpServer(boost::asio::io_context& ioc, tcp::endpoint ep, HandlerFn handler)
    : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), handler_(std::move(handler)) {
        boost::beast::error_code ec;
        auto check = [&](const char* what) {
            if (ec) throw std::runtime_error(std::string(what) + " " + ep.address().to_string() + ":" +
                                             std::to_string(ep.port()) + ": " + ec.message());
        };
        acceptor_.open(ep.protocol(), ec);
        check("open");
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
        check("set_option");
        acceptor_.bind(ep, ec);
        check("bind");
        acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
        check("listen");
    }

    void run() { do_accept(); }

    void stop() {
        boost::asio::dispatch(acceptor_.get_executor(), [this] {
            boost::beast::error_code ec;
            acceptor_.close(ec);
        });
    }

private:
    class Connection : public std::enable_shared_from_this<Connection> {
    public:
        Connection(tcp::socket s, HandlerFn h) : stream_(std::move(s)), handler_(std::move(h)) {}

        void start() {
            boost::asio::dispatch(stream_.get_executor(), [self = shared_from_this()] { self->read_next(); });
        }

    private:
        void read_next() {
            parser_.emplace();
            parser_->body_limit(kBodyLimit);
            stream_.expires_after(kIdleTimeout);
            http::async_read(stream_, buffer_, *parser_,
                [self = shared_from_this()](boost::beast::error_code ec, std::size_t) { self->on_read(ec); });
        }

        void on_read(boost::beast::error_code ec) {
            if (ec == http::error::end_of_stream || ec == boost::beast::error::timeout) return close();
            if (ec == http::error::body_limit) {
                auto res = std::make_shared<Response>(http::status::payload_too_large, 11);
                res->set(http::field::content_type, "application/json");
                res->body() = R"({"error":"request body too large"})";
                return send(std::move(res), false);
            }
            if (ec) {
                log_debug("http") << "read: " << ec.message();
                return close();
            }

            const Request& req = parser_->get();
            auto res = std::make_shared<Response>();
            res->version(req.version());
            const auto started = std::chrono::steady_clock::now();

            if (req.method() == http::verb::options) {
                res->result(http::status::no_content);
            } else {
                handler_(req, *res);
            }
            allow_cors(*res);

            log_debug("http") << req.method_string() << " " << req.target() << " -> " << res->result_int() << " in "
                              << std::chrono::duration_cast<std::chrono::milliseconds>(
                                     std::chrono::steady_clock::now() - started).count()
                              << "ms";
            send(std::move(res), req.keep_alive());
        }

        void send(std::shared_ptr<Response> res, bool keep_alive) {
            res->keep_alive(keep_alive);
            res->prepare_payload();
            http::async_write(stream_, *res,
                [self = shared_from_this(), res](boost::beast::error_code ec, std::size_t) {
                    if (ec || !res->keep_alive()) return self->close();
                    self->read_next();
                });
        }

        static void allow_cors(Response& res) {
            res.set(http::field::access_control_allow_origin, "*");
            res.set(http::field::access_control_allow_headers, "*");
            res.set(http::field::access_control_allow_methods, "GET, POST, DELETE, OPTIONS");
        }

        void close() {
            boost::beast::error_code ec;
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        }

        boost::beast::tcp_stream stream_;
        boost::beast::flat_buffer buffer_;
        std::optional<http::request_parser<http::string_body>> parser_;
        HandlerFn handler_;
    };

    void do_accept() {
        acceptor_.async_accept(
            boost::asio::make_strand(ioc_),
            [this](boost::beast::error_code ec, tcp::socket s) {
                if (ec == boost::asio::error::operation_aborted) return;
                if (ec) {
                    log_warn("http") << "accept: " << ec.message();
                } else {
                    std::make_shared<Connection>(std::move(s), handler_)->start();
                }
                do_accept();
            });
    }

    boost::asio::io_context& ioc_;
    tcp::acceptor acceptor_;
    HandlerFn handler_;
};
