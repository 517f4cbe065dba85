#include "HttpServer.h"
#include "Request.h"
#include "Response.h"
#include "../observability/Metrics.h"
#include "../observability/Logging.h"
#include <array>
#include <chrono>
#include <algorithm>
#include <exception>
#include <optional>
#include <boost/beast/http.hpp>
#include <boost/asio/thread_pool.hpp>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;

namespace {

constexpr std::size_t MAX_BODY = 256 * 1024;

struct Session : std::enable_shared_from_this<Session> {
    net::ip::tcp::socket socket;
    beast::flat_buffer buffer;
    net::steady_timer read_timer;
    Router& router;
    unsigned http_version = 11;
    Request req;
    bool draining_ = false;
    std::array<char, 4096> drain_buf_{};
    int drain_seconds_ = 5;
    std::chrono::steady_clock::time_point start_ts;
    bool metrics_enabled;
    bool access_log;
    std::shared_ptr<net::thread_pool> cpu_pool;

    Session(net::ip::tcp::socket&& s, Router& r, bool me, bool al, std::shared_ptr<net::thread_pool> pool)
        : socket(std::move(s)), buffer(), read_timer(socket.get_executor()), router(r), metrics_enabled(me),
          access_log(al), cpu_pool(std::move(pool)) {}

    void run() { do_read(); }

    void do_read() {
        auto self = shared_from_this();
        req = {};
        http_version = 11;

        auto parser = std::make_shared<http::request_parser<http::string_body>>();
        parser->header_limit(8 * 1024);
        parser->body_limit(MAX_BODY);

        read_timer.expires_after(std::chrono::seconds(5));
        read_timer.async_wait([self](const boost::system::error_code& ec) {
            if (!ec) self->close_socket();
        });

        http::async_read_header(socket, buffer, *parser, [self, parser](beast::error_code ec, std::size_t) {
            boost::system::error_code ignored_cancel;
            self->read_timer.cancel(ignored_cancel);

            if (ec) {
                if (ec == http::error::end_of_stream) { self->close_socket(); return; }
                if (ec == http::error::header_limit) {
                    self->reply_json_error(http::status::request_header_fields_too_large, "{\"error\":\"header_too_large\"}", true, "(header)");
                    return;
                }
                if (ec == http::error::bad_target || ec == http::error::bad_method || ec == http::error::bad_version ||
                    ec == http::error::bad_field) {
                    self->reply_json_error(http::status::bad_request, "{\"error\":\"bad_request\"}", true, "(parse)");
                    return;
                }
                self->close_socket();
                return;
            }

            self->http_version = parser->get().version();
            auto content_len = parser->content_length();
            if (content_len && *content_len > MAX_BODY) {
                observability::log_info("oversized_body_header", {{"len", int64_t(*content_len)}});
                self->drain_seconds_ = std::min(10, std::max(5, int(*content_len / (256 * 1024))));
                self->reply_json_error(http::status::payload_too_large, "{\"error\":\"body_too_large\"}", true, "(body)");
                return;
            }
            self->read_timer.expires_after(std::chrono::seconds(content_len && *content_len > 0 ? 20 : 10));
            self->read_timer.async_wait([self](const boost::system::error_code& ec2) {
                if (!ec2) self->close_socket();
            });

            http::async_read(self->socket, self->buffer, *parser, [self, parser](beast::error_code ec2, std::size_t) {
                boost::system::error_code ignored;
                self->read_timer.cancel(ignored);
                if (ec2) {
                    if (ec2 == http::error::body_limit) {
                        self->reply_json_error(http::status::payload_too_large, "{\"error\":\"payload_too_large\"}", true, "(body)");
                        return;
                    }
                    self->close_socket();
                    return;
                }
                self->req = parser->release();
                self->start_ts = std::chrono::steady_clock::now();
                self->handle_request();
            });
        });
    }

    void handle_request() {
        auto self = shared_from_this();
        std::string cleaned_target = strip_query(std::string(req.target()));

        // Handlers may block on the directory or the database.
        net::post(*cpu_pool, [self, cleaned_target]() {
            std::shared_ptr<Response> res;
            try {
                res = std::make_shared<Response>(self->router.route(self->req));
            } catch (const std::exception& e) {
                observability::log_error("handler_exception", {{"path", cleaned_target}, {"err", std::string(e.what())}});
                res = std::make_shared<Response>(make_json_response(http::status::internal_server_error, self->req, "{\"error\":\"internal\"}"));
            }
            net::post(self->socket.get_executor(), [self, res, cleaned_target]() {
                self->send_response(res, cleaned_target);
            });
        });
    }

    void send_response(std::shared_ptr<Response> res, const std::string& cleaned_target) {
        auto self = shared_from_this();
        if (res->find(http::field::connection) == res->end()) res->keep_alive(req.keep_alive());

        auto elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_ts).count();
        std::string method = std::string(req.method_string());
        int code = static_cast<int>(res->result_int());
        if (metrics_enabled) {
            observability::Metrics::instance().inc(cleaned_target, method, code);
            observability::Metrics::instance().observe_latency(cleaned_target, method, elapsed_ms);
        }
        if (access_log) {
            observability::log_info("http_access", {{"path", cleaned_target}, {"method", method},
                                                    {"code", int64_t(code)}, {"ms", elapsed_ms}});
        }

        http::async_write(socket, *res, [self, res, cleaned_target](boost::system::error_code ec, std::size_t) {
            if (ec) {
                observability::log_warn("write_error", {{"path", cleaned_target}, {"err", int64_t(ec.value())}});
                self->close_socket();
                return;
            }
            if (res->keep_alive()) self->do_read();
            else self->graceful_close_after_write();
        });
    }

    void close_socket(bool hard_shutdown = true) {
        boost::system::error_code ignored;
        read_timer.cancel(ignored);
        socket.cancel(ignored);
        if (hard_shutdown) socket.shutdown(net::ip::tcp::socket::shutdown_both, ignored);
        socket.close(ignored);
    }

    void start_drain_timer() {
        auto self = shared_from_this();
        boost::system::error_code ignored;
        read_timer.cancel(ignored);
        read_timer.expires_after(std::chrono::seconds(drain_seconds_));
        read_timer.async_wait([self](const boost::system::error_code& ec) {
            if (ec) return;
            self->close_socket(false);
        });
    }

    void do_drain_read() {
        auto self = shared_from_this();
        socket.async_read_some(net::buffer(drain_buf_), [self](boost::system::error_code ec, std::size_t) {
            if (ec) {
                if (ec == net::error::operation_aborted) return;
                boost::system::error_code ignored;
                self->read_timer.cancel(ignored);
                self->close_socket(false);
                return;
            }
            self->do_drain_read();
        });
    }

    void graceful_close_after_write() {
        if (draining_) return;
        draining_ = true;
        boost::system::error_code ignored;
        socket.shutdown(net::ip::tcp::socket::shutdown_send, ignored);
        start_drain_timer();
        do_drain_read();
    }

    void reply_json_error(http::status st, const std::string& body, bool close_conn, const std::string& cleaned_target) {
        auto res = std::make_shared<Response>(st, http_version);
        res->set(http::field::content_type, "application/json");
        res->keep_alive(!close_conn && req.keep_alive());
        res->body() = body;
        res->prepare_payload();
        if (!close_conn) {
            send_response(res, cleaned_target);
            return;
        }
        res->set(http::field::connection, "close");
        http::async_write(socket, *res, [self = shared_from_this(), res, cleaned_target](boost::system::error_code ec, std::size_t) {
            if (ec) {
                observability::log_warn("write_error", {{"path", cleaned_target}, {"err", int64_t(ec.value())}});
                self->close_socket();
                return;
            }
            self->graceful_close_after_write();
        });
    }
};

}

HttpServer::HttpServer(net::io_context& ioc, unsigned short port, Router& router, bool metrics_enabled, bool access_log,
                       std::shared_ptr<net::thread_pool> cpu_pool)
    : ioc_(ioc), acceptor_(ioc, net::ip::tcp::endpoint(net::ip::address_v4::any(), port)), router_(router),
      metrics_enabled_(metrics_enabled), access_log_(access_log), cpu_pool_(std::move(cpu_pool)) {
    if (!cpu_pool_) cpu_pool_ = std::make_shared<net::thread_pool>(2);
}

void HttpServer::run() { do_accept(); }

void HttpServer::stop() {
    net::post(ioc_, [this] {
        boost::system::error_code ignored;
        acceptor_.close(ignored);
    });
}

unsigned short HttpServer::port() const { return acceptor_.local_endpoint().port(); }

void HttpServer::do_accept() {
    acceptor_.async_accept([this](beast::error_code ec, net::ip::tcp::socket socket) {
        if (ec == net::error::operation_aborted) return;
        if (!ec) {
            auto s = std::make_shared<Session>(std::move(socket), router_, metrics_enabled_, access_log_, cpu_pool_);
            s->run();
        } else {
            observability::log_warn("accept_error", {{"err", int64_t(ec.value())}});
        }
        do_accept();
    });
}
