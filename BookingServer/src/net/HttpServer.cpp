#include "HttpServer.h"
#include "Request.h"
#include "Response.h"
#include "../observability/Metrics.h"
#include "../observability/Logging.h"
#include <algorithm>
#include <array>
#include <chrono>
#include <memory>
#include <boost/beast/http.hpp>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;

static constexpr std::size_t kMaxHeaderBytes = 8 * 1024;
static constexpr std::size_t kMaxBodyBytes = 1 * 1024 * 1024;

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
    std::chrono::seconds response_timeout;
    std::string remote;

    Session(net::ip::tcp::socket&& s, Router& r, bool me, bool al, std::chrono::seconds rt)
        : socket(std::move(s)), buffer(), read_timer(socket.get_executor()), router(r), metrics_enabled(me), access_log(al),
          response_timeout(rt) {
        boost::system::error_code ec;
        auto ep = socket.remote_endpoint(ec);
        if (!ec) remote = ep.address().to_string();
    }

    void run() { do_read(); }

    void do_read() {
        auto self = shared_from_this();
        req = {};
        http_version = 11;

        auto parser = std::make_shared<http::request_parser<http::string_body>>();
        parser->header_limit(kMaxHeaderBytes);
        parser->body_limit(kMaxBodyBytes);

        read_timer.expires_after(std::chrono::seconds(5));
        read_timer.async_wait([self](const boost::system::error_code& ec) {
            if (!ec) self->close_socket();
        });

        http::async_read_header(socket, buffer, *parser, [self, parser](beast::error_code ec, std::size_t) {
            self->read_timer.cancel();

            if (ec) {
                if (ec == http::error::end_of_stream) { self->close_socket(); return; }
                if (ec == http::error::header_limit) {
                    self->reply_json_error(http::status::request_header_fields_too_large, "{\"error\":\"header_too_large\"}", "(header)");
                    return;
                }
                if (ec == http::error::bad_target || ec == http::error::bad_method || ec == http::error::bad_version ||
                    ec == http::error::bad_field) {
                    self->reply_json_error(http::status::bad_request, "{\"error\":\"bad_request\"}", "(parse)");
                    return;
                }
                self->close_socket();
                return;
            }

            auto& hdr_req = parser->get();
            self->http_version = hdr_req.version();
            std::size_t content_len = 0;
            if (auto len = parser->content_length()) content_len = static_cast<std::size_t>(*len);
            if (content_len > kMaxBodyBytes) {
                observability::log_info("oversized_body_header", {{"len", int64_t(content_len)}});
                self->drain_seconds_ = std::min(10, std::max(5, int(content_len / (256 * 1024))));
                self->reply_json_error(http::status::payload_too_large, "{\"error\":\"body_too_large\"}", "(body)");
                return;
            }

            if (content_len == 0) self->read_timer.expires_after(std::chrono::seconds(10));
            else if (content_len <= 128*1024) self->read_timer.expires_after(std::chrono::seconds(20));
            else self->read_timer.expires_after(std::chrono::seconds(60));
            self->read_timer.async_wait([self](const boost::system::error_code& ec) {
                if (!ec) self->close_socket();
            });

            http::async_read(self->socket, self->buffer, *parser, [self, parser](beast::error_code ec2, std::size_t) {
                self->read_timer.cancel();
                if (ec2) {
                    if (ec2 == http::error::body_limit) {
                        self->reply_json_error(http::status::payload_too_large, "{\"error\":\"payload_too_large\"}", "(body)");
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
        std::string pattern = router.pattern_for(req);
        auto answered = std::make_shared<bool>(false);
        Router::Responder respond = [self, pattern, answered](Response res) {
            if (*answered) {
                observability::log_warn("http.duplicate_response", {{"path", pattern}});
                return;
            }
            *answered = true;
            self->read_timer.cancel();
            self->send_response(std::make_shared<Response>(std::move(res)), pattern);
        };
        try {
            router.route(req, respond);
        } catch (const std::exception& e) {
            observability::log_error("http.handler_exception", {{"path", pattern}, {"what", std::string(e.what())}});
            if (!*answered) {
                respond(json_response(req, http::status::internal_server_error, "{\"error\":\"internal\"}"));
            }
        }
        if (!*answered) arm_response_deadline(respond, answered, pattern);
    }

    // Answers 500 and closes when an async handler never calls back, e.g. its
    // completion threw after route() had returned.
    void arm_response_deadline(Router::Responder respond, std::shared_ptr<bool> answered, const std::string& pattern) {
        read_timer.expires_after(response_timeout);
        read_timer.async_wait([self = shared_from_this(), respond, answered, pattern](const boost::system::error_code& ec) {
            if (ec || *answered) return;
            observability::log_error("http.response_timeout", {{"path", pattern}});
            Response res = json_response(self->req, http::status::internal_server_error, "{\"error\":\"internal\"}");
            res.keep_alive(false);
            respond(std::move(res));
        });
    }

    void record(const Response& res, const std::string& pattern) {
        std::string method(req.method_string());
        int code = static_cast<int>(res.result_int());
        double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_ts).count();
        if (metrics_enabled) {
            observability::Metrics::instance().inc(pattern, method, code);
            observability::Metrics::instance().observe_latency(pattern, method, ms);
        }
        if (access_log) {
            observability::log_info("access", {{"method", method}, {"path", Router::path_of(req)}, {"status", int64_t(code)},
                                               {"ms", int64_t(ms)}, {"remote", remote}});
        }
    }

    void send_response(std::shared_ptr<Response> sp, const std::string& pattern) {
        auto self = shared_from_this();
        if (sp->find(http::field::connection) == sp->end()) {
            sp->keep_alive(req.keep_alive());
        }
        record(*sp, pattern);
        http::async_write(socket, *sp, [self, sp, pattern](boost::system::error_code ec, std::size_t) {
            if (ec) {
                observability::log_warn("write_error", {{"path", pattern}, {"err", int64_t(ec.value())}});
                self->close_socket();
                return;
            }
            if (sp->keep_alive()) self->do_read();
            else self->graceful_close_after_write();
        });
    }

    void close_socket(bool hard_shutdown = true) {
        boost::system::error_code ignored;
        read_timer.cancel();
        socket.cancel(ignored);
        if (hard_shutdown) socket.shutdown(net::ip::tcp::socket::shutdown_both, ignored);
        socket.close(ignored);
    }

    void start_drain_timer() {
        auto self = shared_from_this();
        read_timer.expires_after(std::chrono::seconds(drain_seconds_));
        read_timer.async_wait([self](const boost::system::error_code& ec) {
            if (ec) return;
            self->close_socket(false);
        });
    }

    // Reads and discards whatever the peer still sends so the close does not reset the response.
    void do_drain_read() {
        auto self = shared_from_this();
        socket.async_read_some(net::buffer(drain_buf_), [self](boost::system::error_code ec, std::size_t) {
            if (ec) {
                if (ec == boost::asio::error::operation_aborted) return;
                self->read_timer.cancel();
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

    void reply_json_error(http::status st, const std::string& body, const std::string& label) {
        auto res = std::make_shared<Response>(st, http_version);
        res->set(http::field::content_type, "application/json; charset=utf-8");
        res->set(http::field::connection, "close");
        res->keep_alive(false);
        res->body() = body;
        res->prepare_payload();
        start_ts = std::chrono::steady_clock::now();
        http::async_write(socket, *res, [self = shared_from_this(), res, label](boost::system::error_code ec, std::size_t) {
            if (ec) {
                observability::log_warn("write_error", {{"path", label}, {"err", int64_t(ec.value())}});
                self->close_socket();
                return;
            }
            self->graceful_close_after_write();
        });
    }
};

HttpServer::HttpServer(net::io_context& ioc, const std::string& host, unsigned short port, Router& router, bool metrics_enabled, bool access_log)
    : ioc_(ioc), acceptor_(ioc, net::ip::tcp::endpoint(net::ip::make_address(host), port)), router_(router), metrics_enabled_(metrics_enabled), access_log_(access_log) {}

void HttpServer::run() { do_accept(); }

unsigned short HttpServer::local_port() const { return acceptor_.local_endpoint().port(); }

void HttpServer::set_response_timeout(std::chrono::seconds t) { response_timeout_ = t; }

void HttpServer::do_accept() {
    acceptor_.async_accept([this](beast::error_code ec, net::ip::tcp::socket socket) {
        if (!ec) {
            auto s = std::make_shared<Session>(std::move(socket), router_, metrics_enabled_, access_log_, response_timeout_);
            s->run();
        } else observability::log_warn("accept error", {{"err", int64_t(ec.value())}});

        do_accept();
    });
}
