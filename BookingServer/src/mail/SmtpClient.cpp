#include "SmtpClient.h"
#include <algorithm>
#include <cctype>
#include <istream>
#include <stdexcept>
#include <boost/asio/ip/host_name.hpp>
#include "../auth/Tokens.h"
#include "../observability/Logging.h"

namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace mail {

bool append_reply_line(SmtpReply& r, const std::string& line) {
    if (line.size() < 3 || !isdigit((unsigned char)line[0]) || !isdigit((unsigned char)line[1]) || !isdigit((unsigned char)line[2])) {
        throw std::runtime_error("malformed smtp reply line");
    }
    int code = (line[0]-'0')*100 + (line[1]-'0')*10 + (line[2]-'0');
    if (!r.lines.empty() && code != r.code) throw std::runtime_error("smtp reply code changed mid-reply");
    r.code = code;
    bool more = line.size() > 3 && line[3] == '-';
    if (line.size() > 3 && line[3] != '-' && line[3] != ' ') throw std::runtime_error("malformed smtp reply separator");
    r.lines.push_back(line.size() > 4 ? line.substr(4) : std::string());
    return !more;
}

bool reply_has_capability(const SmtpReply& r, const std::string& keyword) {
    auto upper = [](std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), ::toupper);
        return s;
    };
    const std::string want = upper(keyword);
    for (const auto& l : r.lines) {
        std::string first = upper(l.substr(0, l.find(' ')));
        if (first == want) return true;
    }
    return false;
}

std::string auth_plain_token(const std::string& user, const std::string& pass) {
    std::string raw;
    raw.push_back('\0');
    raw += user;
    raw.push_back('\0');
    raw += pass;
    return auth::base64_encode(raw);
}

namespace {

class SmtpSession : public std::enable_shared_from_this<SmtpSession> {
public:
    SmtpSession(net::io_context& ioc, ssl::context& tls, config::SmtpSettings s, MailMessage m, SendCallback cb)
        : ioc_(ioc), resolver_(ioc), stream_(ioc, tls), timer_(ioc), settings_(std::move(s)), msg_(std::move(m)), cb_(std::move(cb)) {}

    void start() {
        for (const auto& rcpt : msg_.recipients()) {
            if (!is_envelope_address(rcpt)) { finish(SendStatus::failed, "invalid recipient address"); return; }
        }
        if (!is_envelope_address(settings_.from)) { finish(SendStatus::failed, "invalid sender address"); return; }
        implicit_tls_ = settings_.port == 465;
        payload_ = dot_stuff(render_message(msg_, std::chrono::system_clock::now()));

        if (!SSL_set_tlsext_host_name(stream_.native_handle(), settings_.host.c_str())) {
            finish(SendStatus::failed, "cannot set TLS server name");
            return;
        }
        stream_.set_verify_mode(ssl::verify_peer);
        stream_.set_verify_callback(ssl::host_name_verification(settings_.host));

        arm_timer("resolve");
        auto self = shared_from_this();
        resolver_.async_resolve(settings_.host, std::to_string(settings_.port),
            [self](const boost::system::error_code& ec, tcp::resolver::results_type eps) {
                if (ec) { self->fail("resolve", ec); return; }
                self->arm_timer("connect");
                net::async_connect(self->stream_.next_layer(), eps, [self](const boost::system::error_code& ec2, const tcp::endpoint&) {
                    if (ec2) { self->fail("connect", ec2); return; }
                    if (self->implicit_tls_) self->handshake([self]{ self->expect(220, "greeting", [self](const SmtpReply&) { self->send_ehlo(); }); });
                    else self->expect(220, "greeting", [self](const SmtpReply&) { self->send_ehlo(); });
                });
            });
    }

private:
    using ReplyFn = std::function<void(const SmtpReply&)>;

    void arm_timer(const char* step) {
        step_ = step;
        timer_.expires_after(std::chrono::seconds(settings_.timeout_sec));
        std::weak_ptr<SmtpSession> weak = shared_from_this();
        timer_.async_wait([weak](const boost::system::error_code& ec) {
            if (ec) return;
            auto self = weak.lock();
            if (!self) return;
            self->timed_out_ = true;
            boost::system::error_code ignored;
            self->resolver_.cancel();
            self->stream_.next_layer().close(ignored);
        });
    }

    void handshake(std::function<void()> next) {
        arm_timer("tls_handshake");
        auto self = shared_from_this();
        stream_.async_handshake(ssl::stream_base::client, [self, next](const boost::system::error_code& ec) {
            if (ec) { self->fail("tls_handshake", ec); return; }
            self->tls_ = true;
            next();
        });
    }

    void write(const std::string& line, std::function<void()> next) {
        out_ = line;
        auto self = shared_from_this();
        auto on_write = [self, next](const boost::system::error_code& ec, std::size_t) {
            if (ec) { self->fail("write", ec); return; }
            next();
        };
        if (tls_) net::async_write(stream_, net::buffer(out_), on_write);
        else net::async_write(stream_.next_layer(), net::buffer(out_), on_write);
    }

    void read_reply(ReplyFn next) {
        reply_ = SmtpReply{};
        read_line(std::move(next));
    }

    void read_line(ReplyFn next) {
        auto self = shared_from_this();
        auto on_read = [self, next](const boost::system::error_code& ec, std::size_t) {
            if (ec) { self->fail("read", ec); return; }
            std::istream is(&self->read_buf_);
            std::string line;
            std::getline(is, line);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            bool done = false;
            try {
                done = append_reply_line(self->reply_, line);
            } catch (const std::exception& e) {
                self->finish(SendStatus::failed, std::string(self->step_) + ": " + e.what());
                return;
            }
            if (!done) { self->read_line(next); return; }
            next(self->reply_);
        };
        if (tls_) net::async_read_until(stream_, read_buf_, "\r\n", on_read);
        else net::async_read_until(stream_.next_layer(), read_buf_, "\r\n", on_read);
    }

    // 251 (user not local, will forward) is accepted wherever 250 is.
    void expect(int want, const char* step, ReplyFn next) {
        arm_timer(step);
        auto self = shared_from_this();
        read_reply([self, want, step, next](const SmtpReply& r) {
            if (r.code != want && !(want == 250 && r.code == 251)) {
                std::string text = r.lines.empty() ? std::string() : r.lines.front();
                self->finish(SendStatus::failed, std::string(step) + " rejected: " + std::to_string(r.code) + " " + text);
                return;
            }
            next(r);
        });
    }

    void command(const std::string& line, int want, const char* step, ReplyFn next) {
        arm_timer(step);
        auto self = shared_from_this();
        write(line + "\r\n", [self, want, step, next]{ self->expect(want, step, next); });
    }

    static std::string ehlo_name() {
        boost::system::error_code ec;
        std::string h = net::ip::host_name(ec);
        if (ec || h.empty()) return "localhost";
        return h;
    }

    void send_ehlo() {
        auto self = shared_from_this();
        command("EHLO " + ehlo_name(), 250, "ehlo", [self](const SmtpReply& r) {
            if (self->tls_) { self->send_auth(); return; }
            if (!reply_has_capability(r, "STARTTLS")) {
                self->finish(SendStatus::failed, "server does not offer STARTTLS");
                return;
            }
            self->command("STARTTLS", 220, "starttls", [self](const SmtpReply&) {
                // anything buffered before the handshake is not trusted
                self->read_buf_.consume(self->read_buf_.size());
                self->handshake([self]{ self->send_ehlo(); });
            });
        });
    }

    void send_auth() {
        auto self = shared_from_this();
        command("AUTH PLAIN " + auth_plain_token(settings_.user, settings_.pass), 235, "auth", [self](const SmtpReply&) {
            self->command("MAIL FROM:<" + self->settings_.from + ">", 250, "mail_from", [self](const SmtpReply&) {
                self->rcpts_ = self->msg_.recipients();
                self->send_rcpt(0);
            });
        });
    }

    void send_rcpt(size_t i) {
        auto self = shared_from_this();
        if (i >= rcpts_.size()) {
            command("DATA", 354, "data", [self](const SmtpReply&) {
                self->arm_timer("payload");
                self->write(self->payload_, [self]{
                    self->expect(250, "payload", [self](const SmtpReply&) { self->send_quit(); });
                });
            });
            return;
        }
        command("RCPT TO:<" + rcpts_[i] + ">", 250, "rcpt_to", [self, i](const SmtpReply&) { self->send_rcpt(i + 1); });
    }

    // The message is accepted at this point; QUIT problems do not change the outcome.
    void send_quit() {
        delivered_ = true;
        auto self = shared_from_this();
        arm_timer("quit");
        write("QUIT\r\n", [self]{
            self->read_reply([self](const SmtpReply&) { self->finish(SendStatus::sent, std::string()); });
        });
    }

    void fail(const char* step, const boost::system::error_code& ec) {
        if (delivered_) { finish(SendStatus::sent, std::string()); return; }
        std::string reason = std::string(step) + ": " + (timed_out_ ? std::string("timeout") : ec.message());
        finish(SendStatus::failed, reason);
    }

    void finish(SendStatus status, std::string reason) {
        if (finished_) return;
        finished_ = true;
        timer_.cancel();
        boost::system::error_code ignored;
        stream_.next_layer().shutdown(tcp::socket::shutdown_both, ignored);
        stream_.next_layer().close(ignored);
        SendResult result{status, std::move(reason)};
        net::post(ioc_, [cb = std::move(cb_), result]() { cb(result); });
    }

    net::io_context& ioc_;
    tcp::resolver resolver_;
    ssl::stream<tcp::socket> stream_;
    net::steady_timer timer_;
    net::streambuf read_buf_;
    config::SmtpSettings settings_;
    MailMessage msg_;
    SendCallback cb_;
    std::string payload_;
    std::string out_;
    std::vector<std::string> rcpts_;
    SmtpReply reply_;
    const char* step_ = "init";
    bool implicit_tls_ = false;
    bool tls_ = false;
    bool timed_out_ = false;
    bool delivered_ = false;
    bool finished_ = false;
};

}

void async_send_mail(net::io_context& ioc, ssl::context& tls, const config::SmtpSettings& settings, MailMessage msg, SendCallback cb) {
    if (!settings.configured()) {
        net::post(ioc, [cb = std::move(cb)]() { cb(SendResult{SendStatus::not_configured, std::string()}); });
        return;
    }
    auto session = std::make_shared<SmtpSession>(ioc, tls, settings, std::move(msg), cb);
    try {
        session->start();
    } catch (const std::exception& e) {
        // every throwing step in start() runs before the session can report
        observability::log_error("smtp.start_failed", {{"what", std::string(e.what())}});
        net::post(ioc, [cb, reason = std::string(e.what())]() { cb(SendResult{SendStatus::failed, reason}); });
    }
}

}
