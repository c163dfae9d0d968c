#pragma once

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <string>
#include <cstdlib>
#include <chrono>
#include <utility>
#include <stdexcept>
#include <cctype>

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;

struct TestResponse {
    int code = 0;
    std::string body;
    std::string content_type;
    std::string location;
    std::string set_cookie;
};

// "admin_session=abc; Path=/; ..." -> "admin_session=abc"
static inline std::string cookie_pair(const std::string& set_cookie) {
    return set_cookie.substr(0, set_cookie.find(';'));
}

// Simple JSON string extractor (first "key":"...")
static inline std::string json_extract_string(const std::string& js, const std::string& key) {
    std::string q = "\"" + key + "\"";
    size_t pos = js.find(q);
    if (pos == std::string::npos) return {};
    size_t colon = js.find(':', pos + q.size());
    if (colon == std::string::npos) return {};
    size_t i = colon + 1;
    while (i < js.size() && isspace((unsigned char)js[i])) ++i;
    if (i >= js.size() || js[i] != '"') return {};
    ++i;
    std::string out;
    for (; i < js.size(); ++i) {
        char c = js[i];
        if (c == '\\' && i + 1 < js.size()) { out.push_back(js[++i]); continue; }
        if (c == '"') return out;
        out.push_back(c);
    }
    return {};
}

// Simple JSON int extractor (finds "key":NUMBER)
static inline int json_extract_int(const std::string& js, const std::string& key, int fallback=-1) {
    std::string q = "\"" + key + "\"";
    size_t pos = js.find(q);
    if (pos == std::string::npos) return fallback;
    size_t colon = js.find(':', pos + q.size()); if (colon == std::string::npos) return fallback;
    size_t start = colon + 1; while (start < js.size() && isspace((unsigned char)js[start])) ++start;
    size_t end = start; while (end < js.size() && (isdigit((unsigned char)js[end]) || js[end]=='-' )) ++end;
    if (end <= start) return fallback;
    try { return std::stoi(js.substr(start, end-start)); } catch (const std::exception&) { return fallback; }
}

// Blocking one-shot request against 127.0.0.1:port. `content_type` is only
// sent with a body.
static inline TestResponse request(unsigned short port, const std::string& method, const std::string& target,
                                   const std::string& body = "", const std::string& content_type = "application/json",
                                   const std::string& cookie = "") {
    const std::string host = "127.0.0.1";
    asio::io_context ioc;
    asio::ip::tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);
    // timeouts (per operation)
    const auto op_timeout = std::chrono::seconds(5);
    beast::error_code ec;
    auto const results = resolver.resolve(host, std::to_string(port), ec);
    if (ec) throw std::runtime_error("resolve failed for " + host + " -> " + ec.message());
    stream.expires_after(op_timeout);
    stream.connect(results, ec);
    if (ec) throw std::runtime_error("connect failed " + host + ":" + std::to_string(port) + " -> " + ec.message());

    http::request<http::string_body> req{http::string_to_verb(method), target, 11};
    req.set(http::field::host, host + ":" + std::to_string(port));
    if (!body.empty()) req.set(http::field::content_type, content_type);
    if (!cookie.empty()) req.set(http::field::cookie, cookie);
    req.body() = body;
    req.prepare_payload();

    stream.expires_after(op_timeout);
    http::write(stream, req, ec);
    if (ec) throw std::runtime_error("write failed target=" + target + " -> " + ec.message());

    beast::flat_buffer b;
    http::response<http::string_body> res;
    stream.expires_after(op_timeout);
    http::read(stream, b, res, ec);
    if (ec) throw std::runtime_error("read failed target=" + target + " -> " + ec.message());

    TestResponse out;
    out.code = res.result_int();
    out.body = res.body();
    out.content_type = std::string(res[http::field::content_type]);
    out.location = std::string(res[http::field::location]);
    out.set_cookie = std::string(res[http::field::set_cookie]);
    beast::error_code shut_ec;
    stream.socket().shutdown(asio::ip::tcp::socket::shutdown_both, shut_ec);
    return out;
}

static inline TestResponse post_form(unsigned short port, const std::string& target, const std::string& body, const std::string& cookie = "") {
    return request(port, "POST", target, body, "application/x-www-form-urlencoded", cookie);
}

static inline TestResponse post_json(unsigned short port, const std::string& target, const std::string& body, const std::string& cookie = "") {
    return request(port, "POST", target, body, "application/json", cookie);
}

static inline TestResponse get(unsigned short port, const std::string& target, const std::string& cookie = "") {
    return request(port, "GET", target, "", "", cookie);
}
