#pragma once

#include <boost/beast/http.hpp>
#include <string>
#include "Request.h"

using Response = boost::beast::http::response<boost::beast::http::string_body>;

inline Response make_response(const Request& req, boost::beast::http::status st, const std::string& content_type, std::string body) {
    Response res{st, req.version()};
    res.set(boost::beast::http::field::content_type, content_type);
    res.keep_alive(req.keep_alive());
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

inline Response json_response(const Request& req, boost::beast::http::status st, std::string body) {
    return make_response(req, st, "application/json; charset=utf-8", std::move(body));
}

inline Response html_response(const Request& req, boost::beast::http::status st, std::string body) {
    return make_response(req, st, "text/html; charset=utf-8", std::move(body));
}

// 303 See Other
inline Response redirect_response(const Request& req, const std::string& location) {
    Response res = make_response(req, boost::beast::http::status::see_other, "text/plain; charset=utf-8", std::string());
    res.set(boost::beast::http::field::location, location);
    return res;
}
