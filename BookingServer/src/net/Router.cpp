#include "Router.h"
#include <boost/beast/http.hpp>

void Router::add_route(std::string method, std::string path, Handler h) {
    add_async_route(std::move(method), std::move(path), [h = std::move(h)](const Request& req, Responder respond) {
        respond(h(req));
    });
}

void Router::add_async_route(std::string method, std::string path, AsyncHandler h) {
    Key k{std::move(method), std::move(path)};
    routes_[std::move(k)] = std::move(h);
}

void Router::add_prefix_route(std::string method, std::string prefix, AsyncHandler h) {
    prefixes_.push_back(PrefixRoute{std::move(method), std::move(prefix), std::move(h)});
}

std::string Router::path_of(const Request& req) {
    std::string target(req.target());
    auto qpos = target.find('?');
    if (qpos != std::string::npos) target.erase(qpos);
    return target;
}

const Router::PrefixRoute* Router::find_prefix(const std::string& method, const std::string& path) const {
    const PrefixRoute* best = nullptr;
    for (const auto& p : prefixes_) {
        if (!method.empty() && p.method != method) continue;
        if (path.compare(0, p.prefix.size(), p.prefix) != 0) continue;
        if (!best || p.prefix.size() > best->prefix.size()) best = &p;
    }
    return best;
}

void Router::route(const Request& req, Responder respond) const {
    std::string method(req.method_string());
    std::string path = path_of(req);
    auto it = routes_.find(Key{method, path});
    if (it != routes_.end()) {
        it->second(req, std::move(respond));
        return;
    }
    if (auto p = find_prefix(method, path)) {
        p->handler(req, std::move(respond));
        return;
    }
    bool path_exists = false;
    for (const auto& r : routes_) {
        if (r.first.path == path) { path_exists = true; break; }
    }
    if (!path_exists && find_prefix(std::string(), path)) path_exists = true;
    if (path_exists) {
        respond(json_response(req, boost::beast::http::status::method_not_allowed, "{\"error\":\"method not allowed\"}"));
        return;
    }
    respond(json_response(req, boost::beast::http::status::not_found, "{\"error\":\"not found\"}"));
}

std::string Router::pattern_for(const Request& req) const {
    std::string method(req.method_string());
    std::string path = path_of(req);
    if (routes_.count(Key{method, path})) return path;
    if (auto p = find_prefix(method, path)) return p->prefix + "*";
    return "(unmatched)";
}
