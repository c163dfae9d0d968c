#pragma once

#include "Request.h"
#include "Response.h"
#include <string>
#include <functional>
#include <unordered_map>
#include <vector>

class Router {
public:
    using Responder = std::function<void(Response)>;
    using Handler = std::function<Response(const Request&)>;
    // The request stays alive until respond is called; respond exactly once.
    using AsyncHandler = std::function<void(const Request&, Responder)>;

    void add_route(std::string method, std::string path, Handler h);
    void add_async_route(std::string method, std::string path, AsyncHandler h);
    // Matches every path starting with `prefix`; exact routes win.
    void add_prefix_route(std::string method, std::string prefix, AsyncHandler h);

    void route(const Request& req, Responder respond) const;

    // Route pattern used for metrics labels, "(unmatched)" when none applies.
    std::string pattern_for(const Request& req) const;

    static std::string path_of(const Request& req);

private:
    struct Key { std::string method; std::string path; };
    struct KeyHash {
        size_t operator()(Key const& k) const noexcept { return std::hash<std::string>()(k.method + "#" + k.path); }
    };
    struct KeyEq { bool operator()(Key const& a, Key const& b) const noexcept { return a.method==b.method && a.path==b.path; } };
    struct PrefixRoute { std::string method; std::string prefix; AsyncHandler handler; };

    const PrefixRoute* find_prefix(const std::string& method, const std::string& path) const;

    std::unordered_map<Key, AsyncHandler, KeyHash, KeyEq> routes_;
    std::vector<PrefixRoute> prefixes_;
};
