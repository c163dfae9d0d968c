#include "FormBody.h"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include "../net/MiniJson.h"
#include "../observability/Logging.h"

namespace web {

std::string url_decode(std::string_view s) {
    std::string out; out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '%') {
            if (i + 2 >= s.size()) return out;
            auto hex = [&](char h)->int {
                if (h >= '0' && h <= '9') return h - '0';
                if (h >= 'a' && h <= 'f') return 10 + (h - 'a');
                if (h >= 'A' && h <= 'F') return 10 + (h - 'A');
                return -1;
            };
            int hi = hex(s[i+1]); int lo = hex(s[i+2]); if (hi < 0 || lo < 0) return out;
            out.push_back(char((hi << 4) | lo)); i += 2;
        } else if (c == '+') out.push_back(' ');
        else out.push_back(c);
    }
    return out;
}

booking::Fields parse_urlencoded(std::string_view s) {
    booking::Fields out;
    size_t pos = 0;
    while (pos < s.size()) {
        size_t amp = s.find('&', pos);
        if (amp == std::string_view::npos) amp = s.size();
        auto pair = s.substr(pos, amp - pos);
        if (!pair.empty()) {
            size_t eq = pair.find('=');
            std::string key = url_decode(pair.substr(0, eq));
            std::string value = eq == std::string_view::npos ? std::string() : url_decode(pair.substr(eq + 1));
            if (!key.empty()) out.emplace(std::move(key), std::move(value));
        }
        pos = amp + 1;
    }
    return out;
}

booking::Fields query_params(const Request& req) {
    std::string_view target(req.target().data(), req.target().size());
    auto q = target.find('?');
    if (q == std::string_view::npos) return {};
    return parse_urlencoded(target.substr(q + 1));
}

std::string header_value(const Request& req, boost::beast::http::field f) {
    auto it = req.find(f);
    if (it == req.end()) return std::string();
    return std::string(it->value());
}

std::optional<booking::Fields> parse_body(const Request& req) {
    std::string ct = header_value(req, boost::beast::http::field::content_type);
    std::transform(ct.begin(), ct.end(), ct.begin(), ::tolower);
    if (ct.find("application/json") == std::string::npos) return parse_urlencoded(req.body());
    try {
        return json_parse_flat_object(req.body());
    } catch (const std::runtime_error& e) {
        observability::log_info("body.invalid_json", {{"what", std::string(e.what())}});
        return std::nullopt;
    }
}

}
