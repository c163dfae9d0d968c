#include "StaticFiles.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include "../observability/Logging.h"

namespace web {

std::string content_type_for(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    if (ext == ".html")  return "text/html; charset=utf-8";
    if (ext == ".css")   return "text/css; charset=utf-8";
    if (ext == ".js")    return "application/javascript; charset=utf-8";
    if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
    if (ext == ".png")   return "image/png";
    if (ext == ".webp")  return "image/webp";
    if (ext == ".svg")   return "image/svg+xml";
    if (ext == ".ico")   return "image/x-icon";
    return "application/octet-stream";
}

std::optional<std::string> resolve_static_path(const std::string& root, const std::string& url_path) {
    std::string rel = url_path;
    while (!rel.empty() && rel.front() == '/') rel.erase(rel.begin());
    if (rel.empty()) return std::nullopt;
    if (rel.find('\0') != std::string::npos || rel.find('\\') != std::string::npos) return std::nullopt;
    for (const auto& part : std::filesystem::path(rel)) {
        if (part == "..") return std::nullopt;
    }
    return (std::filesystem::path(root) / rel).string();
}

static bool read_file_to_string(const std::string& path, std::string& out) {
    std::ifstream f(path, std::ios::in | std::ios::binary);
    if (!f) return false;
    std::ostringstream ss;
    ss << f.rdbuf();
    out = ss.str();
    return true;
}

Response serve_static(const Request& req, const std::string& root, const std::string& url_path) {
    auto full = resolve_static_path(root, url_path);
    if (!full) {
        return make_response(req, boost::beast::http::status::not_found, "text/plain; charset=utf-8", "File non trovato");
    }
    std::error_code fec;
    std::string body;
    if (!std::filesystem::is_regular_file(*full, fec) || !read_file_to_string(*full, body)) {
        observability::log_debug("static.missing", {{"path", url_path}});
        return make_response(req, boost::beast::http::status::not_found, "text/plain; charset=utf-8", "File non trovato");
    }
    return make_response(req, boost::beast::http::status::ok, content_type_for(*full), std::move(body));
}

}
