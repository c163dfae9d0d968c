#pragma once

#include <optional>
#include <string>
#include "../net/Request.h"
#include "../net/Response.h"

namespace web {

// Content type by extension, application/octet-stream when unknown.
std::string content_type_for(const std::string& path);

// `url_path` resolved below `root`; nullopt for traversal attempts, NUL bytes or backslashes.
std::optional<std::string> resolve_static_path(const std::string& root, const std::string& url_path);

// 200 with the file, 404 when missing or not a regular file.
Response serve_static(const Request& req, const std::string& root, const std::string& url_path);

}
