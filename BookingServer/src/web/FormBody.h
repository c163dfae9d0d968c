#pragma once

#include <optional>
#include <string>
#include <string_view>
#include "../booking/BookingService.h"
#include "../net/Request.h"

namespace web {

// Percent-decoding with '+' as space; stops at a malformed escape.
std::string url_decode(std::string_view s);

// a=1&b=2; the first occurrence of a key wins.
booking::Fields parse_urlencoded(std::string_view s);

booking::Fields query_params(const Request& req);

// JSON object for application/json, urlencoded otherwise. nullopt when a JSON
// body is malformed or not an object.
std::optional<booking::Fields> parse_body(const Request& req);

std::string header_value(const Request& req, boost::beast::http::field f);

}
