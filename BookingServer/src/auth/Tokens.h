#pragma once

#include <cstddef>
#include <string>

namespace auth {

// Standard alphabet with padding (SMTP AUTH).
std::string base64_encode(const std::string& in);
// URL-safe alphabet, no padding.
std::string base64url_encode(const std::string& in);

// `bytes` of RAND_bytes output, base64url encoded. Throws std::runtime_error
// when the generator fails.
std::string random_token(std::size_t bytes);

// Constant-time for equal lengths; length mismatch returns false immediately.
bool constant_time_equals(const std::string& a, const std::string& b);

}
