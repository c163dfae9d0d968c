#pragma once

#include <string>
#include <optional>
#include <cstdint>
#include <string_view>
#include <limits>
#include <map>

// Top-level members of a JSON object as text. Strings are decoded, numbers are
// kept verbatim, booleans become "true"/"false". null members and nested
// objects or arrays are skipped. Throws std::runtime_error on malformed input.
std::map<std::string, std::string> json_parse_flat_object(const std::string& js);

std::string json_escape_resp(const std::string& s);
// "\"...\"" or null
std::string json_quote_or_null(const std::optional<std::string>& o);
std::optional<int64_t> json_parse_int_strict(const std::optional<std::string>& o);

// Well-formed UTF-8 without NUL bytes.
bool is_valid_utf8_text(std::string_view s);


inline std::optional<int64_t> parse_int64_strict_sv(std::string_view s) {
    if (s.empty()) return std::nullopt;
    size_t i = 0;
    bool neg = false;
    if (s[i] == '-') { neg = true; ++i; }
    if (i >= s.size()) return std::nullopt;

    const uint64_t maxAbs = neg ? (uint64_t(std::numeric_limits<int64_t>::max()) + 1ULL) : uint64_t(std::numeric_limits<int64_t>::max());
    uint64_t v = 0;
    for (; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (c < '0' || c > '9') return std::nullopt;
        uint64_t d = uint64_t(c - '0');
        if (v > (maxAbs - d) / 10) return std::nullopt;
        v = v * 10 + d;
    }

    if (!neg) return static_cast<int64_t>(v);
    if (v == (uint64_t(std::numeric_limits<int64_t>::max()) + 1ULL)) return std::numeric_limits<int64_t>::min();
    return -static_cast<int64_t>(v);
}
