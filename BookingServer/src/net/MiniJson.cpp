#include "MiniJson.h"
#include <stdexcept>
#include <cctype>
#include <vector>

namespace {

struct Scanner {
    const std::string& js;
    size_t i = 0;

    size_t n() const { return js.size(); }

    void skip_ws() { while (i < n() && isspace((unsigned char)js[i])) ++i; }

    char peek() {
        skip_ws();
        if (i >= n()) throw std::runtime_error("unexpected end of json");
        return js[i];
    }

    void expect(char c) {
        if (peek() != c) throw std::runtime_error(std::string("expected '") + c + "' in json");
        ++i;
    }

    static void append_utf8(std::string& out, int code) {
        if (code <= 0x7f) out.push_back((char)code);
        else if (code <= 0x7ff) {
            out.push_back((char)(0xc0 | ((code >> 6) & 0x1f)));
            out.push_back((char)(0x80 | (code & 0x3f)));
        } else if (code <= 0xffff) {
            out.push_back((char)(0xe0 | ((code >> 12) & 0x0f)));
            out.push_back((char)(0x80 | ((code >> 6) & 0x3f)));
            out.push_back((char)(0x80 | (code & 0x3f)));
        } else {
            out.push_back((char)(0xf0 | ((code >> 18) & 0x07)));
            out.push_back((char)(0x80 | ((code >> 12) & 0x3f)));
            out.push_back((char)(0x80 | ((code >> 6) & 0x3f)));
            out.push_back((char)(0x80 | (code & 0x3f)));
        }
    }

    int hex4() {
        if (i + 4 > n()) throw std::runtime_error("invalid unicode escape in json string");
        int code = 0;
        for (size_t k = i; k < i + 4; ++k) {
            char ch = js[k];
            code <<= 4;
            if (ch >= '0' && ch <= '9') code += ch - '0';
            else if (ch >= 'a' && ch <= 'f') code += 10 + (ch - 'a');
            else if (ch >= 'A' && ch <= 'F') code += 10 + (ch - 'A');
            else throw std::runtime_error("invalid hex in unicode escape");
        }
        i += 4;
        return code;
    }

    // i at the opening quote
    std::string string() {
        expect('"');
        std::string out;
        for (;;) {
            if (i >= n()) throw std::runtime_error("unterminated json string");
            char c = js[i++];
            if (c == '"') return out;
            if ((unsigned char)c < 0x20) throw std::runtime_error("control character in json string");
            if (c != '\\') { out.push_back(c); continue; }
            if (i >= n()) throw std::runtime_error("unterminated escape in json string");
            char e = js[i++];
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'u': {
                    int code = hex4();
                    if (code >= 0xdc00 && code <= 0xdfff) throw std::runtime_error("unpaired low surrogate in json string");
                    if (code >= 0xd800 && code <= 0xdbff) {
                        if (i + 6 > n() || js[i] != '\\' || js[i+1] != 'u') throw std::runtime_error("unpaired high surrogate in json string");
                        i += 2;
                        int low = hex4();
                        if (low < 0xdc00 || low > 0xdfff) throw std::runtime_error("invalid surrogate pair in json string");
                        code = 0x10000 + ((code - 0xd800) << 10) + (low - 0xdc00);
                    }
                    append_utf8(out, code);
                    break;
                }
                default: throw std::runtime_error("unsupported escape in json string");
            }
        }
    }

    bool literal(const char* word) {
        size_t len = std::char_traits<char>::length(word);
        if (js.compare(i, len, word) != 0) return false;
        i += len;
        return true;
    }

    std::string number() {
        size_t start = i;
        if (i < n() && js[i] == '-') ++i;
        size_t digits = i;
        while (i < n() && isdigit((unsigned char)js[i])) ++i;
        if (i == digits) throw std::runtime_error("invalid json number");
        if (i < n() && js[i] == '.') {
            ++i;
            size_t frac = i;
            while (i < n() && isdigit((unsigned char)js[i])) ++i;
            if (i == frac) throw std::runtime_error("invalid json number");
        }
        if (i < n() && (js[i] == 'e' || js[i] == 'E')) {
            ++i;
            if (i < n() && (js[i] == '+' || js[i] == '-')) ++i;
            size_t exp = i;
            while (i < n() && isdigit((unsigned char)js[i])) ++i;
            if (i == exp) throw std::runtime_error("invalid json number");
        }
        return js.substr(start, i - start);
    }

    // Consumes a nested object or array without keeping it.
    void skip_container() {
        std::vector<char> stack;
        do {
            char c = peek();
            if (c == '"') { string(); continue; }
            ++i;
            if (c == '{' || c == '[') stack.push_back(c == '{' ? '}' : ']');
            else if (c == '}' || c == ']') {
                if (stack.empty() || stack.back() != c) throw std::runtime_error("mismatched bracket in json");
                stack.pop_back();
            }
        } while (!stack.empty());
    }
};

}

std::map<std::string, std::string> json_parse_flat_object(const std::string& js) {
    std::map<std::string, std::string> out;
    Scanner sc{js};
    sc.expect('{');
    if (sc.peek() == '}') {
        ++sc.i;
    } else {
        for (;;) {
            std::string key = sc.string();
            sc.expect(':');
            char c = sc.peek();
            if (c == '"') out[key] = sc.string();
            else if (c == '{' || c == '[') sc.skip_container();
            else if (sc.literal("true")) out[key] = "true";
            else if (sc.literal("false")) out[key] = "false";
            else if (sc.literal("null")) out.erase(key);
            else out[key] = sc.number();
            c = sc.peek();
            ++sc.i;
            if (c == '}') break;
            if (c != ',') throw std::runtime_error("expected ',' or '}' in json object");
        }
    }
    sc.skip_ws();
    if (sc.i != js.size()) throw std::runtime_error("trailing data after json object");
    return out;
}

// escape chars for JSON response strings; escapes control chars < 0x20 with \u00XX
std::string json_escape_resp(const std::string& s) {
    static const char* hex = "0123456789ABCDEF";
    std::string out; out.reserve(s.size()+8);
    for (unsigned char uc : s) {
        if (uc == '"') { out += "\\\""; }
        else if (uc == '\\') { out += "\\\\"; }
        else if (uc == '\n') { out += "\\n"; }
        else if (uc == '\r') { out += "\\r"; }
        else if (uc == '\t') { out += "\\t"; }
        else if (uc < 0x20) {
            out.push_back('\\'); out.push_back('u'); out.push_back('0'); out.push_back('0');
            out.push_back(hex[(uc >> 4) & 0xF]); out.push_back(hex[uc & 0xF]);
        } else out.push_back((char)uc);
    }
    return out;
}

std::string json_quote_or_null(const std::optional<std::string>& o) {
    if (!o.has_value()) return "null";
    return "\"" + json_escape_resp(*o) + "\"";
}

static bool is_int_strict(const std::string& s) {
    if (s.empty()) return false;
    size_t i = 0;
    if (s[0] == '-') { if (s.size() == 1) return false; i = 1; }
    for (; i < s.size(); ++i) if (s[i] < '0' || s[i] > '9') return false;
    return true;
}

std::optional<int64_t> json_parse_int_strict(const std::optional<std::string>& o) {
    if (!o.has_value() || o->empty() || !is_int_strict(*o)) return std::nullopt;
    return parse_int64_strict_sv(std::string_view(*o));
}

bool is_valid_utf8_text(std::string_view s) {
    size_t i = 0;
    while (i < s.size()) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (c == 0) return false;
        if (c < 0x80) { ++i; continue; }
        size_t len;
        uint32_t code;
        if ((c & 0xe0) == 0xc0) { len = 2; code = c & 0x1f; }
        else if ((c & 0xf0) == 0xe0) { len = 3; code = c & 0x0f; }
        else if ((c & 0xf8) == 0xf0) { len = 4; code = c & 0x07; }
        else return false;
        if (i + len > s.size()) return false;
        for (size_t k = 1; k < len; ++k) {
            unsigned char cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xc0) != 0x80) return false;
            code = (code << 6) | (cc & 0x3f);
        }
        // overlong forms, surrogates and anything past U+10FFFF
        if ((len == 2 && code < 0x80) || (len == 3 && code < 0x800) || (len == 4 && code < 0x10000)) return false;
        if (code >= 0xd800 && code <= 0xdfff) return false;
        if (code > 0x10ffff) return false;
        i += len;
    }
    return true;
}
