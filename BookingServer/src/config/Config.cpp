#include "Config.h"
#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace config {

static std::string getenv_or(const char* name, const char* def) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string(def);
}

static Config::LogLevel parse_level(const std::string& s) {
    std::string u = s;
    std::transform(u.begin(), u.end(), u.begin(), ::toupper);
    if (u == "DEBUG") return Config::LogLevel::DEBUG;
    if (u == "WARN") return Config::LogLevel::WARN;
    if (u == "ERROR") return Config::LogLevel::ERROR;
    return Config::LogLevel::INFO;
}

// Malformed values keep the current default.
static void parse_int_into(const std::string& s, int& out) {
    if (s.empty()) return;
    try { out = std::stoi(s); } catch (const std::exception&) {}
}

static void parse_port_into(const std::string& s, uint16_t& out) {
    int v = -1;
    parse_int_into(s, v);
    if (v > 0 && v <= 65535) out = static_cast<uint16_t>(v);
}

int log_level_number(Config::LogLevel l) {
    switch (l) {
        case Config::LogLevel::DEBUG: return 1;
        case Config::LogLevel::INFO: return 2;
        case Config::LogLevel::WARN: return 3;
        case Config::LogLevel::ERROR: return 4;
    }
    return 2;
}

Config Config::from_env(int argc, char** argv) {
    Config c;
    c.host = getenv_or("BOOKING_HOST", "0.0.0.0");
    parse_port_into(getenv_or("BOOKING_PORT", "8000"), c.port);
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "--port" && i+1 < argc) parse_port_into(argv[i+1], c.port);
    }
    c.log_level = parse_level(getenv_or("LOG_LEVEL", "INFO"));
    c.metrics_enabled = getenv_or("METRICS_ENABLED", "1") != "0";
    c.access_log = getenv_or("ACCESS_LOG", "1") != "0";
    parse_int_into(getenv_or("RESPONSE_TIMEOUT_SEC", ""), c.response_timeout_sec);
    c.response_timeout_sec = std::clamp(c.response_timeout_sec, 1, 3600);

    c.database_url = getenv_or("DATABASE_URL", "");
    parse_int_into(getenv_or("DB_WORKERS", ""), c.db_workers);
    c.db_workers = std::clamp(c.db_workers, 1, 64);

    c.static_root = getenv_or("STATIC_ROOT", "./public_html");
    c.public_base_url = getenv_or("PUBLIC_BASE_URL", "");
    while (!c.public_base_url.empty() && c.public_base_url.back() == '/') c.public_base_url.pop_back();

    c.smtp.host = getenv_or("SMTP_HOST", "");
    parse_port_into(getenv_or("SMTP_PORT", "587"), c.smtp.port);
    c.smtp.user = getenv_or("SMTP_USER", "");
    c.smtp.pass = getenv_or("SMTP_PASS", "");
    c.smtp.from = getenv_or("SMTP_FROM", c.smtp.user.c_str());
    c.smtp.notify = getenv_or("SMTP_NOTIFY", "");
    parse_int_into(getenv_or("SMTP_TIMEOUT_SEC", ""), c.smtp.timeout_sec);
    c.smtp.timeout_sec = std::clamp(c.smtp.timeout_sec, 1, 300);

    c.admin_user = getenv_or("ADMIN_USER", "admin");
    c.admin_password = getenv_or("ADMIN_PASSWORD", "");
    parse_int_into(getenv_or("SESSION_TTL_SEC", ""), c.session_ttl_sec);
    if (c.session_ttl_sec <= 0) c.session_ttl_sec = 43200;
    parse_int_into(getenv_or("SESSION_MAX", ""), c.session_max);
    if (c.session_max <= 0) c.session_max = 1024;
    return c;
}

}
