#pragma once

#include <cstdint>
#include <string>

namespace config {

struct SmtpSettings {
    std::string host;
    uint16_t port = 587;
    std::string user;
    std::string pass;
    std::string from;
    std::string notify;
    int timeout_sec = 15;
    // host, user, password and sender are all required to send anything
    bool configured() const { return !host.empty() && !user.empty() && !pass.empty() && !from.empty(); }
};

struct Config {
    enum class LogLevel { DEBUG, INFO, WARN, ERROR };
    std::string host = "0.0.0.0";
    uint16_t port = 8000;
    LogLevel log_level = LogLevel::INFO;
    bool metrics_enabled = true;
    bool access_log = true;
    std::string database_url;
    int db_workers = 4;
    std::string static_root = "./public_html";
    std::string public_base_url;
    SmtpSettings smtp;
    std::string admin_user = "admin";
    std::string admin_password;
    int session_ttl_sec = 43200;
    int session_max = 1024;
    int response_timeout_sec = 300;
    static Config from_env(int argc, char** argv);
};

int log_level_number(Config::LogLevel l);

}
