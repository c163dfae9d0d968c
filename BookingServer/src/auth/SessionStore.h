#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace auth {

inline constexpr const char* kSessionCookie = "admin_session";

struct AdminCredentials {
    std::string user;
    std::string password;

    // An empty password disables login altogether.
    bool enabled() const { return !password.empty(); }
    bool check(const std::string& user_in, const std::string& password_in) const;
};

// In-memory admin sessions keyed by random token. Sessions expire after `ttl`
// without use; past `max_sessions` the oldest one is evicted.
class SessionStore {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    SessionStore(std::chrono::seconds ttl, std::size_t max_sessions, Clock now = &std::chrono::steady_clock::now);

    std::string create(const std::string& user);
    // Refreshes the idle deadline on success.
    bool validate(const std::string& token);
    void remove(const std::string& token);
    std::size_t size() const;

private:
    struct Entry {
        std::string user;
        std::chrono::steady_clock::time_point created;
        std::chrono::steady_clock::time_point last_seen;
    };

    void purge_expired(std::chrono::steady_clock::time_point now);

    std::chrono::seconds ttl_;
    std::size_t max_sessions_;
    Clock now_;
    std::unordered_map<std::string, Entry> sessions_;
    mutable std::mutex mu_;
};

// Value of cookie `name` in a Cookie header, nullopt when absent.
std::optional<std::string> cookie_value(const std::string& cookie_header, const std::string& name);

std::string session_cookie(const std::string& token);
std::string expired_session_cookie();

}
