#include "SessionStore.h"
#include <algorithm>
#include "Tokens.h"
#include "../observability/Logging.h"

namespace auth {

static constexpr std::size_t kSessionTokenBytes = 32;

bool AdminCredentials::check(const std::string& user_in, const std::string& password_in) const {
    if (!enabled()) return false;
    // both comparisons always run
    bool user_ok = constant_time_equals(user_in, user);
    bool pass_ok = constant_time_equals(password_in, password);
    return user_ok && pass_ok;
}

SessionStore::SessionStore(std::chrono::seconds ttl, std::size_t max_sessions, Clock now)
    : ttl_(ttl), max_sessions_(std::max<std::size_t>(1, max_sessions)), now_(std::move(now)) {}

void SessionStore::purge_expired(std::chrono::steady_clock::time_point now) {
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (now - it->second.last_seen >= ttl_) it = sessions_.erase(it);
        else ++it;
    }
}

std::string SessionStore::create(const std::string& user) {
    std::string token = random_token(kSessionTokenBytes);
    auto now = now_();
    std::lock_guard lock(mu_);
    purge_expired(now);
    while (sessions_.size() >= max_sessions_) {
        auto oldest = std::min_element(sessions_.begin(), sessions_.end(),
            [](const auto& a, const auto& b) { return a.second.created < b.second.created; });
        observability::log_info("session.evicted", {{"user", oldest->second.user}});
        sessions_.erase(oldest);
    }
    sessions_[token] = Entry{user, now, now};
    return token;
}

bool SessionStore::validate(const std::string& token) {
    if (token.empty()) return false;
    auto now = now_();
    std::lock_guard lock(mu_);
    auto it = sessions_.find(token);
    if (it == sessions_.end()) return false;
    if (now - it->second.last_seen >= ttl_) {
        sessions_.erase(it);
        return false;
    }
    it->second.last_seen = now;
    return true;
}

void SessionStore::remove(const std::string& token) {
    std::lock_guard lock(mu_);
    sessions_.erase(token);
}

std::size_t SessionStore::size() const {
    std::lock_guard lock(mu_);
    return sessions_.size();
}

static std::string trim_spaces(const std::string& s) {
    size_t b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return std::string();
    size_t e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

std::optional<std::string> cookie_value(const std::string& cookie_header, const std::string& name) {
    size_t pos = 0;
    while (pos <= cookie_header.size()) {
        size_t end = cookie_header.find(';', pos);
        if (end == std::string::npos) end = cookie_header.size();
        std::string part = trim_spaces(cookie_header.substr(pos, end - pos));
        size_t eq = part.find('=');
        if (eq != std::string::npos && trim_spaces(part.substr(0, eq)) == name) {
            std::string v = trim_spaces(part.substr(eq + 1));
            if (v.size() >= 2 && v.front() == '"' && v.back() == '"') v = v.substr(1, v.size() - 2);
            return v;
        }
        pos = end + 1;
    }
    return std::nullopt;
}

std::string session_cookie(const std::string& token) {
    return std::string(kSessionCookie) + "=" + token + "; Path=/; HttpOnly; SameSite=Lax";
}

std::string expired_session_cookie() {
    return std::string(kSessionCookie) + "=; Path=/; HttpOnly; SameSite=Lax; Max-Age=0";
}

}
