#include <chrono>
#include <iostream>
#include <set>
#include <string>
#include "auth/SessionStore.h"
#include "auth/Tokens.h"

using namespace auth;
using namespace std::chrono;

int main() {
    steady_clock::time_point now{};
    auto clock = [&now] { return now; };

    {
        SessionStore store(seconds(60), 10, clock);
        std::string t = store.create("admin");
        if (t.size() != 43) { std::cerr << "session token length " << t.size() << "\n"; return 1; }
        if (!store.validate(t)) { std::cerr << "fresh session rejected\n"; return 1; }
        if (store.validate("") || store.validate(t + "x")) { std::cerr << "unknown token accepted\n"; return 1; }

        // use refreshes the idle deadline
        now += seconds(50);
        if (!store.validate(t)) { std::cerr << "session expired early\n"; return 1; }
        now += seconds(50);
        if (!store.validate(t)) { std::cerr << "validate did not refresh the deadline\n"; return 1; }
        now += seconds(60);
        if (store.validate(t)) { std::cerr << "idle session still valid\n"; return 1; }
        if (store.size() != 0) { std::cerr << "expired session not dropped\n"; return 1; }

        std::string t2 = store.create("admin");
        store.remove(t2);
        if (store.validate(t2)) { std::cerr << "removed session still valid\n"; return 1; }
    }

    {
        SessionStore store(seconds(3600), 2, clock);
        std::string a = store.create("admin");
        now += seconds(1);
        std::string b = store.create("admin");
        now += seconds(1);
        store.validate(a);
        std::string c = store.create("admin");
        if (store.size() != 2) { std::cerr << "store exceeded its limit\n"; return 1; }
        if (store.validate(a)) { std::cerr << "oldest session should be evicted\n"; return 1; }
        if (!store.validate(b) || !store.validate(c)) { std::cerr << "newer sessions lost\n"; return 1; }
    }

    {
        std::set<std::string> seen;
        for (int i = 0; i < 200; ++i) seen.insert(random_token(24));
        if (seen.size() != 200) { std::cerr << "random_token repeated\n"; return 1; }
        for (const auto& t : seen) {
            if (t.find_first_not_of("ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_") != std::string::npos) {
                std::cerr << "token not url-safe: " << t << "\n"; return 1;
            }
        }
        if (base64_encode("hello") != "aGVsbG8=") { std::cerr << "base64_encode mismatch\n"; return 1; }
        if (base64url_encode("\xfb\xff") != "-_8") { std::cerr << "base64url_encode mismatch: " << base64url_encode("\xfb\xff") << "\n"; return 1; }
        if (!constant_time_equals("abc", "abc") || constant_time_equals("abc", "abd") || constant_time_equals("abc", "abcd")) {
            std::cerr << "constant_time_equals mismatch\n"; return 1;
        }
    }

    {
        AdminCredentials creds{"admin", "s3cr3t"};
        if (!creds.enabled() || !creds.check("admin", "s3cr3t")) { std::cerr << "valid login rejected\n"; return 1; }
        if (creds.check("admin", "wrong") || creds.check("root", "s3cr3t") || creds.check("", "")) { std::cerr << "bad login accepted\n"; return 1; }
        AdminCredentials disabled{"admin", ""};
        if (disabled.enabled() || disabled.check("admin", "")) { std::cerr << "empty password should disable login\n"; return 1; }
    }

    {
        if (cookie_value("theme=dark; admin_session=abc123; x=1", kSessionCookie) != std::string("abc123")) { std::cerr << "cookie lookup failed\n"; return 1; }
        if (cookie_value("admin_session=\"q\"", kSessionCookie) != std::string("q")) { std::cerr << "quoted cookie\n"; return 1; }
        if (cookie_value("not_admin_session=abc", kSessionCookie).has_value()) { std::cerr << "cookie name matched by suffix\n"; return 1; }
        if (cookie_value("", kSessionCookie).has_value()) { std::cerr << "empty header matched\n"; return 1; }
        std::string set = session_cookie("tok");
        if (set.find("admin_session=tok") != 0 || set.find("HttpOnly") == std::string::npos || set.find("Path=/") == std::string::npos) {
            std::cerr << "session cookie attributes: " << set << "\n"; return 1;
        }
        if (expired_session_cookie().find("Max-Age=0") == std::string::npos) { std::cerr << "expired cookie lacks Max-Age=0\n"; return 1; }
    }

    std::cout << "session_store_unit ok\n";
    return 0;
}
