#include "BookingApi.h"
#include <cctype>
#include <filesystem>
#include "FormBody.h"
#include "Pages.h"
#include "StaticFiles.h"
#include "../booking/BookingErrors.h"
#include "../net/MiniJson.h"
#include "../observability/Logging.h"

namespace http = boost::beast::http;

namespace web {

// host, host:port or [v6]:port; nothing that could extend the URL
static bool is_plain_host(const std::string& host) {
    if (host.empty() || host.size() > 255) return false;
    for (unsigned char c : host) {
        if (!(std::isalnum(c) || c == '.' || c == '-' || c == ':' || c == '[' || c == ']')) return false;
    }
    return true;
}

std::string link_base_for(const Request& req, const std::string& public_base_url) {
    if (!public_base_url.empty()) return public_base_url;
    std::string host = header_value(req, http::field::host);
    if (!is_plain_host(host)) host = "127.0.0.1:8000";
    return "http://" + host;
}

bool has_admin_session(const Request& req, auth::SessionStore& sessions) {
    auto token = auth::cookie_value(header_value(req, http::field::cookie), auth::kSessionCookie);
    return token && sessions.validate(*token);
}

static http::status to_status(const boost::system::error_code& ec) {
    return static_cast<http::status>(booking::http_status_for(ec));
}

static Response json_error(const Request& req, const boost::system::error_code& ec) {
    return json_response(req, to_status(ec), std::string("{\"error\":\"") + booking::error_key(ec) + "\"}");
}

static std::string mail_json(const mail::SendResult& r) {
    return std::string("{\"sent\":") + (r.sent() ? "true" : "false") + ",\"status\":\"" + mail::to_string(r.status) + "\"}";
}

static Router::AsyncHandler static_file(std::string root, std::string file) {
    return [root = std::move(root), file = std::move(file)](const Request& req, Router::Responder respond) {
        respond(serve_static(req, root, file));
    };
}

static Router::AsyncHandler static_tree(std::string root) {
    return [root = std::move(root)](const Request& req, Router::Responder respond) {
        respond(serve_static(req, root, Router::path_of(req)));
    };
}

// 401 before the body is looked at
static Router::AsyncHandler admin_only(std::shared_ptr<auth::SessionStore> sessions, Router::AsyncHandler inner) {
    return [sessions, inner = std::move(inner)](const Request& req, Router::Responder respond) {
        if (!has_admin_session(req, *sessions)) {
            respond(json_response(req, http::status::unauthorized, "{\"error\":\"unauthorized\"}"));
            return;
        }
        inner(req, std::move(respond));
    };
}

// Parses the body and hands the fields on; 400 on malformed JSON.
static Router::AsyncHandler with_body(std::function<void(const Request&, booking::Fields, Router::Responder)> inner) {
    return [inner = std::move(inner)](const Request& req, Router::Responder respond) {
        auto fields = parse_body(req);
        if (!fields) {
            respond(json_response(req, http::status::bad_request, "{\"error\":\"invalid_body\"}"));
            return;
        }
        inner(req, std::move(*fields), std::move(respond));
    };
}

static void register_public_routes(Router& router, const ApiContext& ctx) {
    auto service = ctx.service;
    auto public_base = ctx.public_base_url;

    router.add_async_route("GET", "/api/availability", [service](const Request& req, Router::Responder respond) {
        service->availability([&req, respond](const boost::system::error_code& ec, booking::Availability a) {
            if (ec) { respond(json_error(req, ec)); return; }
            respond(json_response(req, http::status::ok, booking::availability_to_json(a)));
        });
    });

    router.add_async_route("POST", "/prenota", [service, public_base](const Request& req, Router::Responder respond) {
        auto fields = parse_body(req);
        if (!fields) {
            respond(html_response(req, http::status::bad_request, message_page("Dati non validi", "Richiesta non leggibile.")));
            return;
        }
        service->create(*fields, booking::Origin::public_form, link_base_for(req, public_base),
            [&req, respond](const boost::system::error_code& ec, booking::CreateResult r) {
                if (ec) { respond(html_response(req, to_status(ec), error_page(ec))); return; }
                respond(html_response(req, http::status::ok, booking_received_page(r.booking, r.confirmation)));
            });
    });

    router.add_async_route("GET", "/annulla", [service](const Request& req, Router::Responder respond) {
        auto q = query_params(req);
        service->cancel_by_token(q["token"], [&req, respond](const boost::system::error_code& ec, booking::Booking, bool already) {
            if (ec) { respond(html_response(req, to_status(ec), error_page(ec))); return; }
            respond(html_response(req, http::status::ok, cancel_result_page(already)));
        });
    });

    router.add_async_route("GET", "/", static_file(ctx.static_root, "index.html"));
    router.add_async_route("GET", "/index.html", static_file(ctx.static_root, "index.html"));
    for (const char* prefix : {"/css/", "/js/", "/public/"}) {
        router.add_prefix_route("GET", prefix, static_tree(ctx.static_root));
    }
}

static void register_admin_pages(Router& router, const ApiContext& ctx) {
    auto sessions = ctx.sessions;
    auto admin = ctx.admin;
    auto root = ctx.static_root;

    router.add_async_route("GET", "/admin/login", [root](const Request& req, Router::Responder respond) {
        std::error_code fec;
        if (std::filesystem::is_regular_file(std::filesystem::path(root) / "admin" / "login.html", fec)) {
            respond(serve_static(req, root, "admin/login.html"));
            return;
        }
        respond(html_response(req, http::status::ok, login_form_page()));
    });

    router.add_async_route("POST", "/admin/login", with_body([sessions, admin](const Request& req, booking::Fields f, Router::Responder respond) {
        std::string user = f.count("username") ? f["username"] : f["user"];
        if (!admin.check(user, f["password"])) {
            observability::log_warn("admin.login_failed", {{"enabled", int64_t(admin.enabled())}});
            respond(html_response(req, http::status::unauthorized, login_failed_page(admin.enabled())));
            return;
        }
        std::string token = sessions->create(user);
        observability::log_info("admin.login", {{"sessions", int64_t(sessions->size())}});
        Response res = redirect_response(req, "/admin");
        res.set(http::field::set_cookie, auth::session_cookie(token));
        respond(std::move(res));
    }));

    router.add_route("GET", "/admin/logout", [sessions](const Request& req) {
        auto token = auth::cookie_value(header_value(req, http::field::cookie), auth::kSessionCookie);
        if (token) sessions->remove(*token);
        Response res = redirect_response(req, "/admin/login");
        res.set(http::field::set_cookie, auth::expired_session_cookie());
        return res;
    });

    router.add_route("GET", "/admin", [sessions, root](const Request& req) {
        if (!has_admin_session(req, *sessions)) return redirect_response(req, "/admin/login");
        return serve_static(req, root, "admin/index.html");
    });
}

static void register_admin_api(Router& router, const ApiContext& ctx) {
    auto service = ctx.service;
    auto sessions = ctx.sessions;
    auto public_base = ctx.public_base_url;

    router.add_async_route("GET", "/api/bookings", admin_only(sessions, [service](const Request& req, Router::Responder respond) {
        service->list([&req, respond](const boost::system::error_code& ec, std::vector<booking::Booking> list) {
            if (ec) { respond(json_error(req, ec)); return; }
            respond(json_response(req, http::status::ok, "{\"bookings\":" + booking::bookings_to_json_array(list) + "}"));
        });
    }));

    router.add_async_route("POST", "/api/bookings/create", admin_only(sessions, with_body(
        [service, public_base](const Request& req, booking::Fields f, Router::Responder respond) {
            service->create(f, booking::Origin::admin, link_base_for(req, public_base),
                [&req, respond](const boost::system::error_code& ec, booking::CreateResult r) {
                    if (ec) { respond(json_error(req, ec)); return; }
                    respond(json_response(req, http::status::created,
                        "{\"booking\":" + booking::booking_to_json(r.booking) +
                        ",\"confirmation_email\":" + mail_json(r.confirmation) + "}"));
                });
        })));

    router.add_async_route("POST", "/api/bookings/cancel", admin_only(sessions, with_body(
        [service](const Request& req, booking::Fields f, Router::Responder respond) {
            service->cancel_by_id(f, [&req, respond](const boost::system::error_code& ec, booking::Booking b, bool already) {
                if (ec) { respond(json_error(req, ec)); return; }
                respond(json_response(req, http::status::ok,
                    "{\"booking\":" + booking::booking_to_json(b) + ",\"already_canceled\":" + (already ? "true" : "false") + "}"));
            });
        })));

    router.add_async_route("POST", "/api/bookings/delete", admin_only(sessions, with_body(
        [service](const Request& req, booking::Fields f, Router::Responder respond) {
            service->delete_by_id(f, [&req, respond](const boost::system::error_code& ec, int64_t id) {
                if (ec) { respond(json_error(req, ec)); return; }
                respond(json_response(req, http::status::ok, "{\"deleted\":true,\"id\":" + std::to_string(id) + "}"));
            });
        })));

    router.add_async_route("POST", "/api/bookings/update", admin_only(sessions, with_body(
        [service](const Request& req, booking::Fields f, Router::Responder respond) {
            service->update(f, [&req, respond](const boost::system::error_code& ec, booking::UpdateResult r) {
                if (ec) { respond(json_error(req, ec)); return; }
                std::string thank_you = r.thank_you ? mail_json(*r.thank_you) : "{\"sent\":false,\"status\":\"skipped\"}";
                respond(json_response(req, http::status::ok,
                    "{\"booking\":" + booking::booking_to_json(r.booking) + ",\"thank_you_email\":" + thank_you + "}"));
            });
        })));
}

void register_booking_routes(Router& router, const ApiContext& ctx) {
    register_public_routes(router, ctx);
    register_admin_pages(router, ctx);
    register_admin_api(router, ctx);
}

}
