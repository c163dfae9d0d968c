#include <boost/asio.hpp>
#include <iostream>
#include <string>
#include <memory>
#include <csignal>
#include <chrono>
#include "net/Router.h"
#include "net/HttpServer.h"
#include "observability/Metrics.h"
#include "observability/Logging.h"
#include "config/Config.h"
#include "db/DbPool.h"
#include "auth/SessionStore.h"
#include "booking/BookingService.h"
#include "booking/PgBookingRepository.h"
#include "mail/Notifier.h"
#include "web/BookingApi.h"

using config::Config;
using observability::log_info;
using observability::log_warn;
using observability::log_error;
using observability::set_log_level;

int main(int argc, char** argv) {
    auto cfg = Config::from_env(argc, argv);
    set_log_level(config::log_level_number(cfg.log_level));

    if (cfg.database_url.empty()) {
        std::cerr << "fatal: DATABASE_URL environment variable is not set\n";
        return 2;
    }

    int exit_code = 0;
    try {
        boost::asio::io_context io;

        auto dbpool = std::make_shared<db::DbPool>(io, cfg.database_url, cfg.db_workers);
        auto repo = std::make_shared<booking::PgBookingRepository>(dbpool);
        auto notifier = std::make_shared<mail::SmtpNotifier>(io, cfg.smtp);
        auto service = std::make_shared<booking::BookingService>(repo, notifier);
        auto sessions = std::make_shared<auth::SessionStore>(std::chrono::seconds(cfg.session_ttl_sec),
                                                             static_cast<std::size_t>(cfg.session_max));
        if (cfg.admin_password.empty()) log_warn("admin_login_disabled", {{"reason", std::string("ADMIN_PASSWORD not set")}});
        if (cfg.public_base_url.empty()) {
            log_warn("public_base_url_unset", {{"effect", std::string("cancellation links follow the request Host header")}});
        }

        Router router;

        router.add_route("GET", "/health", [](const Request& req) {
            return json_response(req, boost::beast::http::status::ok, "{\"status\":\"ok\"}");
        });
        router.add_async_route("GET", "/db/health", [repo](const Request& req, Router::Responder respond) {
            repo->async_ping([&req, respond](const boost::system::error_code& ec) {
                if (ec) { respond(json_response(req, boost::beast::http::status::internal_server_error, "{\"db\":\"down\"}")); return; }
                respond(json_response(req, boost::beast::http::status::ok, "{\"db\":\"ok\"}"));
            });
        });
        if (cfg.metrics_enabled) {
            router.add_route("GET", "/metrics", [](const Request& req) {
                return make_response(req, boost::beast::http::status::ok, "text/plain; version=0.0.4",
                                     observability::Metrics::instance().scrape());
            });
        }

        web::ApiContext api;
        api.service = service;
        api.sessions = sessions;
        api.admin = auth::AdminCredentials{cfg.admin_user, cfg.admin_password};
        api.static_root = cfg.static_root;
        api.public_base_url = cfg.public_base_url;
        web::register_booking_routes(router, api);

        HttpServer server(io, cfg.host, cfg.port, router, cfg.metrics_enabled, cfg.access_log);
        server.set_response_timeout(std::chrono::seconds(cfg.response_timeout_sec));

        boost::asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&io](const boost::system::error_code& ec, int sig) {
            if (ec) return;
            log_info("shutdown", {{"signal", int64_t(sig)}});
            io.stop();
        });

        // accept connections only once the schema is in place
        repo->async_migrate([&](const boost::system::error_code& ec) {
            if (ec) {
                log_error("migration_failed", {{"err", ec.message()}});
                exit_code = 1;
                io.stop();
                return;
            }
            server.run();
            log_info("server_start", {{"host", cfg.host}, {"port", int64_t(server.local_port())}});
        });

        for (;;) {
            try {
                io.run();
                break;
            } catch (const std::exception& e) {
                log_error("io_context_exception", {{"what", std::string(e.what())}});
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "server error: " << e.what() << std::endl;
        return 1;
    }

    return exit_code;
}
