#pragma once

#include <memory>
#include <string>
#include "../auth/SessionStore.h"
#include "../booking/BookingService.h"
#include "../net/Router.h"

namespace web {

struct ApiContext {
    std::shared_ptr<booking::BookingService> service;
    std::shared_ptr<auth::SessionStore> sessions;
    auth::AdminCredentials admin;
    std::string static_root;
    // empty: links are built from the request Host header
    std::string public_base_url;
};

// "<PUBLIC_BASE_URL>" or "http://<Host>", 127.0.0.1:8000 when Host is absent
// or carries anything besides a host name, address and port.
std::string link_base_for(const Request& req, const std::string& public_base_url);

// true when the Cookie header carries a live admin session
bool has_admin_session(const Request& req, auth::SessionStore& sessions);

// Public booking pages, static assets, admin login/logout/panel and the
// /api/bookings* JSON API.
void register_booking_routes(Router& router, const ApiContext& ctx);

}
