#pragma once

#include <boost/system/error_code.hpp>
#include <string>
#include "../booking/Booking.h"
#include "../mail/MailMessage.h"

namespace web {

std::string html_escape(const std::string& s);

// Minimal Italian HTML document around `inner_html`.
std::string render_page(const std::string& title, const std::string& inner_html);

// "<h1>title</h1><p>message</p>" page
std::string message_page(const std::string& title, const std::string& message);

std::string booking_received_page(const booking::Booking& b, const mail::SendResult& confirmation);

std::string cancel_result_page(bool already_canceled);

// Heading and explanation for a booking error, as shown to public visitors.
std::string error_page(const boost::system::error_code& ec);

std::string login_failed_page(bool login_enabled);

// Served at /admin/login when the static root has no admin/login.html.
std::string login_form_page();

}
