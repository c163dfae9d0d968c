#pragma once

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "MailMessage.h"
#include "../config/Config.h"

namespace mail {

struct SmtpReply {
    int code = 0;
    std::vector<std::string> lines;
};

// Adds one reply line (CRLF stripped) to `r`. Returns true on the final line
// of a reply ("250 ok" as opposed to "250-SIZE"). Throws std::runtime_error on
// a malformed line or a code that changes mid-reply.
bool append_reply_line(SmtpReply& r, const std::string& line);

// EHLO keyword lookup, case-insensitive ("STARTTLS", "AUTH").
bool reply_has_capability(const SmtpReply& r, const std::string& keyword);

// "\0user\0pass", base64
std::string auth_plain_token(const std::string& user, const std::string& pass);

using SendCallback = std::function<void(SendResult)>;

// Delivers one message over SMTP submission and reports through `cb` on the
// io_context. Port 465 uses implicit TLS, any other port STARTTLS. Each network
// step is bounded by settings.timeout_sec.
void async_send_mail(boost::asio::io_context& ioc, boost::asio::ssl::context& tls,
                     const config::SmtpSettings& settings, MailMessage msg, SendCallback cb);

}
