#pragma once

#include <chrono>
#include <string>
#include <vector>
#include "../booking/Booking.h"

namespace mail {

enum class SendStatus { sent, not_configured, failed };

const char* to_string(SendStatus s);

struct SendResult {
    SendStatus status = SendStatus::not_configured;
    std::string reason;
    bool sent() const { return status == SendStatus::sent; }
};

struct MailMessage {
    std::string from;
    std::string to;
    // envelope recipients only, never rendered as a header
    std::vector<std::string> bcc;
    std::string subject;
    std::string body;

    std::vector<std::string> recipients() const;
};

// Usable in MAIL FROM / RCPT TO: non-empty, one '@', no whitespace, brackets or control characters.
bool is_envelope_address(const std::string& addr);

// RFC 5322 message with CRLF line endings; header values are stripped of CR/LF
// and non-ASCII subjects are RFC 2047 encoded.
std::string render_message(const MailMessage& m, std::chrono::system_clock::time_point now);

// DATA payload: CRLF line endings, leading dots doubled, terminated by "\r\n.\r\n".
std::string dot_stuff(const std::string& rendered);

// "<base>/annulla?token=<token>"
std::string cancel_url(const std::string& base, const std::string& token);

MailMessage confirmation_message(const booking::Booking& b, const std::string& from, const std::string& notify, const std::string& cancel_link);
MailMessage thank_you_message(const booking::Booking& b, const std::string& from);

}
