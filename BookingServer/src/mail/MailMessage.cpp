#include "MailMessage.h"
#include <cstdio>
#include <ctime>
#include "../auth/Tokens.h"

namespace mail {

const char* to_string(SendStatus s) {
    switch (s) {
        case SendStatus::sent: return "sent";
        case SendStatus::not_configured: return "not_configured";
        case SendStatus::failed: return "failed";
    }
    return "failed";
}

std::vector<std::string> MailMessage::recipients() const {
    std::vector<std::string> out;
    out.push_back(to);
    for (const auto& b : bcc) {
        if (!b.empty() && b != to) out.push_back(b);
    }
    return out;
}

bool is_envelope_address(const std::string& addr) {
    if (addr.empty() || addr.size() > 254) return false;
    size_t at = addr.find('@');
    if (at == std::string::npos || at == 0 || at + 1 == addr.size()) return false;
    if (addr.find('@', at + 1) != std::string::npos) return false;
    for (unsigned char c : addr) {
        if (c <= 0x20 || c == 0x7f || c == '<' || c == '>' || c == '"' || c == ',') return false;
    }
    return true;
}

static std::string header_value(const std::string& v) {
    std::string out;
    out.reserve(v.size());
    for (char c : v) out.push_back((c == '\r' || c == '\n') ? ' ' : c);
    return out;
}

static std::string encode_subject(const std::string& s) {
    bool ascii = true;
    for (unsigned char c : s) if (c >= 0x80) { ascii = false; break; }
    if (ascii) return header_value(s);
    return "=?UTF-8?B?" + auth::base64_encode(header_value(s)) + "?=";
}

static std::string rfc5322_date(std::chrono::system_clock::time_point now) {
    static const char* days[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
    static const char* months[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%s, %02d %s %04d %02d:%02d:%02d +0000",
        days[tm.tm_wday], tm.tm_mday, months[tm.tm_mon], tm.tm_year + 1900, tm.tm_hour, tm.tm_min, tm.tm_sec);
    return std::string(buf);
}

static std::string domain_of(const std::string& addr) {
    auto at = addr.rfind('@');
    if (at == std::string::npos || at + 1 >= addr.size()) return "localhost";
    return addr.substr(at + 1);
}

std::string render_message(const MailMessage& m, std::chrono::system_clock::time_point now) {
    std::string out;
    out += "From: " + header_value(m.from) + "\r\n";
    out += "To: " + header_value(m.to) + "\r\n";
    out += "Subject: " + encode_subject(m.subject) + "\r\n";
    out += "Date: " + rfc5322_date(now) + "\r\n";
    out += "Message-ID: <" + auth::random_token(12) + "@" + header_value(domain_of(m.from)) + ">\r\n";
    out += "MIME-Version: 1.0\r\n";
    out += "Content-Type: text/plain; charset=utf-8\r\n";
    out += "Content-Transfer-Encoding: 8bit\r\n";
    out += "\r\n";
    out += m.body;
    return out;
}

std::string dot_stuff(const std::string& rendered) {
    std::string out;
    out.reserve(rendered.size() + 16);
    bool line_start = true;
    for (size_t i = 0; i < rendered.size(); ++i) {
        char c = rendered[i];
        if (c == '\r' && i + 1 < rendered.size() && rendered[i+1] == '\n') continue;
        if (c == '\n' || c == '\r') {
            out += "\r\n";
            line_start = true;
            continue;
        }
        if (line_start && c == '.') out.push_back('.');
        out.push_back(c);
        line_start = false;
    }
    if (!line_start) out += "\r\n";
    out += ".\r\n";
    return out;
}

std::string cancel_url(const std::string& base, const std::string& token) {
    return base + "/annulla?token=" + token;
}

static std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (const auto& l : lines) { out += l; out += "\r\n"; }
    return out;
}

MailMessage confirmation_message(const booking::Booking& b, const std::string& from, const std::string& notify, const std::string& cancel_link) {
    MailMessage m;
    m.from = from;
    m.to = b.email;
    if (!notify.empty()) m.bcc.push_back(notify);
    m.subject = "Conferma prenotazione";
    m.body = join_lines({
        "Grazie per la tua richiesta di prenotazione.",
        "",
        "Nome: " + b.full_name(),
        "Telefono: " + b.telefono,
        "Email: " + b.email,
        "Data e ora: " + b.display_slot(),
        "Note: " + (b.note.empty() ? std::string("Nessuna nota.") : b.note),
        "",
        "Se devi annullare la prenotazione, usa questo link:",
        cancel_link,
        "",
        "Ti contatteremo a breve per confermare.",
    });
    return m;
}

MailMessage thank_you_message(const booking::Booking& b, const std::string& from) {
    MailMessage m;
    m.from = from;
    m.to = b.email;
    m.subject = "Grazie per la visita";
    m.body = join_lines({
        "Ciao " + b.full_name() + ",",
        "",
        "grazie per essere venuto all'appuntamento del " + b.display_slot() + ".",
        "Speriamo di rivederti presto.",
    });
    return m;
}

}
