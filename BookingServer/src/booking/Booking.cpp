#include "Booking.h"
#include "../net/MiniJson.h"

namespace booking {

std::string Booking::display_slot() const {
    if (data.has_value() && ora.has_value()) return *data + " " + *ora;
    if (legacy_data_ora.has_value()) return *legacy_data_ora;
    if (data.has_value()) return *data;
    return std::string();
}

static std::string quoted(const std::string& s) {
    return "\"" + json_escape_resp(s) + "\"";
}

std::string booking_to_json(const Booking& b) {
    std::string out;
    out.reserve(384);
    out += "{\"id\":" + std::to_string(b.id);
    out += ",\"nome\":" + quoted(b.nome);
    out += ",\"cognome\":" + quoted(b.cognome);
    out += ",\"telefono\":" + quoted(b.telefono);
    out += ",\"email\":" + quoted(b.email);
    out += ",\"data\":" + json_quote_or_null(b.data);
    out += ",\"ora\":" + json_quote_or_null(b.ora);
    out += ",\"data_ora\":" + quoted(b.display_slot());
    out += ",\"note\":" + quoted(b.note);
    out += ",\"status\":" + quoted(b.status);
    out += ",\"created_at\":" + quoted(b.created_at);
    out += ",\"canceled_at\":" + json_quote_or_null(b.canceled_at);
    out += std::string(",\"attended\":") + (b.attended ? "true" : "false");
    out += std::string(",\"paid\":") + (b.paid ? "true" : "false");
    out += ",\"thanked_at\":" + json_quote_or_null(b.thanked_at);
    out += "}";
    return out;
}

std::string bookings_to_json_array(const std::vector<Booking>& list) {
    std::string out = "[";
    for (size_t i = 0; i < list.size(); ++i) {
        if (i) out += ",";
        out += booking_to_json(list[i]);
    }
    out += "]";
    return out;
}

}
