#include "Pages.h"
#include "../booking/BookingErrors.h"

namespace web {

std::string html_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 16);
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#x27;"; break;
            default: out.push_back(c); break;
        }
    }
    return out;
}

std::string render_page(const std::string& title, const std::string& inner_html) {
    std::string out;
    out += "<!doctype html>\n<html lang=\"it\">\n<head>\n";
    out += "<meta charset=\"UTF-8\" />\n";
    out += "<meta name=\"viewport\" content=\"width=device-width, initial-scale=1.0\" />\n";
    out += "<title>" + html_escape(title) + "</title>\n";
    out += "<style>\n"
           "body { font-family: Arial, sans-serif; padding: 40px; background: #f8fafc; color: #0b0f1a; }\n"
           ".card { max-width: 520px; margin: 0 auto; background: #fff; padding: 32px; border-radius: 24px; }\n"
           "a { color: #0b0f1a; }\n"
           "</style>\n</head>\n<body>\n<div class=\"card\">\n";
    out += inner_html;
    out += "\n</div>\n</body>\n</html>\n";
    return out;
}

std::string message_page(const std::string& title, const std::string& message) {
    return render_page(title, "<h1>" + html_escape(title) + "</h1><p>" + html_escape(message) + "</p>");
}

std::string booking_received_page(const booking::Booking& b, const mail::SendResult& confirmation) {
    std::string status = confirmation.sent()
        ? "Conferma inviata via email."
        : (confirmation.status == mail::SendStatus::not_configured
            ? "Prenotazione salvata. Configura SMTP per inviare la conferma."
            : "Prenotazione salvata, ma non e stato possibile inviare la conferma via email.");
    std::string cancel_link = "/annulla?token=" + b.token;
    std::string inner;
    inner += "<h1>Grazie, " + html_escape(b.full_name()) + ".</h1>\n";
    inner += "<p>La tua richiesta e stata registrata per <strong>" + html_escape(b.display_slot()) + "</strong>.</p>\n";
    inner += "<p><strong>" + html_escape(status) + "</strong></p>\n";
    inner += "<p>Se devi annullare: <a href=\"" + html_escape(cancel_link) + "\">Annulla prenotazione</a></p>\n";
    inner += "<p><a href=\"/\">Torna alla pagina principale</a></p>";
    return render_page("Prenotazione ricevuta", inner);
}

std::string cancel_result_page(bool already_canceled) {
    if (already_canceled) return message_page("Prenotazione gia annullata", "Nessuna azione necessaria.");
    return message_page("Prenotazione annullata", "Lo slot e di nuovo disponibile.");
}

std::string error_page(const boost::system::error_code& ec) {
    using booking::errc;
    if (ec == errc::missing_fields) return message_page("Dati mancanti", "Compila tutti i campi obbligatori.");
    if (ec == errc::privacy_required) return message_page("Consenso mancante", "Accetta l'informativa sulla privacy per prenotare.");
    if (ec == errc::invalid_date) return message_page("Data non valida", "Seleziona una data corretta.");
    if (ec == errc::date_out_of_range) return message_page("Data fuori intervallo", "Seleziona una data entro 2 mesi.");
    if (ec == errc::invalid_time) return message_page("Orario non valido", "Seleziona un orario valido.");
    if (ec == errc::invalid_text) return message_page("Dati non validi", "Alcuni campi contengono caratteri non ammessi.");
    if (ec == errc::slot_taken) return message_page("Slot non disponibile", "Seleziona un altro orario.");
    if (ec == errc::missing_token) return message_page("Token mancante", "Impossibile annullare.");
    if (ec == errc::not_found) return message_page("Token non valido", "Richiesta non trovata.");
    return message_page("Errore", "Si e verificato un errore. Riprova piu tardi.");
}

std::string login_failed_page(bool login_enabled) {
    if (!login_enabled) {
        return message_page("Accesso disabilitato", "L'accesso amministratore non e configurato.");
    }
    return render_page("Accesso negato",
        "<h1>Accesso negato</h1><p>Credenziali non valide.</p><p><a href=\"/admin/login\">Riprova</a></p>");
}

std::string login_form_page() {
    return render_page("Accesso amministratore",
        "<h1>Accesso amministratore</h1>\n"
        "<form method=\"post\" action=\"/admin/login\">\n"
        "<p><label>Utente <input name=\"username\" autocomplete=\"username\" required /></label></p>\n"
        "<p><label>Password <input name=\"password\" type=\"password\" autocomplete=\"current-password\" required /></label></p>\n"
        "<p><button type=\"submit\">Entra</button></p>\n"
        "</form>");
}

}
