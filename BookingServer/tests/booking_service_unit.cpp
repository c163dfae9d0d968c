#include <algorithm>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <boost/asio.hpp>
#include "test_util.h"
#include "InMemoryBookingRepository.h"
#include "RecordingNotifier.h"
#include "booking/BookingErrors.h"
#include "booking/BookingService.h"

using namespace booking;
using boost::system::error_code;

namespace {

struct Fixture {
    boost::asio::io_context ioc;
    std::shared_ptr<InMemoryBookingRepository> repo = std::make_shared<InMemoryBookingRepository>(ioc);
    std::shared_ptr<RecordingNotifier> notifier = std::make_shared<RecordingNotifier>(ioc);
    // 2025-03-03T10:00:00Z, a Monday
    std::chrono::system_clock::time_point now{std::chrono::seconds(1740996000)};
    BookingService service{repo, notifier, [this] { return now; }};

    std::pair<error_code, CreateResult> create(Fields f, Origin origin = Origin::public_form) {
        std::pair<error_code, CreateResult> out;
        service.create(f, origin, "http://studio.test", [&out](const error_code& ec, CreateResult r) {
            out = {ec, std::move(r)};
        });
        drain(ioc);
        return out;
    }

    struct CancelOut { error_code ec; Booking b; bool already = false; };

    CancelOut cancel_token(const std::string& token) {
        CancelOut out;
        service.cancel_by_token(token, [&out](const error_code& ec, Booking b, bool already) { out = {ec, std::move(b), already}; });
        drain(ioc);
        return out;
    }

    CancelOut cancel_id(const std::string& id) {
        CancelOut out;
        service.cancel_by_id(Fields{{"id", id}}, [&out](const error_code& ec, Booking b, bool already) { out = {ec, std::move(b), already}; });
        drain(ioc);
        return out;
    }

    std::pair<error_code, UpdateResult> update(Fields f) {
        std::pair<error_code, UpdateResult> out;
        service.update(f, [&out](const error_code& ec, UpdateResult r) { out = {ec, std::move(r)}; });
        drain(ioc);
        return out;
    }

    std::vector<std::string> free_slots(const std::string& date) {
        std::vector<std::string> out;
        service.availability([&out, date](const error_code& ec, Availability a) {
            if (ec) return;
            for (const auto& d : a.dates) if (d.date == date) out = d.available;
        });
        drain(ioc);
        return out;
    }
};

Fields form(const std::string& data, const std::string& ora) {
    return Fields{
        {"nome", " Anna "}, {"cognome", "Rossi"}, {"telefono", "+39 333 1234567"},
        {"email", "anna@example.it"}, {"data", data}, {"ora", ora},
        {"note", "prima visita"}, {"privacy", "on"},
    };
}

bool has(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

}

int main() {
    const CivilDate today{2025, 3, 3};

    // field helpers
    {
        if (!is_truthy(Fields{{"privacy", "on"}}, "privacy") || !is_truthy(Fields{{"privacy", "1"}}, "privacy")) { std::cerr << "consent values rejected\n"; return 1; }
        for (const char* v : {"", "false", "0", "off", "  OFF "}) {
            if (is_truthy(Fields{{"privacy", v}}, "privacy")) { std::cerr << "non-consent accepted: '" << v << "'\n"; return 1; }
        }
        if (is_truthy(Fields{}, "privacy")) { std::cerr << "absent consent accepted\n"; return 1; }
        if (parse_flag("YES") != true || parse_flag("off") != false || parse_flag("maybe").has_value()) { std::cerr << "parse_flag mismatch\n"; return 1; }
        if (parse_booking_id("12") != 12 || parse_booking_id("0") || parse_booking_id("-3") || parse_booking_id("1x") || parse_booking_id("")) {
            std::cerr << "parse_booking_id mismatch\n"; return 1;
        }
    }

    // validation order and window bounds
    {
        NewBooking nb;
        auto f = form("2025-03-10", "09:00");
        if (validate_new_booking(f, Origin::public_form, today, nb)) { std::cerr << "valid form rejected\n"; return 1; }
        if (nb.nome != "Anna" || nb.data != "2025-03-10" || nb.note != "prima visita") { std::cerr << "fields not trimmed/copied\n"; return 1; }

        auto missing = f; missing["telefono"] = "   ";
        missing["privacy"] = "";
        if (validate_new_booking(missing, Origin::public_form, today, nb) != errc::missing_fields) { std::cerr << "missing_fields should come first\n"; return 1; }

        auto no_consent = f; no_consent.erase("privacy");
        no_consent["data"] = "not-a-date";
        if (validate_new_booking(no_consent, Origin::public_form, today, nb) != errc::privacy_required) { std::cerr << "privacy_required expected\n"; return 1; }
        if (validate_new_booking(no_consent, Origin::admin, today, nb) != errc::invalid_date) { std::cerr << "admin origin should skip consent\n"; return 1; }

        auto bad_date = f; bad_date["data"] = "2025-02-30";
        if (validate_new_booking(bad_date, Origin::public_form, today, nb) != errc::invalid_date) { std::cerr << "invalid_date expected\n"; return 1; }

        for (const char* d : {"2025-03-02", "2025-05-02"}) {
            auto out = f; out["data"] = d; out["ora"] = "12:00";
            if (validate_new_booking(out, Origin::public_form, today, nb) != errc::date_out_of_range) { std::cerr << "date_out_of_range expected for " << d << "\n"; return 1; }
        }
        for (const char* d : {"2025-03-03", "2025-05-01"}) {
            auto in = f; in["data"] = d;
            if (validate_new_booking(in, Origin::public_form, today, nb)) { std::cerr << "window bound rejected: " << d << "\n"; return 1; }
        }

        auto bad_time = f; bad_time["ora"] = "12:30";
        if (validate_new_booking(bad_time, Origin::public_form, today, nb) != errc::invalid_time) { std::cerr << "invalid_time expected\n"; return 1; }

        // bytes the database would refuse or truncate
        for (std::string key : {"nome", "cognome", "telefono", "email", "note"}) {
            for (std::string bad : {std::string("\xff\xfe"), std::string("\xed\xa0\x80x"), std::string("Ma\0rio", 6)}) {
                auto g = f; g[key] = bad;
                if (validate_new_booking(g, Origin::public_form, today, nb) != errc::invalid_text) { std::cerr << "invalid_text expected for " << key << "\n"; return 1; }
            }
        }
        auto bad_text = f; bad_text["nome"] = "\xff"; bad_text.erase("privacy");
        if (validate_new_booking(bad_text, Origin::public_form, today, nb) != errc::invalid_text) { std::cerr << "text check should precede consent\n"; return 1; }
        if (booking::http_status_for(errc::invalid_text) != 400 || std::string(booking::error_key(errc::invalid_text)) != "invalid_text") {
            std::cerr << "invalid_text should be a 400\n"; return 1;
        }
    }

    // create, conflict, confirmation
    {
        Fixture fx;
        if (fx.service.today() != today) { std::cerr << "service today mismatch\n"; return 1; }

        auto [ec, r] = fx.create(form("2025-03-10", "09:00"));
        if (ec) { std::cerr << "create failed: " << ec.message() << "\n"; return 1; }
        if (r.booking.id != 1 || r.booking.status != kStatusBooked) { std::cerr << "created booking mismatch\n"; return 1; }
        if (r.booking.token.size() != 32) { std::cerr << "token length " << r.booking.token.size() << "\n"; return 1; }
        if (r.booking.created_at != "2025-03-03T10:00:00Z") { std::cerr << "created_at " << r.booking.created_at << "\n"; return 1; }
        if (!r.confirmation.sent()) { std::cerr << "confirmation not reported as sent\n"; return 1; }
        if (fx.notifier->count("confirmation") != 1) { std::cerr << "expected one confirmation\n"; return 1; }
        if (fx.notifier->sent[0].cancel_link != "http://studio.test/annulla?token=" + r.booking.token) {
            std::cerr << "cancel link mismatch: " << fx.notifier->sent[0].cancel_link << "\n"; return 1;
        }

        auto dup = fx.create(form("2025-03-10", "09:00"));
        if (dup.first != errc::slot_taken) { std::cerr << "expected slot_taken got " << dup.first.message() << "\n"; return 1; }
        if (fx.notifier->count("confirmation") != 1) { std::cerr << "conflict should not send mail\n"; return 1; }
        if (fx.repo->rows.size() != 1) { std::cerr << "conflict stored a row\n"; return 1; }

        auto other = fx.create(form("2025-03-10", "09:30"), Origin::admin);
        if (other.first) { std::cerr << "second slot rejected\n"; return 1; }
        if (other.second.booking.token == r.booking.token) { std::cerr << "tokens should differ\n"; return 1; }

        auto invalid = fx.create(form("2025-03-10", "13:00"));
        if (invalid.first != errc::invalid_time || fx.repo->rows.size() != 2) { std::cerr << "invalid create reached storage\n"; return 1; }

        auto free = fx.free_slots("2025-03-10");
        if (has(free, "09:00") || has(free, "09:30") || !has(free, "10:00")) { std::cerr << "availability ignores bookings\n"; return 1; }
    }

    // mail outcome never fails a booking
    {
        Fixture fx;
        fx.notifier->next_status = mail::SendStatus::not_configured;
        auto [ec, r] = fx.create(form("2025-03-11", "10:00"));
        if (ec || r.confirmation.status != mail::SendStatus::not_configured) { std::cerr << "not_configured should still book\n"; return 1; }
        fx.notifier->next_status = mail::SendStatus::failed;
        auto second = fx.create(form("2025-03-11", "10:30"));
        if (second.first || second.second.confirmation.status != mail::SendStatus::failed) { std::cerr << "failed mail should still book\n"; return 1; }
        if (fx.repo->rows.size() != 2) { std::cerr << "bookings missing after mail failures\n"; return 1; }
    }

    // storage failure
    {
        Fixture fx;
        fx.repo->fail_next = true;
        auto [ec, r] = fx.create(form("2025-03-11", "10:00"));
        if (ec != errc::storage_failure || http_status_for(ec) != 500) { std::cerr << "storage failure not propagated\n"; return 1; }
        if (fx.notifier->count("confirmation") != 0) { std::cerr << "mail sent after storage failure\n"; return 1; }
    }

    // cancellation by token is idempotent and frees the slot
    {
        Fixture fx;
        auto created = fx.create(form("2025-03-12", "15:00")).second.booking;

        if (fx.cancel_token("  ").ec != errc::missing_token) { std::cerr << "missing_token expected\n"; return 1; }
        if (fx.cancel_token("nope").ec != errc::not_found) { std::cerr << "unknown token should be not_found\n"; return 1; }
        if (fx.cancel_token(std::string("ab\0cd", 5)).ec != errc::not_found || fx.cancel_token("\xff\xfe").ec != errc::not_found) { std::cerr << "malformed token should be not_found\n"; return 1; }

        auto first = fx.cancel_token(created.token);
        if (first.ec || first.already || !first.b.is_canceled() || !first.b.canceled_at) { std::cerr << "first cancel mismatch\n"; return 1; }
        if (has(fx.free_slots("2025-03-12"), "15:00") == false) { std::cerr << "canceled slot not freed\n"; return 1; }

        fx.now += std::chrono::hours(1);
        auto second = fx.cancel_token(created.token);
        if (second.ec || !second.already) { std::cerr << "second cancel should report already canceled\n"; return 1; }
        if (second.b.canceled_at != first.b.canceled_at) { std::cerr << "canceled_at changed on repeat\n"; return 1; }

        auto rebook = fx.create(form("2025-03-12", "15:00"));
        if (rebook.first) { std::cerr << "canceled slot could not be rebooked\n"; return 1; }

        if (fx.cancel_id("abc").ec != errc::invalid_id || fx.cancel_id("0").ec != errc::invalid_id) { std::cerr << "invalid id accepted\n"; return 1; }
        if (fx.cancel_id("99").ec != errc::not_found) { std::cerr << "unknown id should be not_found\n"; return 1; }
        auto by_id = fx.cancel_id(std::to_string(rebook.second.booking.id));
        if (by_id.ec || by_id.already || !by_id.b.is_canceled()) { std::cerr << "cancel by id mismatch\n"; return 1; }
    }

    // delete
    {
        Fixture fx;
        auto b = fx.create(form("2025-03-13", "16:00")).second.booking;
        error_code ec;
        int64_t deleted = 0;
        fx.service.delete_by_id(Fields{{"id", std::to_string(b.id)}}, [&](const error_code& e, int64_t id) { ec = e; deleted = id; });
        drain(fx.ioc);
        if (ec || deleted != b.id || !fx.repo->rows.empty()) { std::cerr << "delete failed\n"; return 1; }
        fx.service.delete_by_id(Fields{{"id", std::to_string(b.id)}}, [&](const error_code& e, int64_t) { ec = e; });
        drain(fx.ioc);
        if (ec != errc::not_found) { std::cerr << "second delete should be not_found\n"; return 1; }
        fx.service.delete_by_id(Fields{}, [&](const error_code& e, int64_t) { ec = e; });
        if (ec != errc::invalid_id) { std::cerr << "delete without id should be invalid_id\n"; return 1; }
    }

    // thank-you email goes out once
    {
        Fixture fx;
        auto b = fx.create(form("2025-03-14", "11:00")).second.booking;
        const std::string id = std::to_string(b.id);

        if (fx.update(Fields{{"id", id}, {"attended", "maybe"}}).first != errc::invalid_flag) { std::cerr << "invalid_flag expected\n"; return 1; }
        if (fx.update(Fields{{"id", "999"}, {"paid", "true"}}).first != errc::not_found) { std::cerr << "update unknown id should be not_found\n"; return 1; }

        auto paid = fx.update(Fields{{"id", id}, {"paid", "true"}});
        if (paid.first || !paid.second.booking.paid || paid.second.booking.attended) { std::cerr << "paid update mismatch\n"; return 1; }
        if (paid.second.thank_you.has_value()) { std::cerr << "paid alone should not send a thank-you\n"; return 1; }

        auto attended = fx.update(Fields{{"id", id}, {"attended", "true"}});
        if (attended.first || !attended.second.booking.attended) { std::cerr << "attended update failed\n"; return 1; }
        if (!attended.second.thank_you || !attended.second.thank_you->sent()) { std::cerr << "thank-you not sent\n"; return 1; }
        if (!attended.second.booking.thanked_at || !attended.second.booking.paid) { std::cerr << "thanked_at not stamped or paid lost\n"; return 1; }

        auto again = fx.update(Fields{{"id", id}, {"attended", "true"}});
        if (again.second.thank_you.has_value()) { std::cerr << "attended true->true sent again\n"; return 1; }
        fx.update(Fields{{"id", id}, {"attended", "false"}});
        auto retoggle = fx.update(Fields{{"id", id}, {"attended", "1"}});
        if (retoggle.first || retoggle.second.thank_you.has_value()) { std::cerr << "thanked booking got a second thank-you\n"; return 1; }
        if (fx.notifier->count("thank_you") != 1) { std::cerr << "expected exactly one thank-you got " << fx.notifier->count("thank_you") << "\n"; return 1; }
    }

    // a failed thank-you leaves thanked_at unset and is retried on the next transition
    {
        Fixture fx;
        auto b = fx.create(form("2025-03-14", "11:30")).second.booking;
        const std::string id = std::to_string(b.id);
        fx.notifier->next_status = mail::SendStatus::failed;
        auto failed = fx.update(Fields{{"id", id}, {"attended", "true"}});
        if (failed.first || !failed.second.thank_you || failed.second.thank_you->status != mail::SendStatus::failed) { std::cerr << "failed thank-you not reported\n"; return 1; }
        if (failed.second.booking.thanked_at || !failed.second.booking.attended) { std::cerr << "failed thank-you stamped thanked_at\n"; return 1; }

        fx.notifier->next_status = mail::SendStatus::sent;
        fx.update(Fields{{"id", id}, {"attended", "false"}});
        auto retry = fx.update(Fields{{"id", id}, {"attended", "true"}});
        if (!retry.second.thank_you || !retry.second.thank_you->sent() || !retry.second.booking.thanked_at) { std::cerr << "thank-you retry failed\n"; return 1; }
    }

    // schedule order
    {
        Fixture fx;
        fx.create(form("2025-03-20", "14:00"));
        fx.create(form("2025-03-18", "16:00"));
        fx.create(form("2025-03-18", "09:30"));
        std::vector<Booking> list;
        fx.service.list([&list](const error_code& ec, std::vector<Booking> l) { if (!ec) list = std::move(l); });
        drain(fx.ioc);
        if (list.size() != 3) { std::cerr << "list size " << list.size() << "\n"; return 1; }
        if (list[0].display_slot() != "2025-03-18 09:30" || list[1].display_slot() != "2025-03-18 16:00" || list[2].display_slot() != "2025-03-20 14:00") {
            std::cerr << "list not in schedule order\n"; return 1;
        }
    }

    std::cout << "booking_service_unit ok\n";
    return 0;
}
