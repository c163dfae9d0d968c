#include "BookingService.h"
#include <algorithm>
#include <cctype>
#include "BookingErrors.h"
#include "SlotCatalog.h"
#include "../auth/Tokens.h"
#include "../net/MiniJson.h"
#include "../observability/Logging.h"
#include "../observability/Metrics.h"

namespace booking {

static constexpr std::size_t kTokenBytes = 24;

static std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && isspace((unsigned char)s[b])) ++b;
    while (e > b && isspace((unsigned char)s[e-1])) --e;
    return s.substr(b, e - b);
}

static std::string field(const Fields& f, const std::string& key) {
    auto it = f.find(key);
    return it == f.end() ? std::string() : trim(it->second);
}

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    return s;
}

bool is_truthy(const Fields& f, const std::string& key) {
    auto it = f.find(key);
    if (it == f.end()) return false;
    std::string v = lower(trim(it->second));
    return !(v.empty() || v == "false" || v == "0" || v == "off");
}

std::optional<bool> parse_flag(const std::string& s) {
    std::string v = lower(trim(s));
    if (v == "true" || v == "1" || v == "on" || v == "yes") return true;
    if (v == "false" || v == "0" || v == "off" || v == "no") return false;
    return std::nullopt;
}

std::optional<int64_t> parse_booking_id(const std::string& s) {
    auto v = parse_int64_strict_sv(trim(s));
    if (!v || *v <= 0) return std::nullopt;
    return v;
}

boost::system::error_code validate_new_booking(const Fields& f, Origin origin, const CivilDate& today, NewBooking& out) {
    out.nome = field(f, "nome");
    out.cognome = field(f, "cognome");
    out.telefono = field(f, "telefono");
    out.email = field(f, "email");
    out.data = field(f, "data");
    out.ora = field(f, "ora");
    out.note = field(f, "note");
    if (out.nome.empty() || out.cognome.empty() || out.telefono.empty() || out.email.empty() ||
        out.data.empty() || out.ora.empty()) {
        return errc::missing_fields;
    }
    for (const std::string* v : {&out.nome, &out.cognome, &out.telefono, &out.email, &out.data, &out.ora, &out.note}) {
        if (!is_valid_utf8_text(*v)) return errc::invalid_text;
    }
    if (origin == Origin::public_form && !is_truthy(f, "privacy")) return errc::privacy_required;

    auto date = parse_iso_date(out.data);
    if (!date) return errc::invalid_date;
    int64_t d = days_from_civil(*date);
    if (d < days_from_civil(today) || d > days_from_civil(window_end(today))) return errc::date_out_of_range;
    if (!is_valid_slot(out.ora)) return errc::invalid_time;
    return {};
}

BookingService::BookingService(std::shared_ptr<BookingRepository> repo, std::shared_ptr<mail::Notifier> notifier, Clock now)
    : repo_(std::move(repo)), notifier_(std::move(notifier)), now_(std::move(now)) {}

CivilDate BookingService::today() const { return utc_date(now_()); }

std::string BookingService::now_iso() const { return format_iso_utc(now_()); }

void BookingService::create(const Fields& f, Origin origin, const std::string& link_base, CreateCb cb) {
    NewBooking nb;
    auto ec = validate_new_booking(f, origin, today(), nb);
    if (ec) {
        observability::Metrics::instance().inc_booking("rejected");
        observability::log_info("booking.rejected", {{"reason", ec.message()}});
        cb(ec, CreateResult{});
        return;
    }
    nb.token = auth::random_token(kTokenBytes);
    nb.created_at = now_iso();
    const char* origin_name = origin == Origin::admin ? "admin" : "public";

    auto notifier = notifier_;
    repo_->async_insert(std::move(nb), [notifier, link_base, origin_name, cb](const boost::system::error_code& ec2, Booking b) {
        if (ec2) {
            observability::Metrics::instance().inc_booking(ec2 == errc::slot_taken ? "conflict" : "failed");
            if (ec2 == errc::slot_taken) {
                observability::log_info("booking.slot_taken", {{"origin", std::string(origin_name)}});
            }
            cb(ec2, CreateResult{});
            return;
        }
        observability::Metrics::instance().inc_booking("created");
        observability::log_info("booking.created", {{"id", b.id}, {"origin", std::string(origin_name)},
                                                    {"slot", b.display_slot()}});
        std::string link = mail::cancel_url(link_base, b.token);
        notifier->async_send_confirmation(b, link, [b, cb](mail::SendResult r) {
            cb({}, CreateResult{b, std::move(r)});
        });
    });
}

void BookingService::cancel_by_token(const std::string& token, BookingRepository::CancelCb cb) {
    std::string t = trim(token);
    if (t.empty()) { cb(errc::missing_token, Booking{}, false); return; }
    // issued tokens are base64url, so anything else cannot match a row
    if (!is_valid_utf8_text(t)) { cb(errc::not_found, Booking{}, false); return; }
    repo_->async_cancel_by_token(t, now_iso(), [cb](const boost::system::error_code& ec, Booking b, bool already) {
        if (!ec) observability::log_info("booking.canceled", {{"id", b.id}, {"via", std::string("token")}, {"already", int64_t(already)}});
        cb(ec, std::move(b), already);
    });
}

void BookingService::cancel_by_id(const Fields& f, BookingRepository::CancelCb cb) {
    auto id = parse_booking_id(field(f, "id"));
    if (!id) { cb(errc::invalid_id, Booking{}, false); return; }
    repo_->async_cancel_by_id(*id, now_iso(), [cb](const boost::system::error_code& ec, Booking b, bool already) {
        if (!ec) observability::log_info("booking.canceled", {{"id", b.id}, {"via", std::string("admin")}, {"already", int64_t(already)}});
        cb(ec, std::move(b), already);
    });
}

void BookingService::delete_by_id(const Fields& f, std::function<void(const boost::system::error_code&, int64_t)> cb) {
    auto id = parse_booking_id(field(f, "id"));
    if (!id) { cb(errc::invalid_id, 0); return; }
    int64_t bid = *id;
    repo_->async_delete(bid, [bid, cb](const boost::system::error_code& ec) {
        if (!ec) observability::log_info("booking.deleted", {{"id", bid}});
        cb(ec, bid);
    });
}

void BookingService::update(const Fields& f, UpdateCb cb) {
    auto id = parse_booking_id(field(f, "id"));
    if (!id) { cb(errc::invalid_id, UpdateResult{}); return; }
    std::optional<bool> attended, paid;
    for (auto [key, slot] : {std::make_pair("attended", &attended), std::make_pair("paid", &paid)}) {
        auto it = f.find(key);
        if (it == f.end()) continue;
        *slot = parse_flag(it->second);
        if (!*slot) { cb(errc::invalid_flag, UpdateResult{}); return; }
    }

    int64_t bid = *id;
    auto repo = repo_;
    auto notifier = notifier_;
    auto clock = now_;
    repo_->async_find_by_id(bid, [=](const boost::system::error_code& ec, Booking before) {
        if (ec) { cb(ec, UpdateResult{}); return; }
        repo->async_update_flags(bid, attended, paid, [=](const boost::system::error_code& ec2, Booking after) {
            if (ec2) { cb(ec2, UpdateResult{}); return; }
            bool thank_you_due = attended.value_or(false) && !before.attended && !after.thanked_at.has_value();
            if (!thank_you_due) { cb({}, UpdateResult{std::move(after), std::nullopt}); return; }

            notifier->async_send_thank_you(after, [=](mail::SendResult r) {
                if (!r.sent()) { cb({}, UpdateResult{after, std::move(r)}); return; }
                repo->async_mark_thanked(bid, format_iso_utc(clock()), [=](const boost::system::error_code& ec3, Booking stamped) {
                    if (ec3) {
                        observability::log_error("booking.thanked_stamp_failed", {{"id", bid}, {"err", ec3.message()}});
                        cb({}, UpdateResult{after, r});
                        return;
                    }
                    cb({}, UpdateResult{std::move(stamped), r});
                });
            });
        });
    });
}

void BookingService::list(BookingRepository::ListCb cb) {
    repo_->async_list(std::move(cb));
}

void BookingService::availability(AvailabilityCb cb) {
    CivilDate first = today();
    repo_->async_booked_slots(format_iso_date(first), format_iso_date(window_end(first)),
        [first, cb](const boost::system::error_code& ec, std::vector<BookedSlot> booked) {
            if (ec) { cb(ec, Availability{}); return; }
            cb({}, compute_availability(first, booked));
        });
}

}
