#pragma once

#include <boost/system/error_code.hpp>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include "Availability.h"
#include "Booking.h"
#include "BookingRepository.h"
#include "../mail/Notifier.h"

namespace booking {

// Normalized request body: form fields or top-level JSON members.
using Fields = std::map<std::string, std::string>;

enum class Origin { public_form, admin };

// Consent checkbox semantics: absent, "", "false", "0" and "off" are not consent.
bool is_truthy(const Fields& f, const std::string& key);

// true/false/1/0/on/off/yes/no; nullopt for anything else.
std::optional<bool> parse_flag(const std::string& s);

// Positive integer id, nullopt otherwise.
std::optional<int64_t> parse_booking_id(const std::string& s);

// Checks required fields, their UTF-8 text, consent (public origin only), date window and slot,
// and fills `out` with trimmed values. Token and created_at are left empty.
boost::system::error_code validate_new_booking(const Fields& f, Origin origin, const CivilDate& today, NewBooking& out);

struct CreateResult {
    Booking booking;
    mail::SendResult confirmation;
};

struct UpdateResult {
    Booking booking;
    // unset when no thank-you was due
    std::optional<mail::SendResult> thank_you;
};

class BookingService {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;
    using CreateCb = std::function<void(const boost::system::error_code&, CreateResult)>;
    using UpdateCb = std::function<void(const boost::system::error_code&, UpdateResult)>;
    using AvailabilityCb = std::function<void(const boost::system::error_code&, Availability)>;

    BookingService(std::shared_ptr<BookingRepository> repo, std::shared_ptr<mail::Notifier> notifier,
                   Clock now = &std::chrono::system_clock::now);

    // `link_base` prefixes the cancellation link in the confirmation email.
    // The confirmation is attempted after a successful insert and its outcome
    // never turns into an error.
    void create(const Fields& f, Origin origin, const std::string& link_base, CreateCb cb);

    void cancel_by_token(const std::string& token, BookingRepository::CancelCb cb);
    void cancel_by_id(const Fields& f, BookingRepository::CancelCb cb);
    void delete_by_id(const Fields& f, std::function<void(const boost::system::error_code&, int64_t)> cb);

    // Applies attended/paid when present. A thank-you is attempted when attended
    // goes false -> true and thanked_at is unset; only a sent message stamps thanked_at.
    void update(const Fields& f, UpdateCb cb);

    void list(BookingRepository::ListCb cb);
    void availability(AvailabilityCb cb);

    CivilDate today() const;

private:
    std::string now_iso() const;

    std::shared_ptr<BookingRepository> repo_;
    std::shared_ptr<mail::Notifier> notifier_;
    Clock now_;
};

}
