#include "BookingErrors.h"
#include <string>

namespace booking {

namespace {

class BookingCategory : public boost::system::error_category {
public:
    const char* name() const noexcept override { return "booking"; }
    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
            case errc::missing_fields: return "required fields missing";
            case errc::privacy_required: return "privacy consent required";
            case errc::invalid_date: return "invalid date";
            case errc::date_out_of_range: return "date outside booking window";
            case errc::invalid_time: return "invalid time slot";
            case errc::invalid_id: return "invalid booking id";
            case errc::invalid_flag: return "invalid boolean flag";
            case errc::invalid_text: return "field is not valid UTF-8 text";
            case errc::missing_token: return "missing cancellation token";
            case errc::slot_taken: return "slot already booked";
            case errc::not_found: return "booking not found";
            case errc::storage_failure: return "storage failure";
        }
        return "unknown booking error";
    }
};

}

const boost::system::error_category& booking_category() noexcept {
    static const BookingCategory cat;
    return cat;
}

boost::system::error_code make_error_code(errc e) noexcept {
    return boost::system::error_code(static_cast<int>(e), booking_category());
}

bool is_validation_error(const boost::system::error_code& ec) noexcept {
    if (ec.category() != booking_category()) return false;
    switch (static_cast<errc>(ec.value())) {
        case errc::missing_fields:
        case errc::privacy_required:
        case errc::invalid_date:
        case errc::date_out_of_range:
        case errc::invalid_time:
        case errc::invalid_id:
        case errc::invalid_flag:
        case errc::invalid_text:
        case errc::missing_token:
            return true;
        default:
            return false;
    }
}

int http_status_for(const boost::system::error_code& ec) noexcept {
    if (!ec) return 200;
    if (is_validation_error(ec)) return 400;
    if (ec == errc::not_found) return 404;
    if (ec == errc::slot_taken) return 409;
    return 500;
}

const char* error_key(const boost::system::error_code& ec) noexcept {
    if (ec.category() != booking_category()) return "internal";
    switch (static_cast<errc>(ec.value())) {
        case errc::missing_fields: return "missing_fields";
        case errc::privacy_required: return "privacy_required";
        case errc::invalid_date: return "invalid_date";
        case errc::date_out_of_range: return "date_out_of_range";
        case errc::invalid_time: return "invalid_time";
        case errc::invalid_id: return "invalid_id";
        case errc::invalid_flag: return "invalid_flag";
        case errc::invalid_text: return "invalid_text";
        case errc::missing_token: return "missing_token";
        case errc::slot_taken: return "slot_taken";
        case errc::not_found: return "not_found";
        case errc::storage_failure: return "internal";
    }
    return "internal";
}

}
