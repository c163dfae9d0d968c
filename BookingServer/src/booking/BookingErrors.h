#pragma once

#include <boost/system/error_code.hpp>
#include <type_traits>

namespace booking {

enum class errc {
    missing_fields = 1,
    privacy_required,
    invalid_date,
    date_out_of_range,
    invalid_time,
    invalid_id,
    invalid_flag,
    invalid_text,
    missing_token,
    slot_taken,
    not_found,
    storage_failure,
};

const boost::system::error_category& booking_category() noexcept;

boost::system::error_code make_error_code(errc e) noexcept;

// Request validation failures (400)
bool is_validation_error(const boost::system::error_code& ec) noexcept;

// 400 / 404 / 409 / 500
int http_status_for(const boost::system::error_code& ec) noexcept;

// Machine-readable name for JSON error bodies: "slot_taken", ...; "internal"
// for anything outside the booking category.
const char* error_key(const boost::system::error_code& ec) noexcept;

}

namespace boost { namespace system {
template <> struct is_error_code_enum<booking::errc> : std::true_type {};
} }
