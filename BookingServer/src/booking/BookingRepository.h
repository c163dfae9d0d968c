#pragma once

#include <boost/system/error_code.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "Availability.h"
#include "Booking.h"

namespace booking {

struct NewBooking {
    std::string nome;
    std::string cognome;
    std::string telefono;
    std::string email;
    std::string data;
    std::string ora;
    std::string note;
    std::string token;
    std::string created_at;
};

// Persistence for the bookings table. Every operation completes through its
// callback on the application io_context. Errors use booking::errc:
// slot_taken, not_found, storage_failure.
class BookingRepository {
public:
    using DoneCb = std::function<void(const boost::system::error_code&)>;
    using BookingCb = std::function<void(const boost::system::error_code&, Booking)>;
    using CancelCb = std::function<void(const boost::system::error_code&, Booking, bool already_canceled)>;
    using ListCb = std::function<void(const boost::system::error_code&, std::vector<Booking>)>;
    using SlotsCb = std::function<void(const boost::system::error_code&, std::vector<BookedSlot>)>;

    virtual ~BookingRepository() = default;

    // Creates the table, adds missing columns, backfills status, builds indexes.
    virtual void async_migrate(DoneCb cb) = 0;

    // Fails with slot_taken when a booked row holds the same (data, ora).
    virtual void async_insert(NewBooking nb, BookingCb cb) = 0;

    virtual void async_find_by_id(int64_t id, BookingCb cb) = 0;

    // Idempotent: an already canceled row is returned unchanged.
    virtual void async_cancel_by_token(std::string token, std::string now_iso, CancelCb cb) = 0;
    virtual void async_cancel_by_id(int64_t id, std::string now_iso, CancelCb cb) = 0;

    virtual void async_delete(int64_t id, DoneCb cb) = 0;

    // Absent flags are left untouched.
    virtual void async_update_flags(int64_t id, std::optional<bool> attended, std::optional<bool> paid, BookingCb cb) = 0;

    // Sets thanked_at only while it is null; returns the current row either way.
    virtual void async_mark_thanked(int64_t id, std::string now_iso, BookingCb cb) = 0;

    // Schedule order: data, ora (nulls last), then created_at.
    virtual void async_list(ListCb cb) = 0;

    // (data, ora) of booked rows with from_date <= data <= to_date.
    virtual void async_booked_slots(std::string from_date, std::string to_date, SlotsCb cb) = 0;

    virtual void async_ping(DoneCb cb) = 0;
};

}
