#pragma once

#include <memory>
#include <optional>
#include "BookingRepository.h"
#include "../db/DbPool.h"

namespace booking {

// Decodes one row of a result selected with the booking column list.
// Returns nullopt when id is missing or not an integer.
std::optional<Booking> booking_from_row(const db::DbResult& r, size_t row);

class PgBookingRepository : public BookingRepository {
public:
    explicit PgBookingRepository(std::shared_ptr<db::DbPool> db);

    void async_migrate(DoneCb cb) override;
    void async_insert(NewBooking nb, BookingCb cb) override;
    void async_find_by_id(int64_t id, BookingCb cb) override;
    void async_cancel_by_token(std::string token, std::string now_iso, CancelCb cb) override;
    void async_cancel_by_id(int64_t id, std::string now_iso, CancelCb cb) override;
    void async_delete(int64_t id, DoneCb cb) override;
    void async_update_flags(int64_t id, std::optional<bool> attended, std::optional<bool> paid, BookingCb cb) override;
    void async_mark_thanked(int64_t id, std::string now_iso, BookingCb cb) override;
    void async_list(ListCb cb) override;
    void async_booked_slots(std::string from_date, std::string to_date, SlotsCb cb) override;
    void async_ping(DoneCb cb) override;

private:
    void cancel_where(const std::string& key_sql, std::string key, std::string now_iso, CancelCb cb);

    std::shared_ptr<db::DbPool> db_;
};

}
