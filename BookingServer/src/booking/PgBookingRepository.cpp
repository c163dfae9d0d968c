#include "PgBookingRepository.h"
#include <utility>
#include "BookingErrors.h"
#include "../net/MiniJson.h"
#include "../observability/Logging.h"

namespace booking {

static const char* kColumns =
    "id, nome, cognome, telefono, email, data, ora, data_ora, note, status, token, "
    "created_at, canceled_at, attended, paid, thanked_at";

static const std::vector<std::string>& migration_script() {
    static const std::vector<std::string> steps = {
        "CREATE TABLE IF NOT EXISTS bookings ("
        " id BIGSERIAL PRIMARY KEY,"
        " nome TEXT NOT NULL,"
        " cognome TEXT NOT NULL,"
        " telefono TEXT NOT NULL,"
        " email TEXT NOT NULL,"
        " data_ora TEXT,"
        " created_at TEXT NOT NULL)",
        "ALTER TABLE bookings ADD COLUMN IF NOT EXISTS data TEXT",
        "ALTER TABLE bookings ADD COLUMN IF NOT EXISTS ora TEXT",
        "ALTER TABLE bookings ADD COLUMN IF NOT EXISTS note TEXT",
        "ALTER TABLE bookings ADD COLUMN IF NOT EXISTS status TEXT DEFAULT 'booked'",
        "ALTER TABLE bookings ADD COLUMN IF NOT EXISTS token TEXT",
        "ALTER TABLE bookings ADD COLUMN IF NOT EXISTS canceled_at TEXT",
        "ALTER TABLE bookings ADD COLUMN IF NOT EXISTS attended BOOLEAN NOT NULL DEFAULT FALSE",
        "ALTER TABLE bookings ADD COLUMN IF NOT EXISTS paid BOOLEAN NOT NULL DEFAULT FALSE",
        "ALTER TABLE bookings ADD COLUMN IF NOT EXISTS thanked_at TEXT",
        "UPDATE bookings SET status = 'booked' WHERE status IS NULL",
        "CREATE INDEX IF NOT EXISTS bookings_schedule_idx ON bookings (data, ora)",
        // older databases may already hold duplicates; the service still works without these
        "CREATE UNIQUE INDEX IF NOT EXISTS bookings_token_key ON bookings (token) WHERE token IS NOT NULL",
        "CREATE UNIQUE INDEX IF NOT EXISTS bookings_booked_slot_key ON bookings (data, ora) WHERE status = 'booked'",
    };
    return steps;
}

static std::string sql_select(const std::string& where) {
    return std::string("SELECT ") + kColumns + " FROM bookings " + where;
}

static bool pg_bool(const std::optional<std::string>& v) {
    return v.has_value() && (*v == "t" || *v == "true" || *v == "1");
}

static std::string flag_param(const std::optional<bool>& f) {
    if (!f.has_value()) return std::string();
    return *f ? "true" : "false";
}

std::optional<Booking> booking_from_row(const db::DbResult& r, size_t row) {
    if (row >= r.rows.size()) return std::nullopt;
    const auto& cells = r.rows[row];
    auto cell = [&](const char* name) -> std::optional<std::string> {
        int idx = r.column_index(name);
        if (idx < 0 || size_t(idx) >= cells.size()) return std::nullopt;
        return cells[size_t(idx)];
    };
    auto text = [&](const char* name) { return cell(name).value_or(std::string()); };

    auto id = json_parse_int_strict(cell("id"));
    if (!id.has_value()) return std::nullopt;

    Booking b;
    b.id = *id;
    b.nome = text("nome");
    b.cognome = text("cognome");
    b.telefono = text("telefono");
    b.email = text("email");
    b.data = cell("data");
    b.ora = cell("ora");
    b.legacy_data_ora = cell("data_ora");
    b.note = text("note");
    b.status = cell("status").value_or(kStatusBooked);
    b.token = text("token");
    b.created_at = text("created_at");
    b.canceled_at = cell("canceled_at");
    b.attended = pg_bool(cell("attended"));
    b.paid = pg_bool(cell("paid"));
    b.thanked_at = cell("thanked_at");
    return b;
}

static std::vector<Booking> bookings_from_result(const db::DbResult& r) {
    std::vector<Booking> out;
    out.reserve(r.rows.size());
    for (size_t i = 0; i < r.rows.size(); ++i) {
        auto b = booking_from_row(r, i);
        if (b) out.push_back(std::move(*b));
    }
    return out;
}

// Transport errors and non-ok results both surface as storage_failure.
static bool failed(const char* op, const boost::system::error_code& ec, const db::DbResult& r) {
    if (ec) {
        observability::log_error("booking.repo.db_error", {{"op", std::string(op)}, {"err", ec.message()}});
        return true;
    }
    if (!r.ok) {
        observability::log_error("booking.repo.query_failed", {{"op", std::string(op)}, {"sqlstate", r.sqlstate}, {"msg", r.message}});
        return true;
    }
    return false;
}

PgBookingRepository::PgBookingRepository(std::shared_ptr<db::DbPool> db) : db_(std::move(db)) {}

void PgBookingRepository::async_migrate(DoneCb cb) {
    const auto& steps = migration_script();
    std::vector<size_t> tolerated = {steps.size() - 2, steps.size() - 1};
    db_->async_exec_script(steps, std::move(tolerated), [cb](const boost::system::error_code& ec, db::DbResult r) {
        if (failed("migrate", ec, r)) { cb(errc::storage_failure); return; }
        observability::log_info("booking.repo.migrated");
        cb({});
    });
}

void PgBookingRepository::async_insert(NewBooking nb, BookingCb cb) {
    static const std::string sql =
        "INSERT INTO bookings (nome, cognome, telefono, email, data, ora, note, status, token, created_at) "
        "SELECT $1, $2, $3, $4, $5, $6, $7, 'booked', $8, $9 "
        "WHERE NOT EXISTS (SELECT 1 FROM bookings WHERE data = $5 AND ora = $6 AND status = 'booked') "
        "RETURNING " + std::string(kColumns);
    std::vector<std::string> params = {nb.nome, nb.cognome, nb.telefono, nb.email, nb.data, nb.ora, nb.note, nb.token, nb.created_at};
    static const std::string by_token = sql_select("WHERE token = $1");
    auto db = db_;
    std::string token = nb.token;
    db_->async_exec_params(sql, std::move(params), [db, token, cb](const boost::system::error_code& ec, db::DbResult r) {
        if (!ec && !r.ok && r.sqlstate == db::kUniqueViolation && r.message.find("token") == std::string::npos) {
            cb(errc::slot_taken, Booking{});
            return;
        }
        if (failed("insert", ec, r)) { cb(errc::storage_failure, Booking{}); return; }
        if (auto b = booking_from_row(r, 0)) { cb({}, std::move(*b)); return; }
        // The pool re-runs a statement after a dropped connection, so an
        // earlier attempt may have committed this very row.
        db->async_exec_params(by_token, {token}, [cb](const boost::system::error_code& ec2, db::DbResult r2) {
            if (failed("insert.lookup", ec2, r2)) { cb(errc::storage_failure, Booking{}); return; }
            auto b = booking_from_row(r2, 0);
            if (!b) { cb(errc::slot_taken, Booking{}); return; }
            observability::log_warn("booking.repo.insert_replayed", {{"id", b->id}});
            cb({}, std::move(*b));
        });
    });
}

void PgBookingRepository::async_find_by_id(int64_t id, BookingCb cb) {
    static const std::string sql = sql_select("WHERE id = $1::bigint");
    db_->async_exec_params(sql, {std::to_string(id)}, [cb](const boost::system::error_code& ec, db::DbResult r) {
        if (failed("find_by_id", ec, r)) { cb(errc::storage_failure, Booking{}); return; }
        auto b = booking_from_row(r, 0);
        if (!b) { cb(errc::not_found, Booking{}); return; }
        cb({}, std::move(*b));
    });
}

void PgBookingRepository::cancel_where(const std::string& key_sql, std::string key, std::string now_iso, CancelCb cb) {
    std::string update_sql =
        "UPDATE bookings SET status = 'canceled', canceled_at = $2 WHERE " + key_sql +
        " AND status IS DISTINCT FROM 'canceled' RETURNING " + kColumns;
    std::string select_sql = sql_select("WHERE " + key_sql);
    auto db = db_;
    db_->async_exec_params(update_sql, {key, std::move(now_iso)},
        [db, cb, key, select_sql](const boost::system::error_code& ec, db::DbResult r) {
            if (failed("cancel", ec, r)) { cb(errc::storage_failure, Booking{}, false); return; }
            if (auto b = booking_from_row(r, 0)) { cb({}, std::move(*b), false); return; }
            db->async_exec_params(select_sql, {key}, [cb](const boost::system::error_code& ec2, db::DbResult r2) {
                if (failed("cancel.lookup", ec2, r2)) { cb(errc::storage_failure, Booking{}, false); return; }
                auto b = booking_from_row(r2, 0);
                if (!b) { cb(errc::not_found, Booking{}, false); return; }
                cb({}, std::move(*b), true);
            });
        });
}

void PgBookingRepository::async_cancel_by_token(std::string token, std::string now_iso, CancelCb cb) {
    cancel_where("token = $1", std::move(token), std::move(now_iso), std::move(cb));
}

void PgBookingRepository::async_cancel_by_id(int64_t id, std::string now_iso, CancelCb cb) {
    cancel_where("id = $1::bigint", std::to_string(id), std::move(now_iso), std::move(cb));
}

void PgBookingRepository::async_delete(int64_t id, DoneCb cb) {
    db_->async_exec_params("DELETE FROM bookings WHERE id = $1::bigint", {std::to_string(id)},
        [cb](const boost::system::error_code& ec, db::DbResult r) {
            if (failed("delete", ec, r)) { cb(errc::storage_failure); return; }
            if (r.affected_rows == 0) { cb(errc::not_found); return; }
            cb({});
        });
}

void PgBookingRepository::async_update_flags(int64_t id, std::optional<bool> attended, std::optional<bool> paid, BookingCb cb) {
    static const std::string sql =
        "UPDATE bookings SET "
        "attended = COALESCE(NULLIF($2, '')::boolean, attended), "
        "paid = COALESCE(NULLIF($3, '')::boolean, paid) "
        "WHERE id = $1::bigint RETURNING " + std::string(kColumns);
    db_->async_exec_params(sql, {std::to_string(id), flag_param(attended), flag_param(paid)},
        [cb](const boost::system::error_code& ec, db::DbResult r) {
            if (failed("update_flags", ec, r)) { cb(errc::storage_failure, Booking{}); return; }
            auto b = booking_from_row(r, 0);
            if (!b) { cb(errc::not_found, Booking{}); return; }
            cb({}, std::move(*b));
        });
}

void PgBookingRepository::async_mark_thanked(int64_t id, std::string now_iso, BookingCb cb) {
    static const std::string sql =
        "UPDATE bookings SET thanked_at = $2 WHERE id = $1::bigint AND thanked_at IS NULL RETURNING " + std::string(kColumns);
    db_->async_exec_params(sql, {std::to_string(id), std::move(now_iso)},
        [this, id, cb](const boost::system::error_code& ec, db::DbResult r) {
            if (failed("mark_thanked", ec, r)) { cb(errc::storage_failure, Booking{}); return; }
            if (auto b = booking_from_row(r, 0)) { cb({}, std::move(*b)); return; }
            async_find_by_id(id, cb);
        });
}

void PgBookingRepository::async_list(ListCb cb) {
    static const std::string sql = sql_select("ORDER BY data ASC NULLS LAST, ora ASC NULLS LAST, created_at ASC");
    db_->async_exec(sql, [cb](const boost::system::error_code& ec, db::DbResult r) {
        if (failed("list", ec, r)) { cb(errc::storage_failure, {}); return; }
        cb({}, bookings_from_result(r));
    });
}

void PgBookingRepository::async_booked_slots(std::string from_date, std::string to_date, SlotsCb cb) {
    static const std::string sql =
        "SELECT data, ora FROM bookings WHERE status = 'booked' "
        "AND data IS NOT NULL AND ora IS NOT NULL AND data >= $1 AND data <= $2";
    db_->async_exec_params(sql, {std::move(from_date), std::move(to_date)},
        [cb](const boost::system::error_code& ec, db::DbResult r) {
            if (failed("booked_slots", ec, r)) { cb(errc::storage_failure, {}); return; }
            std::vector<BookedSlot> out;
            out.reserve(r.rows.size());
            for (const auto& row : r.rows) {
                if (row.size() < 2 || !row[0] || !row[1]) continue;
                out.push_back(BookedSlot{*row[0], *row[1]});
            }
            cb({}, std::move(out));
        });
}

void PgBookingRepository::async_ping(DoneCb cb) {
    db_->async_scalar_int("SELECT 1", [cb](const boost::system::error_code& ec, int v) {
        if (ec || v != 1) { cb(errc::storage_failure); return; }
        cb({});
    });
}

}
