#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace booking {

inline constexpr const char* kStatusBooked = "booked";
inline constexpr const char* kStatusCanceled = "canceled";

struct Booking {
    int64_t id = 0;
    std::string nome;
    std::string cognome;
    std::string telefono;
    std::string email;
    std::optional<std::string> data;
    std::optional<std::string> ora;
    // combined string stored by old rows only; see display_slot()
    std::optional<std::string> legacy_data_ora;
    std::string note;
    std::string status = kStatusBooked;
    std::string token;
    std::string created_at;
    std::optional<std::string> canceled_at;
    bool attended = false;
    bool paid = false;
    std::optional<std::string> thanked_at;

    bool is_canceled() const { return status == kStatusCanceled; }
    // "2025-03-10 09:00", falling back to the legacy column for incomplete rows
    std::string display_slot() const;
    std::string full_name() const { return nome + " " + cognome; }
};

// Admin API representation; the cancellation token is not included.
std::string booking_to_json(const Booking& b);
std::string bookings_to_json_array(const std::vector<Booking>& list);

}
