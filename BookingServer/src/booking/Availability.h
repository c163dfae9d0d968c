#pragma once

#include <string>
#include <vector>
#include "CivilDate.h"

namespace booking {

inline constexpr int kBookingWindowDays = 60;

struct BookedSlot {
    std::string date;
    std::string time;
};

struct DayAvailability {
    std::string date;
    std::string label;
    std::vector<std::string> available;
};

struct Availability {
    std::vector<DayAvailability> dates;
    std::vector<std::string> time_slots;
    std::string min_date;
    std::string max_date;
};

// Last bookable day of a window that starts at `today`.
CivilDate window_end(const CivilDate& today, int days = kBookingWindowDays);

// Slot catalog minus `booked` for each of `days` days from `today`.
// Entries of `booked` outside the window are ignored.
Availability compute_availability(const CivilDate& today, const std::vector<BookedSlot>& booked, int days = kBookingWindowDays);

std::string availability_to_json(const Availability& a);

}
