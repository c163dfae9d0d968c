#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace booking {

// Proleptic Gregorian calendar day, no time zone attached.
struct CivilDate {
    int year = 1970;
    int month = 1;
    int day = 1;

    bool operator==(const CivilDate& o) const noexcept { return year == o.year && month == o.month && day == o.day; }
    bool operator!=(const CivilDate& o) const noexcept { return !(*this == o); }
};

// Days since 1970-01-01.
int64_t days_from_civil(const CivilDate& d);
CivilDate civil_from_days(int64_t days);
CivilDate add_days(const CivilDate& d, int64_t n);

// Monday = 0 .. Sunday = 6
int weekday(const CivilDate& d);

// Strict YYYY-MM-DD, rejects impossible days such as 2025-02-30.
std::optional<CivilDate> parse_iso_date(std::string_view s);
std::string format_iso_date(const CivilDate& d);

// "lun 03 mar"
std::string italian_label(const CivilDate& d);

CivilDate utc_date(std::chrono::system_clock::time_point tp);
// "2025-03-10T08:15:00Z"
std::string format_iso_utc(std::chrono::system_clock::time_point tp);

}
