#include "CivilDate.h"
#include <cctype>
#include <cstdio>
#include <ctime>

namespace booking {

static bool is_leap(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

static int days_in_month(int y, int m) {
    static const int dm[12] = {31,28,31,30,31,30,31,31,30,31,30,31};
    if (m == 2 && is_leap(y)) return 29;
    return dm[m - 1];
}

// Hinnant's days_from_civil / civil_from_days, era based so negative years work.
int64_t days_from_civil(const CivilDate& d) {
    int64_t y = d.year;
    const int m = d.month;
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d.day - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

CivilDate civil_from_days(int64_t z) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const int64_t doe = z - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t y = yoe + era * 400;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    const int64_t d = doy - (153 * mp + 2) / 5 + 1;
    const int64_t m = mp < 10 ? mp + 3 : mp - 9;
    return CivilDate{static_cast<int>(y + (m <= 2)), static_cast<int>(m), static_cast<int>(d)};
}

CivilDate add_days(const CivilDate& d, int64_t n) {
    return civil_from_days(days_from_civil(d) + n);
}

int weekday(const CivilDate& d) {
    // 1970-01-01 was a Thursday
    int64_t w = (days_from_civil(d) + 3) % 7;
    if (w < 0) w += 7;
    return static_cast<int>(w);
}

std::optional<CivilDate> parse_iso_date(std::string_view s) {
    if (s.size() != 10 || s[4] != '-' || s[7] != '-') return std::nullopt;
    for (size_t i : {0u, 1u, 2u, 3u, 5u, 6u, 8u, 9u}) {
        if (!isdigit(static_cast<unsigned char>(s[i]))) return std::nullopt;
    }
    CivilDate d;
    d.year = (s[0]-'0')*1000 + (s[1]-'0')*100 + (s[2]-'0')*10 + (s[3]-'0');
    d.month = (s[5]-'0')*10 + (s[6]-'0');
    d.day = (s[8]-'0')*10 + (s[9]-'0');
    if (d.year < 1 || d.month < 1 || d.month > 12) return std::nullopt;
    if (d.day < 1 || d.day > days_in_month(d.year, d.month)) return std::nullopt;
    return d;
}

std::string format_iso_date(const CivilDate& d) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", d.year, d.month, d.day);
    return std::string(buf);
}

std::string italian_label(const CivilDate& d) {
    static const char* weekdays[7] = {"lun", "mar", "mer", "gio", "ven", "sab", "dom"};
    static const char* months[12] = {"gen", "feb", "mar", "apr", "mag", "giu", "lug", "ago", "set", "ott", "nov", "dic"};
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%s %02d %s", weekdays[weekday(d)], d.day, months[d.month - 1]);
    return std::string(buf);
}

CivilDate utc_date(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    int64_t secs = duration_cast<seconds>(tp.time_since_epoch()).count();
    int64_t days = secs / 86400;
    if (secs % 86400 < 0) --days;
    return civil_from_days(days);
}

std::string format_iso_utc(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02dZ",
        tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
        tm.tm_hour, tm.tm_min, tm.tm_sec);
    return std::string(buf);
}

}
