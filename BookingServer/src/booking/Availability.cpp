#include "Availability.h"
#include <unordered_map>
#include <unordered_set>
#include "SlotCatalog.h"
#include "../net/MiniJson.h"

namespace booking {

CivilDate window_end(const CivilDate& today, int days) {
    return add_days(today, days > 0 ? days - 1 : 0);
}

Availability compute_availability(const CivilDate& today, const std::vector<BookedSlot>& booked, int days) {
    if (days < 1) days = 1;
    std::unordered_map<std::string, std::unordered_set<std::string>> by_date;
    for (const auto& b : booked) by_date[b.date].insert(b.time);

    Availability out;
    out.time_slots = time_slots();
    out.dates.reserve(days);
    const int64_t first = days_from_civil(today);
    for (int i = 0; i < days; ++i) {
        CivilDate d = civil_from_days(first + i);
        DayAvailability day;
        day.date = format_iso_date(d);
        day.label = italian_label(d);
        auto it = by_date.find(day.date);
        for (const auto& slot : out.time_slots) {
            if (it == by_date.end() || it->second.count(slot) == 0) day.available.push_back(slot);
        }
        out.dates.push_back(std::move(day));
    }
    out.min_date = out.dates.front().date;
    out.max_date = out.dates.back().date;
    return out;
}

static void append_string_array(std::string& out, const std::vector<std::string>& items) {
    out += "[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i) out += ",";
        out += "\"" + json_escape_resp(items[i]) + "\"";
    }
    out += "]";
}

std::string availability_to_json(const Availability& a) {
    std::string out;
    out.reserve(a.dates.size() * 160 + 256);
    out += "{\"dates\":[";
    for (size_t i = 0; i < a.dates.size(); ++i) {
        const auto& d = a.dates[i];
        if (i) out += ",";
        out += "{\"date\":\"" + json_escape_resp(d.date) + "\",\"label\":\"" + json_escape_resp(d.label) + "\",\"available\":";
        append_string_array(out, d.available);
        out += "}";
    }
    out += "],\"timeSlots\":";
    append_string_array(out, a.time_slots);
    out += ",\"minDate\":\"" + json_escape_resp(a.min_date) + "\",\"maxDate\":\"" + json_escape_resp(a.max_date) + "\"}";
    return out;
}

}
