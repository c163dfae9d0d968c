#include "SlotCatalog.h"
#include <algorithm>

namespace booking {

const std::vector<std::string>& time_slots() {
    static const std::vector<std::string> slots = {
        "09:00", "09:30", "10:00", "10:30", "11:00", "11:30",
        "14:00", "14:30", "15:00", "15:30", "16:00", "16:30", "17:00",
    };
    return slots;
}

bool is_valid_slot(std::string_view slot) {
    const auto& s = time_slots();
    return std::find(s.begin(), s.end(), slot) != s.end();
}

}
