#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace booking {

// Daily bookable times, in display order. 12:00-14:00 is the lunch gap.
const std::vector<std::string>& time_slots();

bool is_valid_slot(std::string_view slot);

}
