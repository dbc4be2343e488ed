#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace datelang {

struct TimezoneOffset {
    std::string name;       // abbreviation or the numeric text, e.g. "CET", "+05:30"
    int offset_seconds = 0;
};

// Removes a trailing timezone ("12:00 CET", "10 am UTC+3", "09:15 -0500")
// and returns the trimmed remainder with the parsed offset, or the input
// unchanged and nullopt.
std::pair<std::string, std::optional<TimezoneOffset>> pop_tz_offset(std::string_view text);

} // namespace datelang
