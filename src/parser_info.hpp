#pragma once

#include <string>
#include <vector>

#include "language_info.hpp"

namespace datelang {

// Name lists handed to the date grammar engine. Each slot of
// weekdays/months/hms holds every surface form of that name.
struct ParserInfo {
    std::string name;
    std::vector<std::string> jump;
    std::vector<std::string> pertain;
    std::vector<std::vector<std::string>> weekdays;  // monday .. sunday
    std::vector<std::vector<std::string>> months;    // january .. december
    std::vector<std::vector<std::string>> hms;       // hour, minute, second
};

// Throws ConfigurationError when a weekday, month or hour/minute/second
// slot is missing or empty.
ParserInfo make_parser_info(const LanguageInfo& info);

} // namespace datelang
