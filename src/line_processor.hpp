#pragma once

#include <cstdint>
#include <string>

#include "language.hpp"

namespace datelang {

enum class Mode { Translate, Search, Applicable };

bool parse_mode(const std::string& value, Mode& mode);

struct LineOptions {
    Mode mode = Mode::Translate;
    bool keep_formatting = false;
    bool strip_timezone = false;
};

// Builds the JSON record for one input line:
//   {"id":..,"input":..,"translation":..}        translate
//   {"id":..,"input":..,"translated":[..],"original":[..]}  search
//   {"id":..,"input":..,"applicable":true|false}  applicable
// A line that fails gets {"id":..,"input":..,"error":..} instead and the
// message is stored in `error`; `error` is cleared otherwise.
std::string process_line(const Language& language, const LineOptions& options, const Settings& settings,
                         int64_t id, const std::string& line, std::string& error);

} // namespace datelang
