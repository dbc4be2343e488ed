#include "parser_info.hpp"
#include "constants.hpp"
#include "errors.hpp"

#include <array>
#include <string_view>

namespace datelang {

namespace {

template <size_t N>
std::vector<std::vector<std::string>> collect(const LanguageInfo& info,
                                              const std::array<std::string_view, N>& tokens) {
    std::vector<std::vector<std::string>> slots;
    slots.reserve(N);
    for (auto token : tokens) {
        const auto* names = info.names(token);
        if (!names || names->empty()) {
            throw ConfigurationError(info.name + ": no names for '" + std::string(token) + "'");
        }
        slots.push_back(*names);
    }
    return slots;
}

} // namespace

ParserInfo make_parser_info(const LanguageInfo& info) {
    ParserInfo parser_info;
    parser_info.name = info.name;
    parser_info.jump = info.skip;
    parser_info.pertain = info.pertain;
    parser_info.weekdays = collect(info, WEEKDAY_TOKENS);
    parser_info.months = collect(info, MONTH_TOKENS);
    parser_info.hms = collect(info, HMS_TOKENS);
    return parser_info;
}

} // namespace datelang
