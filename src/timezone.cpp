#include "timezone.hpp"
#include "pattern_cache.hpp"
#include "text_utils.hpp"

#include <memory>

#include <unicode/unistr.h>

namespace datelang {

namespace {

struct Abbreviation {
    const char* name;
    int offset_seconds;
};

constexpr int HOUR = 3600;

const Abbreviation TIMEZONE_ABBREVIATIONS[] = {
    {"UTC", 0}, {"GMT", 0}, {"Z", 0},
    {"EST", -5 * HOUR}, {"EDT", -4 * HOUR},
    {"CST", -6 * HOUR}, {"CDT", -5 * HOUR},
    {"MST", -7 * HOUR}, {"MDT", -6 * HOUR},
    {"PST", -8 * HOUR}, {"PDT", -7 * HOUR},
    {"AKST", -9 * HOUR}, {"HST", -10 * HOUR},
    {"WET", 0}, {"WEST", HOUR},
    {"CET", HOUR}, {"CEST", 2 * HOUR},
    {"EET", 2 * HOUR}, {"EEST", 3 * HOUR},
    {"BST", HOUR}, {"MSK", 3 * HOUR},
    {"IST", 5 * HOUR + 30 * 60},
    {"SGT", 8 * HOUR}, {"HKT", 8 * HOUR},
    {"JST", 9 * HOUR}, {"KST", 9 * HOUR},
    {"AEST", 10 * HOUR}, {"AEDT", 11 * HOUR},
    {"NZST", 12 * HOUR}, {"NZDT", 13 * HOUR},
};

std::string abbreviation_alternatives() {
    std::string alt;
    for (const auto& abbr : TIMEZONE_ABBREVIATIONS) {
        if (!alt.empty()) alt += '|';
        alt += abbr.name;
    }
    return alt;
}

const icu::RegexPattern& trailing_timezone_pattern() {
    // group 1: abbreviation, 2-4: sign/hours/minutes after it,
    // 5-7: bare numeric offset. Offsets are ASCII digits only.
    static const std::unique_ptr<icu::RegexPattern> pattern = compile_pattern(
        "(?:^|\\s)(?:(" + abbreviation_alternatives() + ")" +
        "(?:\\s*([+-])([0-9]{1,2})(?::?([0-9]{2}))?)?" +
        "|([+-])([0-9]{2})(?::?([0-9]{2}))?)\\s*\\z",
        UREGEX_CASE_INSENSITIVE);
    return *pattern;
}

std::string to_upper_ascii(std::string text) {
    for (auto& c : text) {
        if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
    }
    return text;
}

int lookup_abbreviation(const std::string& name) {
    for (const auto& abbr : TIMEZONE_ABBREVIATIONS) {
        if (to_upper_ascii(name) == abbr.name) return abbr.offset_seconds;
    }
    return 0;
}

std::string group_text(const icu::RegexMatcher& matcher, int group) {
    UErrorCode status = U_ZERO_ERROR;
    std::string out;
    if (matcher.start(group, status) < 0 || U_FAILURE(status)) return out;
    matcher.group(group, status).toUTF8String(out);
    return out;
}

int numeric_offset(const std::string& sign, const std::string& hours, const std::string& minutes) {
    int seconds = std::stoi(hours) * HOUR;
    if (!minutes.empty()) seconds += std::stoi(minutes) * 60;
    return sign == "-" ? -seconds : seconds;
}

} // namespace

std::pair<std::string, std::optional<TimezoneOffset>> pop_tz_offset(std::string_view text) {
    icu::UnicodeString input = icu::UnicodeString::fromUTF8(
        icu::StringPiece(text.data(), static_cast<int32_t>(text.size())));

    UErrorCode status = U_ZERO_ERROR;
    std::unique_ptr<icu::RegexMatcher> matcher(trailing_timezone_pattern().matcher(input, status));
    if (U_FAILURE(status) || !matcher->find(status) || U_FAILURE(status)) {
        return {std::string(text), std::nullopt};
    }

    TimezoneOffset offset;
    std::string abbreviation = group_text(*matcher, 1);
    if (!abbreviation.empty()) {
        offset.offset_seconds = lookup_abbreviation(abbreviation);
        std::string hours = group_text(*matcher, 3);
        if (!hours.empty()) {
            offset.offset_seconds += numeric_offset(group_text(*matcher, 2), hours, group_text(*matcher, 4));
        }
    } else {
        offset.offset_seconds = numeric_offset(group_text(*matcher, 5), group_text(*matcher, 6),
                                               group_text(*matcher, 7));
    }

    int32_t start = matcher->start(status);
    std::string remaining;
    input.tempSubString(0, start).toUTF8String(remaining);

    std::string matched;
    input.tempSubString(start).toUTF8String(matched);
    offset.name = trim(matched);

    return {trim(remaining), offset};
}

} // namespace datelang
