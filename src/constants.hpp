#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include <unicode/uchar.h>

namespace datelang {

// Tokens that are never filtered out by the dictionary split and never get
// a separator inserted around them when rejoined.
inline constexpr std::array<std::string_view, 6> ALWAYS_KEEP_TOKENS = {
    "+", ":", ".", " ", "-", "/"
};

// Tokens the grammar engine understands natively (lowercase key -> token).
inline constexpr std::array<std::string_view, 5> PARSER_KNOWN_TOKENS = {
    "am", "pm", "UTC", "GMT", "Z"
};

// Canonical tokens whose surface forms come from the language info.
inline constexpr std::array<std::string_view, 30> KNOWN_WORD_TOKENS = {
    "monday", "tuesday", "wednesday", "thursday", "friday", "saturday", "sunday",
    "january", "february", "march", "april", "may", "june", "july",
    "august", "september", "october", "november", "december",
    "year", "month", "week", "day", "hour", "minute", "second",
    "ago", "in", "am", "pm"
};

inline constexpr std::array<std::string_view, 7> WEEKDAY_TOKENS = {
    "monday", "tuesday", "wednesday", "thursday", "friday", "saturday", "sunday"
};

inline constexpr std::array<std::string_view, 12> MONTH_TOKENS = {
    "january", "february", "march", "april", "may", "june", "july",
    "august", "september", "october", "november", "december"
};

inline constexpr std::array<std::string_view, 3> HMS_TOKENS = {
    "hour", "minute", "second"
};

// Time units that make a leading "in" meaningful ("in 3 days").
inline constexpr std::array<std::string_view, 7> FRESHNESS_WORDS = {
    "day", "week", "month", "year", "hour", "minute", "second"
};

// Never treated as dictionary hits while scanning free text.
inline constexpr std::array<std::string_view, 4> SEARCH_DASHES = {
    "-", "\xE2\x80\x94\xE2\x80\x94", "\xE2\x80\x94", "\xEF\xBD\x9E"  // -, ——, —, ～
};

// Stripped from both ends of a word before the dictionary lookup in search.
inline constexpr std::string_view SEARCH_STRIP_CHARS = "()\"{}[],.";

template <size_t N>
inline bool contains_token(const std::array<std::string_view, N>& tokens, std::string_view token) {
    for (auto t : tokens) {
        if (t == token) return true;
    }
    return false;
}

// --- Character classes (match ICU regex \w, \d, \s) ---

inline bool is_digit(char32_t c) {
    return u_isdigit(static_cast<UChar32>(c));
}

inline bool is_word_char(char32_t c) {
    UChar32 cp = static_cast<UChar32>(c);
    if (u_hasBinaryProperty(cp, UCHAR_ALPHABETIC)) return true;
    int32_t mask = U_GET_GC_MASK(cp);
    if (mask & (U_GC_M_MASK | U_GC_ND_MASK | U_GC_PC_MASK)) return true;
    return c == 0x200C || c == 0x200D;
}

// Split boundary for whitespace-delimited scripts: \W, '_' or \d.
inline bool is_boundary_char(char32_t c) {
    return !is_word_char(c) || c == '_' || is_digit(c);
}

// [^\W_]: a letter or digit in the regex sense.
inline bool is_alnum_char(char32_t c) {
    return is_word_char(c) && c != '_';
}

inline bool is_space(char32_t c) {
    return u_isUWhiteSpace(static_cast<UChar32>(c));
}

// UTF-8 Helper: Get code point and length from string at index
inline std::pair<char32_t, int> get_char_at(std::string_view text, size_t index) {
    if (index >= text.length()) return {0, 0};

    unsigned char c = static_cast<unsigned char>(text[index]);
    if (c < 0x80) return {c, 1};

    int len = 0;
    char32_t cp = 0;
    if ((c & 0xE0) == 0xC0) {
        len = 2;
        cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
        len = 3;
        cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
        len = 4;
        cp = c & 0x07;
    } else {
        return {0, 0};
    }

    if (index + len > text.length()) return {0, 0};
    for (int k = 1; k < len; ++k) {
        cp = (cp << 6) | (static_cast<unsigned char>(text[index + k]) & 0x3F);
    }
    return {cp, len};
}

// Helper: UTF-8 to UTF-32
inline std::u32string to_u32(std::string_view utf8) {
    std::u32string utf32;
    utf32.reserve(utf8.size());
    size_t i = 0;
    while (i < utf8.length()) {
        auto [c, len] = get_char_at(utf8, i);
        if (len == 0) { i++; continue; } // Skip invalid
        utf32.push_back(c);
        i += len;
    }
    return utf32;
}

inline void append_utf8(std::string& out, char32_t c) {
    if (c <= 0x7F) {
        out.push_back(static_cast<char>(c));
    } else if (c <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | ((c >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    } else if (c <= 0xFFFF) {
        out.push_back(static_cast<char>(0xE0 | ((c >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    } else if (c <= 0x10FFFF) {
        out.push_back(static_cast<char>(0xF0 | ((c >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((c >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    }
}

// Helper: UTF-32 range to UTF-8
inline std::string to_utf8(const char32_t* cps, size_t start, size_t end) {
    std::string utf8;
    utf8.reserve((end - start) * 2);
    for (size_t i = start; i < end; ++i) {
        append_utf8(utf8, cps[i]);
    }
    return utf8;
}

inline std::string to_utf8(const std::u32string& utf32) {
    return to_utf8(utf32.data(), 0, utf32.size());
}

} // namespace datelang
