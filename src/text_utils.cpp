#include "text_utils.hpp"
#include "constants.hpp"
#include <stdexcept>

#include <unicode/locid.h>
#include <unicode/normalizer2.h>
#include <unicode/unistr.h>

namespace datelang {

std::string to_lower(std::string_view text) {
    // ASCII fast path
    bool ascii = true;
    for (unsigned char c : text) {
        if (c >= 0x80) { ascii = false; break; }
    }
    if (ascii) {
        std::string out(text);
        for (auto& c : out) {
            if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
        }
        return out;
    }

    icu::UnicodeString ustr = icu::UnicodeString::fromUTF8(
        icu::StringPiece(text.data(), static_cast<int32_t>(text.size())));
    ustr.toLower(icu::Locale::getRoot());
    std::string out;
    ustr.toUTF8String(out);
    return out;
}

std::string normalize_unicode(std::string_view text) {
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* nfkd = icu::Normalizer2::getNFKDInstance(status);
    if (U_FAILURE(status)) {
        throw std::runtime_error(std::string("NFKD normalizer unavailable: ") + u_errorName(status));
    }

    icu::UnicodeString ustr = icu::UnicodeString::fromUTF8(
        icu::StringPiece(text.data(), static_cast<int32_t>(text.size())));
    icu::UnicodeString decomposed = nfkd->normalize(ustr, status);
    if (U_FAILURE(status)) {
        throw std::runtime_error(std::string("NFKD normalization failed: ") + u_errorName(status));
    }

    icu::UnicodeString stripped;
    for (int32_t i = 0; i < decomposed.length();) {
        UChar32 c = decomposed.char32At(i);
        if (u_charType(c) != U_NON_SPACING_MARK) {
            stripped.append(c);
        }
        i += U16_LENGTH(c);
    }

    std::string out;
    stripped.toUTF8String(out);
    return out;
}

bool is_all_digits(std::string_view text) {
    if (text.empty()) return false;
    size_t i = 0;
    while (i < text.length()) {
        auto [c, len] = get_char_at(text, i);
        if (len == 0 || !is_digit(c)) return false;
        i += len;
    }
    return true;
}

bool contains_digit(std::string_view text) {
    size_t i = 0;
    while (i < text.length()) {
        auto [c, len] = get_char_at(text, i);
        if (len == 0) { i++; continue; }
        if (is_digit(c)) return true;
        i += len;
    }
    return false;
}

std::vector<std::string> split_whitespace(std::string_view text) {
    std::vector<std::string> words;
    std::string current;
    size_t i = 0;
    while (i < text.length()) {
        auto [c, len] = get_char_at(text, i);
        if (len == 0) { i++; continue; }
        if (is_space(c)) {
            if (!current.empty()) {
                words.push_back(std::move(current));
                current.clear();
            }
        } else {
            current.append(text.substr(i, len));
        }
        i += len;
    }
    if (!current.empty()) {
        words.push_back(std::move(current));
    }
    return words;
}

std::string_view strip_chars(std::string_view text, std::string_view chars) {
    size_t start = text.find_first_not_of(chars);
    if (start == std::string_view::npos) return {};
    size_t end = text.find_last_not_of(chars);
    return text.substr(start, end - start + 1);
}

std::string trim(std::string_view text) {
    std::u32string cps = to_u32(text);
    size_t start = 0;
    size_t end = cps.size();
    while (start < end && is_space(cps[start])) start++;
    while (end > start && is_space(cps[end - 1])) end--;
    return to_utf8(cps.data(), start, end);
}

} // namespace datelang
