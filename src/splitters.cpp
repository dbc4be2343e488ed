#include "splitters.hpp"
#include "constants.hpp"
#include "text_utils.hpp"

namespace datelang {

namespace {

// [\W\d_]+ : nothing but punctuation, digits or underscores
bool has_no_letters(const std::u32string& cps) {
    for (char32_t c : cps) {
        if (is_word_char(c) && !is_digit(c) && c != '_') return false;
    }
    return true;
}

bool is_all_non_word(const std::u32string& cps) {
    if (cps.empty()) return false;
    for (char32_t c : cps) {
        if (is_word_char(c)) return false;
    }
    return true;
}

} // namespace

WordChars build_wordchars(const Dictionary& dictionary) {
    WordChars chars;
    for (const auto& [word, _] : dictionary.entries()) {
        std::u32string cps = to_u32(word);
        if (cps.empty() || has_no_letters(cps)) continue;
        for (char32_t c : to_u32(to_lower(word))) {
            chars.insert(c);
        }
    }
    chars.erase(U' ');
    for (char32_t d = U'0'; d <= U'9'; ++d) {
        chars.insert(d);
    }
    return chars;
}

Splitters build_splitters(const LanguageInfo& info, const WordChars& wordchars) {
    Splitters splitters;
    for (auto token : ALWAYS_KEEP_TOKENS) {
        splitters.capturing.insert(std::string(token));
    }

    robin_hood::unordered_flat_set<std::string> candidates(splitters.capturing.begin(),
                                                           splitters.capturing.end());
    for (const auto& token : info.skip) {
        candidates.insert(token);
    }

    for (const auto& token : candidates) {
        std::u32string cps = to_u32(token);
        if (!is_all_non_word(cps)) continue;
        // Only a single character can be a member of the word-character set
        if (cps.size() == 1 && wordchars.count(cps[0])) {
            splitters.wordchars.insert(token);
        }
    }
    return splitters;
}

} // namespace datelang
