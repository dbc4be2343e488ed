#include "tokenizer.hpp"
#include "constants.hpp"

namespace datelang {

std::vector<std::string> split_digit_runs(std::string_view text) {
    std::vector<std::string> fragments;
    std::string current;
    bool current_is_digit = false;

    size_t i = 0;
    while (i < text.length()) {
        auto [c, len] = get_char_at(text, i);
        if (len == 0) { i++; continue; }
        bool digit = is_digit(c);
        if (!current.empty() && digit != current_is_digit) {
            fragments.push_back(std::move(current));
            current.clear();
        }
        current_is_digit = digit;
        current.append(text.substr(i, len));
        i += len;
    }
    if (!current.empty()) {
        fragments.push_back(std::move(current));
    }
    return fragments;
}

Tokenizer::Tokenizer(const Dictionary& dict)
    : dictionary(dict)
{
}

std::vector<std::string> Tokenizer::split(std::string_view text, bool keep_formatting) const {
    std::vector<std::string> tokens;
    for (const auto& fragment : split_digit_runs(text)) {
        auto pieces = dictionary.split(fragment, keep_formatting);
        for (auto& piece : pieces) {
            if (!piece.empty()) tokens.push_back(std::move(piece));
        }
    }
    return tokens;
}

} // namespace datelang
