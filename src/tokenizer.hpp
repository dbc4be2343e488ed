#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "dictionary.hpp"

namespace datelang {

// Splits `text` into runs of digits and the fragments between them.
// Empty fragments are dropped.
std::vector<std::string> split_digit_runs(std::string_view text);

class Tokenizer {
public:
    const Dictionary& dictionary;

    explicit Tokenizer(const Dictionary& dict);

    // Digit runs first, then every fragment through the dictionary's
    // phrase split. Tokens keep their left-to-right order.
    std::vector<std::string> split(std::string_view text, bool keep_formatting) const;
};

} // namespace datelang
