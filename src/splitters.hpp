#pragma once

#include <string>

#include <robin_hood.h>

#include "dictionary.hpp"
#include "language_info.hpp"

namespace datelang {

using WordChars = robin_hood::unordered_flat_set<char32_t>;

struct Splitters {
    // Punctuation that splits only when not surrounded by word characters
    robin_hood::unordered_flat_set<std::string> wordchars;
    // Tokens kept by the tokenizer and glued to their neighbours on join
    robin_hood::unordered_flat_set<std::string> capturing;
};

// Every character used inside a dictionary word (lowercased), except
// space, plus the ASCII digits. Keys made only of non-letters are ignored.
WordChars build_wordchars(const Dictionary& dictionary);

Splitters build_splitters(const LanguageInfo& info, const WordChars& wordchars);

} // namespace datelang
