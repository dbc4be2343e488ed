#pragma once

#include <string>
#include <vector>

#include "dictionary.hpp"

namespace datelang {

// Replaces every token found in the dictionary by its translation (an
// empty translation deletes it on join). Unknown tokens pass through.
void translate_tokens(std::vector<std::string>& tokens, const Dictionary& dictionary);

// Drops a leftover "in" unless a time unit (day, week, ...) is present,
// so "in 3 days" keeps it and a translated preposition does not.
void clear_future_words(std::vector<std::string>& tokens);

// Removes empty tokens in place.
void drop_empty(std::vector<std::string>& tokens);

} // namespace datelang
