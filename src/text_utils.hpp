#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace datelang {

// Full Unicode lowercasing (root locale).
std::string to_lower(std::string_view text);

// NFKD followed by removal of nonspacing marks ("días" -> "dias").
std::string normalize_unicode(std::string_view text);

// True for a non-empty string made only of Unicode decimal digits.
bool is_all_digits(std::string_view text);

bool contains_digit(std::string_view text);

// Splits on runs of Unicode whitespace, dropping empty pieces.
std::vector<std::string> split_whitespace(std::string_view text);

// Removes any of `chars` (ASCII) from both ends.
std::string_view strip_chars(std::string_view text, std::string_view chars);

// Trims Unicode whitespace from both ends.
std::string trim(std::string_view text);

} // namespace datelang
