#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <robin_hood.h>

namespace datelang {

// Concatenates tokens with `separator`, except next to a capturing token,
// which attaches directly to its neighbour.
std::string join_tokens(const std::vector<std::string>& tokens, std::string_view separator,
                        const robin_hood::unordered_flat_set<std::string>& capturing);

// Plain join, separator between every pair.
std::string join_plain(const std::vector<std::string>& tokens, std::string_view separator);

} // namespace datelang
