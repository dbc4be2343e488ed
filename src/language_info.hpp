#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>
#include <robin_hood.h>

namespace datelang {

struct SimplificationRule {
    std::string pattern;
    std::string replacement;  // may reference groups as \N or \g<N>
};

// Immutable per-language configuration record.
struct LanguageInfo {
    std::string name;
    std::vector<std::string> skip;
    std::vector<std::string> pertain;
    // Surface forms keyed by canonical token ("monday", "year", "in", ...)
    robin_hood::unordered_flat_map<std::string, std::vector<std::string>> words;
    std::vector<SimplificationRule> simplifications;
    int sentence_splitter_group = 1;
    bool no_word_spacing = false;

    // Names for a canonical token, or nullptr when the language has none.
    const std::vector<std::string>* names(std::string_view token) const {
        auto it = words.find(std::string(token));
        return it != words.end() ? &it->second : nullptr;
    }
};

// Throws ConfigurationError when the JSON has the wrong shape.
LanguageInfo language_info_from_json(const nlohmann::json& j);

// Reads and parses a language file. Throws ConfigurationError.
LanguageInfo load_language_info(const std::string& path);

} // namespace datelang
