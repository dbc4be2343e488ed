#pragma once

#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "dictionary.hpp"
#include "language_info.hpp"
#include "parser_info.hpp"
#include "pattern_cache.hpp"
#include "simplifier.hpp"
#include "splitters.hpp"

namespace datelang {

struct Settings {
    // Selects the Unicode-normalized dictionary and simplifications.
    // Input is expected to be normalized by the caller (normalize_unicode).
    bool normalize = true;
};

// Parallel lists: translated[i] is the canonical form of original[i]
struct SearchResult {
    std::vector<std::string> translated;
    std::vector<std::string> original;
};

// One language: its configuration plus everything derived from it. Derived
// state (dictionary, compiled patterns, splitter sets) is built on first use
// per normalization mode and then shared read-only, so one instance can
// serve many threads.
class Language {
public:
    Language(std::string shortname, LanguageInfo info);

    // Non-copyable: owns once-initialized caches
    Language(const Language&) = delete;
    Language& operator=(const Language&) = delete;

    const std::string& shortname() const { return shortname_; }
    const LanguageInfo& info() const { return info_; }

    bool validate_info(std::ostream& log = std::cerr) const;

    // True when every token of the simplified text is a number or a
    // dictionary word.
    bool is_applicable(std::string_view date_string, bool strip_timezone, const Settings& settings) const;

    // Canonical (English) form of a date string, e.g. "en 3 días" -> "in 3 day".
    std::string translate(std::string_view date_string, bool keep_formatting, const Settings& settings) const;

    // Maximal runs of recognized or numeric words in free text.
    SearchResult translate_search(std::string_view search_string, const Settings& settings) const;

    // Throws ConfigurationError if weekday/month/hms names are incomplete.
    ParserInfo to_parserinfo() const;

    std::string simplify(std::string_view date_string, const Settings& settings) const;
    std::vector<std::string> split(std::string_view date_string, bool keep_formatting, const Settings& settings) const;
    std::string join(const std::vector<std::string>& tokens, std::string_view separator, const Settings& settings) const;

    const Dictionary& dictionary(const Settings& settings) const;
    const WordChars& wordchars(const Settings& settings) const;
    const Splitters& splitters(const Settings& settings) const;

private:
    struct ModeCache {
        bool normalize;

        std::once_flag dictionary_once;
        std::unique_ptr<Dictionary> dictionary;

        std::once_flag simplifier_once;
        std::unique_ptr<Simplifier> simplifier;

        std::once_flag wordchars_once;
        WordChars wordchars;

        std::once_flag splitters_once;
        Splitters splitters;

        explicit ModeCache(bool normalized) : normalize(normalized) {}
    };

    std::string shortname_;
    LanguageInfo info_;
    mutable ModeCache raw_;
    mutable ModeCache normalized_;
    mutable PatternCache sentence_patterns_;

    ModeCache& cache(const Settings& settings) const;
    const Simplifier& simplifier(const Settings& settings) const;

    std::vector<std::string> sentence_split(std::string_view text) const;
    std::vector<std::string> word_split(std::string_view sentence, const Settings& settings) const;
    std::string join_chunk(const std::vector<std::string>& chunk, const Settings& settings) const;
    bool token_with_digits_is_ok(std::string_view token) const;
};

} // namespace datelang
