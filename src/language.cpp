#include "language.hpp"
#include "constants.hpp"
#include "errors.hpp"
#include "joiner.hpp"
#include "sentence_splitter.hpp"
#include "text_utils.hpp"
#include "timezone.hpp"
#include "tokenizer.hpp"
#include "translator.hpp"
#include "validator.hpp"

namespace datelang {

Language::Language(std::string shortname, LanguageInfo info)
    : shortname_(std::move(shortname)),
      info_(std::move(info)),
      raw_(false),
      normalized_(true)
{
}

bool Language::validate_info(std::ostream& log) const {
    return LanguageValidator::validate_info(shortname_, info_, log);
}

// ============================================================================
// Single date path
// ============================================================================

bool Language::is_applicable(std::string_view date_string, bool strip_timezone, const Settings& settings) const {
    std::string text(date_string);
    if (strip_timezone) {
        text = pop_tz_offset(text).first;
    }

    text = simplify(text, settings);
    auto tokens = split(text, false, settings);

    bool digits_only = true;
    for (const auto& token : tokens) {
        if (!is_all_digits(token)) { digits_only = false; break; }
    }
    if (digits_only) return true;

    const auto& dict = dictionary(settings);
    for (const auto& token : tokens) {
        if (is_all_digits(token) || dict.contains(token)) continue;
        return false;
    }
    return true;
}

std::string Language::translate(std::string_view date_string, bool keep_formatting, const Settings& settings) const {
    std::string text = simplify(date_string, settings);
    auto words = split(text, keep_formatting, settings);

    translate_tokens(words, dictionary(settings));
    clear_future_words(words);
    drop_empty(words);

    return join(words, keep_formatting ? "" : " ", settings);
}

std::string Language::simplify(std::string_view date_string, const Settings& settings) const {
    return simplifier(settings).simplify(date_string);
}

std::vector<std::string> Language::split(std::string_view date_string, bool keep_formatting, const Settings& settings) const {
    Tokenizer tokenizer(dictionary(settings));
    return tokenizer.split(date_string, keep_formatting);
}

std::string Language::join(const std::vector<std::string>& tokens, std::string_view separator, const Settings& settings) const {
    return join_tokens(tokens, separator, splitters(settings).capturing);
}

// ============================================================================
// Free text search
// ============================================================================

SearchResult Language::translate_search(std::string_view search_string, const Settings& settings) const {
    const auto& dict = dictionary(settings);
    const auto& rules = simplifier(settings);

    std::vector<std::vector<std::string>> translated;
    std::vector<std::vector<std::string>> original;

    for (const auto& sentence : sentence_split(search_string)) {
        auto words = word_split(sentence, settings);
        std::vector<std::string> translated_chunk;
        std::vector<std::string> original_chunk;

        for (const auto& raw_word : words) {
            std::string word = rules.simplify(raw_word);
            std::string_view stripped = strip_chars(word, SEARCH_STRIP_CHARS);
            auto translation = dict.lookup(stripped);

            if (translation && !contains_token(SEARCH_DASHES, word)) {
                translated_chunk.push_back(std::move(*translation));
                original_chunk.push_back(raw_word);
            } else if (token_with_digits_is_ok(word)) {
                translated_chunk.push_back(word);
                original_chunk.push_back(raw_word);
            } else if (!translated_chunk.empty()) {
                translated.push_back(std::move(translated_chunk));
                original.push_back(std::move(original_chunk));
                translated_chunk.clear();
                original_chunk.clear();
            }
        }

        if (!translated_chunk.empty()) {
            translated.push_back(std::move(translated_chunk));
            original.push_back(std::move(original_chunk));
        }
    }

    SearchResult result;
    result.translated.reserve(translated.size());
    result.original.reserve(original.size());
    for (size_t i = 0; i < translated.size(); ++i) {
        clear_future_words(translated[i]);
        drop_empty(translated[i]);
        drop_empty(original[i]);
        result.translated.push_back(join_chunk(translated[i], settings));
        result.original.push_back(join_chunk(original[i], settings));
    }
    return result;
}

std::vector<std::string> Language::sentence_split(std::string_view text) const {
    const auto* group = find_sentence_splitter(info_.sentence_splitter_group);
    if (!group) {
        throw ConfigurationError(info_.name + ": unknown sentence_splitter_group " +
                                 std::to_string(info_.sentence_splitter_group));
    }
    return split_sentences(text, sentence_patterns_.get(group->pattern));
}

std::vector<std::string> Language::word_split(std::string_view sentence, const Settings& settings) const {
    if (info_.no_word_spacing) {
        return split(sentence, true, settings);
    }
    return split_whitespace(sentence);
}

std::string Language::join_chunk(const std::vector<std::string>& chunk, const Settings& settings) const {
    if (info_.no_word_spacing) {
        return join(chunk, "", settings);
    }
    return join_plain(chunk, " ");
}

bool Language::token_with_digits_is_ok(std::string_view token) const {
    if (contains_digit(token)) return true;
    if (!info_.no_word_spacing) return false;
    // Scripts without spaces also glue separators into numeric tokens
    return token.find_first_of(".:-/") != std::string_view::npos;
}

// ============================================================================
// Grammar engine bridge
// ============================================================================

ParserInfo Language::to_parserinfo() const {
    return make_parser_info(info_);
}

// ============================================================================
// Lazily built state
// ============================================================================

Language::ModeCache& Language::cache(const Settings& settings) const {
    return settings.normalize ? normalized_ : raw_;
}

const Dictionary& Language::dictionary(const Settings& settings) const {
    ModeCache& c = cache(settings);
    std::call_once(c.dictionary_once, [&]() {
        c.dictionary = std::make_unique<Dictionary>(info_, c.normalize);
    });
    return *c.dictionary;
}

const Simplifier& Language::simplifier(const Settings& settings) const {
    ModeCache& c = cache(settings);
    std::call_once(c.simplifier_once, [&]() {
        c.simplifier = std::make_unique<Simplifier>(info_, c.normalize);
    });
    return *c.simplifier;
}

const WordChars& Language::wordchars(const Settings& settings) const {
    ModeCache& c = cache(settings);
    std::call_once(c.wordchars_once, [&]() {
        c.wordchars = build_wordchars(dictionary(settings));
    });
    return c.wordchars;
}

const Splitters& Language::splitters(const Settings& settings) const {
    ModeCache& c = cache(settings);
    std::call_once(c.splitters_once, [&]() {
        c.splitters = build_splitters(info_, wordchars(settings));
    });
    return c.splitters;
}

} // namespace datelang
