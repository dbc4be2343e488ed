#include "dictionary.hpp"
#include "constants.hpp"
#include "text_utils.hpp"

#include <algorithm>

#include <unicode/uchar.h>

namespace datelang {

namespace {

inline char32_t fold(char32_t c) {
    return static_cast<char32_t>(u_tolower(static_cast<UChar32>(c)));
}

std::u32string fold_all(const std::u32string& cps) {
    std::u32string out(cps);
    for (auto& c : out) c = fold(c);
    return out;
}

} // namespace

Dictionary::Dictionary(const LanguageInfo& info, bool normalize)
    : trie_(new TrieNode()), normalized_(normalize), no_word_spacing_(info.no_word_spacing) {
    add_entries(info);
    if (normalize) {
        normalize_entries(info);
    }
    build_trie();
}

Dictionary::~Dictionary() {
    delete trie_;
}

void Dictionary::add_entries(const LanguageInfo& info) {
    // Later groups override earlier ones
    for (const auto& word : info.skip) {
        entries_[to_lower(word)] = "";
    }
    for (const auto& word : info.pertain) {
        entries_[to_lower(word)] = "";
    }
    for (auto token : KNOWN_WORD_TOKENS) {
        const auto* names = info.names(token);
        if (!names) continue;
        for (const auto& name : *names) {
            entries_[to_lower(name)] = std::string(token);
        }
    }
    for (auto token : ALWAYS_KEEP_TOKENS) {
        entries_[std::string(token)] = std::string(token);
    }
    for (auto token : PARSER_KNOWN_TOKENS) {
        entries_[to_lower(token)] = std::string(token);
    }
}

void Dictionary::normalize_entries(const LanguageInfo& info) {
    robin_hood::unordered_flat_set<std::string> inert;
    for (const auto& word : info.skip) inert.insert(to_lower(word));
    for (const auto& word : info.pertain) inert.insert(to_lower(word));

    // Visit keys in a stable order so collisions resolve the same way on
    // every build.
    std::vector<std::string> keys;
    keys.reserve(entries_.size());
    for (const auto& [key, _] : entries_) keys.push_back(key);
    std::sort(keys.begin(), keys.end());

    robin_hood::unordered_flat_map<std::string, std::string> normalized;
    std::vector<std::string> conflicting;
    for (const auto& key : keys) {
        std::string norm = normalize_unicode(key);
        if (norm != key && entries_.count(norm)) {
            conflicting.push_back(key);
        } else {
            normalized[norm] = entries_[key];
        }
    }

    // A colliding skip/pertain word still deletes its normalized form
    for (const auto& key : conflicting) {
        if (inert.count(key)) {
            normalized[normalize_unicode(key)] = entries_[key];
        }
    }

    entries_ = std::move(normalized);
}

void Dictionary::build_trie() {
    for (const auto& [word, _] : entries_) {
        insert_into_trie(word);
    }
}

void Dictionary::insert_into_trie(const std::string& word) {
    std::u32string cps = to_u32(word);
    if (cps.empty()) return;
    TrieNode* node = trie_;
    for (char32_t cp : cps) {
        node = node->get_or_create_child(fold(cp));
    }
    node->is_word = true;
}

bool Dictionary::contains(std::string_view word) const {
    return entries_.count(to_lower(word)) > 0;
}

std::optional<std::string> Dictionary::lookup(std::string_view word) const {
    auto it = entries_.find(to_lower(word));
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

size_t Dictionary::match_at(const std::u32string& lowered, size_t begin, size_t pos, size_t end) const {
    if (!no_word_spacing_ && pos > begin && !is_boundary_char(lowered[pos - 1])) {
        return pos;
    }

    size_t best = pos;
    TrieNode* node = trie_;
    for (size_t i = pos; i < end; ++i) {
        node = node->get_child(lowered[i]);
        if (!node) break;
        if (!node->is_word) continue;
        size_t stop = i + 1;
        if (no_word_spacing_ || stop == end || is_boundary_char(lowered[stop])) {
            best = stop;
        }
    }
    return best;
}

std::vector<std::string> Dictionary::split(std::string_view text, bool keep_formatting) const {
    std::vector<std::string> tokens;
    if (text.empty()) return tokens;

    std::u32string cps = to_u32(text);
    std::u32string lowered = fold_all(cps);
    size_t n = cps.size();

    size_t begin = 0;
    while (begin < n) {
        size_t known_start = n;
        size_t known_end = n;
        for (size_t p = begin; p < n; ++p) {
            size_t stop = match_at(lowered, begin, p, n);
            if (stop > p) {
                known_start = p;
                known_end = stop;
                break;
            }
        }

        if (known_start == n) {
            if (should_capture(cps, begin, n, keep_formatting)) {
                split_by_numerals(cps, begin, n, keep_formatting, tokens);
            }
            break;
        }

        if (known_start > begin && should_capture(cps, begin, known_start, keep_formatting)) {
            split_by_numerals(cps, begin, known_start, keep_formatting, tokens);
        }
        if (should_capture(cps, known_start, known_end, keep_formatting)) {
            tokens.push_back(to_utf8(cps.data(), known_start, known_end));
        }
        begin = known_end;
    }

    return tokens;
}

void Dictionary::split_by_numerals(const std::u32string& cps, size_t start, size_t end,
                                   bool keep_formatting, std::vector<std::string>& out) const {
    size_t i = start;
    while (i < end) {
        bool digit_run = is_digit(cps[i]);
        size_t j = i + 1;
        while (j < end && is_digit(cps[j]) == digit_run) ++j;
        if (should_capture(cps, i, j, keep_formatting)) {
            out.push_back(to_utf8(cps.data(), i, j));
        }
        i = j;
    }
}

bool Dictionary::should_capture(const std::u32string& cps, size_t start, size_t end, bool keep_formatting) const {
    if (start >= end) return false;
    if (keep_formatting) return true;
    if (contains_token(ALWAYS_KEEP_TOKENS, to_utf8(cps.data(), start, end))) return true;
    for (size_t i = start; i < end; ++i) {
        if (is_alnum_char(cps[i])) return true;
    }
    return false;
}

} // namespace datelang
