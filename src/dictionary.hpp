#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <robin_hood.h>

#include "language_info.hpp"

namespace datelang {

// Trie over lowercase code points of the dictionary keys
struct TrieNode {
    robin_hood::unordered_flat_map<char32_t, TrieNode*> children;
    bool is_word = false;

    ~TrieNode() {
        for (auto& [_, child] : children) {
            delete child;
        }
    }

    inline TrieNode* get_child(char32_t cp) const {
        auto it = children.find(cp);
        return it != children.end() ? it->second : nullptr;
    }

    inline TrieNode* get_or_create_child(char32_t cp) {
        auto it = children.find(cp);
        if (it != children.end()) return it->second;
        TrieNode* node = new TrieNode();
        children[cp] = node;
        return node;
    }
};

// Maps lowercase words and phrases of one language to canonical tokens.
// An empty translation marks a word that is deleted on translation
// (skip and pertain words).
class Dictionary {
public:
    // normalize: build the Unicode-normalized variant (see normalize_unicode)
    Dictionary(const LanguageInfo& info, bool normalize);
    ~Dictionary();

    // Non-copyable due to trie ownership
    Dictionary(const Dictionary&) = delete;
    Dictionary& operator=(const Dictionary&) = delete;

    bool contains(std::string_view word) const;

    // Translation for `word` (case-insensitive), nullopt if unknown.
    std::optional<std::string> lookup(std::string_view word) const;

    // Splits `text` into known words/phrases (longest match first) and the
    // fragments between them. Fragments made only of punctuation or spaces
    // are dropped unless keep_formatting is set or they are always-kept
    // tokens.
    std::vector<std::string> split(std::string_view text, bool keep_formatting) const;

    bool normalized() const { return normalized_; }
    size_t size() const { return entries_.size(); }
    const robin_hood::unordered_flat_map<std::string, std::string>& entries() const { return entries_; }

private:
    TrieNode* trie_;
    robin_hood::unordered_flat_map<std::string, std::string> entries_;
    bool normalized_;
    bool no_word_spacing_;

    void add_entries(const LanguageInfo& info);
    void normalize_entries(const LanguageInfo& info);
    void build_trie();
    void insert_into_trie(const std::string& word);

    // Longest key starting at `pos` that satisfies the boundary rules,
    // returns its end or `pos` when none matches.
    size_t match_at(const std::u32string& lowered, size_t begin, size_t pos, size_t end) const;

    void split_by_numerals(const std::u32string& cps, size_t start, size_t end,
                           bool keep_formatting, std::vector<std::string>& out) const;
    bool should_capture(const std::u32string& cps, size_t start, size_t end, bool keep_formatting) const;
};

} // namespace datelang
