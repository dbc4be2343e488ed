#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <unicode/regex.h>

namespace datelang {

// Sentence-boundary rule for one script family.
struct SentenceSplitterGroup {
    int id;
    const char* pattern;
    const char* scripts;
};

// Registered boundary rules, keyed by `sentence_splitter_group`.
const std::vector<SentenceSplitterGroup>& sentence_splitter_groups();

// Boundary pattern for `group`, nullptr when the group is not registered.
const SentenceSplitterGroup* find_sentence_splitter(int group);

// Splits `text` on every non-empty match of `boundary`; empty sentences
// are dropped.
std::vector<std::string> split_sentences(std::string_view text, const icu::RegexPattern& boundary);

} // namespace datelang
