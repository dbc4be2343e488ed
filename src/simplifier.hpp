#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <unicode/regex.h>

#include "language_info.hpp"
#include "pattern_cache.hpp"

namespace datelang {

// Replacement text split into literals and capture-group references.
// Accepts \N, \g<N> and \\ like the configuration files use.
struct ReplacementTemplate {
    struct Piece {
        std::string literal;
        int group = -1;  // >= 0 for a group reference
    };
    std::vector<Piece> pieces;

    static ReplacementTemplate parse(const std::string& replacement);

    // Shifts user groups by one and surrounds the text with the boundary
    // groups of a wrapped pattern.
    ReplacementTemplate wrapped(int trailing_group) const;

    // Appends the expansion for the current match of `matcher` to `out`.
    // Throws ConfigurationError for a reference to a missing group.
    void expand(const icu::RegexMatcher& matcher, icu::UnicodeString& out) const;
};

// Applies a language's ordered simplification rules.
class Simplifier {
public:
    // normalize: use Unicode-normalized rule keys and replacements
    Simplifier(const LanguageInfo& info, bool normalize);

    Simplifier(const Simplifier&) = delete;
    Simplifier& operator=(const Simplifier&) = delete;

    // Lowercases `text` and applies every rule once, in order.
    // Throws ConfigurationError when a rule's pattern does not compile.
    std::string simplify(std::string_view text) const;

    const std::vector<SimplificationRule>& rules() const { return rules_; }
    size_t compiled_patterns() const { return patterns_.size(); }

    // Anchors a pattern so it only matches whole words:
    // (\A|\d|_|\W)<pattern>(\d|_|\W|\z)
    static std::string wrap_pattern(const std::string& pattern);

private:
    std::vector<SimplificationRule> rules_;
    std::vector<ReplacementTemplate> replacements_;
    bool no_word_spacing_;
    mutable PatternCache patterns_;

    icu::UnicodeString apply(const SimplificationRule& rule, const ReplacementTemplate& replacement,
                             const icu::UnicodeString& input) const;
};

} // namespace datelang
