#include "simplifier.hpp"
#include "errors.hpp"
#include "text_utils.hpp"

#include <cctype>
#include <memory>

#include <unicode/locid.h>
#include <unicode/unistr.h>

namespace datelang {

// --- ReplacementTemplate ---

ReplacementTemplate ReplacementTemplate::parse(const std::string& replacement) {
    ReplacementTemplate tmpl;
    std::string literal;

    auto flush = [&]() {
        if (!literal.empty()) {
            tmpl.pieces.push_back({literal, -1});
            literal.clear();
        }
    };

    size_t i = 0;
    while (i < replacement.size()) {
        char c = replacement[i];
        if (c != '\\' || i + 1 >= replacement.size()) {
            literal += c;
            ++i;
            continue;
        }

        char next = replacement[i + 1];
        if (std::isdigit(static_cast<unsigned char>(next))) {
            // \N or \NN
            size_t j = i + 1;
            int group = 0;
            while (j < replacement.size() && j < i + 3 &&
                   std::isdigit(static_cast<unsigned char>(replacement[j]))) {
                group = group * 10 + (replacement[j] - '0');
                ++j;
            }
            flush();
            tmpl.pieces.push_back({"", group});
            i = j;
        } else if (next == 'g' && i + 2 < replacement.size() && replacement[i + 2] == '<') {
            size_t close = replacement.find('>', i + 3);
            std::string name = close == std::string::npos ? "" : replacement.substr(i + 3, close - i - 3);
            bool numeric = !name.empty();
            for (char d : name) {
                if (!std::isdigit(static_cast<unsigned char>(d))) numeric = false;
            }
            if (!numeric) {
                throw ConfigurationError("Unsupported group reference in replacement '" + replacement + "'");
            }
            flush();
            tmpl.pieces.push_back({"", std::stoi(name)});
            i = close + 1;
        } else if (next == '\\') {
            literal += '\\';
            i += 2;
        } else if (next == 'n') {
            literal += '\n';
            i += 2;
        } else if (next == 't') {
            literal += '\t';
            i += 2;
        } else {
            literal += c;
            literal += next;
            i += 2;
        }
    }
    flush();
    return tmpl;
}

ReplacementTemplate ReplacementTemplate::wrapped(int trailing_group) const {
    ReplacementTemplate out;
    out.pieces.reserve(pieces.size() + 2);
    out.pieces.push_back({"", 1});
    for (const auto& piece : pieces) {
        Piece shifted = piece;
        if (shifted.group >= 0) shifted.group += 1;
        out.pieces.push_back(shifted);
    }
    out.pieces.push_back({"", trailing_group});
    return out;
}

void ReplacementTemplate::expand(const icu::RegexMatcher& matcher, icu::UnicodeString& out) const {
    for (const auto& piece : pieces) {
        if (piece.group < 0) {
            out.append(icu::UnicodeString::fromUTF8(piece.literal));
            continue;
        }
        UErrorCode status = U_ZERO_ERROR;
        icu::UnicodeString group = matcher.group(piece.group, status);
        if (U_FAILURE(status)) {
            throw ConfigurationError("Invalid group reference \\" + std::to_string(piece.group) +
                                     " in simplification replacement");
        }
        out.append(group);
    }
}

// --- Simplifier ---

Simplifier::Simplifier(const LanguageInfo& info, bool normalize)
    : no_word_spacing_(info.no_word_spacing), patterns_(UREGEX_CASE_INSENSITIVE) {
    rules_.reserve(info.simplifications.size());
    for (const auto& rule : info.simplifications) {
        if (normalize) {
            rules_.push_back({normalize_unicode(rule.pattern), normalize_unicode(rule.replacement)});
        } else {
            rules_.push_back(rule);
        }
    }

    replacements_.reserve(rules_.size());
    for (const auto& rule : rules_) {
        replacements_.push_back(ReplacementTemplate::parse(rule.replacement));
    }
}

std::string Simplifier::wrap_pattern(const std::string& pattern) {
    return "(\\A|\\d|_|\\W)" + pattern + "(\\d|_|\\W|\\z)";
}

std::string Simplifier::simplify(std::string_view text) const {
    std::string lowered = to_lower(text);
    if (rules_.empty()) return lowered;

    icu::UnicodeString current = icu::UnicodeString::fromUTF8(
        icu::StringPiece(lowered.data(), static_cast<int32_t>(lowered.size())));
    for (size_t i = 0; i < rules_.size(); ++i) {
        current = apply(rules_[i], replacements_[i], current);
        // A replacement may introduce upper case
        current.toLower(icu::Locale::getRoot());
    }

    std::string out;
    current.toUTF8String(out);
    return out;
}

icu::UnicodeString Simplifier::apply(const SimplificationRule& rule, const ReplacementTemplate& replacement,
                                     const icu::UnicodeString& input) const {
    std::string source = no_word_spacing_ ? rule.pattern : wrap_pattern(rule.pattern);
    const icu::RegexPattern& pattern = patterns_.get(source);

    UErrorCode status = U_ZERO_ERROR;
    std::unique_ptr<icu::RegexMatcher> matcher(pattern.matcher(input, status));
    if (U_FAILURE(status)) {
        throw std::runtime_error(std::string("Could not create matcher: ") + u_errorName(status));
    }

    ReplacementTemplate effective = no_word_spacing_ ? replacement : replacement.wrapped(matcher->groupCount());

    icu::UnicodeString output;
    int32_t last = 0;
    while (matcher->find(status) && U_SUCCESS(status)) {
        int32_t start = matcher->start(status);
        int32_t end = matcher->end(status);
        output.append(input, last, start - last);
        effective.expand(*matcher, output);
        last = end;
    }
    if (U_FAILURE(status)) {
        throw std::runtime_error(std::string("Simplification failed: ") + u_errorName(status));
    }
    output.append(input, last, input.length() - last);
    return output;
}

} // namespace datelang
