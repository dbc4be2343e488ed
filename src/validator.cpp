#include "validator.hpp"
#include "constants.hpp"
#include "errors.hpp"
#include "pattern_cache.hpp"
#include "sentence_splitter.hpp"
#include "simplifier.hpp"

#include <unicode/regex.h>

namespace datelang {

bool LanguageValidator::validate_info(const std::string& language_id, const LanguageInfo& info, std::ostream& log) {
    bool result = true;
    result &= validate_name(language_id, info, log);
    result &= validate_word_lists(language_id, info, log);
    result &= validate_simplifications(language_id, info, log);
    result &= validate_sentence_splitter(language_id, info, log);
    return result;
}

bool LanguageValidator::validate_name(const std::string& language_id, const LanguageInfo& info, std::ostream& log) {
    if (info.name.empty()) {
        log << language_id << ": 'name' is empty" << std::endl;
        return false;
    }
    return true;
}

bool LanguageValidator::validate_word_lists(const std::string& language_id, const LanguageInfo& info, std::ostream& log) {
    bool result = true;

    for (const auto& word : info.skip) {
        if (word.empty()) {
            log << language_id << ": empty string in 'skip'" << std::endl;
            result = false;
        }
    }
    for (const auto& word : info.pertain) {
        if (word.empty()) {
            log << language_id << ": empty string in 'pertain'" << std::endl;
            result = false;
        }
    }

    auto require = [&](std::string_view token) {
        const auto* names = info.names(token);
        if (!names || names->empty()) {
            log << language_id << ": no names for '" << token << "'" << std::endl;
            result = false;
        }
    };
    for (auto token : WEEKDAY_TOKENS) require(token);
    for (auto token : MONTH_TOKENS) require(token);
    for (auto token : HMS_TOKENS) require(token);

    for (auto token : KNOWN_WORD_TOKENS) {
        const auto* names = info.names(token);
        if (!names) continue;
        for (const auto& name : *names) {
            if (name.empty()) {
                log << language_id << ": empty name for '" << token << "'" << std::endl;
                result = false;
            }
        }
    }
    return result;
}

bool LanguageValidator::validate_simplifications(const std::string& language_id, const LanguageInfo& info, std::ostream& log) {
    bool result = true;
    for (size_t i = 0; i < info.simplifications.size(); ++i) {
        const auto& rule = info.simplifications[i];
        if (rule.pattern.empty()) {
            log << language_id << ": simplification " << i << " has an empty pattern" << std::endl;
            result = false;
            continue;
        }
        std::string source = info.no_word_spacing ? rule.pattern : Simplifier::wrap_pattern(rule.pattern);
        try {
            compile_pattern(source, UREGEX_CASE_INSENSITIVE);
            ReplacementTemplate::parse(rule.replacement);
        } catch (const ConfigurationError& e) {
            log << language_id << ": simplification " << i << ": " << e.what() << std::endl;
            result = false;
        }
    }
    return result;
}

bool LanguageValidator::validate_sentence_splitter(const std::string& language_id, const LanguageInfo& info, std::ostream& log) {
    if (!find_sentence_splitter(info.sentence_splitter_group)) {
        log << language_id << ": unknown sentence_splitter_group " << info.sentence_splitter_group << std::endl;
        return false;
    }
    return true;
}

} // namespace datelang
