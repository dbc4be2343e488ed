/**
 * Unit tests for simplification, pattern caching, sentence splitting,
 * timezone stripping, language info loading and validation.
 */

#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>
#include <unicode/unistr.h>

#include "test_runner.hpp"
#include "../src/constants.hpp"
#include "../src/errors.hpp"
#include "../src/language_info.hpp"
#include "../src/parser_info.hpp"
#include "../src/pattern_cache.hpp"
#include "../src/sentence_splitter.hpp"
#include "../src/simplifier.hpp"
#include "../src/text_utils.hpp"
#include "../src/timezone.hpp"
#include "../src/validator.hpp"

using json = nlohmann::json;
using datelang_test::language_path;

class TextPipelineTest : public datelang_test::TestRunner {
private:
    datelang::LanguageInfo en;
    datelang::LanguageInfo es;
    datelang::LanguageInfo zh;

    static datelang::LanguageInfo with_rule(const std::string& pattern, const std::string& replacement) {
        datelang::LanguageInfo info;
        info.name = "xx";
        info.simplifications.push_back({pattern, replacement});
        return info;
    }

public:
    TextPipelineTest()
        : en(datelang::load_language_info(language_path("en"))),
          es(datelang::load_language_info(language_path("es"))),
          zh(datelang::load_language_info(language_path("zh")))
    {
    }

    // --- Text helpers ---

    void testNormalizeUnicode() {
        runTest("Normalize strips accents and folds compatibility forms", []() {
            return datelang::normalize_unicode("días") == "dias"
                && datelang::normalize_unicode("mañana") == "manana"
                && datelang::normalize_unicode("\xEF\xBC\x92\xEF\xBC\x90") == "20"  // fullwidth 20
                && datelang::normalize_unicode("monday") == "monday";
        });
    }

    void testTextHelpers() {
        runTest("Text helpers", []() {
            return datelang::to_lower("MIÉRCOLES") == "miércoles"
                && datelang::to_lower("Jan") == "jan"
                && datelang::is_all_digits("2015")
                && !datelang::is_all_digits("")
                && !datelang::is_all_digits("12a")
                && datelang::contains_digit("3天")
                && !datelang::contains_digit("monday")
                && datelang::split_whitespace("  a  b\tc ") == std::vector<std::string>{"a", "b", "c"}
                && datelang::strip_chars("(monday),", datelang::SEARCH_STRIP_CHARS) == "monday"
                && datelang::strip_chars("...", datelang::SEARCH_STRIP_CHARS).empty()
                && datelang::trim("  12:00 ") == "12:00";
        });
    }

    // --- Replacement templates ---

    void testReplacementParse() {
        runTest("Replacement template parse", []() {
            auto tmpl = datelang::ReplacementTemplate::parse("\\1:\\g<2>");
            return tmpl.pieces.size() == 3
                && tmpl.pieces[0].group == 1
                && tmpl.pieces[1].group == -1 && tmpl.pieces[1].literal == ":"
                && tmpl.pieces[2].group == 2;
        });
    }

    void testReplacementWrapped() {
        runTest("Wrapped replacement shifts groups", []() {
            auto tmpl = datelang::ReplacementTemplate::parse("\\1 hour").wrapped(3);
            return tmpl.pieces.size() == 4
                && tmpl.pieces[0].group == 1
                && tmpl.pieces[1].group == 2
                && tmpl.pieces[2].literal == " hour"
                && tmpl.pieces[3].group == 3;
        });
    }

    void testReplacementNamedGroupRejected() {
        runThrowsTest<datelang::ConfigurationError>("Named group in replacement is rejected", []() {
            datelang::ReplacementTemplate::parse("\\g<name>");
        });
    }

    // --- Simplifier ---

    void testWrapPattern() {
        runTest("Wrap pattern", []() {
            return datelang::Simplifier::wrap_pattern("noon") == "(\\A|\\d|_|\\W)noon(\\d|_|\\W|\\z)";
        });
    }

    void testSimplify() {
        runTest("Simplify applies rules in order", [this]() {
            datelang::Simplifier simplifier(en, false);
            return stringsEqual(simplifier.simplify("Yesterday"), "1 day ago")
                && stringsEqual(simplifier.simplify("a day ago"), "1 day ago")
                && stringsEqual(simplifier.simplify("10h30m"), "10:30")
                && stringsEqual(simplifier.simplify("at noon"), "at 12:00");
        });
    }

    void testSimplifyWholeWordsOnly() {
        runTest("Simplify matches whole words only", [this]() {
            datelang::Simplifier simplifier(en, false);
            return stringsEqual(simplifier.simplify("may"), "may")
                && stringsEqual(simplifier.simplify("nowhere"), "nowhere");
        });
    }

    void testSimplifyIdempotent() {
        runTest("Simplify is idempotent", [this]() {
            datelang::Simplifier simplifier(en, false);
            for (const char* input : {"yesterday", "in 3 days", "a day ago", "10h30m", "now", "tomorrow at noon"}) {
                std::string once = simplifier.simplify(input);
                if (!stringsEqual(simplifier.simplify(once), once)) return false;
            }
            return true;
        });
    }

    void testSimplifyNamedGroups() {
        runTest("Simplify accepts named groups", [this]() {
            datelang::Simplifier simplifier(with_rule("(?P<n>\\d+)\\s*hrs", "\\1 hour"), false);
            return stringsEqual(simplifier.simplify("5 hrs"), "5 hour")
                && stringsEqual(simplifier.simplify("5hrs ago"), "5 hour ago");
        });
    }

    void testSimplifyWithoutWordSpacing() {
        runTest("Simplify without word spacing", [this]() {
            datelang::Simplifier simplifier(zh, true);
            return stringsEqual(simplifier.simplify("昨天"), "1天前")
                && stringsEqual(simplifier.simplify("前天下午"), "2天前下午");
        });
    }

    void testSimplifyNormalized() {
        runTest("Normalized rules use normalized keys", [this]() {
            datelang::Simplifier normalized(es, true);
            datelang::Simplifier raw(es, false);
            return normalized.rules()[2].pattern == "mediodia"
                && stringsEqual(normalized.simplify("mediodia"), "12:00")
                && stringsEqual(raw.simplify("mediodía"), "12:00")
                && stringsEqual(raw.simplify("mediodia"), "mediodia");
        });
    }

    void testPatternsCompiledOnce() {
        runTest("Rule patterns compile once", [this]() {
            datelang::Simplifier simplifier(en, false);
            if (simplifier.compiled_patterns() != 0) return false;
            simplifier.simplify("yesterday");
            simplifier.simplify("tomorrow");
            return simplifier.compiled_patterns() == en.simplifications.size();
        });
    }

    void testInvalidRule() {
        runThrowsTest<datelang::ConfigurationError>("Invalid rule raises configuration error", []() {
            datelang::Simplifier simplifier(with_rule("(unclosed", "x"), false);
            simplifier.simplify("unclosed");
        });
    }

    // --- Pattern cache ---

    void testPatternCache() {
        runTest("Pattern cache returns the same pattern", []() {
            datelang::PatternCache cache;
            const auto& first = cache.get("\\d+");
            const auto& again = cache.get("\\d+");
            cache.get("[a-z]+");
            return &first == &again && cache.size() == 2;
        });
    }

    void testPatternCacheConcurrent() {
        runTest("Pattern cache under concurrent first use", []() {
            datelang::PatternCache cache;
            std::vector<const icu::RegexPattern*> seen(8, nullptr);
            std::vector<std::thread> threads;
            for (size_t t = 0; t < seen.size(); ++t) {
                threads.emplace_back([&cache, &seen, t]() {
                    seen[t] = &cache.get("(\\d+)\\s*day");
                });
            }
            for (auto& th : threads) th.join();
            for (const auto* p : seen) {
                if (p != seen[0]) return false;
            }
            return cache.size() == 1;
        });
    }

    void testPythonGroupSyntax() {
        runTest("Python group syntax compiles", []() {
            auto pattern = datelang::compile_pattern("(?P<num>\\d+)-(?P=num)", 0);
            UErrorCode status = U_ZERO_ERROR;
            icu::UnicodeString input = icu::UnicodeString::fromUTF8("12-12");
            std::unique_ptr<icu::RegexMatcher> matcher(pattern->matcher(input, status));
            return U_SUCCESS(status) && matcher->matches(status);
        });
    }

    // --- Sentence splitting ---

    std::vector<std::string> sentences(int group, const std::string& text) {
        const auto* splitter = datelang::find_sentence_splitter(group);
        auto pattern = datelang::compile_pattern(splitter->pattern, 0);
        return datelang::split_sentences(text, *pattern);
    }

    void testSentenceGroups() {
        runTest("Sentence splitter groups", []() {
            return datelang::sentence_splitter_groups().size() == 6
                && datelang::find_sentence_splitter(1) != nullptr
                && datelang::find_sentence_splitter(6) != nullptr
                && datelang::find_sentence_splitter(7) == nullptr;
        });
    }

    void testSplitSentences() {
        runTest("Split sentences", [this]() {
            return vectorsEqual(sentences(1, "Meet monday. Leave friday!"), {"Meet monday", "Leave friday"})
                && vectorsEqual(sentences(2, "¿Nos vemos el lunes? Llegó hace 3 días."),
                                {"Nos vemos el lunes", "Llegó hace 3 días"})
                && vectorsEqual(sentences(4, "我们见面。明天"), {"我们见面", "明天"})
                && vectorsEqual(sentences(5, "a. b\nc"), {"a. b", "c"})
                && sentences(1, "").empty();
        });
    }

    // --- Timezone ---

    void testPopTimezoneAbbreviation() {
        runTest("Pop timezone abbreviation", []() {
            auto [rest, tz] = datelang::pop_tz_offset("12:00 CET");
            return rest == "12:00" && tz && tz->name == "CET" && tz->offset_seconds == 3600;
        });
    }

    void testPopTimezoneWithOffset() {
        runTest("Pop abbreviation with offset", []() {
            auto [rest, tz] = datelang::pop_tz_offset("10 am UTC+3");
            return rest == "10 am" && tz && tz->name == "UTC+3" && tz->offset_seconds == 3 * 3600;
        });
    }

    void testPopNumericTimezone() {
        runTest("Pop numeric offset", []() {
            auto [rest, tz] = datelang::pop_tz_offset("09:15 -0500");
            auto [rest2, tz2] = datelang::pop_tz_offset("12:00 +05:30");
            return rest == "09:15" && tz && tz->offset_seconds == -5 * 3600
                && rest2 == "12:00" && tz2 && tz2->name == "+05:30" && tz2->offset_seconds == 19800;
        });
    }

    void testNonAsciiOffsetDigits() {
        runTest("Offset with non-ASCII digits is left in place", []() {
            // Arabic-Indic digits
            std::string text = "12 january \xD9\xA2\xD9\xA0\xD9\xA1\xD9\xA5 +\xD9\xA0\xD9\xA5";
            auto [rest, tz] = datelang::pop_tz_offset(text);
            auto [rest2, tz2] = datelang::pop_tz_offset("10:00 UTC+\xD9\xA3");
            return rest == text && !tz
                && rest2 == "10:00 UTC+\xD9\xA3" && !tz2;
        });
    }

    void testPopLowercaseAbbreviation() {
        runTest("Pop lowercase abbreviation", []() {
            auto [rest, tz] = datelang::pop_tz_offset("10:00 cet");
            auto [rest2, tz2] = datelang::pop_tz_offset("10 am utc+3");
            return rest == "10:00" && tz && tz->name == "cet" && tz->offset_seconds == 3600
                && rest2 == "10 am" && tz2 && tz2->offset_seconds == 3 * 3600;
        });
    }

    void testNoTimezone() {
        runTest("Text without timezone is unchanged", []() {
            auto [rest, tz] = datelang::pop_tz_offset("monday 12:00");
            return rest == "monday 12:00" && !tz;
        });
    }

    // --- Language info ---

    void testLanguageInfoFromJson() {
        runTest("Language info from JSON", []() {
            auto info = datelang::language_info_from_json(json::parse(R"({
                "name": "xx",
                "skip": ["the"],
                "monday": "mon",
                "simplifications": [{"one": 1}, {"two": "2"}],
                "no_word_spacing": "True"
            })"));
            return info.name == "xx"
                && info.skip == std::vector<std::string>{"the"}
                && info.names("monday") && *info.names("monday") == std::vector<std::string>{"mon"}
                && info.names("tuesday") == nullptr
                && info.simplifications.size() == 2
                && info.simplifications[0].replacement == "1"
                && info.no_word_spacing
                && info.sentence_splitter_group == 1;
        });
    }

    void testLanguageInfoMissingName() {
        runThrowsTest<datelang::ConfigurationError>("Language info without name", []() {
            datelang::language_info_from_json(json::parse(R"({"skip": ["x"]})"));
        });
    }

    void testLanguageInfoBadList() {
        runThrowsTest<datelang::ConfigurationError>("Language info with a non-list word group", []() {
            datelang::language_info_from_json(json::parse(R"({"name": "xx", "skip": 3})"));
        });
    }

    void testLanguageFileMissing() {
        runThrowsTest<datelang::ConfigurationError>("Missing language file", []() {
            datelang::load_language_info(language_path("does-not-exist"));
        });
    }

    // --- Parser info ---

    void testParserInfo() {
        runTest("Parser info", [this]() {
            auto info = datelang::make_parser_info(en);
            return info.name == "en"
                && info.weekdays.size() == 7
                && info.weekdays[0] == std::vector<std::string>{"monday", "mon"}
                && info.months.size() == 12
                && info.months[11] == std::vector<std::string>{"december", "dec"}
                && info.hms.size() == 3
                && info.jump == en.skip
                && info.pertain == std::vector<std::string>{"of"};
        });
    }

    void testParserInfoIncomplete() {
        runThrowsTest<datelang::ConfigurationError>("Parser info with a missing month", [this]() {
            datelang::LanguageInfo info = en;
            info.words.erase("may");
            datelang::make_parser_info(info);
        });
    }

    // --- Validator ---

    void testValidLanguages() {
        runTest("Shipped languages validate", [this]() {
            std::ostringstream log;
            bool ok = datelang::LanguageValidator::validate_info("en", en, log)
                   && datelang::LanguageValidator::validate_info("es", es, log)
                   && datelang::LanguageValidator::validate_info("zh", zh, log);
            if (!log.str().empty()) std::cerr << "\n" << log.str();
            return ok && log.str().empty();
        });
    }

    void testInvalidLanguage() {
        runTest("Validator reports every problem", [this]() {
            datelang::LanguageInfo info = en;
            info.words.erase("friday");
            info.simplifications.push_back({"(broken", "x"});
            info.sentence_splitter_group = 9;
            std::ostringstream log;
            bool ok = datelang::LanguageValidator::validate_info("en-bad", info, log);
            std::string out = log.str();
            return !ok
                && out.find("en-bad: no names for 'friday'") != std::string::npos
                && out.find("en-bad: simplification 9") != std::string::npos
                && out.find("en-bad: unknown sentence_splitter_group 9") != std::string::npos;
        });
    }

    void runAll() {
        printHeader("Text Pipeline Tests");

        testNormalizeUnicode();
        testTextHelpers();
        testReplacementParse();
        testReplacementWrapped();
        testReplacementNamedGroupRejected();
        testWrapPattern();
        testSimplify();
        testSimplifyWholeWordsOnly();
        testSimplifyIdempotent();
        testSimplifyNamedGroups();
        testSimplifyWithoutWordSpacing();
        testSimplifyNormalized();
        testPatternsCompiledOnce();
        testInvalidRule();
        testPatternCache();
        testPatternCacheConcurrent();
        testPythonGroupSyntax();
        testSentenceGroups();
        testSplitSentences();
        testPopTimezoneAbbreviation();
        testPopTimezoneWithOffset();
        testPopNumericTimezone();
        testNonAsciiOffsetDigits();
        testPopLowercaseAbbreviation();
        testNoTimezone();
        testLanguageInfoFromJson();
        testLanguageInfoMissingName();
        testLanguageInfoBadList();
        testLanguageFileMissing();
        testParserInfo();
        testParserInfoIncomplete();
        testValidLanguages();
        testInvalidLanguage();

        printSummary();
    }
};

int main() {
    try {
        TextPipelineTest tests;
        tests.runAll();
        return tests.getFailCount() > 0 ? 1 : 0;
    } catch (const std::exception& e) {
        std::cerr << "Test setup failed: " << e.what() << std::endl;
        return 1;
    }
}
