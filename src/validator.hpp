#pragma once

#include <ostream>
#include <string>

#include "language_info.hpp"

namespace datelang {

// Checks a language record before it is trusted. Every problem is written
// to `log` as "<language_id>: <message>"; returns false if any was found.
class LanguageValidator {
public:
    static bool validate_info(const std::string& language_id, const LanguageInfo& info, std::ostream& log);

private:
    static bool validate_name(const std::string& language_id, const LanguageInfo& info, std::ostream& log);
    static bool validate_word_lists(const std::string& language_id, const LanguageInfo& info, std::ostream& log);
    static bool validate_simplifications(const std::string& language_id, const LanguageInfo& info, std::ostream& log);
    static bool validate_sentence_splitter(const std::string& language_id, const LanguageInfo& info, std::ostream& log);
};

} // namespace datelang
