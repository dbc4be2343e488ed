#include "pattern_cache.hpp"
#include "errors.hpp"

#include <mutex>

#include <unicode/parseerr.h>
#include <unicode/unistr.h>

namespace datelang {

namespace {

std::string to_icu_syntax(const std::string& source) {
    std::string out;
    out.reserve(source.size());
    size_t i = 0;
    while (i < source.size()) {
        if (source[i] == '\\' && i + 1 < source.size()) {
            out.append(source, i, 2);
            i += 2;
            continue;
        }
        if (source.compare(i, 4, "(?P<") == 0) {
            out += "(?<";
            i += 4;
            continue;
        }
        if (source.compare(i, 4, "(?P=") == 0) {
            size_t close = source.find(')', i);
            if (close != std::string::npos) {
                out += "\\k<" + source.substr(i + 4, close - i - 4) + ">";
                i = close + 1;
                continue;
            }
        }
        out += source[i];
        ++i;
    }
    return out;
}

} // namespace

std::unique_ptr<icu::RegexPattern> compile_pattern(const std::string& source, uint32_t flags) {
    UErrorCode status = U_ZERO_ERROR;
    UParseError parse_error;
    icu::UnicodeString usource = icu::UnicodeString::fromUTF8(to_icu_syntax(source));
    std::unique_ptr<icu::RegexPattern> pattern(
        icu::RegexPattern::compile(usource, flags, parse_error, status));
    if (U_FAILURE(status) || !pattern) {
        throw ConfigurationError("Invalid pattern '" + source + "': " + u_errorName(status) +
                                 " at offset " + std::to_string(parse_error.offset));
    }
    return pattern;
}

const icu::RegexPattern& PatternCache::get(const std::string& source) {
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = patterns_.find(source);
        if (it != patterns_.end()) return *it->second;
    }

    // Compile outside the lock; a concurrent duplicate is discarded below
    auto compiled = compile_pattern(source, flags_);

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto result = patterns_.emplace(source, std::move(compiled));
    return *result.first->second;
}

size_t PatternCache::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return patterns_.size();
}

} // namespace datelang
