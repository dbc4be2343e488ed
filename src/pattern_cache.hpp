#pragma once

#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>

#include <robin_hood.h>
#include <unicode/regex.h>

namespace datelang {

// Compiles `source` (UTF-8) with ICU. Python-style named groups
// "(?P<name>" and "(?P=name)" are accepted. Throws ConfigurationError.
std::unique_ptr<icu::RegexPattern> compile_pattern(const std::string& source, uint32_t flags);

// Compiled regexes keyed by their source text. Patterns are compiled on
// first request and never evicted; the returned references stay valid for
// the lifetime of the cache. Safe to share between threads: ICU patterns
// are immutable and matchers are created per use.
class PatternCache {
public:
    explicit PatternCache(uint32_t flags = 0) : flags_(flags) {}

    PatternCache(const PatternCache&) = delete;
    PatternCache& operator=(const PatternCache&) = delete;

    const icu::RegexPattern& get(const std::string& source);

    size_t size() const;

private:
    uint32_t flags_;
    mutable std::shared_mutex mutex_;
    robin_hood::unordered_node_map<std::string, std::unique_ptr<icu::RegexPattern>> patterns_;
};

} // namespace datelang
