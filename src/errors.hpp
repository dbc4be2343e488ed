#pragma once

#include <stdexcept>
#include <string>

namespace datelang {

// Malformed language configuration. Raised where the broken piece is first
// needed and never retried.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace datelang
