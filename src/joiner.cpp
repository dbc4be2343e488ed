#include "joiner.hpp"

namespace datelang {

std::string join_tokens(const std::vector<std::string>& tokens, std::string_view separator,
                        const robin_hood::unordered_flat_set<std::string>& capturing) {
    if (tokens.empty()) return "";

    std::string joined = tokens[0];
    for (size_t i = 1; i < tokens.size(); ++i) {
        const auto& left = tokens[i - 1];
        const auto& right = tokens[i];
        if (!capturing.count(left) && !capturing.count(right)) {
            joined += separator;
        }
        joined += right;
    }
    return joined;
}

std::string join_plain(const std::vector<std::string>& tokens, std::string_view separator) {
    std::string joined;
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (i > 0) joined += separator;
        joined += tokens[i];
    }
    return joined;
}

} // namespace datelang
