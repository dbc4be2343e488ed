#include "translator.hpp"
#include "constants.hpp"
#include "text_utils.hpp"

#include <algorithm>

namespace datelang {

void translate_tokens(std::vector<std::string>& tokens, const Dictionary& dictionary) {
    for (auto& token : tokens) {
        std::string word = to_lower(token);
        auto translation = dictionary.lookup(word);
        if (translation) {
            token = std::move(*translation);
        }
    }
}

void clear_future_words(std::vector<std::string>& tokens) {
    auto in = std::find(tokens.begin(), tokens.end(), "in");
    if (in == tokens.end()) return;

    for (const auto& token : tokens) {
        if (contains_token(FRESHNESS_WORDS, token)) return;
    }
    tokens.erase(in);
}

void drop_empty(std::vector<std::string>& tokens) {
    tokens.erase(std::remove_if(tokens.begin(), tokens.end(),
                                [](const std::string& t) { return t.empty(); }),
                 tokens.end());
}

} // namespace datelang
