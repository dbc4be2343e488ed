#include "language_info.hpp"
#include "constants.hpp"
#include "errors.hpp"

#include <fstream>

#include <nlohmann/json.hpp>

namespace datelang {

namespace {

std::vector<std::string> read_string_list(const nlohmann::json& j, const char* key) {
    const auto& value = j.at(key);
    if (value.is_string()) {
        return {value.get<std::string>()};
    }
    if (!value.is_array()) {
        throw ConfigurationError(std::string("'") + key + "' must be a list of strings");
    }
    std::vector<std::string> out;
    out.reserve(value.size());
    for (const auto& item : value) {
        if (!item.is_string()) {
            throw ConfigurationError(std::string("'") + key + "' must contain only strings");
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

SimplificationRule read_simplification(const nlohmann::json& entry) {
    if (!entry.is_object() || entry.size() != 1) {
        throw ConfigurationError("each simplification must be a single-entry object");
    }
    auto it = entry.begin();
    SimplificationRule rule;
    rule.pattern = it.key();
    if (it.value().is_string()) {
        rule.replacement = it.value().get<std::string>();
    } else if (it.value().is_number_integer()) {
        rule.replacement = std::to_string(it.value().get<long long>());
    } else {
        throw ConfigurationError("simplification '" + rule.pattern +
                                 "' must map to a string or an integer");
    }
    return rule;
}

bool read_flag(const nlohmann::json& value) {
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_string()) {
        auto s = value.get<std::string>();
        return s == "true" || s == "True" || s == "1";
    }
    if (value.is_number_integer()) return value.get<int>() != 0;
    throw ConfigurationError("'no_word_spacing' must be a boolean");
}

} // namespace

LanguageInfo language_info_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigurationError("language info must be a JSON object");
    }

    LanguageInfo info;
    try {
        if (!j.contains("name") || !j["name"].is_string()) {
            throw ConfigurationError("language info requires a string 'name'");
        }
        info.name = j["name"].get<std::string>();

        if (j.contains("skip")) info.skip = read_string_list(j, "skip");
        if (j.contains("pertain")) info.pertain = read_string_list(j, "pertain");

        for (auto token : KNOWN_WORD_TOKENS) {
            std::string key(token);
            if (j.contains(key)) {
                info.words[key] = read_string_list(j, key.c_str());
            }
        }

        if (j.contains("simplifications")) {
            const auto& rules = j["simplifications"];
            if (!rules.is_array()) {
                throw ConfigurationError("'simplifications' must be a list");
            }
            for (const auto& entry : rules) {
                info.simplifications.push_back(read_simplification(entry));
            }
        }

        if (j.contains("sentence_splitter_group")) {
            const auto& group = j["sentence_splitter_group"];
            if (!group.is_number_integer()) {
                throw ConfigurationError("'sentence_splitter_group' must be an integer");
            }
            info.sentence_splitter_group = group.get<int>();
        }

        if (j.contains("no_word_spacing")) {
            info.no_word_spacing = read_flag(j["no_word_spacing"]);
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(std::string("malformed language info: ") + e.what());
    } catch (const ConfigurationError& e) {
        std::string name = info.name.empty() ? "<unnamed>" : info.name;
        throw ConfigurationError(name + ": " + e.what());
    }

    return info;
}

LanguageInfo load_language_info(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigurationError("Could not open language file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigurationError("Could not parse language file " + path + ": " + e.what());
    }
    return language_info_from_json(j);
}

} // namespace datelang
