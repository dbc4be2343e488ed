#pragma once

#include <memory>
#include <string>
#include <vector>

#include <robin_hood.h>

#include "language.hpp"

namespace datelang {

// Languages keyed by short code. Filled once at startup, then read-only.
class LanguageRegistry {
public:
    // Loads every *.json file in `directory`; the file stem is the short
    // code. Returns the number of languages loaded. Throws
    // ConfigurationError for an unreadable directory or malformed file.
    size_t load_directory(const std::string& directory);

    void add(const std::string& shortname, LanguageInfo info);

    // nullptr when the language is unknown
    std::shared_ptr<const Language> get(const std::string& shortname) const;

    std::vector<std::string> shortnames() const;
    size_t size() const { return languages_.size(); }

private:
    robin_hood::unordered_node_map<std::string, std::shared_ptr<const Language>> languages_;
};

} // namespace datelang
