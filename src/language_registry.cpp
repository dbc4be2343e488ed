#include "language_registry.hpp"
#include "errors.hpp"

#include <algorithm>
#include <filesystem>

namespace datelang {

namespace fs = std::filesystem;

size_t LanguageRegistry::load_directory(const std::string& directory) {
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        throw ConfigurationError("Not a language directory: " + directory);
    }

    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(directory, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".json") {
            files.push_back(entry.path());
        }
    }
    if (ec) {
        throw ConfigurationError("Could not list " + directory + ": " + ec.message());
    }
    std::sort(files.begin(), files.end());

    for (const auto& path : files) {
        add(path.stem().string(), load_language_info(path.string()));
    }
    return files.size();
}

void LanguageRegistry::add(const std::string& shortname, LanguageInfo info) {
    languages_[shortname] = std::make_shared<const Language>(shortname, std::move(info));
}

std::shared_ptr<const Language> LanguageRegistry::get(const std::string& shortname) const {
    auto it = languages_.find(shortname);
    return it != languages_.end() ? it->second : nullptr;
}

std::vector<std::string> LanguageRegistry::shortnames() const {
    std::vector<std::string> names;
    names.reserve(languages_.size());
    for (const auto& [name, _] : languages_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace datelang
