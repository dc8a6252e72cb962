#include "core/patterncatalog.hpp"
#include "core/errors.hpp"
#include <nlohmann/json.hpp>
#include <fnmatch.h>
#include <algorithm>
#include <fstream>
#include <sstream>

namespace cleanbook::core {

using ordered_json = nlohmann::ordered_json;

const std::vector<std::string>& PatternCatalog::reservedKeys() {
    static const std::vector<std::string> keys = {"size_thresholds", "system_exclusions"};
    return keys;
}

PatternCatalog::PatternCatalog(std::vector<Category> categories)
    : categories_(std::move(categories)) {}

PatternCatalog PatternCatalog::loadFromFile(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("Failed to open pattern catalog: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

PatternCatalog PatternCatalog::parse(const std::string& jsonText) {
    ordered_json doc;
    try {
        doc = ordered_json::parse(jsonText);
    } catch (const ordered_json::parse_error& e) {
        throw ConfigError(std::string("Malformed pattern catalog: ") + e.what());
    }

    if (!doc.is_object()) {
        throw ConfigError("Pattern catalog must be an object of categories");
    }

    const auto& reserved = reservedKeys();
    std::vector<Category> categories;

    for (const auto& [categoryName, subcategories] : doc.items()) {
        if (std::find(reserved.begin(), reserved.end(), categoryName) != reserved.end()) {
            continue;
        }
        if (!subcategories.is_object()) {
            throw ConfigError("Category '" + categoryName + "' must map subcategories to patterns");
        }

        Category category{categoryName, {}};
        for (const auto& [subName, patterns] : subcategories.items()) {
            if (!patterns.is_array()) {
                throw ConfigError("Subcategory '" + categoryName + "." + subName +
                                  "' must be a list of patterns");
            }

            Subcategory sub{subName, {}};
            for (const auto& pattern : patterns) {
                if (!pattern.is_string()) {
                    throw ConfigError("Non-string pattern in '" + categoryName + "." + subName + "'");
                }
                sub.patterns.push_back(pattern.get<std::string>());
            }
            category.subcategories.push_back(std::move(sub));
        }
        categories.push_back(std::move(category));
    }

    return PatternCatalog(std::move(categories));
}

std::optional<PatternMatch> PatternCatalog::match(const std::string& name) const {
    for (const auto& category : categories_) {
        for (const auto& sub : category.subcategories) {
            for (const auto& pattern : sub.patterns) {
                if (globMatch(pattern, name)) {
                    return PatternMatch{category.name, sub.name, pattern};
                }
            }
        }
    }
    return std::nullopt;
}

bool PatternCatalog::globMatch(const std::string& pattern, const std::string& name) {
    return fnmatch(pattern.c_str(), name.c_str(), 0) == 0;
}

size_t PatternCatalog::patternCount() const {
    size_t count = 0;
    for (const auto& category : categories_) {
        for (const auto& sub : category.subcategories) {
            count += sub.patterns.size();
        }
    }
    return count;
}

} // namespace cleanbook::core
