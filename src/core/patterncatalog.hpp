#pragma once

#include "core/core_export.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cleanbook::core {

namespace fs = std::filesystem;

/**
 * @brief Result of matching a file name against the catalog
 */
struct PatternMatch {
    std::string category;
    std::string subcategory;
    std::string pattern;

    std::string qualifiedCategory() const { return category + "." + subcategory; }
};

/**
 * @brief Ordered mapping of category -> subcategory -> glob patterns
 *
 * Immutable after construction and safe to share between scanning threads.
 */
class CLEANBOOK_CORE_EXPORT PatternCatalog {
public:
    struct Subcategory {
        std::string name;
        std::vector<std::string> patterns;
    };

    struct Category {
        std::string name;
        std::vector<Subcategory> subcategories;
    };

    // Top-level keys holding metadata rather than patterns
    static const std::vector<std::string>& reservedKeys();

    PatternCatalog() = default;
    explicit PatternCatalog(std::vector<Category> categories);

    /**
     * @brief Load a catalog from a JSON file, preserving key order
     * @throws ConfigError if the file is missing or malformed
     */
    static PatternCatalog loadFromFile(const fs::path& path);

    /**
     * @brief Parse a catalog from JSON text
     * @throws ConfigError if the document is malformed
     */
    static PatternCatalog parse(const std::string& jsonText);

    /**
     * @brief Find the first pattern matching a bare file name
     * @param name File name without directory components
     * @return Match in catalog order, or std::nullopt
     */
    std::optional<PatternMatch> match(const std::string& name) const;

    /**
     * @brief Case-sensitive shell glob match (*, ?, [...])
     */
    static bool globMatch(const std::string& pattern, const std::string& name);

    const std::vector<Category>& categories() const { return categories_; }
    size_t categoryCount() const { return categories_.size(); }
    size_t patternCount() const;
    bool empty() const { return patternCount() == 0; }

private:
    std::vector<Category> categories_;
};

} // namespace cleanbook::core
