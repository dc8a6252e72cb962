#pragma once

#include "scan/scan_export.hpp"
#include <filesystem>
#include <vector>

namespace cleanbook::scan {

namespace fs = std::filesystem;

/**
 * @brief Set of directory subtrees exempt from scanning
 *
 * Entries are expanded and resolved once at construction; the set is
 * read-only afterwards and shared between scan workers without locking.
 */
class CLEANBOOK_SCAN_EXPORT Whitelist {
public:
    Whitelist() = default;
    explicit Whitelist(const std::vector<fs::path>& sanctuaries);

    /**
     * @brief Check whether a path lies inside a sanctuary
     * @param path Candidate path, resolved before comparison
     * @return true if the path equals or descends from a sanctuary, and
     *         true if the path cannot be resolved
     */
    bool isWhitelisted(const fs::path& path) const;

    const std::vector<fs::path>& sanctuaries() const { return sanctuaries_; }

private:
    std::vector<fs::path> sanctuaries_;
};

} // namespace cleanbook::scan
