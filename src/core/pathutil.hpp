#pragma once

#include "core/core_export.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace cleanbook::core {

namespace fs = std::filesystem;

/**
 * @brief A path that could not be listed or measured
 */
struct PathError {
    fs::path path;
    std::string message;
};

/**
 * @brief Point-in-time measurement of a file or directory tree
 *
 * Symbolic links are counted as entries but never followed.
 */
struct TreeMeasurement {
    uint64_t totalBytes = 0;        // Sum of regular file sizes
    uint64_t entryCount = 0;        // Entries visited, including the root
    int64_t newestMtimeNs = 0;      // Latest modification time seen
    std::vector<PathError> errors;  // Listing/stat failures; totals are partial
};

/**
 * @brief Path helpers shared by the scanner and the nuker
 */
class CLEANBOOK_CORE_EXPORT PathUtil {
public:
    /**
     * @brief Expand a leading "~" to the user's home directory
     */
    static fs::path expandUser(const fs::path& path);

    /**
     * @brief Current user's home directory
     */
    static fs::path homeDirectory();

    /**
     * @brief Resolve symlinks and relative components of an existing path
     * @param path Path to resolve
     * @param ec Set on failure
     * @return Absolute resolved path, or std::nullopt if resolution failed
     */
    static std::optional<fs::path> resolve(const fs::path& path, std::error_code& ec);

    /**
     * @brief Resolve as far as the path exists, then normalise the rest
     */
    static fs::path resolveLenient(const fs::path& path);

    /**
     * @brief True if candidate equals base or lies underneath it
     *
     * Both paths are compared component by component after lexical
     * normalisation; callers pass already resolved paths.
     */
    static bool isWithin(const fs::path& candidate, const fs::path& base);

    /**
     * @brief Number of components, counting the root ("/a/b" has 3)
     */
    static size_t componentCount(const fs::path& path);

    /**
     * @brief Measure a regular file or walk a directory tree
     */
    static TreeMeasurement measureTree(const fs::path& path);
};

} // namespace cleanbook::core
