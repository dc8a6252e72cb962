#pragma once

#include "core/core_export.hpp"
#include "core/errors.hpp"
#include "cleanbook/types.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cleanbook::config {

namespace fs = std::filesystem;

using core::ConfigError;

/**
 * @brief Runtime settings for a cleanup session
 */
struct CLEANBOOK_CORE_EXPORT Config {
    std::vector<fs::path> whitelistPaths;     // Scan sanctuaries
    std::vector<fs::path> protectedPaths;     // Extra deletion sanctuaries
    bool safeMode = true;
    bool followSymlinks = false;
    size_t maxWorkers = 4;                    // Scan pool size
    size_t parallelOperations = 2;            // FORCE-mode deletion pool size
    int maxScanDepth = 64;                    // At most INT_MAX
    std::string minimumFileSize = "1MB";
    fs::path targetPath;                      // Defaults to the home directory
    fs::path logPath;
    std::string logLevel = "INFO";
    fs::path auditDbPath;                     // Empty disables the persistent store
    fs::path reportDir = "logs";
    fs::path manifestDir;                     // Defaults to the home directory

    /**
     * @brief Defaults with home-relative paths filled in
     */
    static Config defaults();

    /**
     * @brief Load settings from a JSON file, keeping defaults for absent keys
     * @throws ConfigError if the file cannot be read or has the wrong shape
     */
    static Config loadFromFile(const fs::path& path);

    /**
     * @brief Parse settings from JSON text
     * @throws ConfigError on malformed input
     */
    static Config parse(const std::string& jsonText);

    /**
     * @brief Deletion mode used when the caller names none
     * @return SAFE while safe_mode is on; std::nullopt when it is off, in
     *         which case the mode must be chosen explicitly
     */
    std::optional<DeletionMode> defaultDeletionMode() const;
};

} // namespace cleanbook::config
