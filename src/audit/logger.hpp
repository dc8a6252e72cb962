#pragma once

#include <filesystem>
#include <string>

namespace cleanbook::core {
class PatternCatalog;
}

namespace cleanbook::audit {

namespace fs = std::filesystem;

/**
 * @brief Narrow logging surface used by the scanner and the nuker
 *
 * Implementations must be safe to call from several worker threads.
 */
class Logger {
public:
    virtual ~Logger() = default;

    virtual void logError(const std::string& error, const std::string& context) = 0;
    virtual void logDeletion(const fs::path& path, double sizeMb, bool dryRun) = 0;
    virtual void logScanStart(const fs::path& target, const core::PatternCatalog& catalog) = 0;

    virtual void logArtifactFound(const fs::path& /*path*/, double /*sizeMb*/,
                                  const std::string& /*category*/) {}
    virtual void logWhitelistSkip(const fs::path& /*path*/) {}
};

} // namespace cleanbook::audit
