#pragma once

#include "scan/scan_export.hpp"
#include "scan/directorywalker.hpp"
#include "scan/whitelist.hpp"
#include "core/patterncatalog.hpp"
#include "cleanbook/types.hpp"
#include <filesystem>
#include <memory>
#include <vector>

namespace cleanbook::audit {
class Logger;
}

namespace cleanbook::scan {

namespace fs = std::filesystem;

/**
 * @brief Artifacts and errors produced by one scan
 */
struct ScanResult {
    fs::path root;                    // Resolved scan root
    std::vector<Artifact> artifacts;  // Largest first, ties by path
    std::vector<ScanError> errors;
};

struct ScannerOptions {
    bool followSymlinks = false;
    size_t workers = 4;
    int maxDepth = 64;
};

/**
 * @brief Discovers development artifacts below a root directory
 *
 * The root is split into one unit of work per immediate subdirectory plus
 * one unit for the entries directly inside the root. Units run on a
 * bounded worker pool and their results are merged in submission order.
 * A matched directory is recorded as a single artifact and not entered.
 */
class CLEANBOOK_SCAN_EXPORT Scanner {
public:
    /**
     * @brief Constructor
     * @param catalog Patterns to match entry names against
     * @param whitelist Sanctuaries never scanned
     * @param options Traversal and pool settings
     * @param logger Optional logger for discoveries and whitelist skips
     */
    Scanner(core::PatternCatalog catalog,
            Whitelist whitelist,
            ScannerOptions options = {},
            std::shared_ptr<audit::Logger> logger = nullptr);
    ~Scanner();

    /**
     * @brief Scan a directory tree
     * @param root Directory to scan; "~" is expanded
     * @param minSizeMb Artifacts smaller than this are dropped
     * @return Artifacts sorted by size descending, plus any scan errors.
     *         Filesystem failures are reported in the result, never thrown.
     */
    ScanResult scan(const fs::path& root, double minSizeMb = 0.0) const;

    /**
     * @brief Check a path against the scan whitelist (fails closed)
     */
    bool isWhitelisted(const fs::path& path) const;

    const core::PatternCatalog& catalog() const;
    const ScannerOptions& options() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;

    // Prevent copying
    Scanner(const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;
};

} // namespace cleanbook::scan
