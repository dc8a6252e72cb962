#pragma once

#include "scan/scan_export.hpp"
#include "scan/whitelist.hpp"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace cleanbook::audit {
class Logger;
}

namespace cleanbook::scan {

namespace fs = std::filesystem;

/**
 * @brief A directory that could not be listed or an entry that could not be measured
 */
struct ScanError {
    fs::path path;
    std::string message;
};

/**
 * @brief One directory entry handed to the visitor
 */
struct WalkEntry {
    fs::path path;
    std::string name;
    int depth = 0;            // Depth of the directory containing the entry
    bool isDirectory = false; // After following the link when symlinks are followed
    bool isSymlink = false;
    uint64_t inode = 0;       // From lstat
};

enum class WalkAction {
    DESCEND,  // Recurse if the entry is a directory
    SKIP      // Treat the entry as a leaf
};

struct WalkOptions {
    bool followSymlinks = false;
    int maxDepth = 64;
};

/**
 * @brief Worklist-based directory traversal
 *
 * Whitelisted directories are never listed. Symbolic links are skipped unless
 * followSymlinks is set; when they are followed, directories already visited
 * in this walk (by device and inode) are not entered again, and no directory
 * deeper than maxDepth is listed.
 */
class CLEANBOOK_SCAN_EXPORT DirectoryWalker {
public:
    using Visitor = std::function<WalkAction(const WalkEntry&)>;

    DirectoryWalker(const Whitelist& whitelist, WalkOptions options,
                    audit::Logger* logger = nullptr);

    /**
     * @brief Walk the tree below start
     * @param start Directory to list first
     * @param startDepth Depth assigned to entries of start
     * @param visitor Called once per entry
     * @param errors Receives listing failures; the walk always continues
     */
    void walk(const fs::path& start, int startDepth, const Visitor& visitor,
              std::vector<ScanError>& errors) const;

    /**
     * @brief Describe a single entry without following a link unless allowed
     * @return false if the entry could not be stat'ed
     */
    bool describe(const fs::path& path, int depth, WalkEntry& entry,
                  std::string& error) const;

private:
    const Whitelist& whitelist_;
    WalkOptions options_;
    audit::Logger* logger_;
};

} // namespace cleanbook::scan
