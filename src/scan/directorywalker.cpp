#include "scan/directorywalker.hpp"
#include "audit/logger.hpp"
#include <sys/stat.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <set>
#include <utility>

namespace cleanbook::scan {

namespace {
    using DirectoryKey = std::pair<uint64_t, uint64_t>;

    bool directoryKey(const fs::path& path, DirectoryKey& key) {
        struct stat st;
        if (stat(path.c_str(), &st) == -1) {
            return false;
        }
        key = {static_cast<uint64_t>(st.st_dev), static_cast<uint64_t>(st.st_ino)};
        return true;
    }

    struct PendingDirectory {
        fs::path path;
        int depth;
    };
}

DirectoryWalker::DirectoryWalker(const Whitelist& whitelist, WalkOptions options,
                                 audit::Logger* logger)
    : whitelist_(whitelist), options_(options), logger_(logger) {}

bool DirectoryWalker::describe(const fs::path& path, int depth, WalkEntry& entry,
                               std::string& error) const {
    struct stat lst;
    if (lstat(path.c_str(), &lst) == -1) {
        error = std::string("lstat failed: ") + std::strerror(errno);
        return false;
    }

    entry.path = path;
    entry.name = path.filename().string();
    entry.depth = depth;
    entry.inode = static_cast<uint64_t>(lst.st_ino);
    entry.isSymlink = S_ISLNK(lst.st_mode);
    entry.isDirectory = S_ISDIR(lst.st_mode);

    if (entry.isSymlink && options_.followSymlinks) {
        struct stat st;
        // A dangling link is reported as a non-directory leaf
        entry.isDirectory = stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
    }
    return true;
}

void DirectoryWalker::walk(const fs::path& start, int startDepth, const Visitor& visitor,
                           std::vector<ScanError>& errors) const {
    std::set<DirectoryKey> visited;
    DirectoryKey startKey;
    if (directoryKey(start, startKey)) {
        visited.insert(startKey);
    }

    std::vector<PendingDirectory> pending{{start, startDepth}};
    while (!pending.empty()) {
        PendingDirectory current = std::move(pending.back());
        pending.pop_back();

        if (whitelist_.isWhitelisted(current.path)) {
            if (logger_) logger_->logWhitelistSkip(current.path);
            continue;
        }

        std::error_code ec;
        fs::directory_iterator it(current.path, ec);
        if (ec) {
            errors.push_back({current.path, ec.message()});
            continue;
        }

        std::vector<fs::path> children;
        for (; it != fs::directory_iterator(); it.increment(ec)) {
            children.push_back(it->path());
        }
        if (ec) {
            errors.push_back({current.path, ec.message()});
        }
        std::sort(children.begin(), children.end());

        std::vector<PendingDirectory> subdirectories;
        for (const auto& child : children) {
            WalkEntry entry;
            std::string error;
            if (!describe(child, current.depth, entry, error)) {
                errors.push_back({child, error});
                continue;
            }
            if (entry.isSymlink && !options_.followSymlinks) {
                continue;
            }

            if (visitor(entry) != WalkAction::DESCEND || !entry.isDirectory) {
                continue;
            }

            const int nextDepth = current.depth + 1;
            if (nextDepth > options_.maxDepth) {
                errors.push_back({child, "maximum scan depth exceeded"});
                continue;
            }

            DirectoryKey key;
            if (!directoryKey(child, key)) {
                errors.push_back({child, std::string("stat failed: ") + std::strerror(errno)});
                continue;
            }
            if (!visited.insert(key).second) {
                // Already entered through another link
                continue;
            }
            subdirectories.push_back({child, nextDepth});
        }

        // Reverse so that siblings are popped in name order
        for (auto rit = subdirectories.rbegin(); rit != subdirectories.rend(); ++rit) {
            pending.push_back(std::move(*rit));
        }
    }
}

} // namespace cleanbook::scan
