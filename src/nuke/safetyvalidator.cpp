#include "nuke/safetyvalidator.hpp"
#include "audit/logger.hpp"
#include "core/pathutil.hpp"
#include <sys/stat.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>

namespace cleanbook::nuke {

using core::PathUtil;

const char* toString(UnsafeReason reason) {
    switch (reason) {
        case UnsafeReason::NONE:          return "safe";
        case UnsafeReason::UNRESOLVABLE:  return "unresolvable";
        case UnsafeReason::PROTECTED:     return "protected";
        case UnsafeReason::FOREIGN_OWNER: return "foreign_owner";
        case UnsafeReason::TOO_SHALLOW:   return "too_shallow";
        case UnsafeReason::CHECK_FAILED:  return "check_failed";
    }
    return "unknown";
}

std::vector<fs::path> ProtectedPaths::systemDefaults() {
    std::vector<fs::path> paths = {
        // macOS
        "/System", "/Library", "/Applications", "/private", "/Volumes", "/cores",
        // Shared and Linux
        "/usr", "/bin", "/sbin", "/etc", "/dev", "/boot", "/lib", "/lib32", "/lib64",
        "/proc", "/sys", "/run", "/snap", "/var/lib", "/var/log"
    };

    const fs::path home = PathUtil::homeDirectory();
    paths.push_back(home / ".ssh");
    paths.push_back(home / ".gnupg");
    paths.push_back(home / "Library" / "Keychains");
    paths.push_back(home / "Library" / "Application Support" / "CrashReporter");
    return paths;
}

ProtectedPaths::ProtectedPaths(const std::vector<fs::path>& extras, bool includeSystemDefaults) {
    std::vector<fs::path> candidates;
    if (includeSystemDefaults) {
        candidates = systemDefaults();
    }
    candidates.insert(candidates.end(), extras.begin(), extras.end());

    for (const auto& candidate : candidates) {
        std::error_code ec;
        auto resolved = PathUtil::resolve(candidate, ec);
        if (!resolved) {
            continue;
        }
        if (std::find(entries_.begin(), entries_.end(), *resolved) == entries_.end()) {
            entries_.push_back(*resolved);
        }
    }
}

bool ProtectedPaths::covers(const fs::path& resolvedPath) const {
    return std::any_of(entries_.begin(), entries_.end(), [&](const fs::path& entry) {
        // Deleting an ancestor would take the protected entry with it
        return PathUtil::isWithin(resolvedPath, entry) || PathUtil::isWithin(entry, resolvedPath);
    });
}

SafetyValidator::SafetyValidator(ProtectedPaths protectedPaths,
                                 std::shared_ptr<audit::Logger> logger)
    : protected_(std::move(protectedPaths)), logger_(std::move(logger)) {}

SafetyVerdict SafetyValidator::check(const fs::path& path) const {
    SafetyVerdict verdict;
    try {
        verdict = evaluate(path);
    } catch (const std::exception& e) {
        verdict = SafetyVerdict::unsafe(UnsafeReason::CHECK_FAILED,
                                        std::string(e.what()) + " (" + path.string() + ")");
    }

    if (!verdict.isSafe() && logger_) {
        logger_->logError("refusing " + path.string() + ": " + toString(verdict.reason) +
                          " (" + verdict.detail + ")", "safety_check");
    }
    return verdict;
}

SafetyVerdict SafetyValidator::evaluate(const fs::path& path) const {
    std::error_code ec;
    auto resolved = PathUtil::resolve(path, ec);
    if (!resolved) {
        return SafetyVerdict::unsafe(UnsafeReason::UNRESOLVABLE,
                                     "cannot resolve " + path.string() + ": " + ec.message());
    }

    if (protected_.covers(*resolved)) {
        return SafetyVerdict::unsafe(UnsafeReason::PROTECTED,
                                     resolved->string() + " is a protected location");
    }

    const uid_t user = geteuid();

    struct stat st;
    if (stat(resolved->c_str(), &st) == -1) {
        return SafetyVerdict::unsafe(UnsafeReason::UNRESOLVABLE,
                                     "stat failed for " + resolved->string() + ": " +
                                     std::strerror(errno));
    }
    if (st.st_uid != user) {
        return SafetyVerdict::unsafe(UnsafeReason::FOREIGN_OWNER,
                                     resolved->string() + " is owned by uid " +
                                     std::to_string(st.st_uid));
    }

    // The link itself is what gets removed
    const fs::path expanded = PathUtil::expandUser(path);
    struct stat lst;
    if (lstat(expanded.c_str(), &lst) == 0 && S_ISLNK(lst.st_mode) && lst.st_uid != user) {
        return SafetyVerdict::unsafe(UnsafeReason::FOREIGN_OWNER,
                                     expanded.string() + " link is owned by uid " +
                                     std::to_string(lst.st_uid));
    }

    if (PathUtil::componentCount(*resolved) < MIN_PATH_COMPONENTS) {
        return SafetyVerdict::unsafe(UnsafeReason::TOO_SHALLOW,
                                     resolved->string() + " is too close to the filesystem root");
    }

    return SafetyVerdict::safe();
}

} // namespace cleanbook::nuke
