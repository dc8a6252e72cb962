#pragma once

#include "nuke/nuke_export.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace cleanbook::audit {
class Logger;
}

namespace cleanbook::nuke {

namespace fs = std::filesystem;

// Resolved paths with fewer components are never deleted ("/" has 1)
constexpr size_t MIN_PATH_COMPONENTS = 4;

/**
 * @brief Why a path was refused
 */
enum class UnsafeReason {
    NONE,
    UNRESOLVABLE,     // Path does not exist or cannot be canonicalised
    PROTECTED,        // Equal to or under a protected path
    FOREIGN_OWNER,    // Not owned by the effective user
    TOO_SHALLOW,      // Fewer than MIN_PATH_COMPONENTS components
    CHECK_FAILED      // The check itself raised an error
};

const char* toString(UnsafeReason reason);

/**
 * @brief Outcome of a safety check: Safe, or Unsafe with a reason
 */
struct SafetyVerdict {
    UnsafeReason reason = UnsafeReason::NONE;
    std::string detail;

    bool isSafe() const { return reason == UnsafeReason::NONE; }

    static SafetyVerdict safe() { return {}; }
    static SafetyVerdict unsafe(UnsafeReason reason, std::string detail) {
        return {reason, std::move(detail)};
    }
};

/**
 * @brief Directory subtrees that must never be deleted
 *
 * Built-in system locations for Linux and macOS plus configured extras.
 * Entries are expanded and resolved once; entries that do not exist are
 * dropped.
 */
class CLEANBOOK_NUKE_EXPORT ProtectedPaths {
public:
    /**
     * @brief Constructor
     * @param extras Additional protected locations ("~" is expanded)
     * @param includeSystemDefaults Add systemDefaults() to the set
     */
    explicit ProtectedPaths(const std::vector<fs::path>& extras = {},
                            bool includeSystemDefaults = true);

    /**
     * @brief Candidate system locations before resolution
     */
    static std::vector<fs::path> systemDefaults();

    /**
     * @brief True if a resolved path equals, lies under, or contains a protected entry
     */
    bool covers(const fs::path& resolvedPath) const;

    const std::vector<fs::path>& entries() const { return entries_; }

private:
    std::vector<fs::path> entries_;
};

/**
 * @brief Decides whether a path may be deleted
 *
 * Checks run in order and stop at the first failure: resolution, protected
 * paths, ownership, then minimum depth. Symbolic links are checked both as
 * links and through their target.
 */
class CLEANBOOK_NUKE_EXPORT SafetyValidator {
public:
    explicit SafetyValidator(ProtectedPaths protectedPaths,
                             std::shared_ptr<audit::Logger> logger = nullptr);

    /**
     * @brief Evaluate a path
     * @return Safe, or Unsafe with the first failed check. Never throws.
     *
     * Every Unsafe verdict is logged with context "safety_check".
     */
    SafetyVerdict check(const fs::path& path) const;

    bool isSafeToDelete(const fs::path& path) const {
        return check(path).isSafe();
    }

    const ProtectedPaths& protectedPaths() const { return protected_; }

private:
    SafetyVerdict evaluate(const fs::path& path) const;

    ProtectedPaths protected_;
    std::shared_ptr<audit::Logger> logger_;
};

} // namespace cleanbook::nuke
