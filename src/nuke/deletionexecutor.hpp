#pragma once

#include "nuke/nuke_export.hpp"
#include "nuke/safetyvalidator.hpp"
#include "cleanbook/types.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace cleanbook::nuke {

/**
 * @brief Identity and content summary of a path at one instant
 *
 * Two fingerprints differ if the entry was replaced, grew, shrank, gained
 * or lost entries, or had anything underneath it modified.
 */
struct Fingerprint {
    uint32_t type = 0;            // st_mode & S_IFMT of the path itself
    uint64_t device = 0;
    uint64_t inode = 0;
    uint64_t totalBytes = 0;
    int64_t newestMtimeNs = 0;
    uint64_t entryCount = 0;

    bool operator==(const Fingerprint& other) const;
    bool operator!=(const Fingerprint& other) const { return !(*this == other); }
};

/**
 * @brief Measures, re-checks and removes a single path
 */
class CLEANBOOK_NUKE_EXPORT DeletionExecutor {
public:
    // Runs after the first measurement and before the re-check
    using PreDestroyHook = std::function<void(const fs::path&)>;

    /**
     * @brief Constructor
     * @param validator Re-run immediately before every removal; must outlive the executor
     * @param logger Optional logger for deletions and failures
     */
    explicit DeletionExecutor(const SafetyValidator& validator,
                              std::shared_ptr<audit::Logger> logger = nullptr);

    /**
     * @brief Delete one path
     * @param path File, directory or link; links are removed, not followed
     * @param dryRun Measure and log only
     * @return Result with the freed size on success and size 0 on failure.
     *         Failures are reported in the result, never thrown.
     */
    DeletionResult executeDeletion(const fs::path& path, bool dryRun) const;

    /**
     * @brief Take a fingerprint without following links
     * @param error Set when the path cannot be stat'ed
     * @param missing Set when the path does not exist
     */
    static std::optional<Fingerprint> fingerprint(const fs::path& path, std::string& error,
                                                  bool& missing);

    /**
     * @brief Install a hook called between measuring and removing
     *
     * Not synchronised; set it before deletions start.
     */
    void setPreDestroyHook(PreDestroyHook hook) { hook_ = std::move(hook); }

private:
    const SafetyValidator& validator_;
    std::shared_ptr<audit::Logger> logger_;
    PreDestroyHook hook_;
};

} // namespace cleanbook::nuke
