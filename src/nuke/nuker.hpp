#pragma once

#include "nuke/nuke_export.hpp"
#include "nuke/deletionexecutor.hpp"
#include "nuke/safetyvalidator.hpp"
#include "cleanbook/types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace cleanbook::nuke {

// SAFE mode asks before deleting anything larger than this
constexpr double SAFE_MODE_CONFIRM_MB = 100.0;
// SAFE mode asks before deleting anything with fewer resolved components
constexpr size_t SAFE_MODE_CONFIRM_COMPONENTS = 6;

struct NukerOptions {
    size_t parallelOperations = 2;  // FORCE-mode pool size
    fs::path manifestDir;           // Undo manifests; home directory if empty
};

/**
 * @brief Totals for one deletion batch
 */
struct CLEANBOOK_NUKE_EXPORT DestructionMetrics {
    size_t totalOperations = 0;
    size_t successfulDeletions = 0;
    size_t failedDeletions = 0;
    double totalFreedMb = 0.0;
    double totalFreedGb = 0.0;
    double averageDurationMs = 0.0;   // Over successful deletions
    std::vector<std::pair<fs::path, std::string>> errors;

    nlohmann::json toJson() const;
};

/**
 * @brief Compute metrics for a list of results
 */
CLEANBOOK_NUKE_EXPORT DestructionMetrics summarize(const std::vector<DeletionResult>& results);

/**
 * @brief Runs validated deletions over a batch of artifacts
 *
 * Every artifact is checked by the safety validator before anything else;
 * rejected artifacts are logged and never attempted. The last batch's
 * results are kept for getDestructionMetrics() and createUndoManifest().
 */
class CLEANBOOK_NUKE_EXPORT Nuker {
public:
    /**
     * @brief Constructor
     * @param protectedPaths Locations never deleted
     * @param options Pool size and manifest location
     * @param logger Optional logger shared with the executor and validator
     */
    explicit Nuker(ProtectedPaths protectedPaths,
                   NukerOptions options = {},
                   std::shared_ptr<audit::Logger> logger = nullptr);
    ~Nuker();

    /**
     * @brief Delete a batch of artifacts
     * @param artifacts Usually the output of a scan
     * @param mode How to proceed
     * @param confirm Asked per artifact in INTERACTIVE mode and for large or
     *        shallow artifacts in SAFE mode; a missing callback means "no"
     * @return One result per attempted artifact; skipped artifacts have none.
     *         FORCE results keep input order.
     */
    std::vector<DeletionResult> deleteArtifacts(const std::vector<Artifact>& artifacts,
                                                DeletionMode mode,
                                                const ConfirmationCallback& confirm = nullptr);

    SafetyVerdict checkSafety(const fs::path& path) const;
    bool isSafeToDelete(const fs::path& path) const;

    /**
     * @brief Delete a single path without the batch filtering
     *
     * No confirmation is asked, so the result is labelled FORCE, or
     * DRY_RUN when @p dryRun is set.
     */
    DeletionResult executeDeletion(const fs::path& path, bool dryRun) const;

    /**
     * @brief Metrics for the most recent batch
     */
    DestructionMetrics getDestructionMetrics() const;

    /**
     * @brief Write a JSON record of the most recent batch
     * @return Path written, or std::nullopt if the manifest could not be written
     */
    std::optional<fs::path> createUndoManifest() const;

    std::vector<DeletionResult> lastResults() const;

    void setPreDestroyHook(DeletionExecutor::PreDestroyHook hook);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;

    // Prevent copying
    Nuker(const Nuker&) = delete;
    Nuker& operator=(const Nuker&) = delete;
};

} // namespace cleanbook::nuke
