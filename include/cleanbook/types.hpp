#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace cleanbook {

namespace fs = std::filesystem;

constexpr double BYTES_PER_MB = 1024.0 * 1024.0;

/**
 * @brief A discovered filesystem entry believed to be reclaimable
 */
struct Artifact {
    fs::path path;              // Absolute path at discovery
    uint64_t sizeBytes = 0;     // Recursive regular-file total for directories
    std::string category;       // "<category>.<subcategory>"
    std::string pattern;        // Glob that matched the name
    int depth = 0;              // Distance from the scan root
    uint64_t inode = 0;         // Advisory only

    double sizeMb() const { return static_cast<double>(sizeBytes) / BYTES_PER_MB; }

    /**
     * @brief Short identifier derived from the path
     * @return First 8 hex characters of SHA-256(path)
     */
    std::string identityHash() const;
};

/**
 * @brief Operating modes for a deletion batch
 */
enum class DeletionMode {
    DRY_RUN,      // Measure only, no mutation
    INTERACTIVE,  // Confirm every artifact
    FORCE,        // Parallel, no confirmation
    SAFE          // Confirm large or shallow artifacts
};

const char* toString(DeletionMode mode);

/**
 * @brief Why a single deletion failed
 */
enum class DeletionErrorKind {
    MODIFIED_DURING_DELETION,  // Fingerprint changed between measure and delete
    UNSAFE_PATH,               // Safety validator rejected the path at delete time
    NOT_FOUND,                 // Path vanished before it could be measured
    IO_ERROR                   // Any other filesystem failure
};

const char* toString(DeletionErrorKind kind);

struct DeletionError {
    DeletionErrorKind kind = DeletionErrorKind::IO_ERROR;
    std::string message;
};

/**
 * @brief Outcome of one deletion attempt
 */
struct DeletionResult {
    fs::path path;
    bool success = false;
    double sizeMb = 0.0;                 // Freed (or would-be freed) size, 0 on failure
    std::optional<DeletionError> error;
    double durationMs = 0.0;
    DeletionMode mode = DeletionMode::SAFE;
};

/**
 * @brief Asked before deleting an artifact that needs confirmation
 */
using ConfirmationCallback = std::function<bool(const Artifact&)>;

} // namespace cleanbook
