#include "nuke/deletionexecutor.hpp"
#include "audit/logger.hpp"
#include "core/pathutil.hpp"
#include <sys/stat.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <system_error>

namespace cleanbook::nuke {

namespace {
    double elapsedMs(std::chrono::steady_clock::time_point start) {
        return std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start).count();
    }

    DeletionResult failure(const fs::path& path, DeletionErrorKind kind, std::string message,
                           std::chrono::steady_clock::time_point start) {
        DeletionResult result;
        result.path = path;
        result.success = false;
        result.sizeMb = 0.0;
        result.error = DeletionError{kind, std::move(message)};
        result.durationMs = elapsedMs(start);
        return result;
    }
}

bool Fingerprint::operator==(const Fingerprint& other) const {
    return type == other.type &&
           device == other.device &&
           inode == other.inode &&
           totalBytes == other.totalBytes &&
           newestMtimeNs == other.newestMtimeNs &&
           entryCount == other.entryCount;
}

DeletionExecutor::DeletionExecutor(const SafetyValidator& validator,
                                   std::shared_ptr<audit::Logger> logger)
    : validator_(validator), logger_(std::move(logger)) {}

std::optional<Fingerprint> DeletionExecutor::fingerprint(const fs::path& path,
                                                         std::string& error, bool& missing) {
    missing = false;
    struct stat st;
    if (lstat(path.c_str(), &st) == -1) {
        missing = (errno == ENOENT || errno == ENOTDIR);
        error = std::string("lstat failed: ") + std::strerror(errno);
        return std::nullopt;
    }

    auto measurement = core::PathUtil::measureTree(path);

    Fingerprint fp;
    fp.type = static_cast<uint32_t>(st.st_mode & S_IFMT);
    fp.device = static_cast<uint64_t>(st.st_dev);
    fp.inode = static_cast<uint64_t>(st.st_ino);
    fp.totalBytes = measurement.totalBytes;
    fp.newestMtimeNs = measurement.newestMtimeNs;
    fp.entryCount = measurement.entryCount;
    return fp;
}

DeletionResult DeletionExecutor::executeDeletion(const fs::path& path, bool dryRun) const {
    const auto start = std::chrono::steady_clock::now();

    try {
        std::string error;
        bool missing = false;
        auto before = fingerprint(path, error, missing);
        if (!before) {
            auto kind = missing ? DeletionErrorKind::NOT_FOUND : DeletionErrorKind::IO_ERROR;
            if (logger_) logger_->logError(error + " (" + path.string() + ")", "deletion");
            return failure(path, kind, error, start);
        }

        const double sizeMb = static_cast<double>(before->totalBytes) / BYTES_PER_MB;

        if (dryRun) {
            if (logger_) logger_->logDeletion(path, sizeMb, true);
            DeletionResult result;
            result.path = path;
            result.success = true;
            result.sizeMb = sizeMb;
            result.durationMs = elapsedMs(start);
            return result;
        }

        if (hook_) {
            hook_(path);
        }

        auto after = fingerprint(path, error, missing);
        if (!after || *after != *before) {
            std::string message = "modified during deletion";
            if (!after) {
                message += ": " + error;
            }
            if (logger_) logger_->logError(message + " (" + path.string() + ")", "deletion");
            return failure(path, DeletionErrorKind::MODIFIED_DURING_DELETION, message, start);
        }

        auto verdict = validator_.check(path);
        if (!verdict.isSafe()) {
            return failure(path, DeletionErrorKind::UNSAFE_PATH, verdict.detail, start);
        }

        std::error_code ec;
        if (after->type == S_IFDIR) {
            fs::remove_all(path, ec);
        } else {
            fs::remove(path, ec);
        }
        if (ec) {
            std::string message = "removal failed: " + ec.message();
            if (logger_) logger_->logError(message + " (" + path.string() + ")", "deletion");
            return failure(path, DeletionErrorKind::IO_ERROR, message, start);
        }

        if (logger_) logger_->logDeletion(path, sizeMb, false);

        DeletionResult result;
        result.path = path;
        result.success = true;
        result.sizeMb = sizeMb;
        result.durationMs = elapsedMs(start);
        return result;
    } catch (const std::exception& e) {
        if (logger_) logger_->logError(std::string(e.what()) + " (" + path.string() + ")",
                                       "deletion");
        return failure(path, DeletionErrorKind::IO_ERROR, e.what(), start);
    }
}

} // namespace cleanbook::nuke
