#include "nuke/nuker.hpp"
#include "audit/logger.hpp"
#include "core/pathutil.hpp"
#include "core/workerpool.hpp"
#include <chrono>
#include <ctime>
#include <fstream>
#include <future>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace cleanbook::nuke {

using core::PathUtil;

nlohmann::json DestructionMetrics::toJson() const {
    nlohmann::json j = {
        {"total_operations", totalOperations},
        {"successful_deletions", successfulDeletions},
        {"failed_deletions", failedDeletions},
        {"total_freed_mb", totalFreedMb},
        {"total_freed_gb", totalFreedGb},
        {"average_duration_ms", averageDurationMs},
        {"errors", nlohmann::json::array()}
    };
    for (const auto& [path, error] : errors) {
        j["errors"].push_back({{"path", path.string()}, {"error", error}});
    }
    return j;
}

DestructionMetrics summarize(const std::vector<DeletionResult>& results) {
    DestructionMetrics metrics;
    metrics.totalOperations = results.size();

    double totalDurationMs = 0.0;
    for (const auto& result : results) {
        if (result.success) {
            metrics.successfulDeletions++;
            metrics.totalFreedMb += result.sizeMb;
            totalDurationMs += result.durationMs;
        } else {
            metrics.failedDeletions++;
            metrics.errors.emplace_back(result.path,
                                        result.error ? result.error->message : "unknown error");
        }
    }

    metrics.totalFreedGb = metrics.totalFreedMb / 1024.0;
    if (metrics.successfulDeletions > 0) {
        metrics.averageDurationMs = totalDurationMs / metrics.successfulDeletions;
    }
    return metrics;
}

class Nuker::Impl {
public:
    Impl(ProtectedPaths protectedPaths, NukerOptions options,
         std::shared_ptr<audit::Logger> logger)
        : options_(std::move(options))
        , logger_(std::move(logger))
        , validator_(std::move(protectedPaths), logger_)
        , executor_(validator_, logger_) {
    }

    std::vector<DeletionResult> deleteArtifacts(const std::vector<Artifact>& artifacts,
                                                DeletionMode mode,
                                                const ConfirmationCallback& confirm) {
        std::vector<const Artifact*> safe;
        for (const auto& artifact : artifacts) {
            if (!validator_.check(artifact.path).isSafe()) {
                continue;
            }
            safe.push_back(&artifact);
        }

        std::vector<DeletionResult> results;
        switch (mode) {
            case DeletionMode::DRY_RUN:
                for (const auto* artifact : safe) {
                    results.push_back(run(*artifact, mode));
                }
                break;

            case DeletionMode::INTERACTIVE:
                for (const auto* artifact : safe) {
                    if (!confirm) {
                        logError("no confirmation callback for " + artifact->path.string(),
                                 "interactive");
                        continue;
                    }
                    if (ask(confirm, *artifact)) {
                        results.push_back(run(*artifact, mode));
                    }
                }
                break;

            case DeletionMode::FORCE:
                results = runParallel(safe);
                break;

            case DeletionMode::SAFE:
                for (const auto* artifact : safe) {
                    if (needsConfirmation(*artifact)) {
                        if (!confirm) {
                            logError("confirmation required for " + artifact->path.string(),
                                     "safe_mode");
                            continue;
                        }
                        if (!ask(confirm, *artifact)) {
                            continue;
                        }
                    }
                    results.push_back(run(*artifact, mode));
                }
                break;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            lastResults_ = results;
        }
        return results;
    }

    DestructionMetrics metrics() const {
        return summarize(lastResults());
    }

    std::optional<fs::path> createUndoManifest() const {
        try {
            return writeManifest(lastResults());
        } catch (const std::exception& e) {
            logError(e.what(), "undo_manifest");
            return std::nullopt;
        }
    }

    std::optional<fs::path> writeManifest(const std::vector<DeletionResult>& results) const {

        const auto now = std::chrono::system_clock::now();
        const auto epoch = std::chrono::duration_cast<std::chrono::seconds>(
            now.time_since_epoch()).count();

        nlohmann::json manifest;
        manifest["timestamp"] = isoTimestamp(now);
        manifest["deletions"] = nlohmann::json::array();
        for (const auto& result : results) {
            nlohmann::json entry = {
                {"path", result.path.string()},
                {"size_mb", result.sizeMb},
                {"success", result.success},
                {"mode", toString(result.mode)}
            };
            if (result.error) {
                entry["error"] = result.error->message;
                entry["error_kind"] = toString(result.error->kind);
            }
            manifest["deletions"].push_back(std::move(entry));
        }

        fs::path dir = options_.manifestDir.empty()
            ? PathUtil::homeDirectory()
            : PathUtil::expandUser(options_.manifestDir);
        fs::path path = dir / (".cleanbook_undo_" + std::to_string(epoch) + ".json");

        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            logError("cannot create manifest directory " + dir.string() + ": " + ec.message(),
                     "undo_manifest");
            return std::nullopt;
        }

        std::ofstream file(path, std::ios::out | std::ios::trunc);
        if (!file) {
            logError("cannot open " + path.string(), "undo_manifest");
            return std::nullopt;
        }
        file << manifest.dump(2);
        file.close();
        if (!file) {
            logError("cannot write " + path.string(), "undo_manifest");
            return std::nullopt;
        }

        fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write,
                        fs::perm_options::replace, ec);
        return path;
    }

    std::vector<DeletionResult> lastResults() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lastResults_;
    }

    const SafetyValidator& validator() const { return validator_; }
    DeletionExecutor& executor() { return executor_; }
    const DeletionExecutor& executor() const { return executor_; }

private:
    NukerOptions options_;
    std::shared_ptr<audit::Logger> logger_;
    SafetyValidator validator_;
    DeletionExecutor executor_;
    std::vector<DeletionResult> lastResults_;
    mutable std::mutex mutex_;

    DeletionResult run(const Artifact& artifact, DeletionMode mode) const {
        auto result = executor_.executeDeletion(artifact.path, mode == DeletionMode::DRY_RUN);
        result.mode = mode;
        return result;
    }

    std::vector<DeletionResult> runParallel(const std::vector<const Artifact*>& artifacts) const {
        std::vector<std::future<DeletionResult>> futures;
        futures.reserve(artifacts.size());
        {
            core::WorkerPool pool(options_.parallelOperations);
            for (const auto* artifact : artifacts) {
                futures.push_back(pool.submit([this, artifact] {
                    return run(*artifact, DeletionMode::FORCE);
                }));
            }
        }

        std::vector<DeletionResult> results;
        results.reserve(futures.size());
        for (size_t i = 0; i < futures.size(); ++i) {
            try {
                results.push_back(futures[i].get());
            } catch (const std::exception& e) {
                DeletionResult failed;
                failed.path = artifacts[i]->path;
                failed.error = DeletionError{DeletionErrorKind::IO_ERROR, e.what()};
                failed.mode = DeletionMode::FORCE;
                logError(std::string(e.what()) + " (" + failed.path.string() + ")", "deletion");
                results.push_back(std::move(failed));
            }
        }
        return results;
    }

    bool needsConfirmation(const Artifact& artifact) const {
        if (artifact.sizeMb() > SAFE_MODE_CONFIRM_MB) {
            return true;
        }
        std::error_code ec;
        auto resolved = PathUtil::resolve(artifact.path, ec);
        const fs::path& path = resolved ? *resolved : artifact.path;
        return PathUtil::componentCount(path) < SAFE_MODE_CONFIRM_COMPONENTS;
    }

    // A callback that throws counts as a refusal
    bool ask(const ConfirmationCallback& confirm, const Artifact& artifact) const {
        try {
            return confirm(artifact);
        } catch (const std::exception& e) {
            logError(std::string("confirmation failed: ") + e.what(), "confirmation");
            return false;
        }
    }

    void logError(const std::string& message, const std::string& context) const {
        if (logger_) {
            logger_->logError(message, context);
        }
    }

    static std::string isoTimestamp(std::chrono::system_clock::time_point when) {
        std::time_t t = std::chrono::system_clock::to_time_t(when);
        std::tm tm{};
        localtime_r(&t, &tm);
        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
        return ss.str();
    }
};

Nuker::Nuker(ProtectedPaths protectedPaths, NukerOptions options,
             std::shared_ptr<audit::Logger> logger)
    : impl_(std::make_unique<Impl>(std::move(protectedPaths), std::move(options),
                                   std::move(logger))) {}

Nuker::~Nuker() = default;

std::vector<DeletionResult> Nuker::deleteArtifacts(const std::vector<Artifact>& artifacts,
                                                   DeletionMode mode,
                                                   const ConfirmationCallback& confirm) {
    return impl_->deleteArtifacts(artifacts, mode, confirm);
}

SafetyVerdict Nuker::checkSafety(const fs::path& path) const {
    return impl_->validator().check(path);
}

bool Nuker::isSafeToDelete(const fs::path& path) const {
    return impl_->validator().isSafeToDelete(path);
}

DeletionResult Nuker::executeDeletion(const fs::path& path, bool dryRun) const {
    auto result = impl_->executor().executeDeletion(path, dryRun);
    result.mode = dryRun ? DeletionMode::DRY_RUN : DeletionMode::FORCE;
    return result;
}

DestructionMetrics Nuker::getDestructionMetrics() const {
    return impl_->metrics();
}

std::optional<fs::path> Nuker::createUndoManifest() const {
    return impl_->createUndoManifest();
}

std::vector<DeletionResult> Nuker::lastResults() const {
    return impl_->lastResults();
}

void Nuker::setPreDestroyHook(DeletionExecutor::PreDestroyHook hook) {
    impl_->executor().setPreDestroyHook(std::move(hook));
}

} // namespace cleanbook::nuke
