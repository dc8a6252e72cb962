#pragma once

#include "audit/logger.hpp"
#include <algorithm>
#include <mutex>
#include <string>
#include <vector>

namespace cleanbook::testing {

namespace fs = std::filesystem;

/**
 * @brief Logger double that keeps every call for inspection
 */
class RecordingLogger : public audit::Logger {
public:
    struct ErrorCall {
        std::string error;
        std::string context;
    };

    struct DeletionCall {
        fs::path path;
        double sizeMb;
        bool dryRun;
    };

    void logError(const std::string& error, const std::string& context) override {
        std::lock_guard<std::mutex> lock(mutex_);
        errors_.push_back({error, context});
    }

    void logDeletion(const fs::path& path, double sizeMb, bool dryRun) override {
        std::lock_guard<std::mutex> lock(mutex_);
        deletions_.push_back({path, sizeMb, dryRun});
    }

    void logScanStart(const fs::path& target, const core::PatternCatalog&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        scanStarts_.push_back(target);
    }

    void logArtifactFound(const fs::path& path, double, const std::string&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        found_.push_back(path);
    }

    void logWhitelistSkip(const fs::path& path) override {
        std::lock_guard<std::mutex> lock(mutex_);
        whitelistSkips_.push_back(path);
    }

    std::vector<ErrorCall> errors() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return errors_;
    }

    std::vector<DeletionCall> deletions() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return deletions_;
    }

    std::vector<fs::path> found() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return found_;
    }

    std::vector<fs::path> whitelistSkips() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return whitelistSkips_;
    }

    size_t countErrorsContaining(const std::string& needle) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<size_t>(std::count_if(errors_.begin(), errors_.end(),
            [&](const ErrorCall& call) {
                return call.error.find(needle) != std::string::npos;
            }));
    }

private:
    mutable std::mutex mutex_;
    std::vector<ErrorCall> errors_;
    std::vector<DeletionCall> deletions_;
    std::vector<fs::path> scanStarts_;
    std::vector<fs::path> found_;
    std::vector<fs::path> whitelistSkips_;
};

} // namespace cleanbook::testing
