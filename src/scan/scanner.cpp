#include "scan/scanner.hpp"
#include "audit/logger.hpp"
#include "core/pathutil.hpp"
#include "core/workerpool.hpp"
#include <algorithm>
#include <future>

namespace cleanbook::scan {

using core::PathUtil;

namespace {
    // Output of one unit of work
    struct UnitResult {
        std::vector<Artifact> artifacts;
        std::vector<ScanError> errors;
    };
}

class Scanner::Impl {
public:
    Impl(core::PatternCatalog catalog, Whitelist whitelist, ScannerOptions options,
         std::shared_ptr<audit::Logger> logger)
        : catalog_(std::move(catalog))
        , whitelist_(std::move(whitelist))
        , options_(options)
        , logger_(std::move(logger))
        , walker_(whitelist_, WalkOptions{options.followSymlinks, options.maxDepth},
                  logger_.get()) {
    }

    ScanResult scan(const fs::path& root, double minSizeMb) const {
        ScanResult result;

        std::error_code ec;
        auto resolved = PathUtil::resolve(root, ec);
        if (!resolved) {
            result.root = PathUtil::expandUser(root);
            result.errors.push_back({result.root, "cannot resolve scan root: " + ec.message()});
            return result;
        }
        result.root = *resolved;

        if (whitelist_.isWhitelisted(result.root)) {
            if (logger_) logger_->logWhitelistSkip(result.root);
            return result;
        }

        std::vector<WalkEntry> rootMatches;
        std::vector<WalkEntry> subdirectories;
        partitionRoot(result.root, rootMatches, subdirectories, result.errors);

        std::vector<std::future<UnitResult>> futures;
        {
            core::WorkerPool pool(options_.workers);

            futures.push_back(pool.submit([this, matches = std::move(rootMatches)] {
                UnitResult unit;
                for (const auto& entry : matches) {
                    record(entry, unit);
                }
                return unit;
            }));

            for (const auto& dir : subdirectories) {
                futures.push_back(pool.submit([this, dir] {
                    return scanUnit(dir.path, dir.depth + 1);
                }));
            }
        }

        for (auto& future : futures) {
            try {
                UnitResult unit = future.get();
                for (auto& artifact : unit.artifacts) {
                    if (artifact.sizeMb() >= minSizeMb) {
                        result.artifacts.push_back(std::move(artifact));
                    }
                }
                result.errors.insert(result.errors.end(),
                                     std::make_move_iterator(unit.errors.begin()),
                                     std::make_move_iterator(unit.errors.end()));
            } catch (const std::exception& e) {
                result.errors.push_back({result.root, std::string("scan unit failed: ") + e.what()});
            }
        }

        std::sort(result.artifacts.begin(), result.artifacts.end(),
                  [](const Artifact& a, const Artifact& b) {
                      if (a.sizeBytes != b.sizeBytes) return a.sizeBytes > b.sizeBytes;
                      return a.path < b.path;
                  });

        if (logger_) {
            for (const auto& artifact : result.artifacts) {
                logger_->logArtifactFound(artifact.path, artifact.sizeMb(), artifact.category);
            }
        }
        return result;
    }

    bool isWhitelisted(const fs::path& path) const {
        return whitelist_.isWhitelisted(path);
    }

    const core::PatternCatalog& catalog() const { return catalog_; }
    const ScannerOptions& options() const { return options_; }

private:
    core::PatternCatalog catalog_;
    Whitelist whitelist_;
    ScannerOptions options_;
    std::shared_ptr<audit::Logger> logger_;
    DirectoryWalker walker_;

    // Split root entries into matches recorded at depth 0 and directories
    // that become their own units
    void partitionRoot(const fs::path& root, std::vector<WalkEntry>& matches,
                       std::vector<WalkEntry>& subdirectories,
                       std::vector<ScanError>& errors) const {
        std::error_code ec;
        fs::directory_iterator it(root, ec);
        if (ec) {
            errors.push_back({root, ec.message()});
            return;
        }

        std::vector<fs::path> children;
        for (; it != fs::directory_iterator(); it.increment(ec)) {
            children.push_back(it->path());
        }
        if (ec) {
            errors.push_back({root, ec.message()});
        }
        std::sort(children.begin(), children.end());

        for (const auto& child : children) {
            WalkEntry entry;
            std::string error;
            if (!walker_.describe(child, 0, entry, error)) {
                errors.push_back({child, error});
                continue;
            }
            if (entry.isSymlink && !options_.followSymlinks) {
                continue;
            }

            if (catalog_.match(entry.name)) {
                matches.push_back(std::move(entry));
            } else if (entry.isDirectory) {
                if (whitelist_.isWhitelisted(entry.path)) {
                    if (logger_) logger_->logWhitelistSkip(entry.path);
                    continue;
                }
                subdirectories.push_back(std::move(entry));
            }
        }
    }

    UnitResult scanUnit(const fs::path& dir, int depth) const {
        UnitResult unit;
        walker_.walk(dir, depth, [this, &unit](const WalkEntry& entry) {
            return record(entry, unit) ? WalkAction::SKIP : WalkAction::DESCEND;
        }, unit.errors);
        return unit;
    }

    // Returns true if the entry matched, whether recorded or skipped as a
    // sanctuary; the walker does not descend into it either way
    bool record(const WalkEntry& entry, UnitResult& unit) const {
        auto match = catalog_.match(entry.name);
        if (!match) {
            return false;
        }
        if (whitelist_.isWhitelisted(entry.path)) {
            if (logger_) logger_->logWhitelistSkip(entry.path);
            return true;
        }

        auto measurement = PathUtil::measureTree(entry.path);
        for (auto& error : measurement.errors) {
            unit.errors.push_back({std::move(error.path), std::move(error.message)});
        }

        Artifact artifact;
        artifact.path = entry.path;
        artifact.sizeBytes = measurement.totalBytes;
        artifact.category = match->qualifiedCategory();
        artifact.pattern = match->pattern;
        artifact.depth = entry.depth;
        artifact.inode = entry.inode;
        unit.artifacts.push_back(std::move(artifact));
        return true;
    }
};

Scanner::Scanner(core::PatternCatalog catalog, Whitelist whitelist, ScannerOptions options,
                 std::shared_ptr<audit::Logger> logger)
    : impl_(std::make_unique<Impl>(std::move(catalog), std::move(whitelist), options,
                                   std::move(logger))) {}

Scanner::~Scanner() = default;

ScanResult Scanner::scan(const fs::path& root, double minSizeMb) const {
    return impl_->scan(root, minSizeMb);
}

bool Scanner::isWhitelisted(const fs::path& path) const {
    return impl_->isWhitelisted(path);
}

const core::PatternCatalog& Scanner::catalog() const {
    return impl_->catalog();
}

const ScannerOptions& Scanner::options() const {
    return impl_->options();
}

} // namespace cleanbook::scan
