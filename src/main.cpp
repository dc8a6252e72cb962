#include "audit/auditlog.hpp"
#include "audit/sessionlogger.hpp"
#include "config/config.hpp"
#include "core/patterncatalog.hpp"
#include "core/sizeparse.hpp"
#include "nuke/nuker.hpp"
#include "scan/report.hpp"
#include "scan/scanner.hpp"
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

using namespace cleanbook;

namespace {

struct Options {
    bool scan = false;
    bool clean = false;
    bool dryRun = false;
    bool interactive = false;
    bool force = false;
    bool verbose = false;
    bool quiet = false;
    bool help = false;
    std::optional<fs::path> configPath;
    fs::path patternsPath = "data/patterns.json";
    std::optional<fs::path> target;
    std::optional<std::string> threshold;
};

void printUsage(std::ostream& out) {
    out << "Usage: cleanbook [--scan | --clean] [options]\n"
        << "\n"
        << "  --scan               Scan and report artifacts (default)\n"
        << "  --clean              Scan, then delete artifacts (SAFE mode unless\n"
        << "                       safe_mode is off, which requires a mode flag)\n"
        << "  --dry-run            Simulate deletion\n"
        << "  --interactive        Confirm every deletion\n"
        << "  --force              Delete without confirmation, in parallel\n"
        << "  --config <file>      Configuration file (JSON)\n"
        << "  --patterns <file>    Pattern catalog (JSON, default data/patterns.json)\n"
        << "  --target <dir>       Directory to scan\n"
        << "  --threshold <size>   Minimum artifact size, e.g. 10MB\n"
        << "  --verbose            Debug logging\n"
        << "  --quiet              Warnings and errors only\n"
        << "  --help               Show this message\n";
}

bool parseArguments(int argc, char* argv[], Options& options, std::string& error) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&](const char* name) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                error = std::string(name) + " requires a value";
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--scan") {
            options.scan = true;
        } else if (arg == "--clean") {
            options.clean = true;
        } else if (arg == "--dry-run") {
            options.dryRun = true;
        } else if (arg == "--interactive") {
            options.interactive = true;
        } else if (arg == "--force") {
            options.force = true;
        } else if (arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "--quiet") {
            options.quiet = true;
        } else if (arg == "--help" || arg == "-h") {
            options.help = true;
        } else if (arg == "--config") {
            auto v = value("--config");
            if (!v) return false;
            options.configPath = *v;
        } else if (arg == "--patterns") {
            auto v = value("--patterns");
            if (!v) return false;
            options.patternsPath = *v;
        } else if (arg == "--target") {
            auto v = value("--target");
            if (!v) return false;
            options.target = *v;
        } else if (arg == "--threshold") {
            auto v = value("--threshold");
            if (!v) return false;
            options.threshold = *v;
        } else {
            error = "unknown option: " + arg;
            return false;
        }
    }

    if (options.scan && options.clean) {
        error = "--scan and --clean are mutually exclusive";
        return false;
    }
    if (options.interactive && options.force) {
        error = "--interactive and --force are mutually exclusive";
        return false;
    }
    return true;
}

std::shared_ptr<audit::SessionLogger> makeLogger(const config::Config& config,
                                                 const Options& options) {
    audit::LogLevel level = audit::parseLogLevel(config.logLevel);
    if (options.verbose) level = audit::LogLevel::DEBUG;
    if (options.quiet) level = audit::LogLevel::WARNING;

    std::shared_ptr<audit::AuditLog> auditLog;
    if (!config.auditDbPath.empty()) {
        fs::path keyFile = config.auditDbPath;
        keyFile += ".key";
        auditLog = std::make_shared<audit::AuditLog>(
            config.auditDbPath.string(), audit::AuditLog::loadOrCreateKey(keyFile));
    }

    return std::make_shared<audit::SessionLogger>(config.logPath, level, &std::cerr, auditLog);
}

void printSummary(const scan::ScanReport& report) {
    const auto& s = report.summary;
    std::cout << "Artifacts found:   " << s.totalArtifacts << "\n"
              << "Total size:        " << std::fixed << std::setprecision(2)
              << s.totalSizeMb << " MB (" << s.totalSizeGb << " GB)\n"
              << "Categories:        " << s.uniqueCategories << "\n"
              << "Scan errors:       " << s.scanErrors << "\n";

    if (!report.topArtifacts.empty()) {
        std::cout << "\nLargest artifacts:\n";
        for (const auto& artifact : report.topArtifacts) {
            std::cout << "  " << std::setw(10) << artifact.sizeMb << " MB  "
                      << artifact.category << "  " << artifact.path << "\n";
        }
    }
}

bool promptUser(const Artifact& artifact) {
    std::cout << "Delete " << artifact.path.string() << " (" << std::fixed
              << std::setprecision(2) << artifact.sizeMb() << " MB, "
              << artifact.category << ")? [y/N] " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer)) {
        return false;
    }
    return answer == "y" || answer == "Y" || answer == "yes";
}

std::optional<DeletionMode> selectMode(const Options& options, const config::Config& config) {
    if (options.dryRun) return DeletionMode::DRY_RUN;
    if (options.interactive) return DeletionMode::INTERACTIVE;
    if (options.force) return DeletionMode::FORCE;
    return config.defaultDeletionMode();
}

int runClean(const config::Config& config, const scan::ScanResult& result,
             DeletionMode mode, audit::SessionLogger& logger,
             std::shared_ptr<audit::Logger> sharedLogger) {
    nuke::NukerOptions nukerOptions;
    nukerOptions.parallelOperations = config.parallelOperations;
    nukerOptions.manifestDir = config.manifestDir;

    nuke::Nuker nuker(nuke::ProtectedPaths(config.protectedPaths), nukerOptions,
                      std::move(sharedLogger));

    logger.info(std::string("Deleting in ") + toString(mode) + " mode");

    nuker.deleteArtifacts(result.artifacts, mode, promptUser);
    auto metrics = nuker.getDestructionMetrics();

    std::cout << "\n" << (mode == DeletionMode::DRY_RUN ? "Would free: " : "Freed:      ")
              << std::fixed << std::setprecision(2) << metrics.totalFreedMb << " MB ("
              << metrics.successfulDeletions << " of " << metrics.totalOperations << ")\n";

    if (!metrics.errors.empty()) {
        std::cout << "\nFailures:\n";
        for (const auto& [path, error] : metrics.errors) {
            std::cout << "  " << path.string() << ": " << error << "\n";
        }
    }

    double foundMb = 0.0;
    for (const auto& artifact : result.artifacts) {
        foundMb += artifact.sizeMb();
    }
    logger.logSummary(result.artifacts.size(), foundMb,
                      metrics.successfulDeletions, metrics.totalFreedMb);

    if (mode != DeletionMode::DRY_RUN) {
        if (auto manifest = nuker.createUndoManifest()) {
            logger.info("Undo manifest written to " + manifest->string());
        }
    }

    return metrics.failedDeletions == 0 ? 0 : 1;
}

} // namespace

int main(int argc, char* argv[]) {
    Options options;
    std::string error;
    if (!parseArguments(argc, argv, options, error)) {
        std::cerr << "cleanbook: " << error << "\n\n";
        printUsage(std::cerr);
        return 2;
    }
    if (options.help) {
        printUsage(std::cout);
        return 0;
    }

    config::Config config;
    core::PatternCatalog catalog;
    double minSizeMb = 0.0;
    try {
        config = options.configPath ? config::Config::loadFromFile(*options.configPath)
                                    : config::Config::defaults();
        if (options.target) {
            config.targetPath = *options.target;
        }
        catalog = core::PatternCatalog::loadFromFile(options.patternsPath);
        minSizeMb = core::parseSizeThreshold(options.threshold.value_or(config.minimumFileSize));
    } catch (const std::exception& e) {
        std::cerr << "cleanbook: " << e.what() << "\n";
        return 2;
    }

    std::optional<DeletionMode> mode;
    if (options.clean) {
        mode = selectMode(options, config);
        if (!mode) {
            std::cerr << "cleanbook: safe_mode is disabled; choose --dry-run, --interactive"
                      << " or --force\n";
            return 2;
        }
    }

    std::shared_ptr<audit::SessionLogger> logger;
    try {
        logger = makeLogger(config, options);
    } catch (const std::exception& e) {
        std::cerr << "cleanbook: " << e.what() << "\n";
        return 2;
    }

    scan::ScannerOptions scannerOptions;
    scannerOptions.followSymlinks = config.followSymlinks;
    scannerOptions.workers = config.maxWorkers;
    scannerOptions.maxDepth = config.maxScanDepth;

    logger->logScanStart(config.targetPath, catalog);
    scan::Scanner scanner(catalog, scan::Whitelist(config.whitelistPaths), scannerOptions, logger);
    auto result = scanner.scan(config.targetPath, minSizeMb);

    for (const auto& scanError : result.errors) {
        logger->logError(scanError.message + " (" + scanError.path.string() + ")", "scan");
    }

    int status = 0;
    if (options.clean) {
        status = runClean(config, result, *mode, *logger, logger);
    } else {
        auto report = scan::generateReport(result);
        printSummary(report);
        try {
            auto path = scan::saveReport(report, config.reportDir);
            logger->info("Report saved to " + path.string());
        } catch (const std::exception& e) {
            logger->logError(e.what(), "report");
            status = 1;
        }
    }

    try {
        logger->exportAuditLog();
    } catch (const std::exception& e) {
        logger->logError(e.what(), "audit_export");
        status = 1;
    }
    return status;
}
