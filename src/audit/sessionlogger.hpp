#pragma once

#include "logger.hpp"
#include "auditlog.hpp"
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cleanbook::audit {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

/**
 * @brief Parse a level name, case-insensitive; unknown names give INFO
 */
LogLevel parseLogLevel(const std::string& name);
const char* toString(LogLevel level);

/**
 * @brief One discovery or deletion kept for the session audit export
 */
struct AuditEntry {
    std::string timestamp;             // ISO-8601 local time
    std::string action;                // discovered, deleted, simulated_deletion
    std::string path;
    double sizeMb = 0.0;
    std::optional<std::string> category;
    std::optional<bool> dryRun;
};

/**
 * @brief Logger writing to a log file and a console stream
 *
 * Lines look like "2024-01-01 12:00:00 | INFO     | cleanbook | message".
 * Discoveries and deletions are also kept in memory for exportAuditLog()
 * and, when an AuditLog is attached, persisted as signed events.
 */
class SessionLogger : public Logger {
public:
    /**
     * @brief Constructor
     * @param logPath Log file, opened for append and created with mode 0600
     * @param level Minimum level written to file and console
     * @param console Console stream, or nullptr for file-only logging
     * @param auditLog Optional persistent audit store
     * @throws std::runtime_error if the log file cannot be opened
     */
    SessionLogger(fs::path logPath,
                  LogLevel level = LogLevel::INFO,
                  std::ostream* console = &std::cerr,
                  std::shared_ptr<AuditLog> auditLog = nullptr);
    ~SessionLogger() override;

    // Logger
    void logError(const std::string& error, const std::string& context) override;
    void logDeletion(const fs::path& path, double sizeMb, bool dryRun) override;
    void logScanStart(const fs::path& target, const core::PatternCatalog& catalog) override;
    void logArtifactFound(const fs::path& path, double sizeMb,
                          const std::string& category) override;
    void logWhitelistSkip(const fs::path& path) override;

    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void critical(const std::string& message);

    /**
     * @brief Write the end-of-session summary block
     */
    void logSummary(size_t totalFound, double totalSizeMb,
                    size_t deletedCount, double deletedSizeMb);

    /**
     * @brief Export the in-memory audit trail as JSON
     * @param exportPath Destination; defaults to the log path with ".audit.json"
     * @return Path written
     * @throws std::runtime_error if the file cannot be written
     */
    fs::path exportAuditLog(std::optional<fs::path> exportPath = std::nullopt);

    /**
     * @brief Archive the log file if it was last written before the retention window
     * @return true if the log was archived
     */
    bool rotateLogs(int retentionDays = 30);

    std::vector<AuditEntry> auditEntries() const;
    const fs::path& logPath() const { return logPath_; }
    LogLevel level() const { return level_; }

private:
    void write(LogLevel level, const std::string& message);
    void record(EventType type, AuditEntry entry);
    void persist(EventType type, const EventData& data);  // caller holds mutex_
    void openLogFile();

    fs::path logPath_;
    LogLevel level_;
    std::ostream* console_;
    std::shared_ptr<AuditLog> auditLog_;
    std::ofstream file_;
    std::vector<AuditEntry> entries_;
    mutable std::mutex mutex_;

    SessionLogger(const SessionLogger&) = delete;
    SessionLogger& operator=(const SessionLogger&) = delete;
};

} // namespace cleanbook::audit
