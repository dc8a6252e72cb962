#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <chrono>
#include <memory>
#include <optional>
#include <filesystem>
#include <sqlite3.h>

namespace cleanbook::audit {

namespace fs = std::filesystem;

enum class EventType {
    SCAN_START,
    ARTIFACT_FOUND,
    WHITELIST_SKIP,
    DELETION,
    SIMULATED_DELETION,
    ERROR,
    SUMMARY
};

const char* toString(EventType type);

struct EventData {
    std::string path;
    std::string action;
    double sizeMb = 0.0;
    std::optional<std::string> details;
    std::chrono::system_clock::time_point timestamp;
};

struct Event {
    uint64_t id;
    EventType type;
    EventData data;
    std::vector<uint8_t> signature;
};

enum class Format {
    JSON,
    CSV
};

struct TimeRange {
    std::chrono::system_clock::time_point start;
    std::chrono::system_clock::time_point end;
};

struct Query {
    std::optional<EventType> eventType;
    std::optional<std::string> path;
    std::optional<TimeRange> timeRange;
};

struct ExportResult {
    bool success = false;
    std::string filePath;
    std::vector<uint8_t> signature;
    std::string error;
};

/**
 * @brief Tamper-evident record of scan and deletion events
 *
 * Every row carries an HMAC-SHA256 over its fields so that edits to the
 * database can be detected with verifyLogIntegrity().
 */
class AuditLog {
public:
    explicit AuditLog(const std::string& dbPath, const std::vector<uint8_t>& hmacKey);
    ~AuditLog();

    // Core logging functionality
    bool logEvent(EventType type, const EventData& data);
    bool verifyLogIntegrity(const TimeRange& range);
    ExportResult exportLogs(Format format, const TimeRange& range, const fs::path& outputPath);
    std::vector<Event> queryLogs(const Query& filter);

    // Utility functions
    size_t purgeOldLogs(std::chrono::system_clock::time_point before);
    std::optional<Event> getEventById(uint64_t eventId);

    /**
     * @brief Read the HMAC key from keyFile, creating a random one if absent
     * @throws std::runtime_error if the key cannot be read or written
     */
    static std::vector<uint8_t> loadOrCreateKey(const fs::path& keyFile);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;

    // Prevent copying
    AuditLog(const AuditLog&) = delete;
    AuditLog& operator=(const AuditLog&) = delete;
};

} // namespace cleanbook::audit
