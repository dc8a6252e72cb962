#include "auditlog.hpp"
#include "core/digest.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <ctime>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace cleanbook::audit {

// Schema version for database migrations
constexpr int SCHEMA_VERSION = 1;

// Size of generated HMAC keys
constexpr size_t KEY_SIZE = 32;

// SQL statements
namespace sql {
    const char* CREATE_TABLES = R"(
        CREATE TABLE IF NOT EXISTS audit_log (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            event_type INTEGER NOT NULL,
            path TEXT NOT NULL,
            action TEXT NOT NULL,
            size_mb REAL NOT NULL,
            details TEXT,
            timestamp INTEGER NOT NULL,
            signature BLOB NOT NULL
        );

        CREATE TABLE IF NOT EXISTS schema_version (
            version INTEGER PRIMARY KEY
        );

        CREATE INDEX IF NOT EXISTS idx_timestamp ON audit_log(timestamp);
        CREATE INDEX IF NOT EXISTS idx_path ON audit_log(path);
    )";

    const char* INSERT_EVENT = R"(
        INSERT INTO audit_log (
            event_type, path, action, size_mb, details, timestamp, signature
        ) VALUES (?, ?, ?, ?, ?, ?, ?);
    )";

    const char* SELECT_EVENTS = R"(
        SELECT id, event_type, path, action, size_mb, details, timestamp, signature
        FROM audit_log WHERE 1=1
    )";

    const char* DELETE_BEFORE = "DELETE FROM audit_log WHERE timestamp < ?";
}

const char* toString(EventType type) {
    switch (type) {
        case EventType::SCAN_START:         return "scan_start";
        case EventType::ARTIFACT_FOUND:     return "discovered";
        case EventType::WHITELIST_SKIP:     return "whitelist_skip";
        case EventType::DELETION:           return "deleted";
        case EventType::SIMULATED_DELETION: return "simulated_deletion";
        case EventType::ERROR:              return "error";
        case EventType::SUMMARY:            return "summary";
    }
    return "unknown";
}

class AuditLog::Impl {
public:
    Impl(const std::string& dbPath, const std::vector<uint8_t>& key)
        : hmacKey_(key) {
        if (hmacKey_.empty()) {
            throw std::runtime_error("Audit log requires a non-empty HMAC key");
        }
        if (sqlite3_open(dbPath.c_str(), &db_) != SQLITE_OK) {
            std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
            if (db_) sqlite3_close(db_);
            db_ = nullptr;
            throw std::runtime_error("Failed to open audit log database: " + error);
        }
        initializeDatabase();
    }

    ~Impl() {
        if (db_) sqlite3_close(db_);
    }

    bool logEvent(EventType type, const EventData& data) {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db_, sql::INSERT_EVENT, -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }

        auto timestamp = std::chrono::system_clock::to_time_t(data.timestamp);
        auto signature = generateSignature(type, data, timestamp);
        if (signature.empty()) {
            sqlite3_finalize(stmt);
            return false;
        }

        sqlite3_bind_int(stmt, 1, static_cast<int>(type));
        sqlite3_bind_text(stmt, 2, data.path.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 3, data.action.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_double(stmt, 4, data.sizeMb);
        if (data.details) {
            sqlite3_bind_text(stmt, 5, data.details->c_str(), -1, SQLITE_STATIC);
        } else {
            sqlite3_bind_null(stmt, 5);
        }
        sqlite3_bind_int64(stmt, 6, timestamp);
        sqlite3_bind_blob(stmt, 7, signature.data(), static_cast<int>(signature.size()),
                          SQLITE_STATIC);

        bool success = sqlite3_step(stmt) == SQLITE_DONE;
        sqlite3_finalize(stmt);
        return success;
    }

    bool verifyLogIntegrity(const TimeRange& range) {
        auto events = queryLogs({std::nullopt, std::nullopt, range});
        for (const auto& event : events) {
            auto timestamp = std::chrono::system_clock::to_time_t(event.data.timestamp);
            if (generateSignature(event.type, event.data, timestamp) != event.signature) {
                return false;
            }
        }
        return true;
    }

    ExportResult exportLogs(Format format, const TimeRange& range, const fs::path& outputPath) {
        ExportResult result;
        std::vector<Event> events = queryLogs({std::nullopt, std::nullopt, range});

        std::stringstream output;
        switch (format) {
            case Format::JSON: {
                nlohmann::json j = nlohmann::json::array();
                for (const auto& event : events) {
                    nlohmann::json event_json;
                    event_json["id"] = event.id;
                    event_json["type"] = toString(event.type);
                    event_json["path"] = event.data.path;
                    event_json["action"] = event.data.action;
                    event_json["size_mb"] = event.data.sizeMb;
                    event_json["details"] = event.data.details.value_or("");
                    event_json["timestamp"] = std::chrono::system_clock::to_time_t(event.data.timestamp);
                    event_json["signature"] = core::Digest::toHex(event.signature);
                    j.push_back(event_json);
                }
                output << j.dump(2);
                break;
            }
            case Format::CSV: {
                output << "ID,Type,Path,Action,SizeMB,Details,Timestamp\n";
                for (const auto& event : events) {
                    output << event.id << ","
                          << toString(event.type) << ","
                          << csvField(event.data.path) << ","
                          << csvField(event.data.action) << ","
                          << event.data.sizeMb << ","
                          << csvField(event.data.details.value_or("")) << ","
                          << std::chrono::system_clock::to_time_t(event.data.timestamp)
                          << "\n";
                }
                break;
            }
        }

        const std::string content = output.str();
        std::ofstream file(outputPath, std::ios::binary | std::ios::trunc);
        if (!file) {
            result.error = "Failed to open export file: " + outputPath.string();
            return result;
        }
        file << content;
        if (!file) {
            result.error = "Failed to write export file: " + outputPath.string();
            return result;
        }

        result.success = true;
        result.filePath = outputPath.string();
        result.signature = core::Digest::hmacSha256(hmacKey_, content);
        if (events.empty()) {
            result.error = "No events found in specified range";
        }
        return result;
    }

    std::vector<Event> queryLogs(const Query& filter) {
        std::stringstream query;
        query << sql::SELECT_EVENTS;

        if (filter.eventType) query << " AND event_type = ?";
        if (filter.path) query << " AND path = ?";
        if (filter.timeRange) query << " AND timestamp >= ? AND timestamp <= ?";
        query << " ORDER BY id";

        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db_, query.str().c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
            return {};
        }

        int index = 1;
        if (filter.eventType) {
            sqlite3_bind_int(stmt, index++, static_cast<int>(*filter.eventType));
        }
        if (filter.path) {
            sqlite3_bind_text(stmt, index++, filter.path->c_str(), -1, SQLITE_TRANSIENT);
        }
        if (filter.timeRange) {
            sqlite3_bind_int64(stmt, index++,
                std::chrono::system_clock::to_time_t(filter.timeRange->start));
            sqlite3_bind_int64(stmt, index++,
                std::chrono::system_clock::to_time_t(filter.timeRange->end));
        }

        std::vector<Event> events;
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            events.push_back(readRow(stmt));
        }

        sqlite3_finalize(stmt);
        return events;
    }

    size_t purgeOldLogs(std::chrono::system_clock::time_point before) {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db_, sql::DELETE_BEFORE, -1, &stmt, nullptr) != SQLITE_OK) {
            return 0;
        }

        sqlite3_bind_int64(stmt, 1, std::chrono::system_clock::to_time_t(before));
        size_t removed = 0;
        if (sqlite3_step(stmt) == SQLITE_DONE) {
            removed = static_cast<size_t>(sqlite3_changes(db_));
        }
        sqlite3_finalize(stmt);
        return removed;
    }

    std::optional<Event> getEventById(uint64_t eventId) {
        std::string query = std::string(sql::SELECT_EVENTS) + " AND id = ?";
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db_, query.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
            return std::nullopt;
        }

        sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(eventId));
        std::optional<Event> event;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            event = readRow(stmt);
        }
        sqlite3_finalize(stmt);
        return event;
    }

private:
    sqlite3* db_ = nullptr;
    std::vector<uint8_t> hmacKey_;

    void initializeDatabase() {
        char* errMsg = nullptr;
        if (sqlite3_exec(db_, sql::CREATE_TABLES, nullptr, nullptr, &errMsg)
            != SQLITE_OK) {
            std::string error = errMsg ? errMsg : "unknown error";
            sqlite3_free(errMsg);
            throw std::runtime_error("Failed to initialize database: " + error);
        }

        std::string version = "INSERT OR IGNORE INTO schema_version (version) VALUES (" +
                              std::to_string(SCHEMA_VERSION) + ");";
        if (sqlite3_exec(db_, version.c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK) {
            std::string error = errMsg ? errMsg : "unknown error";
            sqlite3_free(errMsg);
            throw std::runtime_error("Failed to record schema version: " + error);
        }
    }

    static std::string columnText(sqlite3_stmt* stmt, int column) {
        const unsigned char* text = sqlite3_column_text(stmt, column);
        return text ? reinterpret_cast<const char*>(text) : "";
    }

    static Event readRow(sqlite3_stmt* stmt) {
        Event event;
        event.id = static_cast<uint64_t>(sqlite3_column_int64(stmt, 0));
        event.type = static_cast<EventType>(sqlite3_column_int(stmt, 1));
        event.data.path = columnText(stmt, 2);
        event.data.action = columnText(stmt, 3);
        event.data.sizeMb = sqlite3_column_double(stmt, 4);
        if (sqlite3_column_type(stmt, 5) != SQLITE_NULL) {
            event.data.details = columnText(stmt, 5);
        }
        event.data.timestamp = std::chrono::system_clock::from_time_t(
            static_cast<std::time_t>(sqlite3_column_int64(stmt, 6)));

        auto sigSize = sqlite3_column_bytes(stmt, 7);
        const auto* blob = static_cast<const uint8_t*>(sqlite3_column_blob(stmt, 7));
        if (blob && sigSize > 0) {
            event.signature.assign(blob, blob + sigSize);
        }
        return event;
    }

    static std::string csvField(const std::string& value) {
        if (value.find_first_of(",\"\n") == std::string::npos) {
            return value;
        }
        std::string quoted = "\"";
        for (char c : value) {
            if (c == '"') quoted += '"';
            quoted += c;
        }
        quoted += '"';
        return quoted;
    }

    std::vector<uint8_t> generateSignature(EventType type, const EventData& data,
                                           std::time_t timestamp) const {
        // Fields are length-prefixed so that adjacent values cannot be shifted
        std::stringstream canonical;
        auto field = [&canonical](const std::string& value) {
            canonical << value.size() << ':' << value << ';';
        };
        field(std::to_string(static_cast<int>(type)));
        field(data.path);
        field(data.action);
        std::stringstream size;
        size << std::setprecision(17) << data.sizeMb;
        field(size.str());
        field(data.details ? "1" + *data.details : "0");
        field(std::to_string(timestamp));

        return core::Digest::hmacSha256(hmacKey_, canonical.str());
    }
};

// Public interface implementation
AuditLog::AuditLog(const std::string& dbPath, const std::vector<uint8_t>& hmacKey)
    : impl_(std::make_unique<Impl>(dbPath, hmacKey)) {}

AuditLog::~AuditLog() = default;

bool AuditLog::logEvent(EventType type, const EventData& data) {
    return impl_->logEvent(type, data);
}

bool AuditLog::verifyLogIntegrity(const TimeRange& range) {
    return impl_->verifyLogIntegrity(range);
}

ExportResult AuditLog::exportLogs(Format format, const TimeRange& range,
                                  const fs::path& outputPath) {
    return impl_->exportLogs(format, range, outputPath);
}

std::vector<Event> AuditLog::queryLogs(const Query& filter) {
    return impl_->queryLogs(filter);
}

size_t AuditLog::purgeOldLogs(std::chrono::system_clock::time_point before) {
    return impl_->purgeOldLogs(before);
}

std::optional<Event> AuditLog::getEventById(uint64_t eventId) {
    return impl_->getEventById(eventId);
}

std::vector<uint8_t> AuditLog::loadOrCreateKey(const fs::path& keyFile) {
    std::ifstream existing(keyFile, std::ios::binary);
    if (existing) {
        std::vector<uint8_t> key((std::istreambuf_iterator<char>(existing)),
                                 std::istreambuf_iterator<char>());
        if (key.size() < KEY_SIZE / 2) {
            throw std::runtime_error("Audit key file is too short: " + keyFile.string());
        }
        return key;
    }

    std::vector<uint8_t> key(KEY_SIZE);
    if (!core::Digest::randomBytes(key)) {
        throw std::runtime_error("Failed to generate audit key");
    }

    int fd = open(keyFile.c_str(), O_WRONLY | O_CREAT | O_EXCL, S_IRUSR | S_IWUSR);
    if (fd == -1) {
        throw std::runtime_error("Failed to create audit key file: " +
                                 std::string(strerror(errno)));
    }
    ssize_t written = write(fd, key.data(), key.size());
    close(fd);
    if (written != static_cast<ssize_t>(key.size())) {
        throw std::runtime_error("Failed to write audit key file: " + keyFile.string());
    }
    return key;
}

} // namespace cleanbook::audit
