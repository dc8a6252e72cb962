#include "sessionlogger.hpp"
#include "core/patterncatalog.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace cleanbook::audit {

namespace {
    std::string formatTime(std::chrono::system_clock::time_point tp, const char* format) {
        std::time_t t = std::chrono::system_clock::to_time_t(tp);
        std::tm local{};
        localtime_r(&t, &local);
        std::stringstream ss;
        ss << std::put_time(&local, format);
        return ss.str();
    }

    std::string formatMb(double sizeMb) {
        std::stringstream ss;
        ss << std::fixed << std::setprecision(2) << sizeMb;
        return ss.str();
    }

    double round2(double value) {
        return static_cast<double>(static_cast<long long>(value * 100.0 + (value < 0 ? -0.5 : 0.5))) / 100.0;
    }
}

LogLevel parseLogLevel(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "WARNING" || upper == "WARN") return LogLevel::WARNING;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "CRITICAL") return LogLevel::CRITICAL;
    return LogLevel::INFO;
}

const char* toString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:    return "DEBUG";
        case LogLevel::INFO:     return "INFO";
        case LogLevel::WARNING:  return "WARNING";
        case LogLevel::ERROR:    return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
    }
    return "INFO";
}

SessionLogger::SessionLogger(fs::path logPath, LogLevel level, std::ostream* console,
                             std::shared_ptr<AuditLog> auditLog)
    : logPath_(std::move(logPath))
    , level_(level)
    , console_(console)
    , auditLog_(std::move(auditLog)) {
    if (logPath_.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(logPath_.parent_path(), ec);
    }
    openLogFile();
}

SessionLogger::~SessionLogger() = default;

void SessionLogger::openLogFile() {
    // Create with owner-only permissions before handing the file to the stream
    int fd = open(logPath_.c_str(), O_WRONLY | O_CREAT | O_APPEND, S_IRUSR | S_IWUSR);
    if (fd == -1) {
        throw std::runtime_error("Failed to open log file: " + logPath_.string());
    }
    close(fd);

    file_.open(logPath_, std::ios::out | std::ios::app);
    if (!file_) {
        throw std::runtime_error("Failed to open log file: " + logPath_.string());
    }
}

void SessionLogger::write(LogLevel level, const std::string& message) {
    if (level < level_) {
        return;
    }

    std::stringstream line;
    line << formatTime(std::chrono::system_clock::now(), "%Y-%m-%d %H:%M:%S")
         << " | " << std::left << std::setw(8) << toString(level)
         << " | cleanbook | " << message;

    std::lock_guard<std::mutex> lock(mutex_);
    if (file_) {
        file_ << line.str() << '\n' << std::flush;
    }
    if (console_) {
        *console_ << line.str() << '\n';
    }
}

void SessionLogger::persist(EventType type, const EventData& data) {
    if (!auditLog_) {
        return;
    }
    if (!auditLog_->logEvent(type, data)) {
        const std::string note = std::string("Audit store rejected ") + audit::toString(type) +
                                 " event for '" + data.path + "'";
        if (file_) file_ << note << '\n' << std::flush;
        if (console_) *console_ << note << '\n';
    }
}

void SessionLogger::record(EventType type, AuditEntry entry) {
    EventData data;
    data.path = entry.path;
    data.action = entry.action;
    data.sizeMb = entry.sizeMb;
    data.details = entry.category;
    data.timestamp = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    persist(type, data);
    entries_.push_back(std::move(entry));
}

void SessionLogger::logError(const std::string& error, const std::string& context) {
    write(LogLevel::ERROR, "Error in " + context + ": " + error);

    EventData data;
    data.action = context;
    data.details = error;
    data.timestamp = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    persist(EventType::ERROR, data);
}

void SessionLogger::logDeletion(const fs::path& path, double sizeMb, bool dryRun) {
    AuditEntry entry;
    entry.timestamp = formatTime(std::chrono::system_clock::now(), "%Y-%m-%dT%H:%M:%S");
    entry.action = dryRun ? "simulated_deletion" : "deleted";
    entry.path = path.string();
    entry.sizeMb = round2(sizeMb);
    entry.dryRun = dryRun;

    write(LogLevel::INFO, std::string(dryRun ? "Simulated deletion: " : "Deleted: ") +
          path.string() + " (" + formatMb(sizeMb) + " MB)");
    record(dryRun ? EventType::SIMULATED_DELETION : EventType::DELETION, std::move(entry));
}

void SessionLogger::logScanStart(const fs::path& target, const core::PatternCatalog& catalog) {
    write(LogLevel::INFO, "Initiating scan at: " + target.string());
    write(LogLevel::DEBUG, "Pattern catalog loaded: " + std::to_string(catalog.categoryCount()) +
          " categories, " + std::to_string(catalog.patternCount()) + " patterns");
}

void SessionLogger::logArtifactFound(const fs::path& path, double sizeMb,
                                     const std::string& category) {
    AuditEntry entry;
    entry.timestamp = formatTime(std::chrono::system_clock::now(), "%Y-%m-%dT%H:%M:%S");
    entry.action = "discovered";
    entry.path = path.string();
    entry.sizeMb = round2(sizeMb);
    entry.category = category;

    write(LogLevel::INFO, "Found " + category + " artifact: " + path.string() +
          " (" + formatMb(sizeMb) + " MB)");
    record(EventType::ARTIFACT_FOUND, std::move(entry));
}

void SessionLogger::logWhitelistSkip(const fs::path& path) {
    write(LogLevel::DEBUG, "Whitelist protection: " + path.string());
}

void SessionLogger::debug(const std::string& message) { write(LogLevel::DEBUG, message); }
void SessionLogger::info(const std::string& message) { write(LogLevel::INFO, message); }
void SessionLogger::warning(const std::string& message) { write(LogLevel::WARNING, message); }
void SessionLogger::critical(const std::string& message) { write(LogLevel::CRITICAL, message); }

void SessionLogger::logSummary(size_t totalFound, double totalSizeMb,
                               size_t deletedCount, double deletedSizeMb) {
    const std::string rule(60, '=');
    write(LogLevel::INFO, rule);
    write(LogLevel::INFO, "CLEANBOOK SESSION SUMMARY");
    write(LogLevel::INFO, "Total artifacts discovered: " + std::to_string(totalFound) +
          " (" + formatMb(totalSizeMb) + " MB)");
    write(LogLevel::INFO, "Total artifacts purged: " + std::to_string(deletedCount) +
          " (" + formatMb(deletedSizeMb) + " MB)");
    write(LogLevel::INFO, "Disk space liberated: " + formatMb(deletedSizeMb) + " MB");
    write(LogLevel::INFO, rule);

    EventData data;
    data.action = "summary";
    data.sizeMb = deletedSizeMb;
    data.details = std::to_string(totalFound) + " found, " +
                   std::to_string(deletedCount) + " deleted";
    data.timestamp = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    persist(EventType::SUMMARY, data);
}

fs::path SessionLogger::exportAuditLog(std::optional<fs::path> exportPath) {
    fs::path target = exportPath.value_or(fs::path(logPath_).replace_extension(".audit.json"));

    nlohmann::json doc;
    size_t deletions = 0;
    size_t discoveries = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        doc["session_id"] = formatTime(std::chrono::system_clock::now(), "%Y-%m-%dT%H:%M:%S");
        doc["entries"] = nlohmann::json::array();
        for (const auto& entry : entries_) {
            nlohmann::json e;
            e["timestamp"] = entry.timestamp;
            e["action"] = entry.action;
            e["path"] = entry.path;
            e["size_mb"] = entry.sizeMb;
            if (entry.category) e["category"] = *entry.category;
            if (entry.dryRun) e["dry_run"] = *entry.dryRun;
            doc["entries"].push_back(e);

            if (entry.action == "deleted") ++deletions;
            if (entry.action == "discovered") ++discoveries;
        }
        doc["summary"] = {
            {"total_entries", entries_.size()},
            {"deletions", deletions},
            {"discoveries", discoveries}
        };
    }

    std::ofstream out(target, std::ios::out | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Failed to open audit export: " + target.string());
    }
    out << doc.dump(2);
    if (!out) {
        throw std::runtime_error("Failed to write audit export: " + target.string());
    }
    out.close();

    std::error_code ec;
    fs::permissions(target, fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::replace, ec);

    info("Audit log exported to: " + target.string());
    return target;
}

bool SessionLogger::rotateLogs(int retentionDays) {
    auto cutoff = std::chrono::system_clock::now() - std::chrono::hours(24) * retentionDays;

    struct stat st;
    if (stat(logPath_.c_str(), &st) == -1) {
        return false;
    }
    if (std::chrono::system_clock::from_time_t(st.st_mtime) >= cutoff) {
        return false;
    }

    fs::path archive = fs::path(logPath_).replace_extension(
        "." + formatTime(cutoff, "%Y%m%d") + ".log");

    std::error_code ec;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        file_.close();
        fs::rename(logPath_, archive, ec);
        openLogFile();
    }

    if (ec) {
        warning("Failed to archive log " + logPath_.string() + ": " + ec.message());
        return false;
    }
    info("Archived old log to: " + archive.string());
    return true;
}

std::vector<AuditEntry> SessionLogger::auditEntries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

} // namespace cleanbook::audit
