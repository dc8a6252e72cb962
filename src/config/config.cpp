#include "config/config.hpp"
#include "core/pathutil.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <limits>
#include <sstream>

namespace cleanbook::config {

using json = nlohmann::json;
using core::PathUtil;

namespace {
    template<typename T>
    T valueAt(const json& parent, const char* key, const T& fallback, const std::string& where) {
        auto it = parent.find(key);
        if (it == parent.end() || it->is_null()) {
            return fallback;
        }
        try {
            return it->get<T>();
        } catch (const json::type_error& e) {
            throw ConfigError("Invalid value for '" + where + key + "': " + e.what());
        }
    }

    const json& section(const json& doc, const char* key) {
        static const json empty = json::object();
        auto it = doc.find(key);
        if (it == doc.end() || it->is_null()) {
            return empty;
        }
        if (!it->is_object()) {
            throw ConfigError(std::string("Section '") + key + "' must be an object");
        }
        return *it;
    }

    std::vector<fs::path> pathList(const json& doc, const char* key) {
        std::vector<fs::path> paths;
        for (const auto& raw : valueAt<std::vector<std::string>>(doc, key, {}, "")) {
            paths.push_back(PathUtil::expandUser(raw));
        }
        return paths;
    }

    size_t positiveCount(const json& parent, const char* key, size_t fallback,
                         long long maximum = std::numeric_limits<long long>::max()) {
        auto value = valueAt<long long>(parent, key, static_cast<long long>(fallback), "performance.");
        if (value < 1) {
            throw ConfigError(std::string("performance.") + key + " must be at least 1");
        }
        if (value > maximum) {
            throw ConfigError(std::string("performance.") + key + " must be at most " +
                              std::to_string(maximum));
        }
        return static_cast<size_t>(value);
    }
}

Config Config::defaults() {
    Config config;
    const fs::path home = PathUtil::homeDirectory();
    config.targetPath = home;
    config.logPath = home / "cleanbook.log";
    config.manifestDir = home;
    return config;
}

Config Config::loadFromFile(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("Failed to open config file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

Config Config::parse(const std::string& jsonText) {
    json doc;
    try {
        doc = json::parse(jsonText);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("Malformed config: ") + e.what());
    }
    if (!doc.is_object()) {
        throw ConfigError("Config root must be an object");
    }

    Config config = defaults();

    config.whitelistPaths = pathList(doc, "whitelist_paths");
    config.protectedPaths = pathList(doc, "protected_paths");
    config.safeMode = valueAt<bool>(doc, "safe_mode", config.safeMode, "");

    const json& behavior = section(doc, "deletion_behavior");
    config.followSymlinks = valueAt<bool>(behavior, "follow_symlinks", config.followSymlinks,
                                          "deletion_behavior.");

    const json& performance = section(doc, "performance");
    config.maxWorkers = positiveCount(performance, "max_workers", config.maxWorkers);
    config.parallelOperations = positiveCount(performance, "parallel_operations",
                                              config.parallelOperations);
    config.maxScanDepth = static_cast<int>(positiveCount(performance, "max_scan_depth",
                                           static_cast<size_t>(config.maxScanDepth),
                                           std::numeric_limits<int>::max()));

    const json& thresholds = section(doc, "size_thresholds");
    config.minimumFileSize = valueAt<std::string>(thresholds, "minimum_file_size",
                                                  config.minimumFileSize, "size_thresholds.");

    if (auto target = valueAt<std::string>(doc, "target_path", "", ""); !target.empty()) {
        config.targetPath = PathUtil::expandUser(target);
    }

    const json& logging = section(doc, "logging");
    if (auto logPath = valueAt<std::string>(logging, "log_path", "", "logging."); !logPath.empty()) {
        config.logPath = PathUtil::expandUser(logPath);
    }
    config.logLevel = valueAt<std::string>(logging, "log_level", config.logLevel, "logging.");
    if (auto db = valueAt<std::string>(logging, "audit_db", "", "logging."); !db.empty()) {
        config.auditDbPath = PathUtil::expandUser(db);
    }

    const json& paths = section(doc, "paths");
    if (auto dir = valueAt<std::string>(paths, "report_dir", "", "paths."); !dir.empty()) {
        config.reportDir = PathUtil::expandUser(dir);
    }
    if (auto dir = valueAt<std::string>(paths, "manifest_dir", "", "paths."); !dir.empty()) {
        config.manifestDir = PathUtil::expandUser(dir);
    }

    return config;
}

std::optional<DeletionMode> Config::defaultDeletionMode() const {
    if (safeMode) {
        return DeletionMode::SAFE;
    }
    return std::nullopt;
}

} // namespace cleanbook::config
