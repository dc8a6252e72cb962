#include "scan/report.hpp"
#include <chrono>
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace cleanbook::scan {

namespace {
    double round2(double value) {
        return std::round(value * 100.0) / 100.0;
    }
}

nlohmann::json ScanReport::toJson() const {
    nlohmann::json j;
    j["summary"] = {
        {"total_artifacts", summary.totalArtifacts},
        {"total_size_mb", summary.totalSizeMb},
        {"total_size_gb", summary.totalSizeGb},
        {"unique_categories", summary.uniqueCategories},
        {"scan_errors", summary.scanErrors}
    };

    j["categories"] = nlohmann::json::object();
    for (const auto& [name, stats] : categories) {
        j["categories"][name] = {{"count", stats.count}, {"size_mb", stats.sizeMb}};
    }

    j["top_artifacts"] = nlohmann::json::array();
    for (const auto& artifact : topArtifacts) {
        j["top_artifacts"].push_back({
            {"path", artifact.path},
            {"size_mb", artifact.sizeMb},
            {"category", artifact.category}
        });
    }

    j["errors"] = nlohmann::json::array();
    for (const auto& error : errors) {
        j["errors"].push_back({{"path", error.path.string()}, {"error", error.message}});
    }
    return j;
}

ScanReport generateReport(const ScanResult& result) {
    ScanReport report;

    double totalMb = 0.0;
    for (const auto& artifact : result.artifacts) {
        auto& stats = report.categories[artifact.category];
        stats.count++;
        stats.sizeMb += artifact.sizeMb();
        totalMb += artifact.sizeMb();
    }

    report.summary.totalArtifacts = result.artifacts.size();
    report.summary.totalSizeMb = round2(totalMb);
    report.summary.totalSizeGb = round2(totalMb / 1024.0);
    report.summary.uniqueCategories = report.categories.size();
    report.summary.scanErrors = result.errors.size();

    for (size_t i = 0; i < result.artifacts.size() && i < REPORT_TOP_COUNT; ++i) {
        const auto& artifact = result.artifacts[i];
        report.topArtifacts.push_back({artifact.path.string(), round2(artifact.sizeMb()),
                                       artifact.category});
    }

    for (size_t i = 0; i < result.errors.size() && i < REPORT_TOP_COUNT; ++i) {
        report.errors.push_back(result.errors[i]);
    }

    return report;
}

fs::path saveReport(const ScanReport& report, const fs::path& directory) {
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        throw std::runtime_error("Failed to create report directory " + directory.string() +
                                 ": " + ec.message());
    }

    auto epoch = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    fs::path path = directory / ("scan_report_" + std::to_string(epoch) + ".json");

    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file) {
        throw std::runtime_error("Failed to open report file: " + path.string());
    }
    file << report.toJson().dump(2);
    if (!file) {
        throw std::runtime_error("Failed to write report file: " + path.string());
    }
    file.close();

    fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::replace, ec);
    return path;
}

std::map<std::string, std::vector<Artifact>> findDuplicates(const ScanResult& result) {
    std::map<std::string, std::vector<Artifact>> groups;
    for (const auto& artifact : result.artifacts) {
        groups[artifact.pattern + ":" + std::to_string(artifact.sizeBytes)].push_back(artifact);
    }

    for (auto it = groups.begin(); it != groups.end();) {
        if (it->second.size() < 2) {
            it = groups.erase(it);
        } else {
            ++it;
        }
    }
    return groups;
}

} // namespace cleanbook::scan
