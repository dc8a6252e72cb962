#pragma once

#include "scan/scan_export.hpp"
#include "scan/scanner.hpp"
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cleanbook::scan {

// Entries kept in the top-artifact and error lists
constexpr size_t REPORT_TOP_COUNT = 10;

struct CategoryStats {
    size_t count = 0;
    double sizeMb = 0.0;
};

struct ReportSummary {
    size_t totalArtifacts = 0;
    double totalSizeMb = 0.0;   // Rounded to 2 places
    double totalSizeGb = 0.0;   // Rounded to 2 places
    size_t uniqueCategories = 0;
    size_t scanErrors = 0;
};

struct ReportArtifact {
    std::string path;
    double sizeMb = 0.0;        // Rounded to 2 places
    std::string category;
};

/**
 * @brief Aggregated view of one scan, consumed by the reporting layer
 */
struct CLEANBOOK_SCAN_EXPORT ScanReport {
    ReportSummary summary;
    std::map<std::string, CategoryStats> categories;
    std::vector<ReportArtifact> topArtifacts;
    std::vector<ScanError> errors;

    nlohmann::json toJson() const;
};

/**
 * @brief Summarise a scan; a pure function of its input
 */
CLEANBOOK_SCAN_EXPORT ScanReport generateReport(const ScanResult& result);

/**
 * @brief Write a report as scan_report_<epoch>.json with mode 0600
 * @param report Report to write
 * @param directory Created if missing
 * @return Path of the written file
 * @throws std::runtime_error if the file cannot be written
 */
CLEANBOOK_SCAN_EXPORT fs::path saveReport(const ScanReport& report, const fs::path& directory);

/**
 * @brief Group artifacts sharing a pattern and exact size
 * @return "pattern:size_bytes" -> artifacts, only groups of two or more
 */
CLEANBOOK_SCAN_EXPORT std::map<std::string, std::vector<Artifact>> findDuplicates(
    const ScanResult& result);

} // namespace cleanbook::scan
