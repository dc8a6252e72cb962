#include "core/sizeparse.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <regex>
#include <stdexcept>

namespace cleanbook::core {

namespace {
    const std::regex THRESHOLD_PATTERN(
        R"(^(-?)([0-9]+(?:\.[0-9]+)?) ?(KB|MB|GB|TB)?$)",
        std::regex::icase);

    bool isAsciiSpace(char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r';
    }
}

double parseSizeThreshold(const std::string& text) {
    auto begin = std::find_if_not(text.begin(), text.end(), isAsciiSpace);
    auto end = std::find_if_not(text.rbegin(), text.rend(), isAsciiSpace).base();
    if (begin >= end) {
        throw std::invalid_argument("Size threshold is empty");
    }
    const std::string trimmed(begin, end);

    // Reject anything outside printable ASCII before the regex sees it
    for (unsigned char c : trimmed) {
        if (c < 0x20 || c > 0x7e) {
            throw std::invalid_argument("Size threshold contains invalid characters");
        }
    }

    std::smatch match;
    if (!std::regex_match(trimmed, match, THRESHOLD_PATTERN)) {
        throw std::invalid_argument("Invalid size threshold: " + trimmed);
    }

    double value = 0.0;
    try {
        value = std::stod(match[2].str());
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("Size threshold out of bounds: " + trimmed);
    }
    if (!std::isfinite(value)) {
        throw std::invalid_argument("Size threshold out of bounds: " + trimmed);
    }

    std::string unit = match[3].matched ? match[3].str() : "MB";
    std::transform(unit.begin(), unit.end(), unit.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (unit == "KB") {
        value /= 1024.0;
    } else if (unit == "GB") {
        value *= 1024.0;
    } else if (unit == "TB") {
        value *= 1024.0 * 1024.0;
    }

    if (!match[1].str().empty() && value != 0.0) {
        throw std::invalid_argument("Size threshold out of bounds (negative): " + trimmed);
    }
    if (!std::isfinite(value) || value > MAX_THRESHOLD_MB) {
        throw std::invalid_argument("Size threshold out of bounds (max 1TB): " + trimmed);
    }

    return value;
}

} // namespace cleanbook::core
