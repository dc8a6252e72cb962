#pragma once

#include "core/core_export.hpp"
#include <string>

namespace cleanbook::core {

// Largest accepted threshold: 1 TB expressed in MB
constexpr double MAX_THRESHOLD_MB = 1024.0 * 1024.0;

/**
 * @brief Parse a human size threshold such as "100MB", "1.5gb" or "500 KB"
 *
 * A missing unit means MB. Accepted units are KB, MB, GB and TB in any case.
 * Only plain decimal numbers are accepted.
 *
 * @param text Threshold text
 * @return Threshold in megabytes
 * @throws std::invalid_argument on malformed input, or with an
 *         "out of bounds" message for negative or oversized values
 */
CLEANBOOK_CORE_EXPORT double parseSizeThreshold(const std::string& text);

} // namespace cleanbook::core
