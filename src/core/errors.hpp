#pragma once

#include <stdexcept>
#include <string>

namespace cleanbook::core {

/**
 * @brief Configuration or pattern catalog could not be loaded
 *
 * Fatal to the caller; the scanner and nuker never throw it.
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace cleanbook::core
