#pragma once

#include "core/core_export.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace cleanbook::core {

/**
 * @brief Message digests used for artifact identities and audit signatures
 */
class CLEANBOOK_CORE_EXPORT Digest {
public:
    /**
     * @brief SHA-256 of a byte string
     * @return Hash value or empty vector on failure
     */
    static std::vector<uint8_t> sha256(std::string_view data);

    /**
     * @brief HMAC-SHA256 of a byte string
     * @param key MAC key
     * @param data Data to authenticate
     * @return MAC or empty vector on failure
     */
    static std::vector<uint8_t> hmacSha256(const std::vector<uint8_t>& key,
                                           std::string_view data);

    /**
     * @brief Lowercase hex encoding
     */
    static std::string toHex(const std::vector<uint8_t>& bytes);

    /**
     * @brief Fill a buffer from the OpenSSL CSPRNG
     * @return true if the generator succeeded
     */
    static bool randomBytes(std::vector<uint8_t>& out);
};

} // namespace cleanbook::core
