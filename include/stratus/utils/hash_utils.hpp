/**
 * @file hash_utils.hpp
 * @brief SHA-256 and HMAC-SHA256 helpers backed by OpenSSL
 *
 * Used by the object-store URL presigner (AWS Signature Version 4 derives
 * its signing key through a chain of HMAC-SHA256 operations and hashes the
 * canonical request with SHA-256).
 *
 * **Thread Safety**:
 * All functions are thread-safe and reentrant.
 *
 * @date 2025
 */

#pragma once

#include <string>

namespace stratus {
namespace utils {

/**
 * @class HashUtils
 * @brief Static digest utilities
 *
 * **Usage Example**:
 * @code
 * std::string digest = HashUtils::Sha256Hex("");
 * // e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855
 *
 * std::string mac = HashUtils::HmacSha256("key", "message");  // 32 raw bytes
 * std::string hex = HashUtils::ToHex(mac);
 * @endcode
 */
class HashUtils {
public:
    /**
     * @brief SHA-256 of data as lowercase hex
     * @throws std::runtime_error if OpenSSL reports a failure
     */
    static std::string Sha256Hex(const std::string& data);

    /**
     * @brief HMAC-SHA256 of data keyed with key
     * @return 32 raw digest bytes
     * @throws std::runtime_error if OpenSSL reports a failure
     */
    static std::string HmacSha256(const std::string& key, const std::string& data);

    /**
     * @brief Convert raw bytes to lowercase hexadecimal
     */
    static std::string ToHex(const std::string& bytes);
};

} // namespace utils
} // namespace stratus
