/**
 * @file hash_utils.cpp
 * @brief Implementation of digest helpers using OpenSSL EVP and HMAC
 *
 * @date 2025
 */

#include "stratus/utils/hash_utils.hpp"

#include <spdlog/spdlog.h>

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace stratus {
namespace utils {

namespace {

/**
 * @brief Convert binary data to hexadecimal string
 * @param data Binary data buffer
 * @param length Number of bytes to convert
 * @return Lowercase hexadecimal string representation
 */
std::string BinaryToHex(const unsigned char* data, std::size_t length) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

} // anonymous namespace

std::string HashUtils::Sha256Hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_length = 0;

    if (EVP_Digest(data.data(), data.size(), digest, &digest_length,
                   EVP_sha256(), nullptr) != 1) {
        spdlog::error("EVP_Digest(SHA-256) failed");
        throw std::runtime_error("SHA-256 computation failed");
    }

    return BinaryToHex(digest, digest_length);
}

std::string HashUtils::HmacSha256(const std::string& key, const std::string& data) {
    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned int mac_length = 0;

    const unsigned char* result = HMAC(EVP_sha256(),
                                       key.data(), static_cast<int>(key.size()),
                                       reinterpret_cast<const unsigned char*>(data.data()),
                                       data.size(), mac, &mac_length);
    if (result == nullptr) {
        spdlog::error("HMAC-SHA256 failed");
        throw std::runtime_error("HMAC-SHA256 computation failed");
    }

    return std::string(reinterpret_cast<const char*>(mac), mac_length);
}

std::string HashUtils::ToHex(const std::string& bytes) {
    return BinaryToHex(reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size());
}

} // namespace utils
} // namespace stratus
