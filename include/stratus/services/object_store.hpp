/**
 * @file object_store.hpp
 * @brief Object store contract used as the bulk-data side channel
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace stratus {
namespace services {

/**
 * @struct ByteRange
 * @brief Inclusive byte range `[first, last]`
 */
struct ByteRange {
    std::uint64_t first{0};
    std::uint64_t last{0};
};

/**
 * @enum PresignMethod
 * @brief Operation a presigned URL grants
 */
enum class PresignMethod {
    GET,   ///< Download the object
    PUT    ///< Upload (create or replace) the object
};

/**
 * @class ObjectStore
 * @brief Bucket/key blob storage
 *
 * Bodies are raw bytes held in std::string. GetObject and HeadObject throw
 * ObjectNotFound for a missing key; every other failure is a ServiceError.
 */
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    virtual void PutObject(const std::string& bucket, const std::string& key,
                           const std::string& body) = 0;

    virtual std::string GetObject(const std::string& bucket, const std::string& key,
                                  const std::optional<ByteRange>& range = std::nullopt) = 0;

    /// Object size in bytes
    virtual std::uint64_t HeadObject(const std::string& bucket, const std::string& key) = 0;

    virtual void DeleteObject(const std::string& bucket, const std::string& key) = 0;

    /// Delete every object whose key starts with prefix
    virtual void DeleteObjectsByPrefix(const std::string& bucket, const std::string& prefix) = 0;

    /// Time-limited URL granting method on one object without credentials
    virtual std::string PresignUrl(PresignMethod method, const std::string& bucket,
                                   const std::string& key, std::chrono::seconds ttl) = 0;
};

} // namespace services
} // namespace stratus
