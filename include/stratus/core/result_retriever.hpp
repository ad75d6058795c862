/**
 * @file result_retriever.hpp
 * @brief Size-bounded retrieval of command output from the object store
 *
 * Every retrieval probes the object size first so an oversized stream is
 * never downloaded in full:
 *
 * ```
 * HeadObject(key)
 *   ├─ ObjectNotFound        -> absent ("" for ReadOrBlank)
 *   ├─ size <  limit         -> GetObject(key)
 *   └─ size >= limit
 *        ├─ KEEP_PREFIX      -> GetObject(key, bytes 0..limit-1), truncated
 *        └─ WITHHOLD_CONTENT -> no fetch, truncated
 * ```
 *
 * @date 2025
 */

#pragma once

#include "stratus/services/object_store.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace stratus {
namespace core {

/**
 * @enum TruncationPolicy
 * @brief What to hand back when an object reaches the limit
 */
enum class TruncationPolicy {
    KEEP_PREFIX,        ///< First `limit` bytes (exec output)
    WITHHOLD_CONTENT    ///< Nothing (file reads)
};

/**
 * @struct RetrievedObject
 * @brief Content of one stream and whether it hit the limit
 */
struct RetrievedObject {
    std::string content;
    bool truncated{false};
};

/**
 * @class ResultRetriever
 * @brief Head-then-get reader bound to one bucket
 */
class ResultRetriever {
public:
    ResultRetriever(std::shared_ptr<services::ObjectStore> store, std::string bucket);

    /**
     * @brief Retrieve an object bounded by limit
     *
     * @param key Object key
     * @param limit Size ceiling in bytes; an object of exactly limit bytes is truncated
     * @param policy Truncation behaviour
     * @return std::nullopt when the object does not exist
     * @throws ServiceError for any other store failure
     */
    std::optional<RetrievedObject> Fetch(const std::string& key, std::size_t limit,
                                         TruncationPolicy policy) const;

    /**
     * @brief Fetch with KEEP_PREFIX; a missing object reads as empty
     */
    RetrievedObject ReadOrBlank(const std::string& key, std::size_t limit) const;

private:
    std::shared_ptr<services::ObjectStore> store_;
    std::string bucket_;
};

} // namespace core
} // namespace stratus
