/**
 * @file result_retriever.cpp
 * @brief Implementation of ResultRetriever
 *
 * @date 2025
 */

#include "stratus/core/result_retriever.hpp"
#include "stratus/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace stratus {
namespace core {

ResultRetriever::ResultRetriever(std::shared_ptr<services::ObjectStore> store, std::string bucket)
    : store_(std::move(store))
    , bucket_(std::move(bucket)) {
}

std::optional<RetrievedObject> ResultRetriever::Fetch(const std::string& key, std::size_t limit,
                                                      TruncationPolicy policy) const {
    std::uint64_t size = 0;
    try {
        size = store_->HeadObject(bucket_, key);
    } catch (const ObjectNotFound&) {
        spdlog::debug("No object at {}", key);
        return std::nullopt;
    }

    RetrievedObject result;
    if (size < limit) {
        try {
            result.content = store_->GetObject(bucket_, key);
        } catch (const ObjectNotFound&) {
            // Deleted between the probe and the fetch
            return std::nullopt;
        }
        return result;
    }

    spdlog::debug("Object {} is {} bytes, limit is {}", key, size, limit);
    result.truncated = true;

    if (policy == TruncationPolicy::WITHHOLD_CONTENT || limit == 0) {
        return result;
    }

    services::ByteRange range;
    range.first = 0;
    range.last = static_cast<std::uint64_t>(limit) - 1;
    try {
        result.content = store_->GetObject(bucket_, key, range);
    } catch (const ObjectNotFound&) {
        return std::nullopt;
    }
    return result;
}

RetrievedObject ResultRetriever::ReadOrBlank(const std::string& key, std::size_t limit) const {
    auto object = Fetch(key, limit, TruncationPolicy::KEEP_PREFIX);
    if (!object) {
        return RetrievedObject{};
    }
    return *object;
}

} // namespace core
} // namespace stratus
