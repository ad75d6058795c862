/**
 * @file artifact_janitor.hpp
 * @brief Best-effort removal of per-invocation object-store artifacts
 *
 * @date 2025
 */

#pragma once

#include "stratus/core/invocation.hpp"
#include "stratus/services/object_store.hpp"

#include <memory>
#include <string>

namespace stratus {
namespace core {

/**
 * @class ArtifactJanitor
 * @brief Deletes objects without ever throwing
 *
 * Failures are logged at warn level and absorbed.
 */
class ArtifactJanitor {
public:
    ArtifactJanitor(std::shared_ptr<services::ObjectStore> store, std::string bucket);

    void DeleteObject(const std::string& key) const;
    void DeletePrefix(const std::string& prefix) const;

    /// Stdout key, stderr key, then everything under `{prefix}{command_id}/`
    void DeleteInvocationArtifacts(const Invocation& invocation) const;

private:
    std::shared_ptr<services::ObjectStore> store_;
    std::string bucket_;
};

} // namespace core
} // namespace stratus
