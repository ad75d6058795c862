/**
 * @file artifact_janitor.cpp
 * @brief Implementation of ArtifactJanitor
 *
 * @date 2025
 */

#include "stratus/core/artifact_janitor.hpp"
#include "stratus/core/best_effort.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace stratus {
namespace core {

ArtifactJanitor::ArtifactJanitor(std::shared_ptr<services::ObjectStore> store, std::string bucket)
    : store_(std::move(store))
    , bucket_(std::move(bucket)) {
}

void ArtifactJanitor::DeleteObject(const std::string& key) const {
    BestEffort("delete s3://" + bucket_ + "/" + key, [&] {
        store_->DeleteObject(bucket_, key);
    });
}

void ArtifactJanitor::DeletePrefix(const std::string& prefix) const {
    BestEffort("delete objects under s3://" + bucket_ + "/" + prefix, [&] {
        store_->DeleteObjectsByPrefix(bucket_, prefix);
    });
}

void ArtifactJanitor::DeleteInvocationArtifacts(const Invocation& invocation) const {
    spdlog::debug("Cleaning up artifacts of command {}", invocation.command_id);
    DeleteObject(invocation.stdout_key);
    DeleteObject(invocation.stderr_key);
    DeletePrefix(invocation.ArtifactPrefix());
}

} // namespace core
} // namespace stratus
