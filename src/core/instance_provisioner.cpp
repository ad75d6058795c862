/**
 * @file instance_provisioner.cpp
 * @brief Implementation of InstanceProvisioner and AgentReadinessWaiter
 *
 * @date 2025
 */

#include "stratus/core/instance_provisioner.hpp"
#include "stratus/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace stratus {
namespace core {

const char* const kInstanceNamePrefix = "inspect_ec2_sandbox_";
const char* const kTaskTagKey = "inspect_task";

constexpr int AgentReadinessWaiter::kMaxAttempts;
constexpr std::chrono::seconds AgentReadinessWaiter::kDelay;

// ============================================================================
// INSTANCE PROVISIONER
// ============================================================================

InstanceProvisioner::InstanceProvisioner(std::shared_ptr<services::ControlPlane> control_plane)
    : control_plane_(std::move(control_plane)) {
}

utils::TagSet InstanceProvisioner::BuildInstanceTags(const SandboxConfig& config,
                                                     const std::string& task_name) {
    utils::TagSet tags = config.ExtraTags();
    tags.emplace_back("Name", kInstanceNamePrefix + task_name);
    tags.emplace_back(kTaskTagKey, task_name);
    tags.emplace_back(utils::kMarkerTagKey, utils::kMarkerTagValue);
    return tags;
}

InstanceHandle InstanceProvisioner::Provision(const SandboxConfig& config,
                                              const std::string& task_name) {
    services::LaunchRequest request;
    request.image_id = config.ImageId();
    request.instance_type = config.InstanceType();
    request.security_group_id = config.SecurityGroupId();
    request.subnet_id = config.SubnetId();
    request.instance_profile = config.InstanceProfile();
    request.tags = BuildInstanceTags(config, task_name);

    spdlog::info("Launching {} instance from {} for task '{}'",
                 request.instance_type, request.image_id, task_name);

    std::string instance_id;
    try {
        instance_id = control_plane_->LaunchInstance(request);
        spdlog::debug("Waiting for instance {} to reach running", instance_id);
        control_plane_->WaitUntilRunning(instance_id);
    } catch (const ServiceError& e) {
        spdlog::error("Failed to provision instance: {}", e.what());
        throw ProvisioningFailure(e);
    }

    spdlog::info("Instance {} is running", instance_id);
    return InstanceHandle{instance_id, config.Region(), config};
}

// ============================================================================
// AGENT READINESS WAITER
// ============================================================================

AgentReadinessWaiter::AgentReadinessWaiter(std::shared_ptr<services::CommandRelay> relay,
                                           Sleeper sleeper)
    : relay_(std::move(relay))
    , sleeper_(std::move(sleeper)) {
}

RetryPolicy AgentReadinessWaiter::Policy() {
    RetryPolicy policy;
    policy.max_attempts = kMaxAttempts;
    policy.delay = kDelay;
    return policy;
}

bool AgentReadinessWaiter::IsReady(const std::string& instance_id) const {
    auto records = relay_->DescribeAgentInventory(instance_id);
    return records.size() == 1 && records.front().ping_status == "Online";
}

void AgentReadinessWaiter::AwaitReady(const std::string& instance_id,
                                      const std::string& region) const {
    spdlog::info("Waiting for relay agent on {} ({})", instance_id, region);

    auto result = PollUntil(Policy(), sleeper_, [&] {
        try {
            return IsReady(instance_id);
        } catch (const std::exception& e) {
            spdlog::debug("Readiness probe for {} failed: {}", instance_id, e.what());
            return false;
        }
    });

    if (!result.satisfied) {
        throw ReadinessTimeout(instance_id, result.attempts);
    }
    spdlog::info("Instance {} is online after {} probe(s)", instance_id, result.attempts);
}

} // namespace core
} // namespace stratus
