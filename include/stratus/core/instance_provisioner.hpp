/**
 * @file instance_provisioner.hpp
 * @brief Instance launch and relay-agent readiness
 *
 * Sample setup runs both steps back to back:
 *
 * ```
 * InstanceProvisioner::Provision(config, task)
 *   ├─ tags = extra_tags + Name + inspect_task + marker
 *   ├─ LaunchInstance (MinCount = MaxCount = 1)
 *   └─ WaitUntilRunning (control plane waiter)
 *          │
 *          ▼
 * AgentReadinessWaiter::AwaitReady(instance_id, region)
 *   └─ up to 20 inventory probes, 30 s apart, until exactly one Online record
 * ```
 *
 * @date 2025
 */

#pragma once

#include "stratus/core/invocation.hpp"
#include "stratus/core/retry.hpp"
#include "stratus/core/sandbox_config.hpp"
#include "stratus/services/command_relay.hpp"
#include "stratus/services/control_plane.hpp"

#include <memory>
#include <string>

namespace stratus {
namespace core {

/// Prefix of the Name tag on every sandbox instance
extern const char* const kInstanceNamePrefix;

/// Tag naming the task an instance serves
extern const char* const kTaskTagKey;

/**
 * @class InstanceProvisioner
 * @brief Launches one tagged instance and waits for it to run
 *
 * Launch failures are rarely transient, so nothing here retries.
 */
class InstanceProvisioner {
public:
    explicit InstanceProvisioner(std::shared_ptr<services::ControlPlane> control_plane);

    /**
     * @brief Launch one instance for a task
     *
     * @param config Resolved configuration
     * @param task_name Used in the Name and inspect_task tags
     * @return Handle of the running instance
     * @throws ProvisioningFailure carrying the control plane's code and message
     */
    InstanceHandle Provision(const SandboxConfig& config, const std::string& task_name);

    /// Tags applied at launch, in order
    static utils::TagSet BuildInstanceTags(const SandboxConfig& config,
                                           const std::string& task_name);

private:
    std::shared_ptr<services::ControlPlane> control_plane_;
};

/**
 * @class AgentReadinessWaiter
 * @brief Waits until the relay agent on an instance reports Online
 */
class AgentReadinessWaiter {
public:
    static constexpr int kMaxAttempts = 20;
    static constexpr std::chrono::seconds kDelay{30};

    AgentReadinessWaiter(std::shared_ptr<services::CommandRelay> relay, Sleeper sleeper);

    /**
     * @brief Block until the instance is reachable through the relay
     *
     * A probe that throws counts as not ready.
     *
     * @throws ReadinessTimeout after the last attempt
     */
    void AwaitReady(const std::string& instance_id, const std::string& region) const;

    /// One probe: exactly one inventory record, and it is Online
    bool IsReady(const std::string& instance_id) const;

    static RetryPolicy Policy();

private:
    std::shared_ptr<services::CommandRelay> relay_;
    Sleeper sleeper_;
};

} // namespace core
} // namespace stratus
