/**
 * @file sandbox_environment.hpp
 * @brief Harness-facing sandbox: one instance, its clients and its operations
 *
 * Lifecycle of one sample:
 *
 * ```
 * SampleInit(task, config, factory)
 *   ├─ clients = factory(region)          (per environment, never global)
 *   ├─ InstanceProvisioner::Provision
 *   └─ AgentReadinessWaiter::AwaitReady
 *          │
 *          ▼
 *   {"default": SandboxEnvironment}
 *          │  Exec / ReadFile* / WriteFile  (any number of times)
 *          ▼
 * SampleCleanup(environments, interrupted)
 *   └─ TerminateInstances unless interrupted
 * ```
 *
 * @date 2025
 */

#pragma once

#include "stratus/core/command_dispatcher.hpp"
#include "stratus/core/file_transfer.hpp"
#include "stratus/core/invocation.hpp"
#include "stratus/core/key_generator.hpp"
#include "stratus/core/retry.hpp"
#include "stratus/core/sandbox_config.hpp"
#include "stratus/services/service_clients.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace stratus {
namespace core {

class SandboxEnvironment;

/// Environments of one sample keyed by name ("default")
using EnvironmentMap = std::map<std::string, std::shared_ptr<SandboxEnvironment>>;

/**
 * @struct CleanupPrompts
 * @brief User interaction hooks for bulk cleanup
 */
struct CleanupPrompts {
    std::function<void(const std::vector<services::InstanceSummary>&)> display;  ///< Show the instances
    std::function<bool()> confirm;          ///< Ask before terminating; false cancels
    std::function<bool()> is_interactive;   ///< Defaults to IsInteractiveSession()
};

/**
 * @class SandboxEnvironment
 * @brief One provisioned instance exposed as exec / read / write
 *
 * Owns its collaborator clients and key generator. Not copyable.
 *
 * **Usage Example**:
 * @code
 * auto envs = SandboxEnvironment::SampleInit("my_task", config, MakeAwsCliClients);
 * auto& sandbox = *envs.at("default");
 *
 * ExecRequest request;
 * request.cmd = {"uname", "-a"};
 * ExecOutcome outcome = sandbox.Exec(request);
 *
 * SandboxEnvironment::SampleCleanup(envs, false);
 * @endcode
 */
class SandboxEnvironment {
public:
    SandboxEnvironment(InstanceHandle handle,
                       services::ServiceClients clients,
                       Sleeper sleeper = ThreadSleeper(),
                       std::shared_ptr<KeyGenerator> keys = nullptr);

    SandboxEnvironment(const SandboxEnvironment&) = delete;
    SandboxEnvironment& operator=(const SandboxEnvironment&) = delete;

    /***************************************************************************
     * Sample lifecycle
     ***************************************************************************/

    /**
     * @brief Provision and wait for one environment
     *
     * @throws ProvisioningFailure if the launch fails
     * @throws ReadinessTimeout if the relay agent never comes online
     */
    static EnvironmentMap SampleInit(const std::string& task_name,
                                     const SandboxConfig& config,
                                     const services::ClientFactory& factory,
                                     Sleeper sleeper = ThreadSleeper());

    /**
     * @brief Terminate every environment's instance unless the run was interrupted
     *
     * Each instance is terminated even if an earlier one fails.
     *
     * @throws ServiceError the first termination failure, after all attempts
     */
    static void SampleCleanup(const EnvironmentMap& environments, bool interrupted);

    /// SampleCleanup that logs failures instead of throwing (error paths)
    static bool TryCleanup(const EnvironmentMap& environments, bool interrupted);

    /***************************************************************************
     * Bulk cleanup
     ***************************************************************************/

    /// Marker-tagged instances in pending, running, stopping or stopped state
    static std::vector<services::InstanceSummary> ListOwnedInstances(
        services::ControlPlane& control_plane);

    /**
     * @brief Terminate every owned instance in one call
     *
     * Confirmation is requested only for an interactive session.
     *
     * @return Number of instances terminated (0 if none or cancelled)
     */
    static std::size_t BulkCleanup(services::ControlPlane& control_plane,
                                   const CleanupPrompts& prompts);

    /**
     * @brief Targeted cleanup
     * @throws NotImplementedError always
     */
    static void Cleanup(const std::string& instance_id);

    /// stdin is a tty and neither CI nor STRATUS_UNDER_TEST is set
    static bool IsInteractiveSession(const EnvLookup& env = ProcessEnvironment());

    /***************************************************************************
     * Operations
     ***************************************************************************/

    /**
     * @brief Run a command to completion
     *
     * `input` and `user` are not supported by the relay; they are ignored
     * with a warning.
     */
    ExecOutcome Exec(const ExecRequest& request);

    std::string ReadFileText(const std::string& path);
    std::vector<std::uint8_t> ReadFileBytes(const std::string& path);
    void WriteFile(const std::string& path, const std::string& contents);
    void WriteFile(const std::string& path, const std::vector<std::uint8_t>& contents);

    /// Shell command opening an interactive session on the instance
    std::string ConnectionCommand() const;

    /// Terminate this environment's instance
    void Terminate();

    const InstanceHandle& Handle() const { return handle_; }
    const std::string& InstanceId() const { return handle_.instance_id; }

private:
    InstanceHandle handle_;
    services::ServiceClients clients_;
    std::shared_ptr<KeyGenerator> keys_;
    CommandDispatcher dispatcher_;
    FileTransferBridge files_;
};

} // namespace core
} // namespace stratus
