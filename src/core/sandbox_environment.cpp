/**
 * @file sandbox_environment.cpp
 * @brief Implementation of SandboxEnvironment
 *
 * @date 2025
 */

#include "stratus/core/sandbox_environment.hpp"
#include "stratus/core/best_effort.hpp"
#include "stratus/core/errors.hpp"
#include "stratus/core/instance_provisioner.hpp"

#include <spdlog/spdlog.h>

#include <unistd.h>

#include <exception>
#include <utility>

namespace stratus {
namespace core {

namespace {

const std::vector<std::string> kLiveInstanceStates = {
    "pending", "running", "stopping", "stopped"
};

std::shared_ptr<KeyGenerator> EnsureKeys(std::shared_ptr<KeyGenerator> keys,
                                         const SandboxConfig& config) {
    if (keys) {
        return keys;
    }
    return std::make_shared<KeyGenerator>(config.KeyPrefix());
}

} // anonymous namespace

SandboxEnvironment::SandboxEnvironment(InstanceHandle handle,
                                       services::ServiceClients clients,
                                       Sleeper sleeper,
                                       std::shared_ptr<KeyGenerator> keys)
    : handle_(std::move(handle))
    , clients_(std::move(clients))
    , keys_(EnsureKeys(std::move(keys), handle_.config))
    , dispatcher_(handle_.instance_id, handle_.config.Bucket(), clients_, keys_, std::move(sleeper))
    , files_(dispatcher_, handle_.config.Bucket(), clients_.object_store, keys_) {
}

// ============================================================================
// SAMPLE LIFECYCLE
// ============================================================================

EnvironmentMap SandboxEnvironment::SampleInit(const std::string& task_name,
                                              const SandboxConfig& config,
                                              const services::ClientFactory& factory,
                                              Sleeper sleeper) {
    services::ServiceClients clients = factory(config.Region());

    InstanceProvisioner provisioner(clients.control_plane);
    InstanceHandle handle = provisioner.Provision(config, task_name);

    AgentReadinessWaiter readiness(clients.relay, sleeper);
    try {
        readiness.AwaitReady(handle.instance_id, handle.region);
    } catch (const ReadinessTimeout&) {
        spdlog::error("Instance {} left running for diagnosis; remove it with 'stratus cleanup'",
                      handle.instance_id);
        throw;
    }

    EnvironmentMap environments;
    environments["default"] = std::make_shared<SandboxEnvironment>(
        std::move(handle), std::move(clients), std::move(sleeper));
    return environments;
}

void SandboxEnvironment::SampleCleanup(const EnvironmentMap& environments, bool interrupted) {
    if (interrupted) {
        for (const auto& [name, environment] : environments) {
            spdlog::info("Run interrupted, keeping instance {} ({})",
                         environment->InstanceId(), name);
        }
        return;
    }

    // Every instance gets its terminate call; the first failure is reported afterwards
    std::exception_ptr first_failure;
    for (const auto& [name, environment] : environments) {
        try {
            environment->Terminate();
        } catch (const std::exception& e) {
            spdlog::error("Failed to terminate instance {} ({}): {}",
                          environment->InstanceId(), name, e.what());
            if (!first_failure) {
                first_failure = std::current_exception();
            }
        }
    }
    if (first_failure) {
        std::rethrow_exception(first_failure);
    }
}

bool SandboxEnvironment::TryCleanup(const EnvironmentMap& environments, bool interrupted) {
    return BestEffort("sample cleanup", [&] {
        SampleCleanup(environments, interrupted);
    });
}

void SandboxEnvironment::Terminate() {
    spdlog::info("Terminating instance {}", handle_.instance_id);
    clients_.control_plane->TerminateInstances({handle_.instance_id});
}

// ============================================================================
// BULK CLEANUP
// ============================================================================

std::vector<services::InstanceSummary> SandboxEnvironment::ListOwnedInstances(
    services::ControlPlane& control_plane) {

    std::vector<utils::ResourceFilter> filters = {
        utils::TagCodec::TagFilter(utils::kMarkerTagKey, utils::kMarkerTagValue),
        utils::ResourceFilter{"instance-state-name", kLiveInstanceStates},
    };
    return control_plane.DescribeInstances(filters);
}

bool SandboxEnvironment::IsInteractiveSession(const EnvLookup& env) {
    if (!isatty(STDIN_FILENO)) {
        return false;
    }
    return !env("CI") && !env("STRATUS_UNDER_TEST");
}

std::size_t SandboxEnvironment::BulkCleanup(services::ControlPlane& control_plane,
                                            const CleanupPrompts& prompts) {
    auto instances = ListOwnedInstances(control_plane);
    if (instances.empty()) {
        spdlog::info("No sandbox instances found to clean up");
        return 0;
    }

    if (prompts.display) {
        prompts.display(instances);
    }

    bool interactive = prompts.is_interactive ? prompts.is_interactive() : IsInteractiveSession();
    if (interactive && prompts.confirm && !prompts.confirm()) {
        spdlog::info("Cancelled.");
        return 0;
    }

    std::vector<std::string> ids;
    ids.reserve(instances.size());
    for (const auto& instance : instances) {
        ids.push_back(instance.instance_id);
    }

    spdlog::info("Terminating {} instance(s)", ids.size());
    control_plane.TerminateInstances(ids);
    return ids.size();
}

void SandboxEnvironment::Cleanup(const std::string& instance_id) {
    throw NotImplementedError("Cleanup by ID not implemented (requested " + instance_id + ")");
}

// ============================================================================
// OPERATIONS
// ============================================================================

ExecOutcome SandboxEnvironment::Exec(const ExecRequest& request) {
    if (request.input) {
        spdlog::warn("Input parameter not supported by the sandbox, ignoring it");
    }
    if (request.user) {
        spdlog::warn("User parameter not supported by the sandbox, ignoring it");
    }

    auto script = CommandDispatcher::BuildExecScript(request.cmd, request.env, request.cwd);
    return dispatcher_.RunScript(Operation::EXEC, script,
                                 request.timeout.value_or(kDefaultExecTimeout));
}

std::string SandboxEnvironment::ReadFileText(const std::string& path) {
    return files_.ReadFileText(path);
}

std::vector<std::uint8_t> SandboxEnvironment::ReadFileBytes(const std::string& path) {
    return FileTransferBridge::ToBytes(files_.ReadFile(path));
}

void SandboxEnvironment::WriteFile(const std::string& path, const std::string& contents) {
    files_.WriteFile(path, contents);
}

void SandboxEnvironment::WriteFile(const std::string& path,
                                   const std::vector<std::uint8_t>& contents) {
    files_.WriteFile(path, std::string(contents.begin(), contents.end()));
}

std::string SandboxEnvironment::ConnectionCommand() const {
    return "aws ssm start-session --target " + handle_.instance_id +
           " --document-name AWS-StartInteractiveCommand"
           " --parameters command=\"bash -l\"";
}

} // namespace core
} // namespace stratus
