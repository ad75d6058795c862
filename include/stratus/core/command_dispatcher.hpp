/**
 * @file command_dispatcher.hpp
 * @brief Remote shell execution through the command relay
 *
 * One call is one sequential pipeline:
 *
 * ```
 * SUBMITTED ── SendCommand(script, bucket, fresh prefix)
 *     │
 *     ▼
 *  POLLING ── GetInvocationStatus once per second, bounded by the timeout
 *     │
 *     ├─ Success ──────────────────────────► SUCCEEDED ─┐
 *     ├─ Failed/Cancelled/TimedOut ────────► FAILED ────┤
 *     │                                                 ▼
 *     │                          ReadOrBlank(stdout), ReadOrBlank(stderr)
 *     │                                                 │
 *     └─ still running at exhaustion ─► TIMED_OUT       │
 *            CancelCommand (best effort)                │
 *                    │                                  │
 *                    ▼                                  ▼
 *              ArtifactJanitor: stdout key, stderr key, {prefix}{command_id}/
 * ```
 *
 * @date 2025
 */

#pragma once

#include "stratus/core/artifact_janitor.hpp"
#include "stratus/core/invocation.hpp"
#include "stratus/core/key_generator.hpp"
#include "stratus/core/result_retriever.hpp"
#include "stratus/core/retry.hpp"
#include "stratus/services/service_clients.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace stratus {
namespace core {

/**
 * @enum InvocationPhase
 * @brief Where an invocation is in its lifecycle
 */
enum class InvocationPhase {
    SUBMITTED,   ///< Handed to the relay
    POLLING,     ///< Waiting for a terminal state
    SUCCEEDED,   ///< Relay reported success
    FAILED,      ///< Relay reported failure, cancellation or its own timeout
    TIMED_OUT    ///< Caller's timeout expired first
};

std::string InvocationPhaseToString(InvocationPhase phase);

/**
 * @struct Completion
 * @brief Final phase of a wait and the last status seen
 */
struct Completion {
    InvocationPhase phase{InvocationPhase::POLLING};
    services::InvocationStatus status;
    int attempts{0};
};

/**
 * @class CompletionWaiter
 * @brief Bounded poller for one invocation
 *
 * Attempt ceiling is the timeout in seconds at a one-second cadence, with a
 * wall-clock deadline of the same length on top.
 */
class CompletionWaiter {
public:
    CompletionWaiter(std::shared_ptr<services::CommandRelay> relay, Sleeper sleeper);

    /**
     * @brief Poll until terminal or out of budget
     * @throws ServiceError if a status probe fails
     */
    Completion Wait(const Invocation& invocation) const;

    static RetryPolicy PolicyFor(std::chrono::seconds timeout);

private:
    std::shared_ptr<services::CommandRelay> relay_;
    Sleeper sleeper_;
};

/**
 * @class CommandDispatcher
 * @brief Runs shell scripts on one instance and collects their output
 *
 * **Usage Example**:
 * @code
 * CommandDispatcher dispatcher(instance_id, config.Bucket(), clients, keys);
 * auto script = CommandDispatcher::BuildExecScript({"ls", "-la"}, {}, "/tmp");
 * ExecOutcome outcome = dispatcher.RunScript(Operation::EXEC, script,
 *                                            std::chrono::seconds(30));
 * @endcode
 */
class CommandDispatcher {
public:
    CommandDispatcher(std::string instance_id,
                      std::string bucket,
                      const services::ServiceClients& clients,
                      std::shared_ptr<KeyGenerator> keys,
                      Sleeper sleeper = ThreadSleeper());

    /**
     * @brief Submit lines as one script and wait for it
     *
     * @param operation Names the key-prefix segment
     * @param script_lines Script body
     * @param timeout Caller timeout; also sent as the relay execution timeout
     * @return Outcome of a command that reached a terminal state
     *
     * @throws ExecutionTimeout if the command was still running at the timeout
     * @throws PermissionDenied if the shell could not execute the command
     * @throws OutputTruncated if either stream reached 10 MiB
     * @throws ServiceError if submission, polling or retrieval fails
     */
    ExecOutcome RunScript(Operation operation,
                          const std::vector<std::string>& script_lines,
                          std::chrono::seconds timeout);

    /**
     * @brief Script lines for an argv with environment and working directory
     *
     * `export K=V` per variable (name and value quoted), `cd DIR` when cwd is set, then the
     * quoted command line.
     */
    static std::vector<std::string> BuildExecScript(const std::vector<std::string>& cmd,
                                                    const std::map<std::string, std::string>& env,
                                                    const std::optional<std::string>& cwd);

    const std::string& InstanceId() const { return instance_id_; }

private:
    std::string instance_id_;
    std::string bucket_;
    std::shared_ptr<services::CommandRelay> relay_;
    std::shared_ptr<KeyGenerator> keys_;
    CompletionWaiter waiter_;
    ResultRetriever retriever_;
    ArtifactJanitor janitor_;
};

} // namespace core
} // namespace stratus
