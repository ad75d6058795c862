/**
 * @file command_relay.hpp
 * @brief Command relay contract (send, poll, cancel, agent inventory)
 *
 * The relay delivers a shell script to an instance that has no inbound
 * network path and mirrors the script's stdout/stderr into the object store
 * under a caller-chosen key prefix.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace stratus {
namespace services {

/**
 * @enum CommandState
 * @brief Relay-side status of one command invocation
 */
enum class CommandState {
    PENDING,      ///< Accepted, not yet delivered (also: invocation not yet visible)
    IN_PROGRESS,  ///< Running on the instance
    DELAYED,      ///< Delivery retried by the relay
    SUCCESS,      ///< Exited with status 0
    CANCELLED,    ///< Cancelled before completion
    CANCELLING,   ///< Cancellation in flight
    TIMED_OUT,    ///< Relay's own execution timeout hit
    FAILED        ///< Exited non-zero or could not run
};

/// Parse a relay status string (`"InProgress"`, `"Success"`, ...)
CommandState ParseCommandState(const std::string& status);

/// Relay spelling of a state
std::string CommandStateToString(CommandState state);

/// True for states after which the invocation will not change again
bool IsTerminal(CommandState state);

/**
 * @struct CommandRequest
 * @brief One shell script submission
 */
struct CommandRequest {
    std::string instance_id;                   ///< Target instance
    std::vector<std::string> script_lines;     ///< Script, one line per element
    std::chrono::seconds execution_timeout{3600};  ///< Relay-side execution timeout
    std::string output_bucket;                 ///< Bucket receiving stdout/stderr
    std::string output_key_prefix;             ///< Unique per-invocation key prefix
};

/**
 * @struct InvocationStatus
 * @brief Snapshot of a command on one instance
 */
struct InvocationStatus {
    CommandState state{CommandState::PENDING};  ///< Current state
    std::optional<int> response_code;           ///< Exit code once known
};

/**
 * @struct AgentInfo
 * @brief Relay agent inventory record
 */
struct AgentInfo {
    std::string instance_id;   ///< Instance the agent runs on
    std::string ping_status;   ///< `Online`, `ConnectionLost`, ...
};

/**
 * @class CommandRelay
 * @brief Remote command execution service
 *
 * Implementations throw ServiceError on any service failure. A command not
 * yet visible on the instance is reported as PENDING rather than an error.
 */
class CommandRelay {
public:
    virtual ~CommandRelay() = default;

    /// Submit a script and return the relay-assigned command id
    virtual std::string SendCommand(const CommandRequest& request) = 0;

    virtual InvocationStatus GetInvocationStatus(const std::string& command_id,
                                                 const std::string& instance_id) = 0;

    virtual void CancelCommand(const std::string& command_id,
                               const std::vector<std::string>& instance_ids) = 0;

    /// Agent records for one instance (empty until the agent registers)
    virtual std::vector<AgentInfo> DescribeAgentInventory(const std::string& instance_id) = 0;

    /// Read a value from the relay's parameter store, nullopt when absent
    virtual std::optional<std::string> GetParameter(const std::string& name) = 0;

    /**
     * @brief Object key the relay writes a stream to
     *
     * Layout: `{prefix}{command_id}/{instance_id}/awsrunShellScript/0.awsrunShellScript/{stream}`.
     *
     * @param stream "stdout" or "stderr"
     */
    virtual std::string OutputKey(const std::string& key_prefix,
                                  const std::string& command_id,
                                  const std::string& instance_id,
                                  const std::string& stream) const;
};

} // namespace services
} // namespace stratus
