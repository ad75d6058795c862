/**
 * @file aws_command_relay.hpp
 * @brief CommandRelay over `aws ssm`
 *
 * @date 2025
 */

#pragma once

#include "stratus/services/aws_cli.hpp"
#include "stratus/services/command_relay.hpp"

#include <memory>

namespace stratus {
namespace services {

/// Relay document that runs a shell script
extern const char* const kRunShellScriptDocument;

class AwsCommandRelay : public CommandRelay {
public:
    explicit AwsCommandRelay(std::shared_ptr<AwsCli> cli);

    std::string SendCommand(const CommandRequest& request) override;
    InvocationStatus GetInvocationStatus(const std::string& command_id,
                                         const std::string& instance_id) override;
    void CancelCommand(const std::string& command_id,
                       const std::vector<std::string>& instance_ids) override;
    std::vector<AgentInfo> DescribeAgentInventory(const std::string& instance_id) override;
    std::optional<std::string> GetParameter(const std::string& name) override;

    /// `send-command` arguments for request
    static std::vector<std::string> SendArguments(const CommandRequest& request);

    /// Status and exit code from a `get-command-invocation` response
    static InvocationStatus ParseInvocationStatus(const nlohmann::json& response);

    /// Records from a `describe-instance-information` response
    static std::vector<AgentInfo> ParseAgentInventory(const nlohmann::json& response);

private:
    std::shared_ptr<AwsCli> cli_;
};

} // namespace services
} // namespace stratus
