/**
 * @file aws_command_relay.cpp
 * @brief Implementation of AwsCommandRelay
 *
 * @date 2025
 */

#include "stratus/services/aws_command_relay.hpp"
#include "stratus/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace stratus {
namespace services {

using json = nlohmann::json;

const char* const kRunShellScriptDocument = "AWS-RunShellScript";

AwsCommandRelay::AwsCommandRelay(std::shared_ptr<AwsCli> cli)
    : cli_(std::move(cli)) {
}

std::vector<std::string> AwsCommandRelay::SendArguments(const CommandRequest& request) {
    json parameters = json::object();
    parameters["commands"] = request.script_lines;
    parameters["executionTimeout"] = json::array({std::to_string(request.execution_timeout.count())});

    return {
        "--instance-ids", request.instance_id,
        "--document-name", kRunShellScriptDocument,
        "--parameters", parameters.dump(),
        "--output-s3-bucket-name", request.output_bucket,
        "--output-s3-key-prefix", request.output_key_prefix,
    };
}

InvocationStatus AwsCommandRelay::ParseInvocationStatus(const json& response) {
    InvocationStatus status;
    if (!response.is_object()) {
        return status;
    }

    status.state = ParseCommandState(response.value("Status", ""));

    // -1 means the command has not produced an exit code yet
    if (response.contains("ResponseCode") && response["ResponseCode"].is_number_integer()) {
        int code = response["ResponseCode"].get<int>();
        if (code >= 0) {
            status.response_code = code;
        }
    }
    return status;
}

std::vector<AgentInfo> AwsCommandRelay::ParseAgentInventory(const json& response) {
    std::vector<AgentInfo> records;
    if (!response.is_object() || !response.contains("InstanceInformationList")) {
        return records;
    }
    for (const auto& entry : response["InstanceInformationList"]) {
        AgentInfo info;
        info.instance_id = entry.value("InstanceId", "");
        info.ping_status = entry.value("PingStatus", "");
        records.push_back(std::move(info));
    }
    return records;
}

std::string AwsCommandRelay::SendCommand(const CommandRequest& request) {
    auto response = cli_->Call("ssm", "send-command", SendArguments(request));
    if (!response.is_object() || !response.contains("Command") ||
        !response["Command"].contains("CommandId")) {
        throw ServiceError("ssm", "InvalidResponse", "send-command returned no command id");
    }
    return response["Command"]["CommandId"].get<std::string>();
}

InvocationStatus AwsCommandRelay::GetInvocationStatus(const std::string& command_id,
                                                      const std::string& instance_id) {
    try {
        return ParseInvocationStatus(cli_->Call(
            "ssm", "get-command-invocation",
            {"--command-id", command_id, "--instance-id", instance_id}));
    } catch (const ServiceError& e) {
        if (e.Code() == "InvocationDoesNotExist") {
            spdlog::debug("Invocation {} not visible yet", command_id);
            return InvocationStatus{};
        }
        throw;
    }
}

void AwsCommandRelay::CancelCommand(const std::string& command_id,
                                    const std::vector<std::string>& instance_ids) {
    std::vector<std::string> args = {"--command-id", command_id};
    if (!instance_ids.empty()) {
        args.push_back("--instance-ids");
        args.insert(args.end(), instance_ids.begin(), instance_ids.end());
    }
    cli_->Call("ssm", "cancel-command", args);
}

std::vector<AgentInfo> AwsCommandRelay::DescribeAgentInventory(const std::string& instance_id) {
    json filter = json::object();
    filter["key"] = "InstanceIds";
    filter["valueSet"] = json::array({instance_id});

    return ParseAgentInventory(cli_->Call(
        "ssm", "describe-instance-information",
        {"--instance-information-filter-list", json::array({filter}).dump()}));
}

std::optional<std::string> AwsCommandRelay::GetParameter(const std::string& name) {
    auto response = cli_->Call("ssm", "get-parameters", {"--names", name});
    if (!response.is_object() || !response.contains("Parameters") ||
        !response["Parameters"].is_array() || response["Parameters"].empty()) {
        return std::nullopt;
    }
    const json& parameter = response["Parameters"][0];
    if (!parameter.contains("Value") || !parameter["Value"].is_string()) {
        return std::nullopt;
    }
    return parameter["Value"].get<std::string>();
}

} // namespace services
} // namespace stratus
