/**
 * @file aws_control_plane.cpp
 * @brief Implementation of AwsControlPlane
 *
 * @date 2025
 */

#include "stratus/services/aws_control_plane.hpp"
#include "stratus/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace stratus {
namespace services {

using json = nlohmann::json;
using utils::TagCodec;

AwsControlPlane::AwsControlPlane(std::shared_ptr<AwsCli> cli)
    : cli_(std::move(cli)) {
}

std::vector<std::string> AwsControlPlane::LaunchArguments(const LaunchRequest& request) {
    return {
        "--image-id", request.image_id,
        "--instance-type", request.instance_type,
        "--security-group-ids", request.security_group_id,
        "--subnet-id", request.subnet_id,
        "--iam-instance-profile", "Name=" + request.instance_profile,
        "--tag-specifications", TagCodec::ToTagSpecifications("instance", request.tags).dump(),
        "--min-count", "1",
        "--max-count", "1",
    };
}

std::string AwsControlPlane::ParseLaunchResponse(const json& response) {
    if (!response.is_object() || !response.contains("Instances") ||
        !response["Instances"].is_array() || response["Instances"].empty()) {
        throw ServiceError("ec2", "InvalidResponse", "run-instances returned no instances");
    }

    const json& instance = response["Instances"][0];
    if (!instance.contains("InstanceId") || !instance["InstanceId"].is_string()) {
        throw ServiceError("ec2", "InvalidResponse", "run-instances returned no instance id");
    }
    return instance["InstanceId"].get<std::string>();
}

std::vector<InstanceSummary> AwsControlPlane::ParseInstances(const json& response) {
    std::vector<InstanceSummary> instances;
    if (!response.is_object() || !response.contains("Reservations")) {
        return instances;
    }

    for (const auto& reservation : response["Reservations"]) {
        if (!reservation.contains("Instances")) {
            continue;
        }
        for (const auto& instance : reservation["Instances"]) {
            InstanceSummary summary;
            summary.instance_id = instance.value("InstanceId", "");
            if (instance.contains("State") && instance["State"].is_object()) {
                summary.state = instance["State"].value("Name", "");
            }
            if (instance.contains("Tags")) {
                summary.tags = TagCodec::FromResourceTags(instance["Tags"]);
            }
            instances.push_back(std::move(summary));
        }
    }
    return instances;
}

std::string AwsControlPlane::LaunchInstance(const LaunchRequest& request) {
    auto response = cli_->Call("ec2", "run-instances", LaunchArguments(request));
    std::string instance_id = ParseLaunchResponse(response);
    spdlog::debug("run-instances returned {}", instance_id);
    return instance_id;
}

void AwsControlPlane::WaitUntilRunning(const std::string& instance_id) {
    cli_->Call("ec2", "wait", {"instance-running", "--instance-ids", instance_id});
}

void AwsControlPlane::TerminateInstances(const std::vector<std::string>& instance_ids) {
    if (instance_ids.empty()) {
        return;
    }
    std::vector<std::string> args = {"--instance-ids"};
    args.insert(args.end(), instance_ids.begin(), instance_ids.end());
    cli_->Call("ec2", "terminate-instances", args);
}

std::vector<InstanceSummary> AwsControlPlane::DescribeInstances(
    const std::vector<utils::ResourceFilter>& filters) {

    std::vector<std::string> args;
    if (!filters.empty()) {
        args = {"--filters", TagCodec::ToFilters(filters).dump()};
    }
    return ParseInstances(cli_->Call("ec2", "describe-instances", args));
}

} // namespace services
} // namespace stratus
