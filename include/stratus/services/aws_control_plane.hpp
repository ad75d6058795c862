/**
 * @file aws_control_plane.hpp
 * @brief ControlPlane over `aws ec2`
 *
 * @date 2025
 */

#pragma once

#include "stratus/services/aws_cli.hpp"
#include "stratus/services/control_plane.hpp"

#include <memory>

namespace stratus {
namespace services {

class AwsControlPlane : public ControlPlane {
public:
    explicit AwsControlPlane(std::shared_ptr<AwsCli> cli);

    std::string LaunchInstance(const LaunchRequest& request) override;
    void WaitUntilRunning(const std::string& instance_id) override;
    void TerminateInstances(const std::vector<std::string>& instance_ids) override;
    std::vector<InstanceSummary> DescribeInstances(
        const std::vector<utils::ResourceFilter>& filters) override;

    /// `run-instances` arguments for request
    static std::vector<std::string> LaunchArguments(const LaunchRequest& request);

    /// Instance id from a `run-instances` response
    static std::string ParseLaunchResponse(const nlohmann::json& response);

    /// Flatten `Reservations[].Instances[]`
    static std::vector<InstanceSummary> ParseInstances(const nlohmann::json& response);

private:
    std::shared_ptr<AwsCli> cli_;
};

} // namespace services
} // namespace stratus
