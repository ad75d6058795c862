/**
 * @file control_plane.hpp
 * @brief Compute control plane contract (launch, wait, list, terminate)
 *
 * @date 2025
 */

#pragma once

#include "stratus/utils/tag_codec.hpp"

#include <string>
#include <vector>

namespace stratus {
namespace services {

/**
 * @struct LaunchRequest
 * @brief Everything needed to start exactly one instance
 */
struct LaunchRequest {
    std::string image_id;             ///< Machine image
    std::string instance_type;        ///< Hardware shape
    std::string security_group_id;    ///< Network security group
    std::string subnet_id;            ///< Subnet placement
    std::string instance_profile;     ///< Identity profile name
    utils::TagSet tags;               ///< Tags applied to the instance at launch
};

/**
 * @struct InstanceSummary
 * @brief One instance as listed by the control plane
 */
struct InstanceSummary {
    std::string instance_id;   ///< Instance identifier
    std::string state;         ///< State name (pending, running, ...)
    utils::TagSet tags;        ///< Instance tags
};

/**
 * @class ControlPlane
 * @brief Creates, lists and terminates compute instances
 *
 * Implementations throw ServiceError on any service failure.
 */
class ControlPlane {
public:
    virtual ~ControlPlane() = default;

    /// Launch one instance (MinCount = MaxCount = 1) and return its id
    virtual std::string LaunchInstance(const LaunchRequest& request) = 0;

    /// Block until the instance is running, using the service's own waiter policy
    virtual void WaitUntilRunning(const std::string& instance_id) = 0;

    /// Terminate all listed instances in one call
    virtual void TerminateInstances(const std::vector<std::string>& instance_ids) = 0;

    /// List instances matching every filter
    virtual std::vector<InstanceSummary> DescribeInstances(
        const std::vector<utils::ResourceFilter>& filters) = 0;
};

} // namespace services
} // namespace stratus
