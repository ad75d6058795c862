/**
 * @file aws_clients.hpp
 * @brief ClientFactory wiring the aws-client collaborators for a region
 *
 * @date 2025
 */

#pragma once

#include "stratus/services/service_clients.hpp"

#include <string>

namespace stratus {
namespace services {

/**
 * @brief Control plane, relay and object store sharing one AwsCli
 *
 * Credentials for presigning are resolved lazily, on first use.
 */
ServiceClients MakeAwsCliClients(const std::string& region);

} // namespace services
} // namespace stratus
