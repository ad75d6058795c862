/**
 * @file service_clients.hpp
 * @brief Bundle of collaborator clients owned by one sandbox environment
 *
 * @date 2025
 */

#pragma once

#include "stratus/services/command_relay.hpp"
#include "stratus/services/control_plane.hpp"
#include "stratus/services/object_store.hpp"

#include <functional>
#include <memory>
#include <string>

namespace stratus {
namespace services {

/**
 * @struct ServiceClients
 * @brief Region-scoped clients injected into each environment
 */
struct ServiceClients {
    std::shared_ptr<ControlPlane> control_plane;
    std::shared_ptr<CommandRelay> relay;
    std::shared_ptr<ObjectStore> object_store;
};

/// Builds the clients for a region
using ClientFactory = std::function<ServiceClients(const std::string& region)>;

} // namespace services
} // namespace stratus
