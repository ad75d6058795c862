/**
 * @file aws_clients.cpp
 * @brief Implementation of MakeAwsCliClients
 *
 * @date 2025
 */

#include "stratus/services/aws_clients.hpp"
#include "stratus/services/aws_cli.hpp"
#include "stratus/services/aws_command_relay.hpp"
#include "stratus/services/aws_control_plane.hpp"
#include "stratus/services/aws_object_store.hpp"
#include "stratus/services/s3_presigner.hpp"

#include <memory>
#include <mutex>
#include <optional>

namespace stratus {
namespace services {

ServiceClients MakeAwsCliClients(const std::string& region) {
    auto cli = std::make_shared<AwsCli>(region);

    struct CachedCredentials {
        std::mutex mutex;
        std::optional<AwsCredentials> credentials;
    };
    auto cache = std::make_shared<CachedCredentials>();

    auto presigner = std::make_shared<S3Presigner>(region, [cli, cache] {
        std::lock_guard<std::mutex> lock(cache->mutex);
        if (!cache->credentials) {
            cache->credentials = ResolveCredentials(core::ProcessEnvironment(), *cli);
        }
        return *cache->credentials;
    });

    ServiceClients clients;
    clients.control_plane = std::make_shared<AwsControlPlane>(cli);
    clients.relay = std::make_shared<AwsCommandRelay>(cli);
    clients.object_store = std::make_shared<AwsObjectStore>(cli, presigner);
    return clients;
}

} // namespace services
} // namespace stratus
