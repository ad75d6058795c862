/**
 * @file aws_object_store.hpp
 * @brief ObjectStore over `aws s3api` with locally presigned URLs
 *
 * @date 2025
 */

#pragma once

#include "stratus/services/aws_cli.hpp"
#include "stratus/services/object_store.hpp"
#include "stratus/services/s3_presigner.hpp"

#include <memory>

namespace stratus {
namespace services {

class AwsObjectStore : public ObjectStore {
public:
    AwsObjectStore(std::shared_ptr<AwsCli> cli, std::shared_ptr<S3Presigner> presigner);

    void PutObject(const std::string& bucket, const std::string& key,
                   const std::string& body) override;
    std::string GetObject(const std::string& bucket, const std::string& key,
                          const std::optional<ByteRange>& range = std::nullopt) override;
    std::uint64_t HeadObject(const std::string& bucket, const std::string& key) override;
    void DeleteObject(const std::string& bucket, const std::string& key) override;
    void DeleteObjectsByPrefix(const std::string& bucket, const std::string& prefix) override;
    std::string PresignUrl(PresignMethod method, const std::string& bucket,
                           const std::string& key, std::chrono::seconds ttl) override;

    /// `bytes=first-last`
    static std::string FormatRange(const ByteRange& range);

    /// True for the codes the service uses for a missing key
    static bool IsNotFoundCode(const std::string& code);

private:
    std::shared_ptr<AwsCli> cli_;
    std::shared_ptr<S3Presigner> presigner_;
};

} // namespace services
} // namespace stratus
