/**
 * @file aws_object_store.cpp
 * @brief Implementation of AwsObjectStore
 *
 * Bodies pass through scoped temporary files because the client reads
 * uploads from and writes downloads to the filesystem.
 *
 * @date 2025
 */

#include "stratus/services/aws_object_store.hpp"
#include "stratus/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace stratus {
namespace services {

using json = nlohmann::json;

namespace {

/// delete-objects accepts at most this many keys per call
constexpr std::size_t kDeleteBatchSize = 1000;

} // anonymous namespace

AwsObjectStore::AwsObjectStore(std::shared_ptr<AwsCli> cli, std::shared_ptr<S3Presigner> presigner)
    : cli_(std::move(cli))
    , presigner_(std::move(presigner)) {
}

std::string AwsObjectStore::FormatRange(const ByteRange& range) {
    return "bytes=" + std::to_string(range.first) + "-" + std::to_string(range.last);
}

bool AwsObjectStore::IsNotFoundCode(const std::string& code) {
    return code == "NoSuchKey" || code == "404" || code == "NotFound";
}

void AwsObjectStore::PutObject(const std::string& bucket, const std::string& key,
                               const std::string& body) {
    utils::ScopedTempFile upload("stratus_put");
    upload.Write(body);
    cli_->Call("s3api", "put-object",
               {"--bucket", bucket, "--key", key, "--body", upload.Path().string()});
    spdlog::debug("Uploaded {} bytes to s3://{}/{}", body.size(), bucket, key);
}

std::string AwsObjectStore::GetObject(const std::string& bucket, const std::string& key,
                                      const std::optional<ByteRange>& range) {
    utils::ScopedTempFile download("stratus_get");

    std::vector<std::string> args = {"--bucket", bucket, "--key", key};
    if (range) {
        args.push_back("--range");
        args.push_back(FormatRange(*range));
    }
    args.push_back(download.Path().string());

    try {
        cli_->Call("s3api", "get-object", args);
    } catch (const ServiceError& e) {
        if (IsNotFoundCode(e.Code())) {
            throw ObjectNotFound(key);
        }
        throw;
    }
    return download.Read();
}

std::uint64_t AwsObjectStore::HeadObject(const std::string& bucket, const std::string& key) {
    json response;
    try {
        response = cli_->Call("s3api", "head-object", {"--bucket", bucket, "--key", key});
    } catch (const ServiceError& e) {
        if (IsNotFoundCode(e.Code())) {
            throw ObjectNotFound(key);
        }
        throw;
    }

    if (!response.is_object() || !response.contains("ContentLength")) {
        return 0;
    }
    return response["ContentLength"].get<std::uint64_t>();
}

void AwsObjectStore::DeleteObject(const std::string& bucket, const std::string& key) {
    cli_->Call("s3api", "delete-object", {"--bucket", bucket, "--key", key});
    spdlog::debug("Deleted s3://{}/{}", bucket, key);
}

void AwsObjectStore::DeleteObjectsByPrefix(const std::string& bucket, const std::string& prefix) {
    auto listing = cli_->Call("s3api", "list-objects-v2", {"--bucket", bucket, "--prefix", prefix});
    if (!listing.is_object() || !listing.contains("Contents") || !listing["Contents"].is_array()) {
        return;
    }

    std::vector<std::string> keys;
    for (const auto& entry : listing["Contents"]) {
        if (entry.contains("Key") && entry["Key"].is_string()) {
            keys.push_back(entry["Key"].get<std::string>());
        }
    }

    for (std::size_t start = 0; start < keys.size(); start += kDeleteBatchSize) {
        json objects = json::array();
        for (std::size_t i = start; i < keys.size() && i < start + kDeleteBatchSize; ++i) {
            json object = json::object();
            object["Key"] = keys[i];
            objects.push_back(object);
        }

        json request = json::object();
        request["Objects"] = objects;
        request["Quiet"] = true;
        cli_->Call("s3api", "delete-objects", {"--bucket", bucket, "--delete", request.dump()});
    }

    spdlog::debug("Deleted {} object(s) under s3://{}/{}", keys.size(), bucket, prefix);
}

std::string AwsObjectStore::PresignUrl(PresignMethod method, const std::string& bucket,
                                       const std::string& key, std::chrono::seconds ttl) {
    return presigner_->Presign(method, bucket, key, ttl);
}

} // namespace services
} // namespace stratus
