/**
 * @file s3_presigner.hpp
 * @brief SigV4 query-string presigning of object URLs
 *
 * Presigned URLs are computed locally; no request is made. The signature
 * covers only the host header and uses an unsigned payload, so the same
 * URL works for any body curl uploads.
 *
 * ```
 * signing key = HMAC(HMAC(HMAC(HMAC("AWS4" + secret, date), region), "s3"), "aws4_request")
 * signature   = hex(HMAC(signing key, string-to-sign))
 * ```
 *
 * @date 2025
 */

#pragma once

#include "stratus/core/sandbox_config.hpp"
#include "stratus/services/object_store.hpp"

#include <chrono>
#include <functional>
#include <string>

namespace stratus {
namespace services {

class AwsCli;

/**
 * @struct AwsCredentials
 * @brief Key pair plus optional session token
 */
struct AwsCredentials {
    std::string access_key_id;
    std::string secret_access_key;
    std::string session_token;   ///< Empty for long-term keys
};

/// Supplies credentials at signing time
using CredentialsProvider = std::function<AwsCredentials()>;

/**
 * @brief Credentials from AWS_* variables, else from the aws client
 *
 * Falls back to `aws configure export-credentials --format process`.
 *
 * @throws ConfigError if neither source yields a key pair
 */
AwsCredentials ResolveCredentials(const core::EnvLookup& env, const AwsCli& cli);

/**
 * @class S3Presigner
 * @brief Virtual-hosted style presigner for one region
 */
class S3Presigner {
public:
    /**
     * @param region Signing region
     * @param credentials Called on every Presign
     * @param endpoint Host suffix; defaults to `s3.{region}.amazonaws.com`
     */
    S3Presigner(std::string region, CredentialsProvider credentials, std::string endpoint = "");

    std::string Presign(PresignMethod method, const std::string& bucket,
                        const std::string& key, std::chrono::seconds ttl) const;

    /// Presign at a fixed signing time
    std::string Presign(PresignMethod method, const std::string& bucket,
                        const std::string& key, std::chrono::seconds ttl,
                        std::chrono::system_clock::time_point now) const;

    /// `YYYYMMDD'T'HHMMSS'Z'` in UTC
    static std::string FormatAmzDate(std::chrono::system_clock::time_point time);

    const std::string& Endpoint() const { return endpoint_; }

private:
    std::string region_;
    CredentialsProvider credentials_;
    std::string endpoint_;
};

} // namespace services
} // namespace stratus
