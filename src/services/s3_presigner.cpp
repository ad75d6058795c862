/**
 * @file s3_presigner.cpp
 * @brief Implementation of S3Presigner and credential resolution
 *
 * @date 2025
 */

#include "stratus/services/s3_presigner.hpp"
#include "stratus/core/errors.hpp"
#include "stratus/services/aws_cli.hpp"
#include "stratus/utils/hash_utils.hpp"
#include "stratus/utils/string_utils.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <ctime>
#include <map>
#include <utility>

namespace stratus {
namespace services {

using json = nlohmann::json;
using utils::HashUtils;
using utils::StringUtils;

namespace {

const char* const kAlgorithm = "AWS4-HMAC-SHA256";
const char* const kService = "s3";
const char* const kUnsignedPayload = "UNSIGNED-PAYLOAD";

std::string MethodName(PresignMethod method) {
    return method == PresignMethod::PUT ? "PUT" : "GET";
}

} // anonymous namespace

// ============================================================================
// CREDENTIALS
// ============================================================================

AwsCredentials ResolveCredentials(const core::EnvLookup& env, const AwsCli& cli) {
    auto access_key = env("AWS_ACCESS_KEY_ID");
    auto secret_key = env("AWS_SECRET_ACCESS_KEY");
    if (access_key && secret_key && !access_key->empty() && !secret_key->empty()) {
        AwsCredentials credentials;
        credentials.access_key_id = *access_key;
        credentials.secret_access_key = *secret_key;
        credentials.session_token = env("AWS_SESSION_TOKEN").value_or("");
        return credentials;
    }

    spdlog::debug("No credentials in environment, asking the aws client");
    auto result = cli.RunRaw({"configure", "export-credentials", "--format", "process"});
    if (!result.success) {
        throw ConfigError("Could not resolve AWS credentials: " +
                          StringUtils::Trim(result.stderr_output));
    }

    try {
        auto document = json::parse(result.stdout_output);
        AwsCredentials credentials;
        credentials.access_key_id = document.value("AccessKeyId", "");
        credentials.secret_access_key = document.value("SecretAccessKey", "");
        credentials.session_token = document.value("SessionToken", "");
        if (credentials.access_key_id.empty() || credentials.secret_access_key.empty()) {
            throw ConfigError("aws configure export-credentials returned no key pair");
        }
        return credentials;
    } catch (const json::exception& e) {
        throw ConfigError(std::string("Could not parse exported credentials: ") + e.what());
    }
}

// ============================================================================
// PRESIGNER
// ============================================================================

S3Presigner::S3Presigner(std::string region, CredentialsProvider credentials, std::string endpoint)
    : region_(std::move(region))
    , credentials_(std::move(credentials))
    , endpoint_(std::move(endpoint)) {
    if (endpoint_.empty()) {
        endpoint_ = "s3." + region_ + ".amazonaws.com";
    }
}

std::string S3Presigner::FormatAmzDate(std::chrono::system_clock::time_point time) {
    std::time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm utc{};
    gmtime_r(&t, &utc);

    char buffer[17];
    std::strftime(buffer, sizeof(buffer), "%Y%m%dT%H%M%SZ", &utc);
    return buffer;
}

std::string S3Presigner::Presign(PresignMethod method, const std::string& bucket,
                                 const std::string& key, std::chrono::seconds ttl) const {
    return Presign(method, bucket, key, ttl, std::chrono::system_clock::now());
}

std::string S3Presigner::Presign(PresignMethod method, const std::string& bucket,
                                 const std::string& key, std::chrono::seconds ttl,
                                 std::chrono::system_clock::time_point now) const {
    const AwsCredentials credentials = credentials_();

    const std::string amz_date = FormatAmzDate(now);
    const std::string date_stamp = amz_date.substr(0, 8);
    const std::string scope = date_stamp + "/" + region_ + "/" + kService + "/aws4_request";
    const std::string host = bucket + "." + endpoint_;
    const std::string canonical_uri = "/" + StringUtils::UriEncode(key, true);

    // Sorted by encoded name
    std::map<std::string, std::string> query;
    query["X-Amz-Algorithm"] = kAlgorithm;
    query["X-Amz-Credential"] = credentials.access_key_id + "/" + scope;
    query["X-Amz-Date"] = amz_date;
    query["X-Amz-Expires"] = std::to_string(ttl.count());
    query["X-Amz-SignedHeaders"] = "host";
    if (!credentials.session_token.empty()) {
        query["X-Amz-Security-Token"] = credentials.session_token;
    }

    std::string canonical_query;
    for (const auto& [name, value] : query) {
        if (!canonical_query.empty()) {
            canonical_query += "&";
        }
        canonical_query += StringUtils::UriEncode(name) + "=" + StringUtils::UriEncode(value);
    }

    const std::string canonical_request =
        MethodName(method) + "\n" +
        canonical_uri + "\n" +
        canonical_query + "\n" +
        "host:" + host + "\n" +
        "\n" +
        "host\n" +
        kUnsignedPayload;

    const std::string string_to_sign =
        std::string(kAlgorithm) + "\n" +
        amz_date + "\n" +
        scope + "\n" +
        HashUtils::Sha256Hex(canonical_request);

    std::string signing_key = HashUtils::HmacSha256("AWS4" + credentials.secret_access_key, date_stamp);
    signing_key = HashUtils::HmacSha256(signing_key, region_);
    signing_key = HashUtils::HmacSha256(signing_key, kService);
    signing_key = HashUtils::HmacSha256(signing_key, "aws4_request");

    const std::string signature = HashUtils::ToHex(HashUtils::HmacSha256(signing_key, string_to_sign));

    return "https://" + host + canonical_uri + "?" + canonical_query +
           "&X-Amz-Signature=" + signature;
}

} // namespace services
} // namespace stratus
