/**
 * @file sandbox_config.hpp
 * @brief Sandbox configuration: settings sources, defaults and validation
 *
 * Configuration is assembled once, before any instance is launched:
 *
 * ```
 * .env file  <  STRATUS_* environment  <  JSON file  <  explicit overrides
 *                        │
 *                        ▼
 *               SandboxConfigBuilder::Build()
 *                 ├─ region: AWS_REGION fallback
 *                 ├─ image: parameter-store lookup when unset
 *                 ├─ instance type: t3a.large
 *                 └─ key prefix: "" (must not start with '/')
 *                        │
 *                        ▼
 *               SandboxConfig (immutable)
 * ```
 *
 * @date 2025
 */

#pragma once

#include "stratus/utils/tag_codec.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace stratus {

namespace services {
class CommandRelay;
}

namespace core {

/// Environment variable prefix for settings
extern const char* const kSettingsEnvPrefix;

/// Relay parameter holding the current Ubuntu 24.04 image id
extern const char* const kDefaultImageParameter;

/// Instance type used when none is configured
extern const char* const kDefaultInstanceType;

/**
 * @struct SandboxSettings
 * @brief Partially specified configuration from one source
 *
 * Unset fields are std::nullopt so sources can be layered with MergeFrom().
 */
struct SandboxSettings {
    std::optional<std::string> region;
    std::optional<std::string> vpc_id;
    std::optional<std::string> security_group_id;
    std::optional<std::string> subnet_id;
    std::optional<std::string> ami_id;
    std::optional<std::string> instance_type;
    std::optional<std::string> instance_profile;
    std::optional<std::string> s3_bucket;
    std::optional<std::string> s3_key_prefix;
    std::optional<utils::TagSet> extra_tags;

    /// Overwrite every field that is set in overrides
    void MergeFrom(const SandboxSettings& overrides);
};

/// Looks up one environment variable
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/// Resolves the default image id for a region
using ImageLookup = std::function<std::string(const std::string& region)>;

/// EnvLookup over the real process environment
EnvLookup ProcessEnvironment();

/**
 * @brief Read `STRATUS_*` variables
 *
 * Keys: REGION, VPC_ID, SECURITY_GROUP_ID, SUBNET_ID, AMI_ID, INSTANCE_TYPE,
 * INSTANCE_PROFILE, S3_BUCKET, S3_KEY_PREFIX, EXTRA_TAGS (`k=v;k=v`).
 *
 * @throws TagFormatError if EXTRA_TAGS is malformed
 */
SandboxSettings LoadSettingsFromEnvironment(const EnvLookup& env);

/**
 * @brief Read the same keys from a dotenv file
 *
 * Blank lines and `#` comments are ignored, an `export ` prefix and matching
 * surrounding quotes are stripped. A missing file yields empty settings.
 */
SandboxSettings LoadSettingsFromDotEnv(const std::filesystem::path& path);

/**
 * @brief Read settings from a JSON object file
 *
 * Keys are the lower-case field names. `extra_tags` may be a `k=v;k=v`
 * string, an array of `{"Key","Value"}` objects or a plain object.
 *
 * @throws ConfigError if the file is unreadable or not a JSON object
 */
SandboxSettings LoadSettingsFromJson(const std::filesystem::path& path);

/**
 * @brief Default image lookup through the relay's parameter store
 * @throws ConfigError if the parameter does not exist
 */
std::string LookupDefaultImage(services::CommandRelay& relay);

/**
 * @class SandboxConfig
 * @brief Fully resolved, immutable sandbox configuration
 */
class SandboxConfig {
public:
    struct Fields {
        std::string region;              ///< Service region
        std::string vpc_id;              ///< Network id
        std::string security_group_id;   ///< Security group for the instance
        std::string subnet_id;           ///< Subnet placement
        std::string ami_id;              ///< Machine image
        std::string instance_type;       ///< Hardware shape
        std::string instance_profile;    ///< Identity profile name
        std::string s3_bucket;           ///< Bucket used as side channel
        std::string s3_key_prefix;       ///< Key prefix inside the bucket (may be empty)
        utils::TagSet extra_tags;        ///< Caller-supplied tags
    };

    /**
     * @brief Validate and freeze the fields
     * @throws ConfigError for an empty required field or a key prefix starting with '/'
     */
    explicit SandboxConfig(Fields fields);

    const std::string& Region() const { return fields_.region; }
    const std::string& VpcId() const { return fields_.vpc_id; }
    const std::string& SecurityGroupId() const { return fields_.security_group_id; }
    const std::string& SubnetId() const { return fields_.subnet_id; }
    const std::string& ImageId() const { return fields_.ami_id; }
    const std::string& InstanceType() const { return fields_.instance_type; }
    const std::string& InstanceProfile() const { return fields_.instance_profile; }
    const std::string& Bucket() const { return fields_.s3_bucket; }
    const std::string& KeyPrefix() const { return fields_.s3_key_prefix; }
    const utils::TagSet& ExtraTags() const { return fields_.extra_tags; }

private:
    Fields fields_;
};

/**
 * @class SandboxConfigBuilder
 * @brief Fluent API for assembling a SandboxConfig
 *
 * **Usage Example**:
 * @code
 * auto config = SandboxConfigBuilder()
 *     .FromSettings(LoadSettingsFromDotEnv(".env"))
 *     .FromSettings(LoadSettingsFromEnvironment(ProcessEnvironment()))
 *     .WithInstanceType("t3a.micro")
 *     .Build([&](const std::string& region) {
 *         return LookupDefaultImage(*factory(region).relay);
 *     });
 * @endcode
 */
class SandboxConfigBuilder {
public:
    /// Layer a settings source over what has been collected so far
    SandboxConfigBuilder& FromSettings(const SandboxSettings& settings) {
        settings_.MergeFrom(settings);
        return *this;
    }

    SandboxConfigBuilder& WithRegion(const std::string& region) {
        settings_.region = region;
        return *this;
    }

    SandboxConfigBuilder& WithVpcId(const std::string& vpc_id) {
        settings_.vpc_id = vpc_id;
        return *this;
    }

    SandboxConfigBuilder& WithSecurityGroupId(const std::string& security_group_id) {
        settings_.security_group_id = security_group_id;
        return *this;
    }

    SandboxConfigBuilder& WithSubnetId(const std::string& subnet_id) {
        settings_.subnet_id = subnet_id;
        return *this;
    }

    SandboxConfigBuilder& WithImageId(const std::string& ami_id) {
        settings_.ami_id = ami_id;
        return *this;
    }

    SandboxConfigBuilder& WithInstanceType(const std::string& instance_type) {
        settings_.instance_type = instance_type;
        return *this;
    }

    SandboxConfigBuilder& WithInstanceProfile(const std::string& instance_profile) {
        settings_.instance_profile = instance_profile;
        return *this;
    }

    SandboxConfigBuilder& WithBucket(const std::string& bucket) {
        settings_.s3_bucket = bucket;
        return *this;
    }

    SandboxConfigBuilder& WithKeyPrefix(const std::string& prefix) {
        settings_.s3_key_prefix = prefix;
        return *this;
    }

    SandboxConfigBuilder& WithExtraTags(const utils::TagSet& tags) {
        settings_.extra_tags = tags;
        return *this;
    }

    /**
     * @brief Resolve defaults and validate
     *
     * @param image_lookup Called only when no image id was supplied
     * @param env Source of the AWS_REGION fallback
     * @throws ConfigError if the region cannot be determined or validation fails
     */
    SandboxConfig Build(const ImageLookup& image_lookup,
                        const EnvLookup& env = ProcessEnvironment()) const;

    const SandboxSettings& Settings() const { return settings_; }

private:
    SandboxSettings settings_;
};

} // namespace core
} // namespace stratus
