/**
 * @file sandbox_config.cpp
 * @brief Settings loading, default resolution and configuration validation
 *
 * @date 2025
 */

#include "stratus/core/sandbox_config.hpp"
#include "stratus/core/errors.hpp"
#include "stratus/services/command_relay.hpp"
#include "stratus/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <utility>

using json = nlohmann::json;

namespace stratus {
namespace core {

const char* const kSettingsEnvPrefix = "STRATUS_";
const char* const kDefaultImageParameter =
    "/aws/service/canonical/ubuntu/server/24.04/stable/current/amd64/hvm/ebs-gp3/ami-id";
const char* const kDefaultInstanceType = "t3a.large";

namespace {

using utils::StringUtils;

/// Apply one `KEY=value` pair (key without prefix, upper case) to settings
void ApplySetting(SandboxSettings& settings, const std::string& key, const std::string& value) {
    if (key == "REGION") settings.region = value;
    else if (key == "VPC_ID") settings.vpc_id = value;
    else if (key == "SECURITY_GROUP_ID") settings.security_group_id = value;
    else if (key == "SUBNET_ID") settings.subnet_id = value;
    else if (key == "AMI_ID") settings.ami_id = value;
    else if (key == "INSTANCE_TYPE") settings.instance_type = value;
    else if (key == "INSTANCE_PROFILE") settings.instance_profile = value;
    else if (key == "S3_BUCKET") settings.s3_bucket = value;
    else if (key == "S3_KEY_PREFIX") settings.s3_key_prefix = value;
    else if (key == "EXTRA_TAGS") settings.extra_tags = utils::TagCodec::Unpack(value);
}

const char* const kSettingKeys[] = {
    "REGION", "VPC_ID", "SECURITY_GROUP_ID", "SUBNET_ID", "AMI_ID",
    "INSTANCE_TYPE", "INSTANCE_PROFILE", "S3_BUCKET", "S3_KEY_PREFIX", "EXTRA_TAGS"
};

std::string StripQuotes(const std::string& value) {
    if (value.size() >= 2) {
        char first = value.front();
        char last = value.back();
        if ((first == '"' || first == '\'') && first == last) {
            return value.substr(1, value.size() - 2);
        }
    }
    return value;
}

void Require(const std::string& value, const char* name) {
    if (value.empty()) {
        throw ConfigError(std::string("Sandbox configuration is missing ") + name);
    }
}

} // anonymous namespace

// ============================================================================
// SETTINGS SOURCES
// ============================================================================

void SandboxSettings::MergeFrom(const SandboxSettings& overrides) {
    if (overrides.region) region = overrides.region;
    if (overrides.vpc_id) vpc_id = overrides.vpc_id;
    if (overrides.security_group_id) security_group_id = overrides.security_group_id;
    if (overrides.subnet_id) subnet_id = overrides.subnet_id;
    if (overrides.ami_id) ami_id = overrides.ami_id;
    if (overrides.instance_type) instance_type = overrides.instance_type;
    if (overrides.instance_profile) instance_profile = overrides.instance_profile;
    if (overrides.s3_bucket) s3_bucket = overrides.s3_bucket;
    if (overrides.s3_key_prefix) s3_key_prefix = overrides.s3_key_prefix;
    if (overrides.extra_tags) extra_tags = overrides.extra_tags;
}

EnvLookup ProcessEnvironment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

SandboxSettings LoadSettingsFromEnvironment(const EnvLookup& env) {
    SandboxSettings settings;
    for (const char* key : kSettingKeys) {
        auto value = env(std::string(kSettingsEnvPrefix) + key);
        if (value) {
            ApplySetting(settings, key, *value);
        }
    }
    return settings;
}

SandboxSettings LoadSettingsFromDotEnv(const std::filesystem::path& path) {
    SandboxSettings settings;

    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::debug("No settings file at {}", path.string());
        return settings;
    }

    const std::string prefix = kSettingsEnvPrefix;
    std::string line;
    while (std::getline(file, line)) {
        line = StringUtils::Trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (StringUtils::StartsWith(line, "export ")) {
            line = StringUtils::Trim(line.substr(7));
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string key = StringUtils::Trim(line.substr(0, eq));
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        if (!StringUtils::StartsWith(key, prefix)) {
            continue;
        }

        std::string value = StripQuotes(StringUtils::Trim(line.substr(eq + 1)));
        ApplySetting(settings, key.substr(prefix.size()), value);
    }

    return settings;
}

SandboxSettings LoadSettingsFromJson(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open configuration file: " + path.string());
    }

    json document;
    try {
        document = json::parse(file);
    } catch (const json::parse_error& e) {
        throw ConfigError("Invalid JSON in " + path.string() + ": " + e.what());
    }

    if (!document.is_object()) {
        throw ConfigError("Configuration file must contain a JSON object: " + path.string());
    }

    SandboxSettings settings;
    for (const char* key : kSettingKeys) {
        std::string field = StringUtils::ToLower(key);
        if (!document.contains(field) || document[field].is_null()) {
            continue;
        }

        const json& value = document[field];
        if (field == "extra_tags" && !value.is_string()) {
            if (value.is_array()) {
                settings.extra_tags = utils::TagCodec::FromResourceTags(value);
            } else if (value.is_object()) {
                utils::TagSet tags;
                for (auto it = value.begin(); it != value.end(); ++it) {
                    if (!it.value().is_string()) {
                        throw ConfigError("extra_tags value for '" + it.key() + "' must be a string");
                    }
                    tags.emplace_back(it.key(), it.value().get<std::string>());
                }
                settings.extra_tags = tags;
            } else {
                throw ConfigError("extra_tags must be a string, array or object");
            }
            continue;
        }

        if (!value.is_string()) {
            throw ConfigError("Configuration key '" + field + "' must be a string");
        }
        ApplySetting(settings, key, value.get<std::string>());
    }

    return settings;
}

std::string LookupDefaultImage(services::CommandRelay& relay) {
    auto image = relay.GetParameter(kDefaultImageParameter);
    if (!image || image->empty()) {
        throw ConfigError("Could not find Ubuntu 24.04 image id in parameter store");
    }
    spdlog::debug("Resolved default image {}", *image);
    return *image;
}

// ============================================================================
// SANDBOX CONFIG
// ============================================================================

SandboxConfig::SandboxConfig(Fields fields)
    : fields_(std::move(fields)) {

    Require(fields_.region, "region");
    Require(fields_.vpc_id, "vpc_id");
    Require(fields_.security_group_id, "security_group_id");
    Require(fields_.subnet_id, "subnet_id");
    Require(fields_.ami_id, "ami_id");
    Require(fields_.instance_type, "instance_type");
    Require(fields_.instance_profile, "instance_profile");
    Require(fields_.s3_bucket, "s3_bucket");

    if (StringUtils::StartsWith(fields_.s3_key_prefix, "/")) {
        throw ConfigError("S3 key prefix '" + fields_.s3_key_prefix + "' must not start with a '/'");
    }
}

SandboxConfig SandboxConfigBuilder::Build(const ImageLookup& image_lookup,
                                          const EnvLookup& env) const {
    SandboxConfig::Fields fields;

    if (settings_.region) {
        fields.region = *settings_.region;
    } else if (auto aws_region = env("AWS_REGION")) {
        fields.region = *aws_region;
    } else {
        throw ConfigError(std::string("Region must be specified either in settings, or as an "
                                      "environment variable ") + kSettingsEnvPrefix +
                          "REGION or AWS_REGION.");
    }

    // Fail on a bad prefix before spending a parameter-store round trip
    fields.s3_key_prefix = settings_.s3_key_prefix.value_or("");
    if (StringUtils::StartsWith(fields.s3_key_prefix, "/")) {
        throw ConfigError("S3 key prefix '" + fields.s3_key_prefix + "' must not start with a '/'");
    }

    fields.vpc_id = settings_.vpc_id.value_or("");
    fields.security_group_id = settings_.security_group_id.value_or("");
    fields.subnet_id = settings_.subnet_id.value_or("");
    fields.instance_type = settings_.instance_type.value_or(kDefaultInstanceType);
    fields.instance_profile = settings_.instance_profile.value_or("");
    fields.s3_bucket = settings_.s3_bucket.value_or("");
    fields.extra_tags = settings_.extra_tags.value_or(utils::TagSet{});

    if (settings_.ami_id) {
        fields.ami_id = *settings_.ami_id;
    } else {
        if (!image_lookup) {
            throw ConfigError("No image id configured and no image lookup available");
        }
        fields.ami_id = image_lookup(fields.region);
    }

    return SandboxConfig(std::move(fields));
}

} // namespace core
} // namespace stratus
